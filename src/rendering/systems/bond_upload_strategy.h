#pragma once
#include <glad/glad.h>

class BondMeshBuilder;

// How a freshly rebuilt bond mesh reaches the GPU. The draw call only depends on
// the builder's vertex count, so strategies can be swapped freely.
class BondUploadStrategy
{
public:
    virtual ~BondUploadStrategy() = default;
    virtual void upload(GLuint vertexBuffer, GLuint normalBuffer, const BondMeshBuilder& builder) = 0;
    virtual const char* name() const = 0;
};

// Re-uploads every written vertex and normal each frame
class FullReuploadStrategy : public BondUploadStrategy
{
public:
    void upload(GLuint vertexBuffer, GLuint normalBuffer, const BondMeshBuilder& builder) override;
    const char* name() const override { return "full re-upload"; }
};
