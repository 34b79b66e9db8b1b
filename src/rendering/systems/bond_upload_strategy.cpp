#include "bond_upload_strategy.h"
#include "../core/mesh/bond_mesh_builder.h"

void FullReuploadStrategy::upload(GLuint vertexBuffer, GLuint normalBuffer, const BondMeshBuilder& builder)
{
    GLsizeiptr bytes = static_cast<GLsizeiptr>(builder.getVertexCount()) * 3 * static_cast<GLsizeiptr>(sizeof(float));
    if (bytes == 0)
        return;

    glBindBuffer(GL_ARRAY_BUFFER, vertexBuffer);
    glBufferSubData(GL_ARRAY_BUFFER, 0, bytes, builder.getVertices().data());
    glBindBuffer(GL_ARRAY_BUFFER, normalBuffer);
    glBufferSubData(GL_ARRAY_BUFFER, 0, bytes, builder.getNormals().data());
    glBindBuffer(GL_ARRAY_BUFFER, 0);
}
