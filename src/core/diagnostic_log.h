#pragma once
#include <string>
#include <vector>

enum class ErrorKind
{
    MissingField,
    InvalidDimension,
    UnknownStorageClass,
    MissingArrayPayload,
    MalformedPayload,
    UnsupportedField,
    HostFailure,
    ShaderBuildFailure,
};

const char* errorKindName(ErrorKind kind);

struct DiagnosticEntry
{
    ErrorKind kind;
    std::string message;
};

// Persistent, user-visible log of everything that went wrong while loading or
// rendering. Entries are never removed; the UI shows them in a window.
class DiagnosticLog
{
public:
    void report(ErrorKind kind, const std::string& message);

    const std::vector<DiagnosticEntry>& entries() const { return m_entries; }
    bool empty() const { return m_entries.empty(); }
    size_t size() const { return m_entries.size(); }
    size_t count(ErrorKind kind) const;
    bool hasFatal() const { return count(ErrorKind::ShaderBuildFailure) > 0; }

private:
    std::vector<DiagnosticEntry> m_entries;
};
