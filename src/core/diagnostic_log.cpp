#include "diagnostic_log.h"
#include <algorithm>
#include <iostream>

const char* errorKindName(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::MissingField: return "MISSING_FIELD";
        case ErrorKind::InvalidDimension: return "INVALID_DIMENSION";
        case ErrorKind::UnknownStorageClass: return "UNKNOWN_STORAGE_CLASS";
        case ErrorKind::MissingArrayPayload: return "MISSING_ARRAY_PAYLOAD";
        case ErrorKind::MalformedPayload: return "MALFORMED_PAYLOAD";
        case ErrorKind::UnsupportedField: return "UNSUPPORTED_FIELD";
        case ErrorKind::HostFailure: return "HOST_FAILURE";
        case ErrorKind::ShaderBuildFailure: return "SHADER_BUILD_FAILURE";
    }
    return "UNKNOWN";
}

void DiagnosticLog::report(ErrorKind kind, const std::string& message)
{
    std::cerr << "ERROR::" << errorKindName(kind) << ": " << message << "\n";
    m_entries.push_back({ kind, message });
}

size_t DiagnosticLog::count(ErrorKind kind) const
{
    return static_cast<size_t>(std::count_if(m_entries.begin(), m_entries.end(),
        [kind](const DiagnosticEntry& entry) { return entry.kind == kind; }));
}
