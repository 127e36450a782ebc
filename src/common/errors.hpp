#pragma once

#include <stdexcept>
#include <string>

namespace hostform {

enum class ErrorKind {
    PreconditionNotFound,
    QueryFailed,
    ParseFailed,
    WriteFailed,
    FilesystemConflict,
    ConfigInvalid
};

inline std::string toErrorKindString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::PreconditionNotFound:
        return "precondition_not_found";
    case ErrorKind::QueryFailed:
        return "query_failed";
    case ErrorKind::ParseFailed:
        return "parse_failed";
    case ErrorKind::WriteFailed:
        return "write_failed";
    case ErrorKind::FilesystemConflict:
        return "filesystem_conflict";
    case ErrorKind::ConfigInvalid:
        return "config_invalid";
    }
    return "unknown";
}

// Every reconciler failure is raised as a ReconcileError. Nothing below the
// CLI entry point catches it, so one failure ends the whole run.
class ReconcileError : public std::runtime_error
{
public:
    ReconcileError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    ErrorKind kind() const
    {
        return m_kind;
    }

private:
    ErrorKind m_kind;
};

} // namespace hostform
