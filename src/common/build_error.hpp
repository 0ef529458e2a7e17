#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "common/enums.hpp"

namespace stratum {

// Thrown by the descriptor parser and the provisioning pipeline. Carries
// everything the invoker needs to report the failure verbatim.
class BuildError : public std::runtime_error {
public:
    BuildError(BuildErrorKind kind, const std::string &message,
               int exitCode = 1, int line = 0, std::string output = {})
        : std::runtime_error(message)
        , m_kind(kind)
        , m_exitCode(exitCode)
        , m_line(line)
        , m_output(std::move(output))
    {
    }

    BuildErrorKind kind() const { return m_kind; }

    // Exit code the build process should terminate with.
    int exitCode() const { return m_exitCode; }

    // Descriptor line of the offending directive, 0 when not tied to one.
    int line() const { return m_line; }

    const std::string &output() const { return m_output; }

private:
    BuildErrorKind m_kind;
    int m_exitCode;
    int m_line;
    std::string m_output;
};

inline const char *buildErrorKindName(BuildErrorKind kind)
{
    switch (kind) {
    case BuildErrorKind::Parse:
        return "parse";
    case BuildErrorKind::UnresolvableBase:
        return "unresolvable_base";
    case BuildErrorKind::UnknownIdentity:
        return "unknown_identity";
    case BuildErrorKind::CommandFailed:
        return "command_failed";
    case BuildErrorKind::Workspace:
        return "workspace";
    }
    return "workspace";
}

} // namespace stratum
