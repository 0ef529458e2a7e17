#pragma once

namespace stratum {

enum class StepKind {
    SetUser,
    Run,
    Comment
};

enum class StepStatus {
    Committed,
    Failed
};

enum class BuildErrorKind {
    Parse,
    UnresolvableBase,
    UnknownIdentity,
    CommandFailed,
    Workspace
};

// Lazy resolves a principal only when a RUN step needs it; Strict also
// resolves it when the USER step is applied.
enum class IdentityPolicy {
    Lazy,
    Strict
};

} // namespace stratum
