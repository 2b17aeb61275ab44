#pragma once

#include <stdexcept>
#include <string>

namespace linksim {

// ─── Error Taxonomy ────────────────────────────────────────────
// Every error raised by the core derives from LinksimError.
// Numerical anomalies (non-convergence, budget clamp, degenerate
// projection) are not errors: they land in SolverDiagnostics.

class LinksimError : public std::runtime_error {
public:
    explicit LinksimError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Bad input detected before any mutation: empty page set, unknown
/// project, malformed rule, invalid solver parameter.
class ValidationError : public LinksimError {
public:
    explicit ValidationError(const std::string& what)
        : LinksimError(what) {}
};

/// Malformed setting or logging setup failure.
class ConfigError : public LinksimError {
public:
    explicit ConfigError(const std::string& what)
        : LinksimError(what) {}
};

/// Unexpected failure while a run was in the running state.
class RunFailure : public LinksimError {
public:
    explicit RunFailure(const std::string& what)
        : LinksimError(what) {}
};

/// Raised at an iteration checkpoint once cancellation is requested.
class RunCancelled : public LinksimError {
public:
    explicit RunCancelled(const std::string& what)
        : LinksimError(what) {}
};

} // namespace linksim
