// About: Exception hierarchy. ValidationError and its subtypes are user
// input problems (exit code 2, message only); everything else is a failure
// outside the orchestrator's control (exit code 1).
#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace videoml {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ─── Validation (exit 2) ───────────────────────────────────────────

class ValidationError : public Error {
public:
    using Error::Error;
};

class NotFoundError : public ValidationError {
public:
    using ValidationError::ValidationError;
};

/// Discovery without an explicit path found zero or several candidates.
class AmbiguousDiscoveryError : public ValidationError {
public:
    using ValidationError::ValidationError;
};

/// A generated artifact the render handoff requires is absent.
class MissingArtifactError : public NotFoundError {
public:
    explicit MissingArtifactError(const std::filesystem::path& path)
        : NotFoundError("Missing artifact: " + path.string()), path_(path) {}

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// ─── Runtime failures (exit 1) ─────────────────────────────────────

/// Failure inside the loader, generator, renderer or encoder.
class CollaboratorError : public Error {
public:
    CollaboratorError(std::string collaborator, const std::string& message)
        : Error(collaborator + ": " + message), collaborator_(std::move(collaborator)) {}

    [[nodiscard]] const std::string& collaborator() const { return collaborator_; }

private:
    std::string collaborator_;
};

class FilesystemWatchError : public Error {
public:
    using Error::Error;
};

/// Process exit code for an exception escaping a command.
[[nodiscard]] inline int exit_code_for(const std::exception& e) {
    return dynamic_cast<const ValidationError*>(&e) ? 2 : 1;
}

}  // namespace videoml
