#pragma once

#include <stdexcept>
#include <string>

namespace snapbucket {

/// Root of the error taxonomy. `resource()` names the remote or local
/// resource involved (volume id, object key, device), empty when none.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message, std::string resource = {})
        : std::runtime_error(message), resource_(std::move(resource)) {}

    const std::string& resource() const { return resource_; }

private:
    std::string resource_;
};

// A volume did not reach the requested state within the poll budget.
class ResourceTimeout : public Error {
public:
    using Error::Error;
};

// A part could not be stored after exhausting retries, or failed fatally.
class PartUploadFailed : public Error {
public:
    using Error::Error;
};

class CompleteFailed : public Error {
public:
    using Error::Error;
};

// The archiver or compressor exited non-zero, or the stream outgrew its target.
class SourceFailure : public Error {
public:
    using Error::Error;
};

// The extractor exited non-zero or closed its input early.
class TransferCorruption : public Error {
public:
    using Error::Error;
};

class DeviceResolutionFailure : public Error {
public:
    using Error::Error;
};

class ConfigurationError : public Error {
public:
    using Error::Error;
};

// Not enough free memory to buffer a chunk.
class ResourceExhausted : public Error {
public:
    using Error::Error;
};

class StorageError : public Error {
public:
    using Error::Error;
};

class ControlPlaneError : public Error {
public:
    using Error::Error;
};

// A local OS tool failed to start or returned non-zero.
class CommandFailed : public Error {
public:
    CommandFailed(const std::string& message, std::string command, int exit_code)
        : Error(message, std::move(command)), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

}  // namespace snapbucket
