/**
 * Warden error taxonomy
 *
 * Every error raised by the synchronous layers (sandbox, session manager,
 * templates, file transfer) derives from warden::Error. kind() is the
 * stable identifier placed in structured results handed to callers.
 */
#pragma once
#include <stdexcept>
#include <string>

namespace warden {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
    virtual const char* kind() const noexcept { return "internal"; }
};

// The isolated environment could not be started
class ProvisionError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "provision"; }
};

class UnsupportedLanguageError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "unsupported_language"; }
};

// Execution exceeded its wall clock; the sandbox has been destroyed
class TimeoutError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "timeout"; }
};

class PathSecurityError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "path_security"; }
};

class FileSizeError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "file_size"; }
};

// Operation needs a running sandbox
class SandboxStateError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "sandbox_state"; }
};

class CapacityError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "capacity"; }
};

class NotFoundError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "not_found"; }
};

// Path names a directory, link or device where a regular file is needed
class NotAFileError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "not_a_file"; }
};

// Unreadable or invalid service configuration
class ConfigError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "config"; }
};

} // namespace warden
