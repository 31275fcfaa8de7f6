#pragma once

#include <stdexcept>
#include <string>

namespace kgsynth {

/**
 * @brief Process exit codes, one per fatal error kind
 */
enum class ExitCode : int {
    Success = 0,
    Usage = 1,
    FileNotFound = 2,
    JsonDecode = 3,
    InvalidConfig = 4,
    OutputFailure = 5,
    EmptySchema = 6
};

inline int to_int(ExitCode code) { return static_cast<int>(code); }

/**
 * @brief Base class for fatal errors that abort a run
 *
 * Recoverable conditions (malformed triples, unknown types, duplicate
 * instances) are reported on the console and never thrown.
 */
class Error : public std::runtime_error {
public:
    Error(const std::string& message, ExitCode code)
        : std::runtime_error(message), code_(code) {}

    ExitCode exit_code() const { return code_; }

private:
    ExitCode code_;
};

class FileNotFoundError : public Error {
public:
    explicit FileNotFoundError(const std::string& path)
        : Error("File not found at " + path, ExitCode::FileNotFound), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class JsonDecodeError : public Error {
public:
    explicit JsonDecodeError(const std::string& message)
        : Error("Error decoding JSON: " + message, ExitCode::JsonDecode) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error("Invalid configuration: " + message, ExitCode::InvalidConfig) {}
};

class OutputError : public Error {
public:
    explicit OutputError(const std::string& message)
        : Error(message, ExitCode::OutputFailure) {}
};

} // namespace kgsynth
