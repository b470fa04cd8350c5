#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sb {

enum class ErrorKind {
    Configuration,
    AccountNotFound,
    Transport,
    Validation,
    DuplicateCollision,
    SinkRejection
};

std::string to_string(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(const ErrorKind kind, const std::string& message, std::string details = {})
        : std::runtime_error(message), kind_(kind), details_(std::move(details)) {}

    [[nodiscard]] ErrorKind kind() const { return kind_; }
    [[nodiscard]] const std::string& details() const { return details_; }

private:
    ErrorKind kind_;
    std::string details_;
};

class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& message, std::string details = {})
        : Error(ErrorKind::Configuration, message, std::move(details)) {}

protected:
    ConfigurationError(const ErrorKind kind, const std::string& message, std::string details)
        : Error(kind, message, std::move(details)) {}
};

class AccountNotFoundError : public ConfigurationError {
public:
    explicit AccountNotFoundError(const std::string& message, std::string details = {})
        : ConfigurationError(ErrorKind::AccountNotFound, message, std::move(details)) {}
};

class TransportError : public Error {
public:
    explicit TransportError(const std::string& message, std::string details = {}, const long httpStatus = 0)
        : Error(ErrorKind::Transport, message, std::move(details)), http_status_(httpStatus) {}

    [[nodiscard]] long httpStatus() const { return http_status_; }

private:
    long http_status_;
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message, std::string details = {})
        : Error(ErrorKind::Validation, message, std::move(details)) {}
};

}
