#pragma once

#include <stdexcept>
#include <string>

namespace mockapic {

// Error kinds raised by the store and the service. The HTTP layer maps
// them to status codes; nothing retries internally.
class MockError : public std::runtime_error {
public:
    explicit MockError(const std::string& msg) : std::runtime_error(msg) {}
};

class ValidationError : public MockError {
public:
    ValidationError(std::string field, std::string value)
        : MockError(field + " {" + value + "} does not exist"),
          field_(std::move(field)), value_(std::move(value)) {}

    const std::string& field() const { return field_; }
    const std::string& value() const { return value_; }

private:
    std::string field_;
    std::string value_;
};

class NotFoundError : public MockError {
public:
    explicit NotFoundError(const std::string& msg) : MockError(msg) {}
};

class CorruptDataError : public MockError {
public:
    explicit CorruptDataError(const std::string& msg) : MockError(msg) {}
};

class ListError : public MockError {
public:
    explicit ListError(const std::string& msg) : MockError(msg) {}
};

class WriteError : public MockError {
public:
    explicit WriteError(const std::string& msg) : MockError(msg) {}
};

// Identifier with the wrong length or shape; never reaches the filesystem.
class InvalidIdError : public MockError {
public:
    explicit InvalidIdError(const std::string& msg) : MockError(msg) {}
};

} // namespace mockapic
