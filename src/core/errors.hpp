#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace uuidpp {

// Exception for malformed UUID text
class FormatError : public std::runtime_error {
public:
    FormatError(const std::string& reason, const std::string& input)
        : std::runtime_error("uuid: " + reason + ": \"" + input + "\""),
          reason_(reason), input_(input) {}

    const std::string& reason() const { return reason_; }
    const std::string& input() const { return input_; }

private:
    std::string reason_;
    std::string input_;
};

// Exception for binary input or output buffers of the wrong size
class LengthError : public std::runtime_error {
public:
    LengthError(size_t expected, size_t actual)
        : std::runtime_error("uuid: UUID must be exactly " + std::to_string(expected) +
                             " bytes long, got " + std::to_string(actual) + " bytes"),
          expected_(expected), actual_(actual) {}

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

// Exception for storage values that are neither bytes nor text
class UnsupportedSourceTypeError : public std::runtime_error {
public:
    explicit UnsupportedSourceTypeError(const std::string& type_name)
        : std::runtime_error("uuid: cannot convert " + type_name + " to UUID"),
          type_name_(type_name) {}

    const std::string& type_name() const { return type_name_; }

private:
    std::string type_name_;
};

// Exception for failures of the message digest backend
class DigestError : public std::runtime_error {
public:
    explicit DigestError(const std::string& message)
        : std::runtime_error("uuid: digest failed: " + message) {}
};

} // namespace uuidpp
