#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace socrates::sandbox {

// Failures of the execution substrate or of the request itself. Anything that
// is a property of the submitted code is reported in a result instead.
class SandboxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CodeTooLarge : public SandboxError {
public:
    CodeTooLarge(std::size_t actual, std::size_t maximum)
        : SandboxError("Code size (" + std::to_string(actual) +
                       " bytes) exceeds maximum allowed size (" +
                       std::to_string(maximum) + " bytes)")
        , actual_(actual)
        , maximum_(maximum) {}

    std::size_t Actual() const { return actual_; }
    std::size_t Maximum() const { return maximum_; }

private:
    std::size_t actual_;
    std::size_t maximum_;
};

class InvalidTestIndex : public SandboxError {
public:
    InvalidTestIndex(int index, std::size_t count)
        : SandboxError("Test index " + std::to_string(index) +
                       " is out of range (0-" + std::to_string(count == 0 ? 0 : count - 1) + ")")
        , index_(index) {}

    int Index() const { return index_; }

private:
    int index_;
};

class DockerUnavailable : public SandboxError {
public:
    using SandboxError::SandboxError;
};

}  // namespace socrates::sandbox
