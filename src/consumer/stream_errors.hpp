#ifndef STREAM_ERRORS_HPP
#define STREAM_ERRORS_HPP

#include <stdexcept>
#include <string>

// Raised to the consumer when the record buffer was closed by a failure
class BufferClosedError : public std::runtime_error {
public:
    explicit BufferClosedError(const std::string& what) : std::runtime_error(what) {}
};

// The coordinator run loop returned or threw while the stream was live
class CoordinatorError : public std::runtime_error {
public:
    explicit CoordinatorError(const std::string& what) : std::runtime_error(what) {}
};

// A checkpoint action failed; not retried
class CheckpointError : public std::runtime_error {
public:
    explicit CheckpointError(const std::string& what) : std::runtime_error(what) {}
};

#endif // STREAM_ERRORS_HPP
