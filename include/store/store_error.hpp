#ifndef DOCPIPE_STORE_ERROR_HPP
#define DOCPIPE_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace docpipe {

// Failure classes shared by every layer of the pipeline
enum class ErrorKind {
    NOT_FOUND = 0,
    OUT_OF_RANGE,
    INVALID_ARGUMENT,
    TRANSFORM_ERROR,
    STALE_RESPONSE,
    INTERNAL_ERROR
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND: return "Not found";
        case ErrorKind::OUT_OF_RANGE: return "Out of range";
        case ErrorKind::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorKind::TRANSFORM_ERROR: return "Transform error";
        case ErrorKind::STALE_RESPONSE: return "Stale response";
        case ErrorKind::INTERNAL_ERROR: return "Internal error";
        default: return "Undefined error";
    }
}

namespace store {

class StoreError : public std::runtime_error {
public:
    StoreError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class NotFoundError : public StoreError {
public:
    explicit NotFoundError(const std::string& id)
        : StoreError(ErrorKind::NOT_FOUND, "Entry not found: " + id) {}
};

class OutOfRangeError : public StoreError {
public:
    explicit OutOfRangeError(const std::string& message)
        : StoreError(ErrorKind::OUT_OF_RANGE, "Out of range: " + message) {}
};

class InvalidArgumentError : public StoreError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : StoreError(ErrorKind::INVALID_ARGUMENT, "Invalid argument: " + message) {}
};

} // namespace store
} // namespace docpipe

#endif // DOCPIPE_STORE_ERROR_HPP
