#ifndef DOCPIPE_TRANSFORM_ERROR_HPP
#define DOCPIPE_TRANSFORM_ERROR_HPP

#include <stdexcept>
#include <string>
#include "store/store_error.hpp"

namespace docpipe::transform {

// A transformation rejected its input. Expected and user-actionable.
class TransformError : public std::runtime_error {
public:
    explicit TransformError(const std::string& message)
        : std::runtime_error(message) {}

    ErrorKind kind() const { return ErrorKind::TRANSFORM_ERROR; }
};

class ParseError : public TransformError {
public:
    explicit ParseError(const std::string& message)
        : TransformError(message) {}
};

class FormatError : public TransformError {
public:
    explicit FormatError(const std::string& message)
        : TransformError(message) {}
};

class DecodeError : public TransformError {
public:
    explicit DecodeError(const std::string& message)
        : TransformError(message) {}
};

} // namespace docpipe::transform

#endif // DOCPIPE_TRANSFORM_ERROR_HPP
