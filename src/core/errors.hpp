#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace svec {

    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string& message) :
            std::runtime_error(message) {}
    };

    // Negative index passed to an indexed operation
    class InvalidIndexError : public Error {
    public:
        using Error::Error;
    };

    // Index at or past the current size
    class OutOfRangeError : public Error {
    public:
        using Error::Error;
    };

    // Value kind that has no byte encoding (the empty sentinel, or an
    // unmappable JSON type)
    class UnsupportedTypeError : public Error {
    public:
        using Error::Error;
    };

    // Malformed encoded value bytes
    class ValueDecodeError : public Error {
    public:
        using Error::Error;
    };

    class EmptyInputError : public ValueDecodeError {
    public:
        using ValueDecodeError::ValueDecodeError;
    };

    class UnknownTagError : public ValueDecodeError {
    public:
        UnknownTagError(const std::string& message, uint8_t tag) :
            ValueDecodeError(message),
            tag_(tag) {}

        uint8_t tag() const { return tag_; }

    private:
        uint8_t tag_;
    };

    class MalformedPayloadError : public ValueDecodeError {
    public:
        using ValueDecodeError::ValueDecodeError;
    };

    // Key outside the subspace, or a suffix that is not an encoded index
    class DecodeError : public Error {
    public:
        using Error::Error;
    };

    // Failure reported by the backing store. Carries the MDBX return code.
    class StoreError : public Error {
    public:
        StoreError(const std::string& message, int code) :
            Error(message),
            code_(code) {}

        int code() const { return code_; }

    private:
        int code_;
    };

}  //namespace svec
