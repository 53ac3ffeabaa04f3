#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <ostream>

#include "errors.hpp"
#include "types.hpp"

namespace svec {

    // Kind markers double as the tag byte of the value encoding.
    // EMPTY has no encoding.
    enum class ValueKind : uint8_t { EMPTY = 0x00, INT = 0x01, FLOAT = 0x02, TEXT = 0x03 };

    inline const char* valueKindToString(ValueKind kind) {
        switch(kind) {
            case ValueKind::EMPTY:
                return "empty";
            case ValueKind::INT:
                return "int";
            case ValueKind::FLOAT:
                return "float";
            case ValueKind::TEXT:
                return "text";
        }
        return "unknown";
    }

    /**
     * A vector element: exactly one of integer, float or text, or the EMPTY
     * sentinel returned for indices that are represented sparsely. A stored
     * zero is INT 0, never EMPTY.
     */
    class Value {
    public:
        Value() = default;

        // Unsigned integers above INT64_MAX have no INT representation and
        // throw UnsupportedTypeError
        template <typename T,
                  std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
        Value(T v) :
            data_(checkedInt(v)) {}

        template <typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
        Value(T v) :
            data_(static_cast<double>(v)) {}

        Value(std::string v) :
            data_(std::move(v)) {}
        Value(std::string_view v) :
            data_(std::string(v)) {}
        Value(const char* v) :
            data_(std::string(v)) {}

        // bool is not a vector element kind
        Value(bool) = delete;

        ValueKind kind() const { return static_cast<ValueKind>(kindFromIndex(data_.index())); }

        bool isEmpty() const { return std::holds_alternative<std::monostate>(data_); }
        bool isInt() const { return std::holds_alternative<int64_t>(data_); }
        bool isFloat() const { return std::holds_alternative<double>(data_); }
        bool isText() const { return std::holds_alternative<std::string>(data_); }

        // Accessors throw std::bad_variant_access on a kind mismatch
        int64_t asInt() const { return std::get<int64_t>(data_); }
        double asFloat() const { return std::get<double>(data_); }
        const std::string& asText() const { return std::get<std::string>(data_); }

        static Value empty() { return Value(); }

        bool operator==(const Value& other) const { return data_ == other.data_; }
        bool operator!=(const Value& other) const { return !(*this == other); }

    private:
        template <typename T> static int64_t checkedInt(T v) {
            if constexpr(std::is_unsigned_v<T>) {
                if(static_cast<uint64_t>(v)
                   > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    throw UnsupportedTypeError("Unsigned integer " + std::to_string(static_cast<uint64_t>(v))
                                               + " does not fit a signed 64-bit element");
                }
            }
            return static_cast<int64_t>(v);
        }

        static uint8_t kindFromIndex(size_t index) {
            switch(index) {
                case 1:
                    return static_cast<uint8_t>(ValueKind::INT);
                case 2:
                    return static_cast<uint8_t>(ValueKind::FLOAT);
                case 3:
                    return static_cast<uint8_t>(ValueKind::TEXT);
                default:
                    return static_cast<uint8_t>(ValueKind::EMPTY);
            }
        }

        std::variant<std::monostate, int64_t, double, std::string> data_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Value& v) {
        switch(v.kind()) {
            case ValueKind::EMPTY:
                return os << "<empty>";
            case ValueKind::INT:
                return os << v.asInt();
            case ValueKind::FLOAT:
                return os << v.asFloat();
            case ValueKind::TEXT:
                return os << '"' << v.asText() << '"';
        }
        return os;
    }

    // Element produced by range iteration
    struct IndexValue {
        idxInt index = 0;
        Value value;
    };

}  //namespace svec
