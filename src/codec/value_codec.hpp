#pragma once

/**
 * Byte encoding of vector elements.
 *
 * Layout: one tag byte (the ValueKind) followed by
 *   INT   - 8 byte big-endian two's complement
 *   FLOAT - 8 byte big-endian IEEE-754 bit pattern
 *   TEXT  - the raw text bytes, unterminated. The payload is the whole
 *           remaining buffer.
 */

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>

#include "../core/errors.hpp"
#include "../core/types.hpp"
#include "../core/value.hpp"

namespace svec {
    namespace codec {

        constexpr size_t VALUE_TAG_SIZE = 1;
        constexpr size_t FIXED_PAYLOAD_SIZE = 8;

        inline void appendBigEndian64(Bytes& out, uint64_t v) {
            for(int shift = 56; shift >= 0; shift -= 8) {
                out.push_back(static_cast<char>((v >> shift) & 0xFF));
            }
        }

        inline uint64_t readBigEndian64(const char* p) {
            uint64_t v = 0;
            for(size_t i = 0; i < FIXED_PAYLOAD_SIZE; ++i) {
                v = (v << 8) | static_cast<uint8_t>(p[i]);
            }
            return v;
        }

        inline Bytes encodeValue(const Value& value) {
            Bytes out;
            switch(value.kind()) {
                case ValueKind::INT:
                    out.reserve(VALUE_TAG_SIZE + FIXED_PAYLOAD_SIZE);
                    out.push_back(static_cast<char>(ValueKind::INT));
                    appendBigEndian64(out, static_cast<uint64_t>(value.asInt()));
                    break;
                case ValueKind::FLOAT: {
                    double d = value.asFloat();
                    uint64_t bits;
                    std::memcpy(&bits, &d, sizeof(bits));
                    out.reserve(VALUE_TAG_SIZE + FIXED_PAYLOAD_SIZE);
                    out.push_back(static_cast<char>(ValueKind::FLOAT));
                    appendBigEndian64(out, bits);
                    break;
                }
                case ValueKind::TEXT:
                    out.reserve(VALUE_TAG_SIZE + value.asText().size());
                    out.push_back(static_cast<char>(ValueKind::TEXT));
                    out.append(value.asText());
                    break;
                case ValueKind::EMPTY:
                default:
                    throw UnsupportedTypeError(std::string("Unencodable element of kind ")
                                               + valueKindToString(value.kind()));
            }
            return out;
        }

        inline Value decodeValue(std::string_view bytes) {
            if(bytes.empty()) {
                throw EmptyInputError("No bytes to decode");
            }

            uint8_t tag = static_cast<uint8_t>(bytes[0]);
            std::string_view payload = bytes.substr(VALUE_TAG_SIZE);

            switch(static_cast<ValueKind>(tag)) {
                case ValueKind::INT:
                case ValueKind::FLOAT: {
                    if(payload.size() != FIXED_PAYLOAD_SIZE) {
                        throw MalformedPayloadError(
                                "Expected 8 byte payload for tag " + std::to_string(tag)
                                + ", got " + std::to_string(payload.size()));
                    }
                    uint64_t raw = readBigEndian64(payload.data());
                    if(tag == static_cast<uint8_t>(ValueKind::INT)) {
                        return Value(static_cast<int64_t>(raw));
                    }
                    double d;
                    std::memcpy(&d, &raw, sizeof(d));
                    return Value(d);
                }
                case ValueKind::TEXT:
                    return Value(std::string(payload));
                default:
                    break;
            }

            char hex[8];
            std::snprintf(hex, sizeof(hex), "%02x", tag);
            throw UnknownTagError(
                    std::string("Unable to decode element with unknown typecode ") + hex, tag);
        }

    }  // namespace codec
}  // namespace svec
