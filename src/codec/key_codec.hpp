#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../core/errors.hpp"
#include "../core/types.hpp"
#include "value_codec.hpp"

namespace svec {

    /**
     * An exclusively owned region of the key space, identified by a byte
     * prefix. Every key the region owns starts with the prefix and sorts
     * inside [prefix + 0x00, prefix + 0xFF).
     *
     * Path components are packed as 0x02 <bytes> 0x00 with embedded 0x00
     * escaped to 0x00 0xFF, so the prefix of one path is never a byte prefix
     * of a sibling path.
     */
    class Subspace {
    public:
        static constexpr uint8_t STRING_CODE = 0x02;
        static constexpr uint8_t INT_CODE = 0x15;
        static constexpr uint8_t RANGE_BEGIN_BYTE = 0x00;
        static constexpr uint8_t RANGE_END_BYTE = 0xFF;

        Subspace() = default;
        explicit Subspace(Key prefix) :
            prefix_(std::move(prefix)) {}

        static Subspace fromPath(const std::vector<std::string>& path) {
            Subspace space;
            for(const auto& component : path) {
                space = space.sub(component);
            }
            return space;
        }

        Subspace sub(std::string_view name) const {
            Key prefix = prefix_;
            prefix.push_back(static_cast<char>(STRING_CODE));
            for(char c : name) {
                prefix.push_back(c);
                if(c == '\0') {
                    prefix.push_back(static_cast<char>(0xFF));
                }
            }
            prefix.push_back('\0');
            return Subspace(std::move(prefix));
        }

        const Key& prefix() const { return prefix_; }

        bool contains(std::string_view key) const {
            return key.size() >= prefix_.size()
                   && key.compare(0, prefix_.size(), prefix_) == 0;
        }

        KeyRange range() const {
            Key begin = prefix_;
            begin.push_back(static_cast<char>(RANGE_BEGIN_BYTE));
            Key end = prefix_;
            end.push_back(static_cast<char>(RANGE_END_BYTE));
            return {std::move(begin), std::move(end)};
        }

        // Flipping the sign bit turns two's complement order into unsigned
        // byte order, so the full int64 range sorts numerically.
        Key encodeIndex(idxInt index) const {
            Key key;
            key.reserve(prefix_.size() + 1 + codec::FIXED_PAYLOAD_SIZE);
            key.append(prefix_);
            key.push_back(static_cast<char>(INT_CODE));
            codec::appendBigEndian64(key, static_cast<uint64_t>(index) ^ SIGN_BIT);
            return key;
        }

        idxInt decodeIndex(std::string_view key) const {
            if(!contains(key)) {
                throw DecodeError("Key is not in subspace");
            }
            std::string_view suffix = key.substr(prefix_.size());
            if(suffix.empty() || static_cast<uint8_t>(suffix[0]) != INT_CODE) {
                throw DecodeError("Key suffix does not start with an integer code");
            }
            if(suffix.size() != 1 + codec::FIXED_PAYLOAD_SIZE) {
                throw DecodeError("Integer key suffix has " + std::to_string(suffix.size() - 1)
                                  + " bytes, expected 8");
            }
            return static_cast<idxInt>(codec::readBigEndian64(suffix.data() + 1) ^ SIGN_BIT);
        }

    private:
        static constexpr uint64_t SIGN_BIT = 1ULL << 63;

        Key prefix_;
    };

}  //namespace svec
