#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace svec {

    // Vector indices span the whole signed 64-bit range on the key level.
    // Only non-negative indices are reachable through the vector operations.
    using idxInt = int64_t;

    // Keys and encoded values are opaque byte strings
    using Bytes = std::string;
    using Key = std::string;

    struct KeyValue {
        Key key;
        Bytes value;

        KeyValue() = default;
        KeyValue(Key k, Bytes v) :
            key(std::move(k)),
            value(std::move(v)) {}
    };

    // Half-open [begin, end) interval of the key space
    struct KeyRange {
        Key begin;
        Key end;
    };

}  //namespace svec
