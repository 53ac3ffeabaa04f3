#pragma once

/**
 * Sparse vector stored in a subspace of the key-value store.
 *
 * Each element is stored under the key of its index. The size of a vector
 * is the index of its last key + 1. Indices below the size that have no key
 * read as the default, so only elements that differ from the default need
 * to be written.
 *
 * The element at size - 1 is always stored, even when it equals the
 * default, so that size can be read from the last key alone.
 *
 * A Vector holds no state of its own. Every operation runs inside the
 * transaction passed to it.
 */

#include <algorithm>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "../codec/key_codec.hpp"
#include "../codec/value_codec.hpp"
#include "../storage/kv_store.hpp"
#include "../utils/log.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "value.hpp"
#include "vector_iterator.hpp"

namespace svec {

    class Vector {
    public:
        explicit Vector(Subspace subspace, Value default_value = Value(std::string())) :
            subspace_(std::move(subspace)),
            default_value_(std::move(default_value)),
            // Rejects an EMPTY default up front
            default_bytes_(codec::encodeValue(default_value_)) {}

        const Subspace& subspace() const { return subspace_; }
        const Value& defaultValue() const { return default_value_; }

        // Number of elements, including the sparsely represented ones
        idxInt size(Transaction& tr) const {
            KeyRange range = subspace_.range();
            auto last_key = tr.getKeyAtOrBefore(range.end);
            // Nothing at or below the end of the subspace, or the greatest key
            // belongs to whatever sorts before it: the vector is empty
            if(!last_key || *last_key < range.begin) {
                return 0;
            }
            return subspace_.decodeIndex(*last_key) + 1;
        }

        /**
         * Element at index. Indices inside the vector without a stored key
         * yield the EMPTY value. Throws OutOfRangeError past the end.
         */
        Value get(idxInt index, Transaction& tr) const {
            if(index < 0) {
                throw InvalidIndexError("vector.get: index '" + std::to_string(index)
                                        + "' out of range");
            }

            Key start = subspace_.encodeIndex(index);
            auto just_one = tr.getRange(start, subspace_.range().end, 1);
            if(just_one.empty()) {
                throw OutOfRangeError("vector.get: index '" + std::to_string(index)
                                      + "' out of range");
            }
            if(just_one[0].key == start) {
                return codec::decodeValue(just_one[0].value);
            }
            // A later element exists, so index lies in a sparse gap
            return Value::empty();
        }

        /**
         * Writes unconditionally. Setting past the end grows the vector.
         * Throws InvalidIndexError for a negative index, since a key below
         * index 0 would be counted by size(). Throws UnsupportedTypeError
         * for an EMPTY value. Nothing is written in either case.
         */
        void set(idxInt index, const Value& value, Transaction& tr) const {
            if(index < 0) {
                throw InvalidIndexError("vector.set: index '" + std::to_string(index)
                                        + "' out of range");
            }
            Bytes packed = codec::encodeValue(value);
            tr.set(subspace_.encodeIndex(index), packed);
        }

        void push(const Value& value, Transaction& tr) const {
            Bytes packed = codec::encodeValue(value);
            idxInt index = size(tr);
            tr.set(subspace_.encodeIndex(index), packed);
        }

        /**
         * Removes and returns the last element. An empty vector yields the
         * EMPTY value and is left untouched.
         */
        Value pop(Transaction& tr) const {
            KeyRange range = subspace_.range();
            // The second to last entry tells whether the new last element is
            // stored or only implied by the old size
            auto last_two = tr.getRange(range.begin, range.end, 2, true);
            if(last_two.empty()) {
                return Value::empty();
            }

            idxInt top = subspace_.decodeIndex(last_two[0].key);
            Value popped = codec::decodeValue(last_two[0].value);

            if(top > 0) {
                bool predecessor_sparse = last_two.size() == 1
                                          || subspace_.decodeIndex(last_two[1].key) < top - 1;
                if(predecessor_sparse) {
                    LOG_DEBUG("vector.pop: materializing default at index " << top - 1);
                    tr.set(subspace_.encodeIndex(top - 1), default_bytes_);
                }
            }

            tr.clear(last_two[0].key);
            return popped;
        }

        // Last element, or EMPTY when the vector is empty
        Value back(Transaction& tr) const {
            KeyRange range = subspace_.range();
            auto last = tr.getRange(range.begin, range.end, 1, true);
            if(last.empty()) {
                return Value::empty();
            }
            return codec::decodeValue(last[0].value);
        }

        Value front(Transaction& tr) const { return get(0, tr); }

        /**
         * Iterates the stored elements between start and stop.
         *
         * start is inclusive and stop exclusive, in whichever direction start
         * lies from stop: [start, stop) when start <= stop, (stop, start]
         * otherwise. Negative start or stop count back from the size and
         * clamp at 0. stop == 0 means the size. A non-zero step picks the
         * traversal order, otherwise it follows start -> stop.
         *
         * Unlike get(), sparse gaps are skipped rather than reported.
         */
        VectorIterator
        getRange(idxInt start, idxInt stop, int step, Transaction& tr) const {
            std::optional<idxInt> cached_size;
            auto current_size = [&]() {
                if(!cached_size) {
                    cached_size = size(tr);
                }
                return *cached_size;
            };

            if(start < 0) {
                start = std::max<idxInt>(0, current_size() + start);
            }
            if(stop == 0) {
                stop = current_size();
            } else if(stop < 0) {
                stop = std::max<idxInt>(0, current_size() + stop);
            }

            bool reverse = start > stop;
            if(step > 0) {
                reverse = false;
            } else if(step < 0) {
                reverse = true;
            }

            KeyRange range = subspace_.range();
            Key begin;
            Key end;
            if(start <= stop) {
                begin = subspace_.encodeIndex(start);
                end = subspace_.encodeIndex(stop);
            } else {
                begin = subspace_.encodeIndex(stop + 1);
                end = start == std::numeric_limits<idxInt>::max()
                              ? range.end
                              : subspace_.encodeIndex(start + 1);
            }

            LOG_DEBUG("vector.getRange: start=" << start << " stop=" << stop
                                                << " reverse=" << reverse);
            return VectorIterator(tr.cursor(std::move(begin), std::move(end), reverse),
                                  subspace_);
        }

        VectorIterator getRange(idxInt start, idxInt stop, Transaction& tr) const {
            return getRange(start, stop, 0, tr);
        }

        // Removes every element
        void clear(Transaction& tr) const {
            KeyRange range = subspace_.range();
            tr.clearRange(range.begin, range.end);
        }

        Key encodeKey(idxInt index) const { return subspace_.encodeIndex(index); }
        idxInt decodeKey(std::string_view key) const { return subspace_.decodeIndex(key); }

    private:
        Subspace subspace_;
        Value default_value_;
        Bytes default_bytes_;
    };

}  //namespace svec
