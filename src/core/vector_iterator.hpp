#pragma once

#include <utility>

#include "../codec/key_codec.hpp"
#include "../codec/value_codec.hpp"
#include "../storage/kv_store.hpp"
#include "value.hpp"

namespace svec {

    /**
     * Forward-only cursor over the entries a vector physically stores in a
     * key range. Sparse gaps are skipped, not filled with the default.
     * Bound to the transaction that created it. Not restartable.
     */
    class VectorIterator {
    public:
        VectorIterator(RangeCursor cursor, Subspace subspace) :
            cursor_(std::move(cursor)),
            subspace_(std::move(subspace)) {}

        VectorIterator(const VectorIterator&) = delete;
        VectorIterator& operator=(const VectorIterator&) = delete;
        VectorIterator(VectorIterator&&) = default;

        bool advance() { return cursor_.advance(); }

        // Decodes the entry the last successful advance() landed on
        IndexValue entry() const {
            const KeyValue& kv = cursor_.current();
            IndexValue iv;
            iv.index = subspace_.decodeIndex(kv.key);
            iv.value = codec::decodeValue(kv.value);
            return iv;
        }

    private:
        RangeCursor cursor_;
        Subspace subspace_;
    };

}  //namespace svec
