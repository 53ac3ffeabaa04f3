#pragma once

#include <mdbx.h>

#include <cstring>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "../core/errors.hpp"
#include "../core/types.hpp"
#include "../utils/log.hpp"
#include "../utils/settings.hpp"

namespace svec {

    inline StoreError makeStoreError(const std::string& what, int rc) {
        return StoreError(what + ": " + mdbx_strerror(rc), rc);
    }

    // Transient conditions a fresh transaction may not hit again
    inline bool isRetryableStoreError(int rc) { return rc == MDBX_BUSY; }

    inline MDBX_val toMdbxVal(std::string_view bytes) {
        MDBX_val val;
        val.iov_base = const_cast<char*>(bytes.data());
        val.iov_len = bytes.size();
        return val;
    }

    inline std::string_view fromMdbxVal(const MDBX_val& val) {
        return std::string_view(static_cast<const char*>(val.iov_base), val.iov_len);
    }

    /**
     * Lazy cursor over the keys in [begin, end), ascending or descending.
     * Key and value are copied out of the MDBX pages on every advance, so
     * current() stays valid across writes in the same transaction.
     * Must not outlive the transaction that created it.
     */
    class RangeCursor {
    public:
        RangeCursor(MDBX_txn* txn, MDBX_dbi dbi, Key begin, Key end, bool reverse, size_t limit) :
            begin_(std::move(begin)),
            end_(std::move(end)),
            reverse_(reverse),
            limit_(limit) {
            int rc = mdbx_cursor_open(txn, dbi, &cursor_);
            if(rc != MDBX_SUCCESS) {
                cursor_ = nullptr;
                throw makeStoreError("MDBX cursor open failed", rc);
            }
            done_ = begin_ >= end_;
        }

        ~RangeCursor() {
            if(cursor_) {
                mdbx_cursor_close(cursor_);
            }
        }

        // prevent copying
        RangeCursor(const RangeCursor&) = delete;
        RangeCursor& operator=(const RangeCursor&) = delete;

        RangeCursor(RangeCursor&& other) noexcept :
            cursor_(std::exchange(other.cursor_, nullptr)),
            begin_(std::move(other.begin_)),
            end_(std::move(other.end_)),
            reverse_(other.reverse_),
            limit_(other.limit_),
            returned_(other.returned_),
            started_(other.started_),
            done_(std::exchange(other.done_, true)),
            current_(std::move(other.current_)) {}

        RangeCursor& operator=(RangeCursor&&) = delete;

        // Moves to the next entry. Returns false once the range is exhausted.
        bool advance() {
            if(done_) {
                return false;
            }
            if(limit_ != 0 && returned_ >= limit_) {
                done_ = true;
                return false;
            }

            MDBX_val key, data;
            int rc;
            if(!started_) {
                started_ = true;
                rc = seekFirst(key, data);
            } else {
                rc = mdbx_cursor_get(cursor_, &key, &data, reverse_ ? MDBX_PREV : MDBX_NEXT);
            }

            if(rc == MDBX_NOTFOUND) {
                done_ = true;
                return false;
            }
            if(rc != MDBX_SUCCESS) {
                done_ = true;
                throw makeStoreError("MDBX cursor read failed", rc);
            }

            std::string_view k = fromMdbxVal(key);
            if(reverse_ ? k < std::string_view(begin_) : k >= std::string_view(end_)) {
                done_ = true;
                return false;
            }

            current_.key.assign(k.data(), k.size());
            current_.value.assign(static_cast<const char*>(data.iov_base), data.iov_len);
            returned_++;
            return true;
        }

        const KeyValue& current() const { return current_; }

    private:
        int seekFirst(MDBX_val& key, MDBX_val& data) {
            if(!reverse_) {
                if(begin_.empty()) {
                    return mdbx_cursor_get(cursor_, &key, &data, MDBX_FIRST);
                }
                key = toMdbxVal(begin_);
                return mdbx_cursor_get(cursor_, &key, &data, MDBX_SET_RANGE);
            }

            // Last key strictly below end
            key = toMdbxVal(end_);
            int rc = mdbx_cursor_get(cursor_, &key, &data, MDBX_SET_RANGE);
            if(rc == MDBX_SUCCESS) {
                return mdbx_cursor_get(cursor_, &key, &data, MDBX_PREV);
            }
            if(rc == MDBX_NOTFOUND) {
                return mdbx_cursor_get(cursor_, &key, &data, MDBX_LAST);
            }
            return rc;
        }

        MDBX_cursor* cursor_ = nullptr;
        Key begin_;
        Key end_;
        bool reverse_;
        size_t limit_;  // 0 means unlimited
        size_t returned_ = 0;
        bool started_ = false;
        bool done_ = false;
        KeyValue current_;
    };

    /**
     * RAII wrapper around an MDBX transaction on a single DBI. Aborts on
     * destruction unless committed. This is the whole store contract the
     * vector layer relies on.
     */
    class Transaction {
    public:
        Transaction(MDBX_env* env, MDBX_dbi dbi, bool read_only) :
            dbi_(dbi),
            read_only_(read_only) {
            int rc = mdbx_txn_begin(
                    env, nullptr, read_only ? MDBX_TXN_RDONLY : MDBX_TXN_READWRITE, &txn_);
            if(rc != MDBX_SUCCESS) {
                txn_ = nullptr;
                throw makeStoreError("Failed to begin transaction", rc);
            }
        }

        ~Transaction() {
            if(txn_) {
                mdbx_txn_abort(txn_);
            }
        }

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        Transaction(Transaction&& other) noexcept :
            txn_(std::exchange(other.txn_, nullptr)),
            dbi_(other.dbi_),
            read_only_(other.read_only_) {}

        Transaction& operator=(Transaction&&) = delete;

        void commit() {
            MDBX_txn* txn = std::exchange(txn_, nullptr);
            if(!txn) {
                throw StoreError("Transaction already finished", MDBX_BAD_TXN);
            }
            int rc = mdbx_txn_commit(txn);
            if(rc != MDBX_SUCCESS) {
                throw makeStoreError("Failed to commit transaction", rc);
            }
        }

        void abort() {
            if(txn_) {
                mdbx_txn_abort(std::exchange(txn_, nullptr));
            }
        }

        bool readOnly() const { return read_only_; }
        bool active() const { return txn_ != nullptr; }

        // Greatest key <= key, if any
        std::optional<Key> getKeyAtOrBefore(std::string_view key) {
            MDBX_cursor* cursor = openCursor();
            try {
                MDBX_val k = toMdbxVal(key);
                MDBX_val data;
                int rc = mdbx_cursor_get(cursor, &k, &data, MDBX_SET_RANGE);
                if(rc == MDBX_SUCCESS && fromMdbxVal(k) != key) {
                    rc = mdbx_cursor_get(cursor, &k, &data, MDBX_PREV);
                } else if(rc == MDBX_NOTFOUND) {
                    rc = mdbx_cursor_get(cursor, &k, &data, MDBX_LAST);
                }

                std::optional<Key> result;
                if(rc == MDBX_SUCCESS) {
                    result = Key(fromMdbxVal(k));
                } else if(rc != MDBX_NOTFOUND) {
                    throw makeStoreError("Failed to locate key", rc);
                }
                mdbx_cursor_close(cursor);
                return result;
            } catch(...) {
                mdbx_cursor_close(cursor);
                throw;
            }
        }

        std::optional<Bytes> get(std::string_view key) {
            MDBX_val k = toMdbxVal(key);
            MDBX_val data;
            int rc = mdbx_get(handle(), dbi_, &k, &data);
            if(rc == MDBX_NOTFOUND) {
                return std::nullopt;
            }
            if(rc != MDBX_SUCCESS) {
                throw makeStoreError("Failed to read key", rc);
            }
            return Bytes(fromMdbxVal(data));
        }

        void set(std::string_view key, std::string_view value) {
            MDBX_val k = toMdbxVal(key);
            MDBX_val data = toMdbxVal(value);
            int rc = mdbx_put(handle(), dbi_, &k, &data, MDBX_UPSERT);
            if(rc != MDBX_SUCCESS) {
                throw makeStoreError("Failed to write key", rc);
            }
        }

        void clear(std::string_view key) {
            MDBX_val k = toMdbxVal(key);
            int rc = mdbx_del(handle(), dbi_, &k, nullptr);
            if(rc != MDBX_SUCCESS && rc != MDBX_NOTFOUND) {
                throw makeStoreError("Failed to delete key", rc);
            }
        }

        // limit 0 means unlimited
        std::vector<KeyValue>
        getRange(const Key& begin, const Key& end, size_t limit = 0, bool reverse = false) {
            std::vector<KeyValue> result;
            RangeCursor range = cursor(begin, end, reverse, limit);
            while(range.advance()) {
                result.push_back(range.current());
            }
            return result;
        }

        void clearRange(const Key& begin, const Key& end) {
            if(begin >= end) {
                return;
            }
            MDBX_cursor* cursor = openCursor();
            size_t removed = 0;
            try {
                MDBX_val k = toMdbxVal(begin);
                MDBX_val data;
                int rc = mdbx_cursor_get(cursor, &k, &data, MDBX_SET_RANGE);
                while(rc == MDBX_SUCCESS && fromMdbxVal(k) < std::string_view(end)) {
                    rc = mdbx_cursor_del(cursor, MDBX_CURRENT);
                    if(rc != MDBX_SUCCESS) {
                        throw makeStoreError("Failed to delete range entry", rc);
                    }
                    removed++;
                    // After a delete the cursor already rests on the successor,
                    // which MDBX_NEXT returns without skipping it
                    rc = mdbx_cursor_get(cursor, &k, &data, MDBX_NEXT);
                }
                if(rc != MDBX_SUCCESS && rc != MDBX_NOTFOUND) {
                    throw makeStoreError("Failed to walk range", rc);
                }
                mdbx_cursor_close(cursor);
            } catch(...) {
                mdbx_cursor_close(cursor);
                throw;
            }
            LOG_DEBUG("Cleared " << removed << " keys");
        }

        RangeCursor cursor(Key begin, Key end, bool reverse = false, size_t limit = 0) {
            return RangeCursor(handle(), dbi_, std::move(begin), std::move(end), reverse, limit);
        }

    private:
        MDBX_txn* handle() const {
            if(!txn_) {
                throw StoreError("Transaction already finished", MDBX_BAD_TXN);
            }
            return txn_;
        }

        MDBX_cursor* openCursor() {
            MDBX_cursor* cursor = nullptr;
            int rc = mdbx_cursor_open(handle(), dbi_, &cursor);
            if(rc != MDBX_SUCCESS) {
                throw makeStoreError("MDBX cursor open failed", rc);
            }
            return cursor;
        }

        MDBX_txn* txn_ = nullptr;
        MDBX_dbi dbi_;
        bool read_only_;
    };

    struct StoreOptions {
        size_t map_size_bits = settings::STORE_MAP_SIZE_BITS;
        size_t map_size_max_bits = settings::STORE_MAP_SIZE_MAX_BITS;
        std::string dbi_name = settings::DEFAULT_DBI;
    };

    // Owns one MDBX environment and the named DBI all vectors live in
    class KVStore {
    private:
        MDBX_env* env_ = nullptr;
        MDBX_dbi dbi_ = 0;
        std::string path_;
        StoreOptions options_;

        void init_environment() {
            int rc = mdbx_env_create(&env_);
            if(rc != MDBX_SUCCESS) {
                env_ = nullptr;
                throw makeStoreError("Failed to create MDBX env", rc);
            }

            try {
                // Set geometry for auto-grow
                rc = mdbx_env_set_geometry(env_,
                                           -1,  // lower size bound (use default)
                                           1LL << options_.map_size_bits,      // current/now size
                                           1LL << options_.map_size_max_bits,  // upper size bound
                                           1LL << options_.map_size_bits,      // growth step
                                           -1,   // shrink threshold (use default)
                                           -1);  // pagesize (use default)
                if(rc != MDBX_SUCCESS) {
                    throw makeStoreError("Failed to set geometry", rc);
                }

                rc = mdbx_env_set_maxdbs(env_, settings::MAX_NR_SUBSPACE_DBS);
                if(rc != MDBX_SUCCESS) {
                    throw makeStoreError("Failed to set max dbs", rc);
                }

                rc = mdbx_env_open(env_, path_.c_str(), MDBX_NORDAHEAD, 0664);
                if(rc != MDBX_SUCCESS) {
                    throw makeStoreError("Failed to open environment at " + path_, rc);
                }

                MDBX_txn* txn;
                rc = mdbx_txn_begin(env_, nullptr, MDBX_TXN_READWRITE, &txn);
                if(rc != MDBX_SUCCESS) {
                    throw makeStoreError("Failed to begin transaction", rc);
                }

                rc = mdbx_dbi_open(txn, options_.dbi_name.c_str(), MDBX_CREATE, &dbi_);
                if(rc != MDBX_SUCCESS) {
                    mdbx_txn_abort(txn);
                    throw makeStoreError("Failed to open database " + options_.dbi_name, rc);
                }

                rc = mdbx_txn_commit(txn);
                if(rc != MDBX_SUCCESS) {
                    throw makeStoreError("Failed to commit transaction", rc);
                }
            } catch(...) {
                mdbx_env_close(env_);
                env_ = nullptr;
                throw;
            }
        }

    public:
        explicit KVStore(const std::string& path, StoreOptions options = StoreOptions()) :
            path_(path),
            options_(std::move(options)) {
            std::filesystem::create_directories(path);
            init_environment();
            LOG_INFO("Opened store at " << path_ << " (dbi " << options_.dbi_name << ")");
        }

        ~KVStore() {
            if(env_) {
                mdbx_dbi_close(env_, dbi_);
                mdbx_env_close(env_);
            }
        }

        KVStore(const KVStore&) = delete;
        KVStore& operator=(const KVStore&) = delete;

        Transaction begin(bool read_only = false) { return Transaction(env_, dbi_, read_only); }

        /**
         * Runs fn in a read-write transaction and commits it. Any exception
         * aborts the transaction and propagates. Transient store errors rerun
         * fn in a fresh transaction, so fn must not have side effects outside
         * of it.
         */
        template <typename Fn>
        auto transact(Fn&& fn) -> decltype(fn(std::declval<Transaction&>())) {
            using Result = decltype(fn(std::declval<Transaction&>()));
            for(size_t attempt = 0;; ++attempt) {
                try {
                    Transaction tx = begin(false);
                    if constexpr(std::is_void_v<Result>) {
                        fn(tx);
                        tx.commit();
                        return;
                    } else {
                        Result result = fn(tx);
                        tx.commit();
                        return result;
                    }
                } catch(const StoreError& e) {
                    if(!isRetryableStoreError(e.code())
                       || attempt >= settings::TRANSACT_MAX_RETRIES) {
                        throw;
                    }
                    LOG_WARN("Retrying transaction (attempt " << attempt + 1
                                                             << "): " << e.what());
                }
            }
        }

        // Runs fn against a read-only snapshot
        template <typename Fn>
        auto read(Fn&& fn) -> decltype(fn(std::declval<Transaction&>())) {
            Transaction tx = begin(true);
            return fn(tx);
        }

        const std::string& path() const { return path_; }
        MDBX_env* get_env() const { return env_; }
        MDBX_dbi get_dbi() const { return dbi_; }
    };

}  //namespace svec
