/**
 * Store contract on top of MDBX: point ops, ranges, last-key lookup and
 * transaction boundaries.
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "test_utils.h"

namespace svec {
namespace test {

class KVStoreTest : public StoreTestBase {
protected:
    void Fill(const std::vector<std::string>& keys) {
        store_->transact([&](Transaction& tr) {
            for(const auto& k : keys) {
                tr.set(k, "v" + k);
            }
        });
    }

    static std::string PaddedKey(int i) {
        std::string digits = std::to_string(i);
        return "k" + std::string(3 - digits.size(), '0') + digits;
    }
};

TEST_F(KVStoreTest, SetGetClear) {
    store_->transact([](Transaction& tr) {
        EXPECT_FALSE(tr.get("k").has_value());
        tr.set("k", "v");
        ASSERT_TRUE(tr.get("k").has_value());
        EXPECT_EQ(*tr.get("k"), "v");
        tr.clear("k");
        EXPECT_FALSE(tr.get("k").has_value());
        // Clearing a missing key is not an error
        tr.clear("missing");
    });
}

TEST_F(KVStoreTest, CommittedWritesAreVisibleToLaterTransactions) {
    store_->transact([](Transaction& tr) { tr.set("a", "1"); });
    auto value = store_->read([](Transaction& tr) { return tr.get("a"); });
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "1");
}

TEST_F(KVStoreTest, ExceptionAbortsTransaction) {
    EXPECT_THROW(store_->transact([](Transaction& tr) {
        tr.set("a", "1");
        throw std::runtime_error("boom");
    }),
                 std::runtime_error);
    auto value = store_->read([](Transaction& tr) { return tr.get("a"); });
    EXPECT_FALSE(value.has_value());
}

TEST_F(KVStoreTest, UncommittedTransactionIsDiscarded) {
    {
        Transaction tx = store_->begin();
        tx.set("a", "1");
    }
    auto value = store_->read([](Transaction& tr) { return tr.get("a"); });
    EXPECT_FALSE(value.has_value());
}

TEST_F(KVStoreTest, ReadOnlyTransactionRejectsWrites) {
    Transaction tx = store_->begin(true);
    EXPECT_TRUE(tx.readOnly());
    EXPECT_THROW(tx.set("a", "1"), StoreError);
}

TEST_F(KVStoreTest, FinishedTransactionRejectsUse) {
    Transaction tx = store_->begin();
    tx.commit();
    EXPECT_FALSE(tx.active());
    EXPECT_THROW(tx.get("a"), StoreError);
    EXPECT_THROW(tx.commit(), StoreError);
}

TEST_F(KVStoreTest, KeyAtOrBefore) {
    Fill({"b", "d", "f"});
    store_->read([](Transaction& tr) {
        EXPECT_FALSE(tr.getKeyAtOrBefore("a").has_value());
        EXPECT_EQ(tr.getKeyAtOrBefore("b").value(), "b");
        EXPECT_EQ(tr.getKeyAtOrBefore("c").value(), "b");
        EXPECT_EQ(tr.getKeyAtOrBefore("d").value(), "d");
        EXPECT_EQ(tr.getKeyAtOrBefore("z").value(), "f");
    });
}

TEST_F(KVStoreTest, KeyAtOrBeforeOnEmptyStore) {
    store_->read([](Transaction& tr) { EXPECT_FALSE(tr.getKeyAtOrBefore("z").has_value()); });
}

TEST_F(KVStoreTest, ForwardRangeRespectsBoundsAndLimit) {
    Fill({"a", "b", "c", "d", "e"});
    store_->read([](Transaction& tr) {
        auto all = tr.getRange("b", "e");
        ASSERT_EQ(all.size(), 3u);
        EXPECT_EQ(all[0].key, "b");
        EXPECT_EQ(all[0].value, "vb");
        EXPECT_EQ(all[2].key, "d");

        auto two = tr.getRange("a", "z", 2);
        ASSERT_EQ(two.size(), 2u);
        EXPECT_EQ(two[1].key, "b");

        EXPECT_TRUE(tr.getRange("x", "z").empty());
        EXPECT_TRUE(tr.getRange("d", "b").empty());
    });
}

TEST_F(KVStoreTest, ReverseRangeStartsBelowEnd) {
    Fill({"a", "b", "c", "d", "e"});
    store_->read([](Transaction& tr) {
        auto rev = tr.getRange("b", "d", 0, true);
        ASSERT_EQ(rev.size(), 2u);
        EXPECT_EQ(rev[0].key, "c");
        EXPECT_EQ(rev[1].key, "b");

        // End beyond the last key
        auto last_two = tr.getRange("a", "z", 2, true);
        ASSERT_EQ(last_two.size(), 2u);
        EXPECT_EQ(last_two[0].key, "e");
        EXPECT_EQ(last_two[1].key, "d");

        EXPECT_TRUE(tr.getRange("0", "a", 0, true).empty());
    });
}

TEST_F(KVStoreTest, ClearRangeLeavesNeighbours) {
    Fill({"a", "b", "c", "d", "e"});
    store_->transact([](Transaction& tr) { tr.clearRange("b", "e"); });
    store_->read([](Transaction& tr) {
        auto rest = tr.getRange("", "z");
        ASSERT_EQ(rest.size(), 2u);
        EXPECT_EQ(rest[0].key, "a");
        EXPECT_EQ(rest[1].key, "e");
    });
}

TEST_F(KVStoreTest, ClearRangeRemovesLongContiguousRun) {
    std::vector<std::string> keys = {"a", "z"};
    for(int i = 0; i < 500; ++i) {
        keys.push_back(PaddedKey(i));
    }
    Fill(keys);

    // Ends inside the run
    store_->transact([&](Transaction& tr) { tr.clearRange(PaddedKey(100), PaddedKey(200)); });
    store_->read([&](Transaction& tr) {
        EXPECT_EQ(tr.getRange("", "zz").size(), 402u);
        EXPECT_TRUE(tr.get(PaddedKey(99)).has_value());
        EXPECT_FALSE(tr.get(PaddedKey(100)).has_value());
        EXPECT_FALSE(tr.get(PaddedKey(199)).has_value());
        EXPECT_TRUE(tr.get(PaddedKey(200)).has_value());
    });

    store_->transact([](Transaction& tr) { tr.clearRange("k", "l"); });
    store_->read([](Transaction& tr) {
        auto rest = tr.getRange("", "zz");
        ASSERT_EQ(rest.size(), 2u);
        EXPECT_EQ(rest[0].key, "a");
        EXPECT_EQ(rest[1].key, "z");
    });
}

TEST_F(KVStoreTest, ClearRangeThroughLastKey) {
    Fill({"a", "b", "c"});
    store_->transact([](Transaction& tr) { tr.clearRange("b", "zz"); });
    store_->read([](Transaction& tr) {
        auto rest = tr.getRange("", "zz");
        ASSERT_EQ(rest.size(), 1u);
        EXPECT_EQ(rest[0].key, "a");
    });
}

TEST_F(KVStoreTest, CursorStepsOneEntryPerAdvance) {
    Fill({"a", "b", "c"});
    Transaction tx = store_->begin(true);
    RangeCursor cursor = tx.cursor("a", "c");
    ASSERT_TRUE(cursor.advance());
    EXPECT_EQ(cursor.current().key, "a");
    EXPECT_EQ(cursor.current().value, "va");
    ASSERT_TRUE(cursor.advance());
    EXPECT_EQ(cursor.current().key, "b");
    EXPECT_FALSE(cursor.advance());
    // Stays exhausted
    EXPECT_FALSE(cursor.advance());
}

TEST_F(KVStoreTest, DataSurvivesReopen) {
    store_->transact([](Transaction& tr) { tr.set("persist", "yes"); });
    store_.reset();
    store_ = std::make_unique<KVStore>(test_path_);
    auto value = store_->read([](Transaction& tr) { return tr.get("persist"); });
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "yes");
}

}  // namespace test
}  // namespace svec
