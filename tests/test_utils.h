/**
 * Shared fixtures for store-backed tests.
 */

#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <random>
#include <string>

#include "storage/kv_store.hpp"

namespace fs = std::filesystem;

namespace svec {
namespace test {

/**
 * @brief Opens a fresh MDBX environment in a scratch directory per test
 */
class StoreTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        test_path_ = (fs::temp_directory_path()
                      / ("svec_test_"
                         + std::to_string(std::chrono::steady_clock::now()
                                                  .time_since_epoch()
                                                  .count())
                         + "_" + std::to_string(rd())))
                             .string();
        store_ = std::make_unique<KVStore>(test_path_);
    }

    void TearDown() override {
        store_.reset();
        if(!test_path_.empty() && fs::exists(test_path_)) {
            fs::remove_all(test_path_);
        }
    }

    std::string test_path_;
    std::unique_ptr<KVStore> store_;
};

}  // namespace test
}  // namespace svec
