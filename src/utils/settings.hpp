#pragma once

#include <cstdlib>
#include <string>
#include <sstream>
#include <cstdint>

namespace settings {
    // === Compile-time constants ===
    // For strings we use inline const and not constexpr. Some compilers
    // do not support constexpr for std::string
    inline const std::string NAME = "sparsevec";
    inline const std::string VERSION = "0.3.0";

    // MDBX map sizes. Growth step and initial size are the same.
    constexpr size_t STORE_MAP_SIZE_BITS = 24;      // 16 MiB
    constexpr size_t STORE_MAP_SIZE_MAX_BITS = 36;  // 64 GiB
    constexpr size_t MAX_NR_SUBSPACE_DBS = 8;
    inline const std::string DEFAULT_DBI = "vectors";

    // Top level path component for vectors created through the server
    inline const std::string VECTORS_DIRECTORY = "vectors";

    //DEFAULT VALUES
    constexpr bool DEFAULT_ENABLE_DEBUG_LOG = false;
    constexpr size_t DEFAULT_SERVER_PORT = 8090;
    constexpr size_t DEFAULT_NUM_SERVER_THREADS = 0;
    const std::string DEFAULT_DATA_DIR = "/var/lib/sparsevec";
    const std::string DEFAULT_VECTOR_VALUE = "";
    constexpr size_t DEFAULT_MAX_RANGE_ITEMS = 10'000;
    constexpr size_t DEFAULT_TRANSACT_MAX_RETRIES = 5;

    // === Runtime-configurable settings ===
    inline static std::string DATA_DIR = [] {
        const char* env = std::getenv("SVEC_DATA_DIR");
        return env ? std::string(env) : DEFAULT_DATA_DIR;
    }();
    inline static size_t SERVER_PORT = [] {
        const char* env = std::getenv("SVEC_SERVER_PORT");
        return env ? std::stoull(env) : DEFAULT_SERVER_PORT;
    }();
    // Number of threads for http server - 0 means it will default to hardware concurrency
    inline static size_t NUM_SERVER_THREADS = [] {
        const char* env = std::getenv("SVEC_NUM_SERVER_THREADS");
        return env ? std::stoull(env) : DEFAULT_NUM_SERVER_THREADS;
    }();

    // Text value vectors served over http fall back to for unset indices
    inline static std::string DEFAULT_VALUE = [] {
        const char* env = std::getenv("SVEC_DEFAULT_VALUE");
        return env ? std::string(env) : DEFAULT_VECTOR_VALUE;
    }();

    // Upper bound on entries returned by one range request
    inline static size_t MAX_RANGE_ITEMS = [] {
        const char* env = std::getenv("SVEC_MAX_RANGE_ITEMS");
        return env ? std::stoull(env) : DEFAULT_MAX_RANGE_ITEMS;
    }();

    inline static size_t TRANSACT_MAX_RETRIES = [] {
        const char* env = std::getenv("SVEC_TRANSACT_MAX_RETRIES");
        return env ? std::stoull(env) : DEFAULT_TRANSACT_MAX_RETRIES;
    }();

    inline static bool ENABLE_DEBUG_LOG = [] {
        const char* env = std::getenv("SVEC_DEBUG_LOG");
        return env ? (std::string(env) == "1" || std::string(env) == "true")
                   : DEFAULT_ENABLE_DEBUG_LOG;
    }();

    // Function to get all settings values as a multiline string
    inline std::string getAllSettingsAsString() {
        std::ostringstream oss;
        oss << "\n=== " << NAME << " ===\n";
        oss << "VERSION: " << VERSION << "\n";
        oss << "DATA_DIR: " << DATA_DIR << "\n";
        oss << "SERVER_PORT: " << SERVER_PORT << "\n";
        oss << "NUM_SERVER_THREADS: " << NUM_SERVER_THREADS << "\n";
        oss << "DEFAULT_VALUE: \"" << DEFAULT_VALUE << "\"\n";
        oss << "MAX_RANGE_ITEMS: " << MAX_RANGE_ITEMS << "\n";
        oss << "TRANSACT_MAX_RETRIES: " << TRANSACT_MAX_RETRIES << "\n";
        oss << "ENABLE_DEBUG_LOG: " << (ENABLE_DEBUG_LOG ? "true" : "false") << "\n";
        oss << "\n=== End Settings ===\n";
        return oss.str();
    }

}  //namespace settings
