/**
 * Log sink and scoped timing.
 */

#include <gtest/gtest.h>

#include <string>

#include "utils/log.hpp"
#include "utils/settings.hpp"

namespace svec {
namespace test {

class LogTest : public ::testing::Test {
protected:
    void SetUp() override { saved_debug_ = settings::ENABLE_DEBUG_LOG; }
    void TearDown() override { settings::ENABLE_DEBUG_LOG = saved_debug_; }

    bool saved_debug_ = false;
};

TEST_F(LogTest, InfoCarriesLevelAndMessage) {
    ::testing::internal::CaptureStderr();
    LOG_INFO("opened " << 3 << " vectors");
    std::string out = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(out.find("[INFO]"), std::string::npos);
    EXPECT_NE(out.find("opened 3 vectors"), std::string::npos);
}

TEST_F(LogTest, DebugIsGatedBySetting) {
    settings::ENABLE_DEBUG_LOG = false;
    ::testing::internal::CaptureStderr();
    LOG_DEBUG("hidden");
    EXPECT_EQ(::testing::internal::GetCapturedStderr(), "");

    settings::ENABLE_DEBUG_LOG = true;
    ::testing::internal::CaptureStderr();
    LOG_DEBUG("shown");
    std::string out = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(out.find("[DEBUG]"), std::string::npos);
    EXPECT_NE(out.find("shown"), std::string::npos);
}

TEST_F(LogTest, ScopedTimerReportsOnScopeExit) {
    settings::ENABLE_DEBUG_LOG = true;
    ::testing::internal::CaptureStderr();
    EXPECT_NO_THROW({ LOG_TIME("range"); });
    std::string out = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(out.find("range took"), std::string::npos);
}

TEST_F(LogTest, ScopedTimerSilentWithoutDebug) {
    settings::ENABLE_DEBUG_LOG = false;
    ::testing::internal::CaptureStderr();
    {
        LOG_TIME("quiet");
    }
    EXPECT_EQ(::testing::internal::GetCapturedStderr(), "");
}

}  // namespace test
}  // namespace svec
