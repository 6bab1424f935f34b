/**
 * @file test_platform_core.cpp
 * @brief Layer 0 tests for process identity and version APIs.
 */
#include "lgs_platform.hpp"

#include <filesystem>
#include <regex>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_entrypoint.h"

#if LOGSPRAY_IS_POSIX
#include <unistd.h>
#endif

namespace fs = std::filesystem;
using namespace logspray::platform;

TEST(PlatformCoreTest, GetPID_ReturnsValidID)
{
    EXPECT_GT(get_pid(), 0u);
    EXPECT_EQ(get_pid(), get_pid());
#if LOGSPRAY_IS_POSIX
    EXPECT_EQ(get_pid(), static_cast<uint64_t>(::getpid()));
#endif
}

TEST(PlatformCoreTest, ExecutablePath_IsThisTestBinary)
{
    const fs::path path = executable_path();

    EXPECT_TRUE(path.is_absolute()) << path;
    ASSERT_TRUE(fs::exists(path)) << path;
    EXPECT_TRUE(fs::equivalent(path, fs::path(g_self_exe_path)))
        << path << " vs argv[0] " << g_self_exe_path;
#if defined(LOGSPRAY_PLATFORM_WIN64)
    EXPECT_EQ(path.filename().string(), "test_layer0_platform.exe");
#else
    EXPECT_EQ(path.filename().string(), "test_layer0_platform");
#endif
}

TEST(PlatformCoreTest, VersionString_IsDottedTriple)
{
    const std::string version = version_string();
    EXPECT_TRUE(std::regex_match(version, std::regex(R"(\d+\.\d+\.\d+)"))) << version;
}
