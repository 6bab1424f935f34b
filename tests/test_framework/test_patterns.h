#pragma once
/**
 * @file test_patterns.h
 * @brief Base fixtures for the two kinds of logspray tests.
 *
 * The Logger and the lifecycle are process-wide, and a stopped Logger cannot be
 * started again. The test `main()` therefore starts nothing, and tests pick one
 * of two fixtures:
 *
 * **PureApiTest** runs in the test process and must not start a lifecycle.
 * For line generation, argument parsing and formatting.
 *
 * **IsolatedProcessTest** re-executes the test binary for a named worker
 * scenario. The scenario owns its `LifecycleGuard`; the test asserts on the
 * exit code and the captured output.
 *
 *   TEST_F(LoggerTest, LevelFiltering) {
 *       auto w = SpawnWorker("logger.level_filtering");
 *       ExpectWorkerOk(*w);
 *   }
 */
#include "test_entrypoint.h"
#include "test_process_utils.h"

#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace logspray::tests
{

class PureApiTest : public ::testing::Test
{
};

class IsolatedProcessTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        ASSERT_FALSE(g_self_exe_path.empty()) << "the test main() did not record argv[0]";
    }

    /// Runs this test binary as `<exe> scenario args...`.
    std::unique_ptr<helper::ChildProcess> SpawnWorker(const std::string &scenario,
                                                      std::vector<std::string> args = {})
    {
        args.insert(args.begin(), scenario);
        return std::make_unique<helper::ChildProcess>(g_self_exe_path, args);
    }

    void ExpectWorkerOk(helper::ChildProcess &proc,
                        const std::vector<std::string> &expected_stderr_substrings = {})
    {
        helper::expect_worker_ok(proc, expected_stderr_substrings);
    }
};

} // namespace logspray::tests
