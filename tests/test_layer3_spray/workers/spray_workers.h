#pragma once

namespace logspray::tests::worker::fanout
{

/// Runs a FanOutRunner over this test binary and checks the returned summary.
int run_workers(int worker_count, int lines_per_worker, int line_length);

/// Runs a FanOutRunner whose worker binary does not exist.
int unlaunchable_workers(int worker_count);

/// Runs a FanOutRunner in which exactly one worker is killed by SIGKILL.
int one_worker_crashes(int worker_count, int lines_per_worker);

} // namespace logspray::tests::worker::fanout
