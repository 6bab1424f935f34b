#pragma once

namespace logspray::tests::worker::lifecycle
{

int start_in_order_stop_in_reverse();
int second_guard_is_inert();
int module_without_callbacks();
int unnamed_module_aborts();
int duplicate_module_aborts();
int startup_exception_aborts();
int shutdown_exception_reported();

} // namespace logspray::tests::worker::lifecycle
