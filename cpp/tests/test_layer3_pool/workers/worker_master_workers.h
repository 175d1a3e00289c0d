#pragma once

namespace zworkers::tests::worker::worker_master
{

int start_status_stop_cycle();
int kill_stops_a_running_pool();
int localhost_by_name_starts_and_stops();

} // namespace zworkers::tests::worker::worker_master
