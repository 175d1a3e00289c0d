/**
 * @file main.cpp
 * @brief zworkers-workerpool: pool supervisor and worker process with the built-in tasks.
 *
 *   zworkers-workerpool <ctrl_url> <task_out_url> <num_workers|-1>
 *   zworkers-workerpool --worker <task_out_url>
 *
 * Applications with their own callables build a binary like this one around their own
 * TaskRegistry and point WorkerMaster's local/remote program at it.
 */
#include "zw_pool.hpp"

int main(int argc, char **argv)
{
    zworkers::pool::TaskRegistry registry;
    zworkers::pool::register_builtin_tasks(registry);
    return zworkers::pool::workerpool_main(argc, argv, registry);
}
