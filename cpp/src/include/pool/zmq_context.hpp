#pragma once
/**
 * @file zmq_context.hpp
 * @brief Shared ZeroMQ context as a named static lifecycle module.
 *
 * Provides a single `zmq::context_t` instance owned by the lifecycle manager.
 * Sockets used by Worker, WorkerPool, WorkerMaster and task submission are created
 * from this context. The Streamer owns a private context instead (see streamer.hpp).
 *
 * Usage:
 *   Include GetZMQContextModule() in your LifecycleGuard, after the Logger module.
 *   Then call get_zmq_context() to obtain the shared context.
 */
#include "zworkers_pool_export.h"

#include <zmq.hpp>

#include "utils/module_def.hpp"

namespace zworkers::pool
{

/**
 * @brief Returns the global ZeroMQ context.
 * @pre The "ZMQContext" module has been started. Calling this earlier is fatal.
 */
[[nodiscard]] ZWORKERS_POOL_EXPORT zmq::context_t &get_zmq_context();

/**
 * @brief Creates the global ZeroMQ context. Idempotent.
 */
ZWORKERS_POOL_EXPORT void zmq_context_startup();

/**
 * @brief Destroys the global ZeroMQ context. Idempotent.
 * @details Blocks until every socket created from it has been closed (ZMQ_LINGER
 *          on those sockets bounds the wait).
 */
ZWORKERS_POOL_EXPORT void zmq_context_shutdown();

/**
 * @brief ModuleDef "ZMQContext", depending on "zworkers::utils::Logger".
 */
ZWORKERS_POOL_EXPORT zworkers::utils::ModuleDef GetZMQContextModule();

} // namespace zworkers::pool
