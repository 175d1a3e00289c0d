#pragma once
/**
 * @file zw_pool.hpp
 * @brief Layer 3: distributed worker pools over ZeroMQ.
 *
 * Pulls in the service layer (lifecycle, logger) and every pool component: the shared
 * ZeroMQ context module, endpoints, the task wire format and registry, the streamer,
 * task submission, workers, the per-host pool supervisor, the master and configuration.
 */
#include "zw_service.hpp"

#include "pool/endpoint.hpp"
#include "pool/master_cli.hpp"
#include "pool/pool_config.hpp"
#include "pool/process_spawn.hpp"
#include "pool/result.hpp"
#include "pool/streamer.hpp"
#include "pool/submission.hpp"
#include "pool/task.hpp"
#include "pool/task_registry.hpp"
#include "pool/worker.hpp"
#include "pool/worker_master.hpp"
#include "pool/worker_pool.hpp"
#include "pool/zmq_context.hpp"
