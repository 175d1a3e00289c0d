#pragma once
/**
 * @file submission.hpp
 * @brief Client side of task submission: push tasks, then collect results by count.
 *
 * submit_tasks() binds a private reply endpoint first, stamps its address into every
 * task's Monitor as `backurl`, pushes all tasks into the inbound endpoint and returns
 * a Submission whose expected() count is known immediately. The caller may submit the
 * next batch before draining this one.
 *
 * Results arrive in completion order, not dispatch order. A Submission yields exactly
 * expected() results and then ends; iteration is single-pass. If a worker dies
 * mid-task, next() blocks forever: there is no timeout in the protocol.
 *
 * A reply endpoint belongs to one Submission. Two concurrent submissions must not share
 * one, since results are matched by count only.
 *
 * @code
 *   auto sub = submit_tasks("builtin.add", {json::array({1, 2}), json::array({3, 4})},
 *                           {cfg.task_in_url, cfg.receiver_url});
 *   for (const TaskResult &r : sub) { ... }
 * @endcode
 */
#include "zworkers_pool_export.h"

#include "pool/task.hpp"

#include <zmq.hpp>

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace zworkers::pool
{

/// One task's arguments plus its (caller-owned, fresh) Monitor.
struct TaskArgs
{
    nlohmann::json args = nlohmann::json::array();
    Monitor monitor;
};

/// Lazily produces argument tuples; returns std::nullopt when exhausted.
using ArgsSource = std::function<std::optional<TaskArgs>()>;

struct SubmitOptions
{
    std::string task_in_url;  ///< where tasks are pushed (the streamer's inbound endpoint)
    std::string receiver_url; ///< reply endpoint hint; a port range picks a free port
};

class ZWORKERS_POOL_EXPORT Submission
{
  public:
    class iterator
    {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = TaskResult;
        using difference_type = std::ptrdiff_t;
        using pointer = const TaskResult *;
        using reference = const TaskResult &;

        iterator() = default;
        reference operator*() const { return *m_current; }
        pointer operator->() const { return &*m_current; }
        iterator &operator++()
        {
            advance();
            return *this;
        }
        void operator++(int) { advance(); }
        bool operator==(const iterator &other) const noexcept
        {
            return m_current.has_value() == other.m_current.has_value();
        }

      private:
        friend class Submission;
        explicit iterator(Submission *owner) : m_owner(owner) { advance(); }
        void advance() { m_current = m_owner->next(); }

        Submission *m_owner = nullptr;
        std::optional<TaskResult> m_current;
    };

    /// Takes over sockets prepared by submit_tasks(); @p expected tasks were already sent.
    Submission(zmq::socket_t receiver, zmq::socket_t sender, std::string backurl,
               size_t expected);
    ~Submission() = default;
    Submission(Submission &&) noexcept = default;
    Submission &operator=(Submission &&) noexcept = default;
    Submission(const Submission &) = delete;
    Submission &operator=(const Submission &) = delete;

    /// Number of tasks sent; the number of results this submission yields.
    [[nodiscard]] size_t expected() const noexcept { return m_expected; }
    [[nodiscard]] size_t received() const noexcept { return m_received; }
    /// The reply endpoint stamped into every Monitor.
    [[nodiscard]] const std::string &backurl() const noexcept { return m_backurl; }

    /**
     * @brief Blocks for the next result.
     * @return std::nullopt once expected() results have been returned.
     * @details An undecodable reply still counts toward expected() and is surfaced as a
     *          TaskFailure of kind Unknown.
     */
    std::optional<TaskResult> next();

    /// Single pass: a second begin() continues where the first left off.
    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    /// Drains every remaining result.
    std::vector<TaskResult> collect();

  private:
    zmq::socket_t m_receiver;
    zmq::socket_t m_sender;
    std::string m_backurl;
    size_t m_expected = 0;
    size_t m_received = 0;
};

/**
 * @brief Binds the reply endpoint, then sends one task per item of @p source.
 * @details Each Monitor gets `backurl` and `task_no` set before sending; an empty
 *          `operation` defaults to @p callable_id.
 * @throws std::invalid_argument / std::runtime_error / zmq::error_t if the reply endpoint
 *         cannot be bound or the inbound endpoint cannot be connected.
 */
ZWORKERS_POOL_EXPORT Submission submit_tasks(const std::string &callable_id,
                                             const ArgsSource &source, const SubmitOptions &opts,
                                             zmq::context_t &ctx);

ZWORKERS_POOL_EXPORT Submission submit_tasks(const std::string &callable_id,
                                             const ArgsSource &source, const SubmitOptions &opts);

/**
 * @brief Convenience overload: each element of @p args_list is one task's argument
 *        array and gets a fresh Monitor. Uses the shared ZMQContext module.
 */
ZWORKERS_POOL_EXPORT Submission submit_tasks(const std::string &callable_id,
                                             const std::vector<nlohmann::json> &args_list,
                                             const SubmitOptions &opts);

} // namespace zworkers::pool
