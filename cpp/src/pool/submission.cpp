#include "pool/submission.hpp"
#include "pool/endpoint.hpp"
#include "pool/zmq_context.hpp"
#include "zw_service.hpp"

#include <stdexcept>

#include <cerrno>

namespace zworkers::pool
{

Submission::Submission(zmq::socket_t receiver, zmq::socket_t sender, std::string backurl,
                       size_t expected)
    : m_receiver(std::move(receiver)), m_sender(std::move(sender)), m_backurl(std::move(backurl)),
      m_expected(expected)
{
}

std::optional<TaskResult> Submission::next()
{
    if (m_received >= m_expected)
    {
        return std::nullopt;
    }

    zmq::message_t msg;
    for (;;)
    {
        try
        {
            if (m_receiver.recv(msg, zmq::recv_flags::none))
            {
                break;
            }
        }
        catch (const zmq::error_t &e)
        {
            if (e.num() != EINTR)
            {
                throw;
            }
        }
    }
    ++m_received;

    try
    {
        return decode_result(msg.data(), msg.size());
    }
    catch (const WireError &e)
    {
        LOGGER_ERROR("Submission: undecodable result on {}: {}", m_backurl, e.what());
        TaskFailure f;
        f.kind = TaskFailureKind::Unknown;
        f.type_name = "zworkers::pool::WireError";
        f.message = e.what();
        TaskResult r;
        r.outcome = std::move(f);
        return r;
    }
}

std::vector<TaskResult> Submission::collect()
{
    std::vector<TaskResult> out;
    out.reserve(m_expected - m_received);
    while (auto r = next())
    {
        out.push_back(std::move(*r));
    }
    return out;
}

Submission submit_tasks(const std::string &callable_id, const ArgsSource &source,
                        const SubmitOptions &opts, zmq::context_t &ctx)
{
    zmq::socket_t receiver(ctx, zmq::socket_type::pull);
    receiver.set(zmq::sockopt::linger, 0);
    const std::string backurl = bind_endpoint(receiver, opts.receiver_url);

    // The sender stays open inside the Submission until it is destroyed, so queued tasks
    // are flushed while results are collected; linger 0 keeps an abandoned run from
    // blocking context shutdown.
    zmq::socket_t sender(ctx, zmq::socket_type::push);
    sender.set(zmq::sockopt::linger, 0);
    sender.connect(opts.task_in_url);

    size_t n = 0;
    while (auto item = source())
    {
        Task task;
        task.callable_id = callable_id;
        task.args = std::move(item->args);
        task.monitor = std::move(item->monitor);
        task.monitor.backurl = backurl;
        task.monitor.task_no = static_cast<int64_t>(n);
        if (task.monitor.operation.empty())
        {
            task.monitor.operation = callable_id;
        }
        const auto frame = encode_task(task);
        if (!sender.send(zmq::buffer(frame), zmq::send_flags::none))
        {
            throw std::runtime_error(fmt::format("Submission: send of task {} to {} would block",
                                                 n, opts.task_in_url));
        }
        ++n;
    }
    LOGGER_DEBUG("Submission: sent {} '{}' task(s) to {}, replies on {}", n, callable_id,
                 opts.task_in_url, backurl);
    return Submission(std::move(receiver), std::move(sender), backurl, n);
}

Submission submit_tasks(const std::string &callable_id, const ArgsSource &source,
                        const SubmitOptions &opts)
{
    return submit_tasks(callable_id, source, opts, get_zmq_context());
}

Submission submit_tasks(const std::string &callable_id,
                        const std::vector<nlohmann::json> &args_list, const SubmitOptions &opts)
{
    size_t i = 0;
    ArgsSource source = [&]() -> std::optional<TaskArgs>
    {
        if (i >= args_list.size())
        {
            return std::nullopt;
        }
        return TaskArgs{args_list[i++], Monitor{}};
    };
    return submit_tasks(callable_id, source, opts, get_zmq_context());
}

} // namespace zworkers::pool
