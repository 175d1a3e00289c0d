#include "pool/zmq_context.hpp"
#include "zw_service.hpp"

namespace zworkers::pool
{

namespace
{
constexpr std::chrono::milliseconds kZMQContextShutdownTimeoutMs{2000};
zmq::context_t *g_context = nullptr;

void do_zmq_context_startup(const char * /*arg*/)
{
    zmq_context_startup();
}

void do_zmq_context_shutdown(const char * /*arg*/)
{
    zmq_context_shutdown();
}
} // namespace

zmq::context_t &get_zmq_context()
{
    if (g_context == nullptr)
    {
        ZW_PANIC("get_zmq_context() called before the ZMQContext module was started.");
    }
    return *g_context;
}

void zmq_context_startup()
{
    if (g_context == nullptr)
    {
        g_context = new zmq::context_t(1);
        LOGGER_INFO("ZMQContext: ZeroMQ context created.");
    }
}

void zmq_context_shutdown()
{
    if (g_context == nullptr)
    {
        return;
    }
    delete g_context;
    g_context = nullptr;
    LOGGER_INFO("ZMQContext: ZeroMQ context destroyed.");
}

zworkers::utils::ModuleDef GetZMQContextModule()
{
    zworkers::utils::ModuleDef module("ZMQContext");
    module.add_dependency("zworkers::utils::Logger");
    module.set_startup(&do_zmq_context_startup);
    module.set_shutdown(&do_zmq_context_shutdown, kZMQContextShutdownTimeoutMs);
    return module;
}

} // namespace zworkers::pool
