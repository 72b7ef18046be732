#include "iec62056_21/asio_transport.hpp"

namespace iec62056_21
{

    void AsioTransport::run_with_timeout(const std::function<void()> &cancel)
    {
        io_context_.restart();
        io_context_.run_for(timeout_);

        if (!io_context_.stopped())
        {
            // Operation still pending: abort it and let its handler run
            cancel();
            io_context_.run();
        }
    }

} // namespace iec62056_21
