#include "iec62056_21/tcp_transport.hpp"

namespace iec62056_21
{

    TcpTransport::TcpTransport(const std::string &host, uint16_t port,
                               std::chrono::milliseconds timeout,
                               rclcpp::Logger logger)
        : AsioTransport(timeout, logger),
          socket_(io_context_),
          host_(host),
          port_(port)
    {
    }

    TcpTransport::~TcpTransport()
    {
        disconnect();
    }

    void TcpTransport::connect()
    {
        RCLCPP_DEBUG(logger_, "Connecting to %s:%u", host_.c_str(), port_);

        try
        {
            boost::asio::ip::tcp::resolver resolver(io_context_);
            auto endpoints = resolver.resolve(host_, std::to_string(port_));
            boost::asio::connect(socket_, endpoints);
        }
        catch (const boost::system::system_error &e)
        {
            throw TransportError("Failed to connect to " + host_ + ":" + std::to_string(port_) +
                                 ": " + e.what());
        }

        RCLCPP_INFO(logger_, "Connected to %s:%u", host_.c_str(), port_);
    }

    void TcpTransport::disconnect()
    {
        if (socket_.is_open())
        {
            boost::system::error_code ignored;
            socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
            socket_.close(ignored);
        }
    }

    bool TcpTransport::is_connected() const
    {
        return socket_.is_open();
    }

    void TcpTransport::send(const std::vector<uint8_t> &data)
    {
        write_to(socket_, data);
    }

    std::vector<uint8_t> TcpTransport::recv(std::size_t n)
    {
        return read_from(socket_, n);
    }

} // namespace iec62056_21
