#ifndef IEC62056_21_ASIO_TRANSPORT_HPP
#define IEC62056_21_ASIO_TRANSPORT_HPP

#include <functional>
#include <string>

#include <boost/asio.hpp>
#include "rclcpp/rclcpp.hpp"

#include "iec62056_21/encoding.hpp"
#include "iec62056_21/exceptions.hpp"
#include "iec62056_21/transport.hpp"

namespace iec62056_21
{

    // Shared blocking I/O with timeout for the boost::asio based transports
    class AsioTransport : public Transport
    {
    protected:
        AsioTransport(std::chrono::milliseconds timeout, rclcpp::Logger logger)
            : Transport(timeout), io_context_(), logger_(logger)
        {
        }

        template <typename Stream>
        void write_to(Stream &stream, const std::vector<uint8_t> &data)
        {
            try
            {
                boost::asio::write(stream, boost::asio::buffer(data));
            }
            catch (const boost::system::system_error &e)
            {
                throw TransportError(std::string("Failed to send: ") + e.what());
            }
            RCLCPP_DEBUG(logger_, "Sent %s", printable(data).c_str());
        }

        template <typename Stream>
        std::vector<uint8_t> read_from(Stream &stream, std::size_t n)
        {
            std::vector<uint8_t> data(n);
            boost::system::error_code result = boost::asio::error::would_block;
            std::size_t received = 0;

            boost::asio::async_read(
                stream, boost::asio::buffer(data),
                [&result, &received](const boost::system::error_code &ec, std::size_t bytes_transferred)
                {
                    result = ec;
                    received = bytes_transferred;
                });

            run_with_timeout([&stream]
                             {
                                 boost::system::error_code ignored;
                                 stream.cancel(ignored); });

            if (result == boost::asio::error::operation_aborted)
            {
                throw TimeoutError("Read timed out after " + std::to_string(timeout_.count()) + " ms");
            }
            if (result == boost::asio::error::eof)
            {
                throw TransportError("Connection closed by device");
            }
            if (result)
            {
                throw TransportError("Read failed: " + result.message());
            }

            data.resize(received);
            RCLCPP_DEBUG(logger_, "Received %s", printable(data).c_str());
            return data;
        }

        // Runs pending handlers; calls cancel() and drains them when the timeout expires
        void run_with_timeout(const std::function<void()> &cancel);

        boost::asio::io_context io_context_;
        rclcpp::Logger logger_;
    };

} // namespace iec62056_21

#endif // IEC62056_21_ASIO_TRANSPORT_HPP
