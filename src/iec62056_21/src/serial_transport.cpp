#include "iec62056_21/serial_transport.hpp"

#include <thread>

namespace iec62056_21
{

    SerialTransport::SerialTransport(const std::string &port,
                                     std::chrono::milliseconds timeout,
                                     rclcpp::Logger logger)
        : AsioTransport(timeout, logger),
          serial_port_(io_context_),
          port_name_(port)
    {
    }

    SerialTransport::~SerialTransport()
    {
        disconnect();
    }

    void SerialTransport::connect()
    {
        try
        {
            serial_port_.open(port_name_);
            configure(INITIAL_BAUD_RATE);
        }
        catch (const boost::system::system_error &e)
        {
            throw TransportError("Failed to open " + port_name_ + ": " + e.what());
        }

        RCLCPP_INFO(logger_, "Opened serial port %s at %d baud", port_name_.c_str(), INITIAL_BAUD_RATE);
    }

    void SerialTransport::disconnect()
    {
        if (serial_port_.is_open())
        {
            boost::system::error_code ignored;
            serial_port_.close(ignored);
        }
    }

    bool SerialTransport::is_connected() const
    {
        return serial_port_.is_open();
    }

    void SerialTransport::send(const std::vector<uint8_t> &data)
    {
        write_to(serial_port_, data);
    }

    std::vector<uint8_t> SerialTransport::recv(std::size_t n)
    {
        return read_from(serial_port_, n);
    }

    void SerialTransport::switch_baudrate(int baud_rate)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));

        try
        {
            configure(baud_rate);
        }
        catch (const boost::system::system_error &e)
        {
            throw TransportError("Failed to switch baud rate: " + std::string(e.what()));
        }

        RCLCPP_INFO(logger_, "Switched %s to %d baud", port_name_.c_str(), baud_rate);
    }

    void SerialTransport::configure(int baud_rate)
    {
        serial_port_.set_option(boost::asio::serial_port_base::baud_rate(baud_rate));

        // 7 data bits, even parity, 1 stop bit
        serial_port_.set_option(boost::asio::serial_port_base::character_size(7));
        serial_port_.set_option(boost::asio::serial_port_base::parity(
            boost::asio::serial_port_base::parity::even));
        serial_port_.set_option(boost::asio::serial_port_base::stop_bits(
            boost::asio::serial_port_base::stop_bits::one));

        // No flow control
        serial_port_.set_option(boost::asio::serial_port_base::flow_control(
            boost::asio::serial_port_base::flow_control::none));
    }

} // namespace iec62056_21
