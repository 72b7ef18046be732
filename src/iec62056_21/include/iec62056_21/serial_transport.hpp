#ifndef IEC62056_21_SERIAL_TRANSPORT_HPP
#define IEC62056_21_SERIAL_TRANSPORT_HPP

#include "iec62056_21/asio_transport.hpp"

namespace iec62056_21
{

    // Optical probe or USB converter: 7E1, starting at 300 baud
    class SerialTransport : public AsioTransport
    {
    public:
        static constexpr bool REQUIRES_ADDRESS = false;
        static constexpr int INITIAL_BAUD_RATE = 300;

        SerialTransport(const std::string &port,
                        std::chrono::milliseconds timeout = std::chrono::seconds(10),
                        rclcpp::Logger logger = rclcpp::get_logger("iec62056_21.SerialTransport"));
        ~SerialTransport() override;

        void connect() override;
        void disconnect() override;
        bool is_connected() const;

        void send(const std::vector<uint8_t> &data) override;
        std::vector<uint8_t> recv(std::size_t n) override;

        // Waits for the device to change over, then reconfigures the port
        void switch_baudrate(int baud_rate) override;

        bool requires_address() const override { return REQUIRES_ADDRESS; }

        const std::string &port_name() const { return port_name_; }

    private:
        void configure(int baud_rate);

        boost::asio::serial_port serial_port_;
        std::string port_name_;
    };

} // namespace iec62056_21

#endif // IEC62056_21_SERIAL_TRANSPORT_HPP
