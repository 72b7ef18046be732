#ifndef IEC62056_21_TCP_TRANSPORT_HPP
#define IEC62056_21_TCP_TRANSPORT_HPP

#include "iec62056_21/asio_transport.hpp"

namespace iec62056_21
{

    // Network gateway to one or more meters; no baud rate to switch
    class TcpTransport : public AsioTransport
    {
    public:
        static constexpr bool REQUIRES_ADDRESS = true;

        TcpTransport(const std::string &host, uint16_t port,
                     std::chrono::milliseconds timeout = std::chrono::seconds(30),
                     rclcpp::Logger logger = rclcpp::get_logger("iec62056_21.TcpTransport"));
        ~TcpTransport() override;

        void connect() override;
        void disconnect() override;
        bool is_connected() const;

        void send(const std::vector<uint8_t> &data) override;
        std::vector<uint8_t> recv(std::size_t n) override;

        void switch_baudrate(int) override {}

        bool requires_address() const override { return REQUIRES_ADDRESS; }

    private:
        boost::asio::ip::tcp::socket socket_;
        std::string host_;
        uint16_t port_;
    };

} // namespace iec62056_21

#endif // IEC62056_21_TCP_TRANSPORT_HPP
