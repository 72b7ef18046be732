#ifndef IEC62056_21_TRANSPORT_HPP
#define IEC62056_21_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <vector>

namespace iec62056_21
{

    // Raw byte link to a device. Framing is done by FrameReader on top of it.
    class Transport
    {
    public:
        explicit Transport(std::chrono::milliseconds timeout) : timeout_(timeout) {}
        virtual ~Transport() = default;

        virtual void connect() = 0;
        virtual void disconnect() = 0;

        virtual void send(const std::vector<uint8_t> &data) = 0;

        // Blocks until n bytes arrived. Throws TimeoutError or TransportError.
        virtual std::vector<uint8_t> recv(std::size_t n) = 0;

        // No-op where the link has no baud rate
        virtual void switch_baudrate(int baud_rate) = 0;

        // Bus and network links must put the device address in the request
        virtual bool requires_address() const = 0;

        std::chrono::milliseconds timeout() const { return timeout_; }

    protected:
        std::chrono::milliseconds timeout_;
    };

} // namespace iec62056_21

#endif // IEC62056_21_TRANSPORT_HPP
