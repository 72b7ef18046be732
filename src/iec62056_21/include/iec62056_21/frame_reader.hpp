#ifndef IEC62056_21_FRAME_READER_HPP
#define IEC62056_21_FRAME_READER_HPP

#include <chrono>
#include <cstdint>
#include <vector>

#include "rclcpp/rclcpp.hpp"

#include "iec62056_21/transport.hpp"

namespace iec62056_21
{

    // Collects framed replies from a Transport. Checksum failures are NACKed and
    // re-read; partial blocks (EOT) are ACKed and reassembled into one frame.
    class FrameReader
    {
    public:
        enum class State
        {
            AWAITING_START,
            COLLECTING,
            AWAITING_BCC
        };

        // Result of feeding one byte to the parser
        enum class Outcome
        {
            INCOMPLETE,
            FRAME_COMPLETE,
            PARTIAL_BLOCK,
            CONTROL_REPLY,
            CHECKSUM_ERROR
        };

        static constexpr int DEFAULT_MAX_CHECKSUM_RETRIES = 5;

        FrameReader(Transport &transport,
                    int max_checksum_retries = DEFAULT_MAX_CHECKSUM_RETRIES,
                    rclcpp::Logger logger = rclcpp::get_logger("iec62056_21.FrameReader"));

        // Read one logical reply: a command frame (SOH), a data frame (STX) with
        // any partial blocks merged, or a bare ACK/NACK. Throws TimeoutError, or
        // ValidationError once the checksum retries are used up.
        std::vector<uint8_t> read();

        // Read from start_char up to and including end_char, discarding leading bytes
        std::vector<uint8_t> simple_read(uint8_t start_char, uint8_t end_char);

        // Feed a single byte through the state machine
        Outcome process_byte(uint8_t byte);

        // Bytes of the frame the last terminal outcome refers to
        const std::vector<uint8_t> &frame() const { return frame_; }
        State state() const { return state_; }

        void reset();

    private:
        uint8_t recv_byte(std::chrono::steady_clock::time_point &last_byte);

        Transport &transport_;
        int max_checksum_retries_;
        rclcpp::Logger logger_;

        State state_;
        std::vector<uint8_t> frame_;
        uint8_t start_char_;
        uint8_t end_char_;
    };

} // namespace iec62056_21

#endif // IEC62056_21_FRAME_READER_HPP
