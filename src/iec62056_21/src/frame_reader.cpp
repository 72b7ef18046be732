#include "iec62056_21/frame_reader.hpp"
#include "iec62056_21/bcc.hpp"
#include "iec62056_21/constants.hpp"
#include "iec62056_21/encoding.hpp"
#include "iec62056_21/exceptions.hpp"

namespace iec62056_21
{

    FrameReader::FrameReader(Transport &transport, int max_checksum_retries, rclcpp::Logger logger)
        : transport_(transport),
          max_checksum_retries_(max_checksum_retries),
          logger_(logger),
          state_(State::AWAITING_START),
          start_char_(0),
          end_char_(0)
    {
    }

    FrameReader::Outcome FrameReader::process_byte(uint8_t byte)
    {
        switch (state_)
        {
        case State::AWAITING_START:
            if (byte == SOH || byte == STX)
            {
                frame_.assign(1, byte);
                start_char_ = byte;
                state_ = State::COLLECTING;
            }
            else if (byte == ACK || byte == NACK)
            {
                // Bare control reply, no frame around it
                frame_.assign(1, byte);
                return Outcome::CONTROL_REPLY;
            }
            // Anything else before a start marker is noise
            break;

        case State::COLLECTING:
            frame_.push_back(byte);
            if (byte == ETX || byte == EOT)
            {
                end_char_ = byte;
                state_ = State::AWAITING_BCC;
            }
            break;

        case State::AWAITING_BCC:
            frame_.push_back(byte);
            state_ = State::AWAITING_START;

            // Command frames (password challenge) are checked when parsed
            if (start_char_ == SOH)
            {
                return Outcome::FRAME_COMPLETE;
            }
            if (!BCC::validate(frame_))
            {
                return Outcome::CHECKSUM_ERROR;
            }
            return end_char_ == EOT ? Outcome::PARTIAL_BLOCK : Outcome::FRAME_COMPLETE;
        }

        return Outcome::INCOMPLETE;
    }

    std::vector<uint8_t> FrameReader::read()
    {
        std::vector<uint8_t> total;
        int packets = 0;
        int checksum_failures = 0;

        reset();

        auto last_byte = std::chrono::steady_clock::now();

        while (true)
        {
            Outcome outcome = Outcome::INCOMPLETE;
            while (outcome == Outcome::INCOMPLETE)
            {
                outcome = process_byte(recv_byte(last_byte));
            }

            switch (outcome)
            {
            case Outcome::CONTROL_REPLY:
                if (packets == 0)
                {
                    RCLCPP_DEBUG(logger_, "Received control reply %s", printable(frame_).c_str());
                    return frame_;
                }
                RCLCPP_WARN(logger_, "Ignoring %s between partial blocks", printable(frame_).c_str());
                continue;

            case Outcome::CHECKSUM_ERROR:
                ++checksum_failures;
                transport_.send({NACK});
                RCLCPP_WARN(logger_, "BCC not valid in %s, sent NACK (%d/%d)",
                            printable(frame_).c_str(), checksum_failures, max_checksum_retries_);
                if (checksum_failures >= max_checksum_retries_)
                {
                    throw ValidationError("BCC not valid after " + std::to_string(checksum_failures) +
                                          " attempts");
                }
                continue;

            case Outcome::PARTIAL_BLOCK:
            {
                checksum_failures = 0;
                ++packets;
                transport_.send({ACK});
                RCLCPP_DEBUG(logger_, "Received partial block %d, sent ACK", packets);

                // Drop EOT and BCC, end the line; later packets lose their STX
                std::vector<uint8_t> block(frame_.begin() + (packets > 1 ? 1 : 0), frame_.end() - 2);
                block.push_back(CR);
                block.push_back(LF);
                total.insert(total.end(), block.begin(), block.end());
                continue;
            }

            case Outcome::FRAME_COMPLETE:
                if (start_char_ == SOH)
                {
                    total.insert(total.end(), frame_.begin(), frame_.end());
                    return total;
                }

                ++packets;
                total.insert(total.end(), frame_.begin() + (packets > 1 ? 1 : 0), frame_.end());

                if (packets > 1)
                {
                    // Each packet was verified on its own; the last BCC only covers the
                    // last packet, so recompute it over the reassembled frame.
                    total.pop_back();
                    total = BCC::add(total);
                    RCLCPP_DEBUG(logger_, "Reassembled %d partial blocks", packets);
                }
                return total;

            case Outcome::INCOMPLETE:
                break;
            }
        }
    }

    std::vector<uint8_t> FrameReader::simple_read(uint8_t start_char, uint8_t end_char)
    {
        std::vector<uint8_t> data;
        bool start_received = false;
        auto last_byte = std::chrono::steady_clock::now();

        while (true)
        {
            uint8_t byte = recv_byte(last_byte);

            if (!start_received)
            {
                if (byte == start_char)
                {
                    data.push_back(byte);
                    start_received = true;
                }
                continue;
            }

            data.push_back(byte);
            if (byte == end_char)
            {
                break;
            }
        }

        RCLCPP_DEBUG(logger_, "Received %s", printable(data).c_str());
        return data;
    }

    void FrameReader::reset()
    {
        state_ = State::AWAITING_START;
        frame_.clear();
        start_char_ = 0;
        end_char_ = 0;
    }

    // Times out only when no byte arrived within the transport timeout
    uint8_t FrameReader::recv_byte(std::chrono::steady_clock::time_point &last_byte)
    {
        while (true)
        {
            std::vector<uint8_t> data = transport_.recv(1);
            auto now = std::chrono::steady_clock::now();

            if (!data.empty())
            {
                last_byte = now;
                return data[0];
            }
            if (now - last_byte > transport_.timeout())
            {
                throw TimeoutError("No byte received within " +
                                   std::to_string(transport_.timeout().count()) + " ms");
            }
        }
    }

} // namespace iec62056_21
