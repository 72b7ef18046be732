#include <chrono>
#include <functional>
#include <utility>

#include "iec62056_21/bcc.hpp"
#include "iec62056_21/constants.hpp"
#include "iec62056_21/frame_reader.hpp"
#include "iec62056_21/messages.hpp"

#include <rclcpp/rclcpp.hpp>

#include "test_utils.hpp"

using namespace iec62056_21;
using namespace iec62056_21_test;

namespace
{
    // STX {body} {end} BCC
    std::string packet(const std::string &body, uint8_t end)
    {
        return BCC::add(static_cast<char>(STX) + body + static_cast<char>(end));
    }

    std::string corrupt(std::string frame)
    {
        frame.back() = static_cast<char>(frame.back() ^ 0x01);
        return frame;
    }
}

bool test_parser_states()
{
    bool ok = true;

    MockTransport transport;
    FrameReader reader(transport);

    ok &= check(reader.process_byte('x') == FrameReader::Outcome::INCOMPLETE &&
                    reader.state() == FrameReader::State::AWAITING_START,
                "Noise before start marker discarded");
    ok &= check(reader.process_byte(STX) == FrameReader::Outcome::INCOMPLETE &&
                    reader.state() == FrameReader::State::COLLECTING,
                "STX starts collecting");

    for (char c : std::string("0.0.0(1)"))
    {
        reader.process_byte(static_cast<uint8_t>(c));
    }
    ok &= check(reader.process_byte(ETX) == FrameReader::Outcome::INCOMPLETE &&
                    reader.state() == FrameReader::State::AWAITING_BCC,
                "ETX waits for the BCC");

    uint8_t bcc = BCC::calculate(encode("0.0.0(1)\x03"));
    ok &= check(reader.process_byte(bcc) == FrameReader::Outcome::FRAME_COMPLETE, "Valid frame complete");
    ok &= check(reader.state() == FrameReader::State::AWAITING_START, "Back to awaiting start");

    ok &= check(reader.process_byte(NACK) == FrameReader::Outcome::CONTROL_REPLY &&
                    reader.frame() == std::vector<uint8_t>{NACK},
                "Bare NACK is a control reply");

    return ok;
}

bool test_single_frame()
{
    bool ok = true;

    MockTransport transport;
    FrameReader reader(transport);

    std::string frame = packet("1.8.0(0012345.6*kWh)\r\n", ETX);
    transport.reply("\r\n\x7F");
    transport.reply(frame);

    std::vector<uint8_t> data = reader.read();
    ok &= check(decode(data) == frame, "Frame returned without leading noise");
    ok &= check(transport.sent.empty(), "Nothing sent for a valid single frame");

    return ok;
}

bool test_control_reply()
{
    MockTransport transport;
    FrameReader reader(transport);

    transport.reply(std::vector<uint8_t>{ACK});
    return check(reader.read() == std::vector<uint8_t>{ACK}, "Bare ACK returned");
}

bool test_command_frame()
{
    bool ok = true;

    MockTransport transport;
    FrameReader reader(transport);

    const std::string challenge = "\x01P0\x02(1234567)\x03P";
    transport.reply(challenge);

    ok &= check(decode(reader.read()) == challenge, "Password challenge returned with its BCC");
    ok &= check(transport.incoming.empty(), "BCC byte consumed");

    return ok;
}

bool test_checksum_retry()
{
    bool ok = true;

    MockTransport transport;
    FrameReader reader(transport);

    std::string frame = packet("1.8.0(1)\r\n", ETX);
    transport.reply(corrupt(frame));
    transport.reply(frame);

    std::vector<uint8_t> data = reader.read();
    ok &= check(decode(data) == frame, "Frame accepted after resend");
    ok &= check(transport.sent.size() == 1 && transport.sent[0] == std::vector<uint8_t>{NACK},
                "Exactly one NACK sent");

    return ok;
}

bool test_checksum_retry_bound()
{
    bool ok = true;

    MockTransport transport;
    FrameReader reader(transport, 3);

    std::string bad = corrupt(packet("1.8.0(1)\r\n", ETX));
    for (int i = 0; i < 4; ++i)
    {
        transport.reply(bad);
    }

    ok &= check_throws<ValidationError>([&reader]
                                        { reader.read(); },
                                        "Gives up after three bad frames");
    ok &= check(transport.sent.size() == 3, "One NACK per bad frame");

    return ok;
}

bool test_partial_blocks()
{
    bool ok = true;

    MockTransport transport;
    FrameReader reader(transport);

    transport.reply(packet("1.8.0(0001.0*kWh)", EOT));
    transport.reply(packet("1.8.1(0002.0*kWh)", EOT));
    transport.reply(packet("1.8.2(0003.0*kWh)", ETX));

    std::vector<uint8_t> data = reader.read();

    ok &= check(transport.sent.size() == 2 && transport.sent[0] == std::vector<uint8_t>{ACK} &&
                    transport.sent[1] == std::vector<uint8_t>{ACK},
                "Each partial block ACKed");
    ok &= check(BCC::validate(data), "BCC recomputed over reassembled frame");

    AnswerDataMessage reassembled = from_bytes<AnswerDataMessage>(data);
    AnswerDataMessage single = AnswerDataMessage::from_representation(
        packet("1.8.0(0001.0*kWh)\r\n1.8.1(0002.0*kWh)\r\n1.8.2(0003.0*kWh)", ETX));

    ok &= check(reassembled.data().size() == 3, "Three data sets reassembled");
    ok &= check(reassembled.data() == single.data(), "Same data as a single packet reply");

    return ok;
}

bool test_partial_block_retry()
{
    bool ok = true;

    MockTransport transport;
    FrameReader reader(transport);

    std::string first = packet("0.0.0(123)", EOT);
    transport.reply(first);
    transport.reply(corrupt(packet("0.9.1(101010)", EOT)));
    transport.reply(packet("0.9.1(101010)", EOT));
    transport.reply(packet("0.9.2(20101)", ETX));

    AnswerDataMessage answer = from_bytes<AnswerDataMessage>(reader.read());

    ok &= check(transport.sent.size() == 3 && transport.sent[1] == std::vector<uint8_t>{NACK},
                "Corrupted partial block NACKed");
    ok &= check(answer.data().size() == 3 && answer.data()[1].value == "101010",
                "Resent block used in place of the corrupted one");

    return ok;
}

bool test_simple_read()
{
    MockTransport transport;
    FrameReader reader(transport);

    transport.reply(std::vector<uint8_t>{0x00, 0x00, '?'});
    transport.reply("/Els6\\2EK280\r\n(rest)");

    std::vector<uint8_t> data = reader.simple_read('/', LF);
    return check(decode(data) == "/Els6\\2EK280\r\n", "Identification captured between / and LF");
}

bool test_timeout()
{
    bool ok = true;

    MockTransport transport;
    FrameReader reader(transport);

    transport.reply("\x02" "1.8.0(1)");
    ok &= check_throws<TimeoutError>([&reader]
                                     { reader.read(); },
                                     "Incomplete frame times out");
    ok &= check_throws<TimeoutError>([&reader]
                                     { reader.simple_read('/', LF); },
                                     "Silent device times out");

    return ok;
}

bool test_slow_line()
{
    bool ok = true;

    // Whole frame takes longer than the timeout, but no gap between bytes does
    MockTransport transport(false, std::chrono::milliseconds(200));
    transport.byte_delay = std::chrono::milliseconds(20);
    FrameReader reader(transport);

    std::string frame = packet("1.8.0(0012345.6*kWh)\r\n", ETX);
    transport.reply(frame);
    ok &= check(decode(reader.read()) == frame, "Frame read on a slow but steady line");

    transport.reply("/Els6\\2EK280\r\n");
    ok &= check(decode(reader.simple_read('/', LF)) == "/Els6\\2EK280\r\n",
                "Identification read on a slow but steady line");

    return ok;
}

int main(int argc, char **argv)
{
    rclcpp::init(argc, argv);

    std::vector<std::pair<std::string, std::function<bool()>>> tests = {
        {"FrameReader: parser states", test_parser_states},
        {"FrameReader: single frame", test_single_frame},
        {"FrameReader: control reply", test_control_reply},
        {"FrameReader: command frame", test_command_frame},
        {"FrameReader: checksum retry", test_checksum_retry},
        {"FrameReader: retry bound", test_checksum_retry_bound},
        {"FrameReader: partial blocks", test_partial_blocks},
        {"FrameReader: partial block retry", test_partial_block_retry},
        {"FrameReader: simple read", test_simple_read},
        {"FrameReader: timeout", test_timeout},
        {"FrameReader: slow line", test_slow_line},
    };

    int result = run_tests("IEC 62056-21 Frame Reader Tests", tests);

    rclcpp::shutdown();
    return result;
}
