#include "iec62056_21/client.hpp"
#include "iec62056_21/constants.hpp"
#include "iec62056_21/encoding.hpp"
#include "iec62056_21/exceptions.hpp"

#include <cctype>
#include <map>
#include <thread>

namespace iec62056_21
{

    Mode mode_from_string(const std::string &name)
    {
        static const std::map<std::string, Mode> modes = {
            {"readout", Mode::READOUT},
            {"programming", Mode::PROGRAMMING},
            {"binary", Mode::BINARY},
            {"manufacturer6", Mode::MANUFACTURER6},
            {"manufacturer7", Mode::MANUFACTURER7},
            {"manufacturer8", Mode::MANUFACTURER8},
            {"manufacturer9", Mode::MANUFACTURER9},
        };

        auto it = modes.find(name);
        if (it == modes.end())
        {
            throw ClientError("Unknown mode '" + name + "'");
        }
        return it->second;
    }

    char mode_control_char(Mode mode)
    {
        switch (mode)
        {
        case Mode::READOUT:
            return '0';
        case Mode::PROGRAMMING:
            return '1';
        case Mode::BINARY:
            return '2';
        case Mode::MANUFACTURER6:
            return '6';
        case Mode::MANUFACTURER7:
            return '7';
        case Mode::MANUFACTURER8:
            return '8';
        case Mode::MANUFACTURER9:
            return '9';
        }
        return '0';
    }

    int baudrate_for_char(char switchover_baudrate_char)
    {
        switch (switchover_baudrate_char)
        {
        case '0':
            return 300;
        case '1':
            return 600;
        case '2':
            return 1200;
        case '3':
            return 2400;
        case '4':
            return 4800;
        case '5':
            return 9600;
        case '6':
            return 19200;
        default:
            return 0;
        }
    }

    Client::Client(Transport &transport, ClientConfig config,
                   std::shared_ptr<const ErrorParser> error_parser, rclcpp::Logger logger)
        : transport_(transport),
          config_(std::move(config)),
          error_parser_(std::move(error_parser)),
          logger_(logger),
          frame_reader_(transport, config_.max_checksum_retries, logger.get_child("FrameReader")),
          state_(SessionState::NEW)
    {
        if (transport_.requires_address() && config_.device_address.empty())
        {
            // Only a single device behind the link will answer
            RCLCPP_WARN(logger_, "No device address configured, requests go to any device");
        }
        if (!error_parser_)
        {
            error_parser_ = std::make_shared<NullErrorParser>();
        }
    }

    void Client::connect()
    {
        transport_.connect();
    }

    void Client::disconnect()
    {
        transport_.disconnect();
        session_.reset();
        state_ = SessionState::NEW;
    }

    void Client::startup()
    {
        session_.reset();
        state_ = SessionState::NEW;

        if (config_.battery_powered)
        {
            send_battery_power_startup_sequence();
        }

        RCLCPP_INFO(logger_, "Starting init sequence");
        send_init_request();

        IdentificationMessage identification = read_identification();

        Session session;
        session.identification = identification.identification;
        session.manufacturer_id = identification.manufacturer;
        session.switchover_baudrate_char = identification.switchover_baudrate_char;

        // A lower case third letter announces the 20 ms reaction time
        session.use_short_reaction_time =
            std::islower(static_cast<unsigned char>(session.manufacturer_id.back())) != 0;

        session_ = session;
        state_ = SessionState::STARTED;
    }

    void Client::ack_with_option_select(Mode mode)
    {
        const Session &session = require_session();

        AckOptionSelectMessage message;
        message.baud_char = session.switchover_baudrate_char;
        message.mode_char = mode_control_char(mode);

        RCLCPP_INFO(logger_, "Sending option select %s", printable(message.to_representation()).c_str());
        transport_.send(to_bytes(message));
        state_ = SessionState::MODE_SELECTED;
        rest();
    }

    void Client::ack_with_option_select(const std::string &mode)
    {
        ack_with_option_select(mode_from_string(mode));
    }

    Response Client::access_programming_mode()
    {
        startup();
        ack_with_option_select(Mode::PROGRAMMING);

        transport_.switch_baudrate(switchover_baudrate());
        state_ = SessionState::BAUD_SWITCHED;

        return read_response();
    }

    AnswerDataMessage Client::standard_readout()
    {
        startup();
        ack_with_option_select(Mode::READOUT);

        transport_.switch_baudrate(switchover_baudrate());
        state_ = SessionState::BAUD_SWITCHED;

        RCLCPP_INFO(logger_, "Reading standard readout from device");
        Response response = read_response();

        if (!std::holds_alternative<AnswerDataMessage>(response))
        {
            throw ProtocolError("Expected a data readout but received a command message");
        }
        return std::get<AnswerDataMessage>(std::move(response));
    }

    void Client::send_password()
    {
        send_password(config_.password);
    }

    void Client::send_password(const std::string &password)
    {
        CommandMessage command('P', '1', DataSet{password, std::nullopt, std::nullopt});

        RCLCPP_INFO(logger_, "Sending password to device");
        transport_.send(to_bytes(command));
        state_ = SessionState::ACTIVE;
    }

    void Client::send_break()
    {
        CommandMessage command('B', '0');

        RCLCPP_INFO(logger_, "Sending break to end the session");
        transport_.send(to_bytes(command));
        state_ = SessionState::TERMINATED;
    }

    DataSet Client::read_single_value(const std::string &address, const std::string &additional_data)
    {
        CommandMessage request = CommandMessage::for_single_read(address, additional_data);

        RCLCPP_INFO(logger_, "Sending read request %s", printable(request.to_representation()).c_str());
        transport_.send(to_bytes(request));
        state_ = SessionState::ACTIVE;

        Response response = read_response();
        if (!std::holds_alternative<AnswerDataMessage>(response))
        {
            throw ProtocolError("Expected data for " + address + " but received a command message");
        }

        const auto &data = std::get<AnswerDataMessage>(response).data();
        if (data.size() > 1)
        {
            throw TooManyValuesReturned("Read of one value returned " + std::to_string(data.size()));
        }
        if (data.empty())
        {
            throw NoDataReturned("Read of " + address + " returned no data");
        }

        RCLCPP_INFO(logger_, "Received %s", data.front().to_representation().c_str());
        return data.front();
    }

    void Client::write_single_value(const std::string &address, const std::string &value)
    {
        CommandMessage request = CommandMessage::for_single_write(address, value);

        RCLCPP_INFO(logger_, "Sending write request %s", printable(request.to_representation()).c_str());
        transport_.send(to_bytes(request));
        state_ = SessionState::ACTIVE;

        uint8_t ack = recv_ack();
        if (ack == ACK)
        {
            RCLCPP_INFO(logger_, "Write request accepted");
            return;
        }
        if (ack == NACK)
        {
            throw ProtocolError("Received NACK upon writing " + address);
        }
        throw ProtocolError("Received invalid response " + printable(std::vector<uint8_t>{ack}) +
                            " to write request for " + address);
    }

    Response Client::read_response()
    {
        std::vector<uint8_t> data = frame_reader_.read();
        state_ = SessionState::ACTIVE;

        if (!data.empty() && data.front() == SOH)
        {
            // Most likely a password challenge
            return from_bytes<CommandMessage>(data);
        }

        AnswerDataMessage answer = from_bytes<AnswerDataMessage>(data);
        error_parser_->check_for_errors(answer);
        return answer;
    }

    uint8_t Client::recv_ack()
    {
        std::vector<uint8_t> data = transport_.recv(1);
        if (data.empty())
        {
            throw ProtocolError("No reply received where ACK or NACK was expected");
        }
        return data.front();
    }

    void Client::send_battery_power_startup_sequence(bool fast)
    {
        if (fast)
        {
            throw ClientError("Fast startup sequence is not supported");
        }

        // Null characters for 2.1-2.3 s, at most 0.5 s apart
        const auto sequence_length = std::chrono::milliseconds(2200);
        const auto interval = std::chrono::milliseconds(200);

        RCLCPP_INFO(logger_, "Sending battery startup sequence");
        auto started = std::chrono::steady_clock::now();
        while (std::chrono::steady_clock::now() - started < sequence_length)
        {
            transport_.send({0x00});
            rest(interval);
        }
        RCLCPP_INFO(logger_, "Startup sequence finished");

        // 1.5-1.7 s before the request
        rest(std::chrono::milliseconds(1500));
    }

    void Client::rest()
    {
        rest(reaction_time() * 5 / 4);
    }

    void Client::rest(std::chrono::milliseconds duration)
    {
        RCLCPP_DEBUG(logger_, "Resting for %ld ms", static_cast<long>(duration.count()));
        std::this_thread::sleep_for(duration);
    }

    std::chrono::milliseconds Client::reaction_time() const
    {
        if (session_ && session_->use_short_reaction_time)
        {
            return SHORT_REACTION_TIME;
        }
        return REACTION_TIME;
    }

    int Client::switchover_baudrate() const
    {
        const Session &session = require_session();

        int baud_rate = baudrate_for_char(session.switchover_baudrate_char);
        if (baud_rate == 0)
        {
            throw ProtocolError(std::string("Device proposed unknown baud rate character '") +
                                session.switchover_baudrate_char + "'");
        }
        return baud_rate;
    }

    void Client::send_init_request()
    {
        // An optical probe reaches a single device, so no address is needed there
        RequestMessage request;
        if (transport_.requires_address())
        {
            request.device_address = config_.device_address;
        }

        RCLCPP_INFO(logger_, "Sending request %s", printable(request.to_representation()).c_str());
        transport_.send(to_bytes(request));
        rest();
    }

    IdentificationMessage Client::read_identification()
    {
        std::vector<uint8_t> data = frame_reader_.simple_read(static_cast<uint8_t>(START_CHAR), LF);

        IdentificationMessage identification = from_bytes<IdentificationMessage>(data);
        RCLCPP_INFO(logger_, "Received identification %s", printable(data).c_str());
        return identification;
    }

    const Session &Client::require_session() const
    {
        if (!session_)
        {
            throw ClientError("No session, call startup() first");
        }
        return *session_;
    }

} // namespace iec62056_21
