#ifndef IEC62056_21_CLIENT_HPP
#define IEC62056_21_CLIENT_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "rclcpp/rclcpp.hpp"

#include "iec62056_21/client_config.hpp"
#include "iec62056_21/error_parser.hpp"
#include "iec62056_21/frame_reader.hpp"
#include "iec62056_21/messages.hpp"
#include "iec62056_21/transport.hpp"

namespace iec62056_21
{

    // Protocol modes selectable in the ACK option select message
    enum class Mode
    {
        READOUT,
        PROGRAMMING,
        BINARY,
        MANUFACTURER6,
        MANUFACTURER7,
        MANUFACTURER8,
        MANUFACTURER9
    };

    // Throws ClientError for names other than readout, programming, binary, manufacturer6..9
    Mode mode_from_string(const std::string &name);
    char mode_control_char(Mode mode);

    // Mode C switchover character to baud rate, 0 if the character is not defined
    int baudrate_for_char(char switchover_baudrate_char);

    enum class SessionState
    {
        NEW,
        STARTED,
        MODE_SELECTED,
        BAUD_SWITCHED,
        ACTIVE,
        TERMINATED
    };

    // What the device told us about itself during startup
    struct Session
    {
        std::string identification;
        std::string manufacturer_id;
        char switchover_baudrate_char = '0';
        bool use_short_reaction_time = false;
    };

    // Mode C client. Drives the handshake and single value reads/writes over a
    // borrowed Transport; every call blocks until the device answered.
    class Client
    {
    public:
        static constexpr std::chrono::milliseconds REACTION_TIME{200};
        static constexpr std::chrono::milliseconds SHORT_REACTION_TIME{20};

        Client(Transport &transport,
               ClientConfig config = ClientConfig(),
               std::shared_ptr<const ErrorParser> error_parser = std::make_shared<NullErrorParser>(),
               rclcpp::Logger logger = rclcpp::get_logger("iec62056_21.Client"));

        void connect();
        void disconnect();

        // Request + identification; resets any previous session
        void startup();

        void ack_with_option_select(Mode mode);
        void ack_with_option_select(const std::string &mode);

        // Returns the password challenge to be answered with send_password()
        Response access_programming_mode();

        AnswerDataMessage standard_readout();

        void send_password();
        void send_password(const std::string &password);
        void send_break();

        DataSet read_single_value(const std::string &address, const std::string &additional_data = "1");
        void write_single_value(const std::string &address, const std::string &value);

        Response read_response();

        // Single byte reply, ACK or NACK for writes and password checks
        uint8_t recv_ack();

        void send_battery_power_startup_sequence(bool fast = false);

        // Sleep for 1.25 x reaction time, or for the given duration
        void rest();
        void rest(std::chrono::milliseconds duration);

        std::chrono::milliseconds reaction_time() const;
        int switchover_baudrate() const;

        SessionState state() const { return state_; }
        const std::optional<Session> &session() const { return session_; }
        const ClientConfig &config() const { return config_; }

    private:
        void send_init_request();
        IdentificationMessage read_identification();
        const Session &require_session() const;

        Transport &transport_;
        ClientConfig config_;
        std::shared_ptr<const ErrorParser> error_parser_;
        rclcpp::Logger logger_;
        FrameReader frame_reader_;

        SessionState state_;
        std::optional<Session> session_;
    };

} // namespace iec62056_21

#endif // IEC62056_21_CLIENT_HPP
