#include <rclcpp/rclcpp.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "iec62056_21/client.hpp"
#include "iec62056_21/client_config.hpp"
#include "iec62056_21/constants.hpp"
#include "iec62056_21/exceptions.hpp"
#include "iec62056_21/lis200_error_parser.hpp"
#include "iec62056_21/serial_transport.hpp"
#include "iec62056_21/tcp_transport.hpp"

class MeterReader : public rclcpp::Node
{
public:
    MeterReader() : Node("meter_reader")
    {
        // Declare parameters
        this->declare_parameter<std::string>("transport", "serial"); // serial | tcp
        this->declare_parameter<std::string>("port", "/dev/ttyUSB0");
        this->declare_parameter<std::string>("host", "192.168.1.10");
        this->declare_parameter<int>("tcp_port", 8000);
        this->declare_parameter<double>("timeout_s", 10.0);
        this->declare_parameter<std::string>("device_address", "");
        this->declare_parameter<std::string>("password", "00000000");
        this->declare_parameter<bool>("battery_powered", false);
        this->declare_parameter<int>("max_checksum_retries", 5);
        this->declare_parameter<std::string>("mode", "readout"); // readout | single_read
        this->declare_parameter<std::vector<std::string>>("addresses", std::vector<std::string>{});
        this->declare_parameter<double>("poll_period_s", 60.0);
        this->declare_parameter<std::string>("error_parser", "none"); // none | lis200

        // Get parameters
        mode_ = this->get_parameter("mode").as_string();
        addresses_ = this->get_parameter("addresses").as_string_array();
        double poll_period_s = this->get_parameter("poll_period_s").as_double();

        if (mode_ != "readout" && mode_ != "single_read")
        {
            throw std::invalid_argument("mode must be readout or single_read, got " + mode_);
        }
        auto period = iec62056_21::duration_from_seconds("poll_period_s", poll_period_s);

        transport_ = createTransport();

        iec62056_21::ClientConfig config;
        config.device_address = this->get_parameter("device_address").as_string();
        config.password = this->get_parameter("password").as_string();
        config.battery_powered = this->get_parameter("battery_powered").as_bool();
        config.max_checksum_retries = static_cast<int>(this->get_parameter("max_checksum_retries").as_int());

        std::shared_ptr<const iec62056_21::ErrorParser> error_parser =
            std::make_shared<iec62056_21::NullErrorParser>();
        if (this->get_parameter("error_parser").as_string() == "lis200")
        {
            error_parser = std::make_shared<iec62056_21::Lis200ErrorParser>();
        }

        client_ = std::make_unique<iec62056_21::Client>(
            *transport_, config, error_parser, this->get_logger().get_child("client"));

        RCLCPP_INFO(this->get_logger(), "Reading meter every %.1f s in %s mode",
                    poll_period_s, mode_.c_str());

        poll_timer_ = this->create_wall_timer(
            period,
            std::bind(&MeterReader::poll, this));
    }

    ~MeterReader()
    {
        transport_->disconnect();
    }

private:
    std::unique_ptr<iec62056_21::Transport> createTransport()
    {
        std::string kind = this->get_parameter("transport").as_string();
        auto timeout = iec62056_21::duration_from_seconds(
            "timeout_s", this->get_parameter("timeout_s").as_double());

        if (kind == "serial")
        {
            return std::make_unique<iec62056_21::SerialTransport>(
                this->get_parameter("port").as_string(), timeout,
                this->get_logger().get_child("serial"));
        }
        if (kind == "tcp")
        {
            return std::make_unique<iec62056_21::TcpTransport>(
                this->get_parameter("host").as_string(),
                iec62056_21::tcp_port_from_int(this->get_parameter("tcp_port").as_int()), timeout,
                this->get_logger().get_child("tcp"));
        }
        throw std::invalid_argument("transport must be serial or tcp, got " + kind);
    }

    void poll()
    {
        try
        {
            client_->connect();

            if (mode_ == "readout")
            {
                readout();
            }
            else
            {
                readValues();
            }
        }
        catch (const iec62056_21::Iec62056Error &e)
        {
            RCLCPP_ERROR(this->get_logger(), "Meter read failed: %s", e.what());
        }

        // Fresh connection on every poll
        client_->disconnect();
    }

    void readout()
    {
        iec62056_21::AnswerDataMessage answer = client_->standard_readout();

        for (const auto &data_set : answer.data())
        {
            logDataSet(data_set);
        }
        RCLCPP_INFO(this->get_logger(), "Readout from %s complete: %zu values",
                    client_->session()->identification.c_str(), answer.data().size());
    }

    void readValues()
    {
        iec62056_21::Response challenge = client_->access_programming_mode();
        if (!std::holds_alternative<iec62056_21::CommandMessage>(challenge))
        {
            throw iec62056_21::ProtocolError("Device did not send a password challenge");
        }

        client_->send_password();
        if (client_->recv_ack() != iec62056_21::ACK)
        {
            throw iec62056_21::ProtocolError("Password rejected");
        }

        for (const auto &address : addresses_)
        {
            logDataSet(client_->read_single_value(address));
        }

        client_->send_break();
    }

    void logDataSet(const iec62056_21::DataSet &data_set)
    {
        RCLCPP_INFO(this->get_logger(), "%s = %s %s",
                    data_set.address.value_or("-").c_str(),
                    data_set.value.c_str(),
                    data_set.unit.value_or("").c_str());
    }

    // Parameters
    std::string mode_;
    std::vector<std::string> addresses_;

    // Meter session
    std::unique_ptr<iec62056_21::Transport> transport_;
    std::unique_ptr<iec62056_21::Client> client_;

    // ROS interfaces
    rclcpp::TimerBase::SharedPtr poll_timer_;
};

int main(int argc, char **argv)
{
    rclcpp::init(argc, argv);
    auto node = std::make_shared<MeterReader>();
    rclcpp::spin(node);
    rclcpp::shutdown();
    return 0;
}
