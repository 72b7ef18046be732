#include <chrono>
#include <functional>
#include <utility>

#include "iec62056_21/client_config.hpp"
#include "iec62056_21/error_parser.hpp"
#include "iec62056_21/lis200_error_parser.hpp"

#include <rclcpp/rclcpp.hpp>

#include "test_utils.hpp"

using namespace iec62056_21;
using namespace iec62056_21_test;

namespace
{
    AnswerDataMessage answer_with(const std::vector<DataSet> &data_sets)
    {
        return AnswerDataMessage(DataBlock{{DataLine{data_sets}}});
    }
}

bool test_null_error_parser()
{
    NullErrorParser parser;
    parser.check_for_errors(answer_with({DataSet{"#0001", std::nullopt, std::nullopt}}));
    return check(true, "Null parser accepts every answer");
}

bool test_lis200_error_codes()
{
    bool ok = true;

    Lis200ErrorParser parser;

    parser.check_for_errors(answer_with({DataSet{"12.5", std::string("2:300"), std::string("m3")},
                                         DataSet{"#12", std::string("2:301"), std::nullopt}}));
    ok &= check(true, "Answer without four digit code accepted");

    try
    {
        parser.check_for_errors(answer_with({DataSet{"1", std::string("2:300"), std::nullopt},
                                             DataSet{"#0017", std::nullopt, std::nullopt},
                                             DataSet{"#0200", std::nullopt, std::nullopt}}));
        ok &= check(false, "Error code detected");
    }
    catch (const Lis200Error &e)
    {
        ok &= check(e.code() == 17, "First error code reported");
        ok &= check(std::string(e.what()).find("wrong access code") != std::string::npos,
                    "Catalog text in message");
    }

    ok &= check_throws<DeviceError>([&parser]
                                    { parser.check_for_errors(answer_with({DataSet{"#0999", std::nullopt, std::nullopt}})); },
                                    "Unknown code still raised");
    ok &= check(Lis200ErrorParser::describe(999) == "unknown error", "Unknown code described");
    ok &= check(Lis200ErrorParser::describe(249).find("encoder") != std::string::npos, "Code 249 described");

    return ok;
}

bool test_client_config()
{
    bool ok = true;

    ClientConfig defaults = ClientConfig::from_parameters({});
    ok &= check(defaults.password == "00000000" && !defaults.battery_powered &&
                    defaults.device_address.empty() && defaults.max_checksum_retries == 5,
                "Defaults kept for absent keys");

    ClientConfig config = ClientConfig::from_parameters({{"device_address", "45678903"},
                                                         {"password", "12345678"},
                                                         {"battery_powered", "true"},
                                                         {"max_checksum_retries", "3"}});
    ok &= check(config.device_address == "45678903" && config.password == "12345678" &&
                    config.battery_powered && config.max_checksum_retries == 3,
                "Parameters applied");

    ok &= check_throws<ClientError>([]
                                    { ClientConfig::from_parameters({{"battery_powered", "yes"}}); },
                                    "Malformed flag rejected");
    ok &= check_throws<ClientError>([]
                                    { ClientConfig::from_parameters({{"max_checksum_retries", "3x"}}); },
                                    "Malformed number rejected");
    ok &= check_throws<ClientError>([]
                                    { ClientConfig::from_parameters({{"max_checksum_retries", "0"}}); },
                                    "Zero retries rejected");

    return ok;
}

bool test_node_parameter_ranges()
{
    bool ok = true;

    ok &= check(duration_from_seconds("poll_period_s", 60.0) == std::chrono::seconds(60), "Period in seconds");
    ok &= check(duration_from_seconds("timeout_s", 0.25) == std::chrono::milliseconds(250), "Fractional timeout");
    ok &= check_throws<ClientError>([]
                                    { duration_from_seconds("poll_period_s", 0.0); },
                                    "Zero period rejected");
    ok &= check_throws<ClientError>([]
                                    { duration_from_seconds("timeout_s", -1.0); },
                                    "Negative timeout rejected");
    ok &= check_throws<ClientError>([]
                                    { duration_from_seconds("poll_period_s", 1e12); },
                                    "Period beyond range rejected");

    ok &= check(tcp_port_from_int(8000) == 8000, "TCP port in range");
    ok &= check_throws<ClientError>([]
                                    { tcp_port_from_int(0); },
                                    "Port zero rejected");
    ok &= check_throws<ClientError>([]
                                    { tcp_port_from_int(70000); },
                                    "Port above 65535 rejected");

    return ok;
}

int main(int argc, char **argv)
{
    rclcpp::init(argc, argv);

    std::vector<std::pair<std::string, std::function<bool()>>> tests = {
        {"ErrorParser: null parser", test_null_error_parser},
        {"ErrorParser: LIS-200 codes", test_lis200_error_codes},
        {"ClientConfig: parameters", test_client_config},
        {"ClientConfig: node parameter ranges", test_node_parameter_ranges},
    };

    int result = run_tests("IEC 62056-21 Error Parser and Config Tests", tests);

    rclcpp::shutdown();
    return result;
}
