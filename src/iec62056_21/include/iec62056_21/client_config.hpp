#ifndef IEC62056_21_CLIENT_CONFIG_HPP
#define IEC62056_21_CLIENT_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

#include "iec62056_21/frame_reader.hpp"

namespace iec62056_21
{

    struct ClientConfig
    {
        std::string device_address{""};
        std::string password{"00000000"};
        bool battery_powered{false};
        int max_checksum_retries{FrameReader::DEFAULT_MAX_CHECKSUM_RETRIES};

        // Build from string key/value parameters; absent keys keep their default.
        // Throws ClientError on malformed values.
        static ClientConfig from_parameters(const std::map<std::string, std::string> &parameters);
    };

    // Positive number of seconds as milliseconds, at least 1 ms.
    // Throws ClientError naming the parameter otherwise.
    std::chrono::milliseconds duration_from_seconds(const std::string &name, double seconds);

    // Throws ClientError outside 1..65535
    uint16_t tcp_port_from_int(int64_t port);

} // namespace iec62056_21

#endif // IEC62056_21_CLIENT_CONFIG_HPP
