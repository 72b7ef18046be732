#include "iec62056_21/client_config.hpp"
#include "iec62056_21/exceptions.hpp"

#include <cmath>
#include <limits>

namespace iec62056_21
{

    ClientConfig ClientConfig::from_parameters(const std::map<std::string, std::string> &parameters)
    {
        ClientConfig config;

        auto it = parameters.find("device_address");
        if (it != parameters.end())
            config.device_address = it->second;

        it = parameters.find("password");
        if (it != parameters.end())
            config.password = it->second;

        it = parameters.find("battery_powered");
        if (it != parameters.end())
        {
            if (it->second == "true")
                config.battery_powered = true;
            else if (it->second == "false")
                config.battery_powered = false;
            else
                throw ClientError("battery_powered must be true or false, got '" + it->second + "'");
        }

        it = parameters.find("max_checksum_retries");
        if (it != parameters.end())
        {
            try
            {
                std::size_t used = 0;
                config.max_checksum_retries = std::stoi(it->second, &used);
                if (used != it->second.size())
                    throw std::invalid_argument(it->second);
            }
            catch (const std::logic_error &)
            {
                throw ClientError("max_checksum_retries is not a number: '" + it->second + "'");
            }
            if (config.max_checksum_retries < 1)
                throw ClientError("max_checksum_retries must be at least 1");
        }

        return config;
    }

    std::chrono::milliseconds duration_from_seconds(const std::string &name, double seconds)
    {
        const double max_seconds = static_cast<double>(std::numeric_limits<int32_t>::max()) / 1000.0;
        if (!std::isfinite(seconds) || seconds < 0.001 || seconds > max_seconds)
        {
            throw ClientError(name + " must be between 0.001 and " +
                              std::to_string(static_cast<int64_t>(max_seconds)) + " s, got " +
                              std::to_string(seconds));
        }
        return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
    }

    uint16_t tcp_port_from_int(int64_t port)
    {
        if (port < 1 || port > std::numeric_limits<uint16_t>::max())
        {
            throw ClientError("tcp_port must be between 1 and 65535, got " + std::to_string(port));
        }
        return static_cast<uint16_t>(port);
    }

} // namespace iec62056_21
