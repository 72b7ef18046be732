#include "iec62056_21/bcc.hpp"
#include "iec62056_21/constants.hpp"
#include "iec62056_21/encoding.hpp"
#include "iec62056_21/exceptions.hpp"

#include <algorithm>

namespace iec62056_21
{

    uint8_t BCC::calculate(const std::vector<uint8_t> &data)
    {
        uint8_t bcc = 0;

        for (uint8_t byte : data)
        {
            bcc ^= byte & 0x7F;
        }

        return bcc & 0x7F;
    }

    std::vector<uint8_t> BCC::add(const std::vector<uint8_t> &message)
    {
        // Calculation starts after the last SOH, falling back to the last STX
        auto marker = std::find(message.rbegin(), message.rend(), SOH);
        if (marker == message.rend())
        {
            marker = std::find(message.rbegin(), message.rend(), STX);
            if (marker == message.rend())
            {
                throw FramingError("No SOH or STX found in message");
            }
        }

        std::vector<uint8_t> data_for_bcc(marker.base(), message.end());

        std::vector<uint8_t> result = message;
        result.push_back(calculate(data_for_bcc));
        return result;
    }

    std::string BCC::add(const std::string &message)
    {
        return decode(add(encode(message)));
    }

    bool BCC::validate(const std::vector<uint8_t> &message)
    {
        if (message.size() < 2)
        {
            return false;
        }

        std::vector<uint8_t> without_bcc(message.begin(), message.end() - 1);
        return add(without_bcc) == message;
    }

    bool BCC::validate(const std::string &message)
    {
        return validate(encode(message));
    }

} // namespace iec62056_21
