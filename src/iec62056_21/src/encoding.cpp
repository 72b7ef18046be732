#include "iec62056_21/encoding.hpp"
#include "iec62056_21/constants.hpp"

#include <cstdio>

namespace iec62056_21
{

    std::vector<uint8_t> encode(const std::string &text)
    {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    std::string decode(const std::vector<uint8_t> &data)
    {
        return std::string(data.begin(), data.end());
    }

    std::string printable(const std::string &text)
    {
        std::string out;
        out.reserve(text.size());

        for (char c : text)
        {
            uint8_t byte = static_cast<uint8_t>(c);
            switch (byte)
            {
            case SOH:
                out += "<SOH>";
                break;
            case STX:
                out += "<STX>";
                break;
            case ETX:
                out += "<ETX>";
                break;
            case EOT:
                out += "<EOT>";
                break;
            case ACK:
                out += "<ACK>";
                break;
            case NACK:
                out += "<NACK>";
                break;
            case CR:
                out += "<CR>";
                break;
            case LF:
                out += "<LF>";
                break;
            default:
                if (byte < 0x20 || byte == 0x7F)
                {
                    char hex[8];
                    std::snprintf(hex, sizeof(hex), "<%02X>", byte);
                    out += hex;
                }
                else
                {
                    out += c;
                }
            }
        }

        return out;
    }

    std::string printable(const std::vector<uint8_t> &data)
    {
        return printable(decode(data));
    }

} // namespace iec62056_21
