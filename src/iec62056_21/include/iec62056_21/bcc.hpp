#ifndef IEC62056_21_BCC_HPP
#define IEC62056_21_BCC_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace iec62056_21
{

    // Block check character: XOR of 7-bit bytes following the last SOH (or STX)
    class BCC
    {
    public:
        BCC() = delete;

        // XOR-fold of the 7-bit masked bytes
        static uint8_t calculate(const std::vector<uint8_t> &data);

        // Append the BCC to a message that already carries its terminator.
        // Throws FramingError when the message has neither SOH nor STX.
        static std::vector<uint8_t> add(const std::vector<uint8_t> &message);
        static std::string add(const std::string &message);

        // True when the last byte matches the BCC of everything before it
        static bool validate(const std::vector<uint8_t> &message);
        static bool validate(const std::string &message);
    };

} // namespace iec62056_21

#endif // IEC62056_21_BCC_HPP
