#ifndef IEC62056_21_ENCODING_HPP
#define IEC62056_21_ENCODING_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace iec62056_21
{

    // Latin-1: exactly one byte per character in both directions
    std::vector<uint8_t> encode(const std::string &text);
    std::string decode(const std::vector<uint8_t> &data);

    // Render control bytes as <STX>, <ETX>, ... for log output
    std::string printable(const std::string &text);
    std::string printable(const std::vector<uint8_t> &data);

} // namespace iec62056_21

#endif // IEC62056_21_ENCODING_HPP
