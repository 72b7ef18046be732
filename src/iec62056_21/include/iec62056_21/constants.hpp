#ifndef IEC62056_21_CONSTANTS_HPP
#define IEC62056_21_CONSTANTS_HPP

#include <cstdint>

namespace iec62056_21
{

    // Control characters used on the wire
    constexpr uint8_t SOH = 0x01;
    constexpr uint8_t STX = 0x02;
    constexpr uint8_t ETX = 0x03;
    constexpr uint8_t EOT = 0x04;
    constexpr uint8_t ACK = 0x06;
    constexpr uint8_t NACK = 0x15;
    constexpr uint8_t CR = 0x0D;
    constexpr uint8_t LF = 0x0A;

    constexpr char START_CHAR = '/';
    constexpr char REQUEST_CHAR = '?';
    constexpr char END_CHAR = '!';
    constexpr char SEPARATOR_CHAR = '\\';
    constexpr const char *LINE_END = "\r\n";

} // namespace iec62056_21

#endif // IEC62056_21_CONSTANTS_HPP
