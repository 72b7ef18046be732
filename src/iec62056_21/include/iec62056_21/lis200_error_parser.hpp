#ifndef IEC62056_21_LIS200_ERROR_PARSER_HPP
#define IEC62056_21_LIS200_ERROR_PARSER_HPP

#include <string>

#include "iec62056_21/error_parser.hpp"
#include "iec62056_21/exceptions.hpp"

namespace iec62056_21
{

    class Lis200Error : public DeviceError
    {
    public:
        Lis200Error(int code, const std::string &what) : DeviceError(code, what) {}
    };

    // LIS-200 devices (Elster volume correctors) answer with #NNNN in place of the value
    class Lis200ErrorParser : public ErrorParser
    {
    public:
        // Throws Lis200Error for the first data set carrying an error code
        void check_for_errors(const AnswerDataMessage &answer) const override;

        // Catalog text for a code, "unknown error" if not listed
        static std::string describe(int code);
    };

} // namespace iec62056_21

#endif // IEC62056_21_LIS200_ERROR_PARSER_HPP
