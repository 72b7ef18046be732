#ifndef IEC62056_21_ERROR_PARSER_HPP
#define IEC62056_21_ERROR_PARSER_HPP

#include "iec62056_21/messages.hpp"

namespace iec62056_21
{

    // Device errors arrive as ordinary data sets in a manufacturer specific
    // format. An ErrorParser inspects an answer and throws a DeviceError.
    class ErrorParser
    {
    public:
        virtual ~ErrorParser() = default;

        virtual void check_for_errors(const AnswerDataMessage &answer) const = 0;
    };

    // Default: treats every answer as error free
    class NullErrorParser : public ErrorParser
    {
    public:
        void check_for_errors(const AnswerDataMessage &) const override {}
    };

} // namespace iec62056_21

#endif // IEC62056_21_ERROR_PARSER_HPP
