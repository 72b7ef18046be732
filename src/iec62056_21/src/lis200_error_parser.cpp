#include "iec62056_21/lis200_error_parser.hpp"

#include <map>
#include <regex>

namespace iec62056_21
{

    namespace
    {
        const std::map<int, std::string> &error_catalog()
        {
            static const std::map<int, std::string> catalog = {
                {1, "wrong (unknown) address"},
                {2, "wrong address, object not available"},
                {3, "wrong address, entity for object not available"},
                {4, "wrong address, unknown attribute"},
                {5, "wrong address, attribute for object not available"},
                {6, "value outside of allowed range"},
                {9, "write command on constant not executable"},
                {11, "no value range available since no input is allowed"},
                {13, "wrong input"},
                {14, "unknown units code"},
                {17, "wrong access code"},
                {18, "no read authorization"},
                {19, "no write authorization"},
                {20, "function is locked"},
                {100, "archive number not available"},
                {101, "value position not available"},
                {103, "archive empty"},
                {104, "lower limit (from-value) not found"},
                {105, "upper limit (to-value) not found"},
                {108, "maximum limit of simultaneous opened archives exceeded"},
                {109, "archive entry was overwritten while reading out"},
                {110, "CRC error in archive data record"},
                {180, "source not allowed"},
                {200, "syntax error in telegram"},
                {201, "wrong password in telegram"},
                {222, "EEPROM read error"},
                {223, "EEPROM write error"},
                {249, "encoder mode not possible / counter reading cannot be changed"},
            };
            return catalog;
        }

        const std::regex &error_regex()
        {
            static const std::regex regex(R"(^#(\d{4}))");
            return regex;
        }
    }

    void Lis200ErrorParser::check_for_errors(const AnswerDataMessage &answer) const
    {
        for (const auto &data_set : answer.data())
        {
            std::smatch match;
            if (std::regex_search(data_set.value, match, error_regex()))
            {
                int code = std::stoi(match[1].str());
                throw Lis200Error(code, "LIS-200 error " + std::to_string(code) + ": " + describe(code));
            }
        }
    }

    std::string Lis200ErrorParser::describe(int code)
    {
        auto it = error_catalog().find(code);
        if (it == error_catalog().end())
        {
            return "unknown error";
        }
        return it->second;
    }

} // namespace iec62056_21
