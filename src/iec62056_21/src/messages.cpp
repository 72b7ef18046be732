#include "iec62056_21/messages.hpp"
#include "iec62056_21/bcc.hpp"
#include "iec62056_21/constants.hpp"
#include "iec62056_21/exceptions.hpp"

#include <regex>

namespace iec62056_21
{

    namespace
    {
        // Compiled once, shared by every parse
        const std::regex &data_set_regex()
        {
            static const std::regex regex(R"(^(.+)\((.*)\))");
            return regex;
        }

        const std::regex &value_unit_regex()
        {
            static const std::regex regex(R"(^(.*)\*(.*))");
            return regex;
        }

        const std::regex &just_value_regex()
        {
            static const std::regex regex(R"(^\((.*)\))");
            return regex;
        }

        // Line boundaries in latin-1 text: CR, LF, VT, FF, FS, GS, RS and NEL
        bool is_line_break(char c)
        {
            switch (static_cast<uint8_t>(c))
            {
            case '\r':
            case '\n':
            case 0x0B:
            case 0x0C:
            case 0x1C:
            case 0x1D:
            case 0x1E:
            case 0x85:
                return true;
            default:
                return false;
            }
        }

        // CR LF counts as one boundary. A trailing terminator does not open an extra line.
        std::vector<std::string> split_lines(const std::string &text)
        {
            std::vector<std::string> lines;
            std::string current;
            bool pending = false;

            for (std::size_t i = 0; i < text.size(); ++i)
            {
                char c = text[i];
                if (is_line_break(c))
                {
                    if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
                    {
                        ++i;
                    }
                    lines.push_back(current);
                    current.clear();
                    pending = false;
                }
                else
                {
                    current += c;
                    pending = true;
                }
            }

            if (pending)
            {
                lines.push_back(current);
            }

            return lines;
        }

        std::vector<DataSet> flatten(const DataBlock &block)
        {
            std::vector<DataSet> data_sets;
            for (const auto &line : block.data_lines)
            {
                data_sets.insert(data_sets.end(), line.data_sets.begin(), line.data_sets.end());
            }
            return data_sets;
        }

        // Strip a fixed header and trailer after checking the frame length
        std::string inner(const std::string &text, std::size_t head, std::size_t tail,
                          const char *what)
        {
            if (text.size() < head + tail)
            {
                throw ParseError(std::string(what) + " is too short: " + printable(text));
            }
            return text.substr(head, text.size() - head - tail);
        }

        const std::string ALLOWED_COMMANDS = "PWREB";
    }

    // ---- DataSet ----

    std::string DataSet::to_representation() const
    {
        if (address && unit)
        {
            return *address + "(" + value + "*" + *unit + ")";
        }
        if (address)
        {
            return *address + "(" + value + ")";
        }
        return "(" + value + ")";
    }

    DataSet DataSet::from_representation(const std::string &text)
    {
        std::smatch match;

        if (std::regex_search(text, match, just_value_regex()))
        {
            return DataSet{match[1].str(), std::nullopt, std::nullopt};
        }

        if (!std::regex_search(text, match, data_set_regex()))
        {
            throw ParseError("Unable to find address and data in " + printable(text));
        }

        std::string address = match[1].str();
        std::string values = match[2].str();

        std::smatch value_match;
        if (std::regex_search(values, value_match, value_unit_regex()))
        {
            return DataSet{value_match[1].str(), address, value_match[2].str()};
        }

        return DataSet{values, address, std::nullopt};
    }

    bool DataSet::operator==(const DataSet &other) const
    {
        return value == other.value && address == other.address && unit == other.unit;
    }

    // ---- DataLine ----

    std::string DataLine::to_representation() const
    {
        std::string out;
        for (const auto &data_set : data_sets)
        {
            out += data_set.to_representation();
        }
        return out;
    }

    DataLine DataLine::from_representation(const std::string &text)
    {
        DataLine line;
        std::size_t begin = 0;
        std::size_t end = text.find(')');

        while (end != std::string::npos)
        {
            line.data_sets.push_back(DataSet::from_representation(text.substr(begin, end + 1 - begin)));
            begin = end + 1;
            end = text.find(')', begin);
        }

        return line;
    }

    // ---- DataBlock ----

    std::string DataBlock::to_representation() const
    {
        std::string out;
        for (const auto &line : data_lines)
        {
            out += line.to_representation() + LINE_END;
        }
        return out;
    }

    DataBlock DataBlock::from_representation(const std::string &text)
    {
        DataBlock block;
        for (const auto &line : split_lines(text))
        {
            block.data_lines.push_back(DataLine::from_representation(line));
        }
        return block;
    }

    // ---- RequestMessage ----

    std::string RequestMessage::to_representation() const
    {
        return std::string{START_CHAR, REQUEST_CHAR} + device_address + END_CHAR + LINE_END;
    }

    RequestMessage RequestMessage::from_representation(const std::string &text)
    {
        return RequestMessage{inner(text, 2, 3, "Request message")};
    }

    // ---- IdentificationMessage ----

    std::string IdentificationMessage::to_representation() const
    {
        return START_CHAR + manufacturer + switchover_baudrate_char + SEPARATOR_CHAR +
               identification + LINE_END;
    }

    IdentificationMessage IdentificationMessage::from_representation(const std::string &text)
    {
        // /XXXZ\ + CR LF is the shortest identification
        if (text.size() < 8 || text[0] != START_CHAR)
        {
            throw ParseError("Invalid identification message: " + printable(text));
        }

        IdentificationMessage message;
        message.manufacturer = text.substr(1, 3);
        message.switchover_baudrate_char = text[4];
        message.identification = text.substr(6, text.size() - 8);
        return message;
    }

    // ---- AckOptionSelectMessage ----

    std::string AckOptionSelectMessage::to_representation() const
    {
        return std::string{static_cast<char>(ACK), protocol_char, baud_char, mode_char} + LINE_END;
    }

    AckOptionSelectMessage AckOptionSelectMessage::from_representation(const std::string &text)
    {
        if (text.size() < 4 || static_cast<uint8_t>(text[0]) != ACK)
        {
            throw ParseError("Invalid option select message: " + printable(text));
        }

        AckOptionSelectMessage message;
        message.protocol_char = text[1];
        message.baud_char = text[2];
        message.mode_char = text[3];
        return message;
    }

    // ---- CommandMessage ----

    CommandMessage::CommandMessage(char command, char command_type, std::optional<DataSet> data_set)
        : command_(command),
          command_type_(command_type),
          data_set_(std::move(data_set))
    {
        if (ALLOWED_COMMANDS.find(command) == std::string::npos)
        {
            throw ValidationError(std::string("Invalid command '") + command + "'");
        }
        if (command_type < '0' || command_type > '9')
        {
            throw ValidationError(std::string("Invalid command type '") + command_type + "'");
        }
    }

    CommandMessage CommandMessage::for_single_read(const std::string &address,
                                                   const std::string &additional_data)
    {
        return CommandMessage('R', '1', DataSet{additional_data, address, std::nullopt});
    }

    CommandMessage CommandMessage::for_single_write(const std::string &address,
                                                    const std::string &value)
    {
        return CommandMessage('W', '1', DataSet{value, address, std::nullopt});
    }

    std::string CommandMessage::to_representation() const
    {
        std::string message{static_cast<char>(SOH), command_, command_type_};

        if (data_set_)
        {
            message += static_cast<char>(STX);
            message += data_set_->to_representation();
        }
        message += static_cast<char>(ETX);

        return BCC::add(message);
    }

    CommandMessage CommandMessage::from_representation(const std::string &text)
    {
        if (text.size() < 5 || static_cast<uint8_t>(text[0]) != SOH)
        {
            throw ParseError("Invalid command message: " + printable(text));
        }
        if (!BCC::validate(text))
        {
            throw ValidationError("BCC not valid in " + printable(text));
        }

        // Body is everything between the header and the BCC
        std::string body = text.substr(3, text.size() - 4);

        std::optional<DataSet> data_set;
        if (static_cast<uint8_t>(body.front()) == STX)
        {
            data_set = DataSet::from_representation(inner(body, 1, 1, "Command data set"));
        }
        else if (body.size() != 1 || static_cast<uint8_t>(body.front()) != ETX)
        {
            throw ParseError("Invalid command body: " + printable(body));
        }

        return CommandMessage(text[1], text[2], std::move(data_set));
    }

    // ---- AnswerDataMessage ----

    AnswerDataMessage::AnswerDataMessage(DataBlock data_block)
        : data_block_(std::move(data_block))
    {
    }

    const std::vector<DataSet> &AnswerDataMessage::data() const
    {
        if (!cached_data_)
        {
            cached_data_ = flatten(data_block_);
        }
        return *cached_data_;
    }

    std::string AnswerDataMessage::to_representation() const
    {
        std::string message = static_cast<char>(STX) + data_block_.to_representation() +
                              static_cast<char>(ETX);
        return BCC::add(message);
    }

    AnswerDataMessage AnswerDataMessage::from_representation(const std::string &text)
    {
        if (text.size() < 3 || static_cast<uint8_t>(text[0]) != STX)
        {
            throw ParseError("Invalid answer message: " + printable(text));
        }
        if (!BCC::validate(text))
        {
            throw ValidationError("BCC not valid in " + printable(text));
        }

        // STX ... ETX BCC
        return AnswerDataMessage(DataBlock::from_representation(inner(text, 1, 2, "Answer message")));
    }

    // ---- ReadoutDataMessage ----

    ReadoutDataMessage::ReadoutDataMessage(DataBlock data_block)
        : data_block_(std::move(data_block))
    {
    }

    const std::vector<DataSet> &ReadoutDataMessage::data() const
    {
        if (!cached_data_)
        {
            cached_data_ = flatten(data_block_);
        }
        return *cached_data_;
    }

    std::string ReadoutDataMessage::to_representation() const
    {
        std::string message = static_cast<char>(STX) + data_block_.to_representation() +
                              END_CHAR + LINE_END + static_cast<char>(ETX);
        return BCC::add(message);
    }

    ReadoutDataMessage ReadoutDataMessage::from_representation(const std::string &text)
    {
        if (text.size() < 6 || static_cast<uint8_t>(text[0]) != STX)
        {
            throw ParseError("Invalid readout message: " + printable(text));
        }
        if (!BCC::validate(text))
        {
            throw ValidationError("BCC not valid in " + printable(text));
        }

        // STX ... ! CR LF ETX BCC
        return ReadoutDataMessage(DataBlock::from_representation(inner(text, 1, 5, "Readout message")));
    }

    std::string to_representation(const Message &message)
    {
        return std::visit([](const auto &m)
                          { return m.to_representation(); },
                          message);
    }

} // namespace iec62056_21
