#ifndef IEC62056_21_MESSAGES_HPP
#define IEC62056_21_MESSAGES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "iec62056_21/encoding.hpp"

namespace iec62056_21
{

    // Smallest unit of a response: {address}({value}*{unit})
    struct DataSet
    {
        std::string value;
        std::optional<std::string> address;
        std::optional<std::string> unit;

        std::string to_representation() const;
        static DataSet from_representation(const std::string &text);

        bool operator==(const DataSet &other) const;
        bool operator!=(const DataSet &other) const { return !(*this == other); }
    };

    // Data sets written back to back on one line
    struct DataLine
    {
        std::vector<DataSet> data_sets;

        std::string to_representation() const;

        // Splits after every ')', so a value can never contain one
        static DataLine from_representation(const std::string &text);

        bool operator==(const DataLine &other) const { return data_sets == other.data_sets; }
    };

    // Data lines, each terminated by CR LF
    struct DataBlock
    {
        std::vector<DataLine> data_lines;

        std::string to_representation() const;
        static DataBlock from_representation(const std::string &text);

        bool operator==(const DataBlock &other) const { return data_lines == other.data_lines; }
    };

    // /?{address}!CRLF
    struct RequestMessage
    {
        std::string device_address;

        std::string to_representation() const;
        static RequestMessage from_representation(const std::string &text);
    };

    // /{manufacturer}{baud}\{identification}CRLF
    struct IdentificationMessage
    {
        std::string identification;
        std::string manufacturer;
        char switchover_baudrate_char = '0';

        std::string to_representation() const;
        static IdentificationMessage from_representation(const std::string &text);
    };

    // ACK{protocol}{baud}{mode}CRLF
    struct AckOptionSelectMessage
    {
        char baud_char = '0';
        char mode_char = '0';
        char protocol_char = '0';

        std::string to_representation() const;
        static AckOptionSelectMessage from_representation(const std::string &text);
    };

    // SOH{command}{type}[STX{data set}]ETX{bcc}
    class CommandMessage
    {
    public:
        // Throws ValidationError for a command outside P,W,R,E,B or a type outside 0-9
        CommandMessage(char command, char command_type,
                       std::optional<DataSet> data_set = std::nullopt);

        static CommandMessage for_single_read(const std::string &address,
                                              const std::string &additional_data = "");
        static CommandMessage for_single_write(const std::string &address,
                                               const std::string &value);

        char command() const { return command_; }
        char command_type() const { return command_type_; }
        const std::optional<DataSet> &data_set() const { return data_set_; }

        std::string to_representation() const;
        static CommandMessage from_representation(const std::string &text);

    private:
        char command_;
        char command_type_;
        std::optional<DataSet> data_set_;
    };

    // STX{data block}ETX{bcc}
    class AnswerDataMessage
    {
    public:
        explicit AnswerDataMessage(DataBlock data_block);

        const DataBlock &data_block() const { return data_block_; }

        // All data sets of all lines, flattened in order. Computed on first use.
        const std::vector<DataSet> &data() const;

        std::string to_representation() const;
        static AnswerDataMessage from_representation(const std::string &text);

    private:
        DataBlock data_block_;
        mutable std::optional<std::vector<DataSet>> cached_data_;
    };

    // STX{data block}!CRLF ETX{bcc}
    class ReadoutDataMessage
    {
    public:
        explicit ReadoutDataMessage(DataBlock data_block);

        const DataBlock &data_block() const { return data_block_; }
        const std::vector<DataSet> &data() const;

        std::string to_representation() const;
        static ReadoutDataMessage from_representation(const std::string &text);

    private:
        DataBlock data_block_;
        mutable std::optional<std::vector<DataSet>> cached_data_;
    };

    using Message = std::variant<RequestMessage, IdentificationMessage, AckOptionSelectMessage,
                                 CommandMessage, AnswerDataMessage, ReadoutDataMessage>;

    // What a device may send back after a command or a mode select
    using Response = std::variant<CommandMessage, AnswerDataMessage>;

    std::string to_representation(const Message &message);

    inline std::vector<uint8_t> to_bytes(const Message &message)
    {
        return encode(to_representation(message));
    }

    template <typename T>
    std::vector<uint8_t> to_bytes(const T &message)
    {
        return encode(message.to_representation());
    }

    template <typename T>
    T from_bytes(const std::vector<uint8_t> &data)
    {
        return T::from_representation(decode(data));
    }

} // namespace iec62056_21

#endif // IEC62056_21_MESSAGES_HPP
