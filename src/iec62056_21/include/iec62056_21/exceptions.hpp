#ifndef IEC62056_21_EXCEPTIONS_HPP
#define IEC62056_21_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace iec62056_21
{

    // Base for every error raised by the library
    class Iec62056Error : public std::runtime_error
    {
    public:
        explicit Iec62056Error(const std::string &what) : std::runtime_error(what) {}
    };

    // Text or bytes that cannot be decoded into a message
    class ParseError : public Iec62056Error
    {
    public:
        explicit ParseError(const std::string &what) : Iec62056Error(what) {}
    };

    // No SOH or STX marker to start the checksum from
    class FramingError : public ParseError
    {
    public:
        explicit FramingError(const std::string &what) : ParseError(what) {}
    };

    // Checksum mismatch, or an invalid command/command type
    class ValidationError : public Iec62056Error
    {
    public:
        explicit ValidationError(const std::string &what) : Iec62056Error(what) {}
    };

    class TooManyValuesReturned : public Iec62056Error
    {
    public:
        explicit TooManyValuesReturned(const std::string &what) : Iec62056Error(what) {}
    };

    class NoDataReturned : public Iec62056Error
    {
    public:
        explicit NoDataReturned(const std::string &what) : Iec62056Error(what) {}
    };

    class TimeoutError : public Iec62056Error
    {
    public:
        explicit TimeoutError(const std::string &what) : Iec62056Error(what) {}
    };

    class TransportError : public Iec62056Error
    {
    public:
        explicit TransportError(const std::string &what) : Iec62056Error(what) {}
    };

    // Misuse of the client: bad mode name, missing address, unsupported option
    class ClientError : public Iec62056Error
    {
    public:
        explicit ClientError(const std::string &what) : Iec62056Error(what) {}
    };

    // The device answered with something the exchange does not allow
    class ProtocolError : public Iec62056Error
    {
    public:
        explicit ProtocolError(const std::string &what) : Iec62056Error(what) {}
    };

    // Error reported by the device itself, decoded by an ErrorParser
    class DeviceError : public Iec62056Error
    {
    public:
        DeviceError(int code, const std::string &what) : Iec62056Error(what), code_(code) {}

        int code() const { return code_; }

    private:
        int code_;
    };

} // namespace iec62056_21

#endif // IEC62056_21_EXCEPTIONS_HPP
