/*
 *  PicoOSC - Open Sound Control over UDP.
 *  This file defines exceptions used throughout the PicoOSC library.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace picoosc {
    /**
     * @brief Base exception class for all OSC-related errors
     */
    class OSCException : public std::runtime_error {
       public:
        /**
         * @brief Error codes for OSC exceptions
         */
        enum class ErrorCode {
            None = 0,
            EncodeError,      ///< Argument or address cannot be encoded
            DecodeError,      ///< Packet does not conform to the OSC wire format
            BindError,        ///< Server socket could not be resolved or bound
            SendError,        ///< Datagram could not be transmitted
            AddressError,     ///< Invalid OSC address or endpoint URL
            TypeMismatch,     ///< Value accessed as the wrong type
            InvalidArgument,  ///< Invalid function argument
            ServerError,      ///< Server used in an invalid state
            ConfigError       ///< Configuration could not be parsed
        };

        /**
         * @brief Construct a new OSC Exception
         * @param message Error message
         * @param code Error code
         */
        OSCException(const std::string &message, ErrorCode code = ErrorCode::None)
            : std::runtime_error(message), code_(code) {}

        /**
         * @brief Get the error code
         * @return ErrorCode
         */
        ErrorCode code() const { return code_; }

        /**
         * @brief Get a description for an error code
         * @param code The error code
         * @return std::string The description
         */
        static std::string getErrorDescription(ErrorCode code);

       private:
        ErrorCode code_;
    };

    /**
     * @brief Raised when a message or bundle cannot be encoded
     *
     * Covers invalid addresses, strings with embedded nulls and packets larger
     * than a UDP datagram can carry.
     */
    class EncodeError : public OSCException {
       public:
        EncodeError(const std::string &message) : OSCException(message, ErrorCode::EncodeError) {}
    };

    /**
     * @brief Raised when a byte buffer is not a valid OSC packet
     */
    class DecodeError : public OSCException {
       public:
        DecodeError(const std::string &message) : OSCException(message, ErrorCode::DecodeError) {}
    };

    /**
     * @brief Raised when a server cannot resolve or bind its endpoint
     */
    class BindError : public OSCException {
       public:
        BindError(const std::string &message) : OSCException(message, ErrorCode::BindError) {}
    };

    /**
     * @brief Raised when a client fails to transmit a datagram
     */
    class SendError : public OSCException {
       public:
        SendError(const std::string &message) : OSCException(message, ErrorCode::SendError) {}
    };

    /**
     * @brief Exception for address errors
     */
    class AddressException : public OSCException {
       public:
        AddressException(const std::string &message)
            : OSCException(message, ErrorCode::AddressError) {}
    };

    /**
     * @brief Exception for type mismatches
     */
    class TypeMismatchException : public OSCException {
       public:
        TypeMismatchException(const std::string &message)
            : OSCException(message, ErrorCode::TypeMismatch) {}
    };

    /**
     * @brief Exception for invalid arguments
     */
    class InvalidArgumentException : public OSCException {
       public:
        InvalidArgumentException(const std::string &message)
            : OSCException(message, ErrorCode::InvalidArgument) {}
    };

    /**
     * @brief Exception for server errors
     */
    class ServerException : public OSCException {
       public:
        ServerException(const std::string &message)
            : OSCException(message, ErrorCode::ServerError) {}
    };

    /**
     * @brief Exception for configuration errors
     */
    class ConfigException : public OSCException {
       public:
        ConfigException(const std::string &message)
            : OSCException(message, ErrorCode::ConfigError) {}
    };

}  // namespace picoosc
