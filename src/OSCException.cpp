/*
 * PicoOSC - Open Sound Control over UDP.
 * This file contains the implementation of the OSCException class.
 */

#include <unordered_map>

#include "picoosc/Exceptions.h"

namespace picoosc {
    // Static method to get a description for an error code
    std::string OSCException::getErrorDescription(ErrorCode code) {
        static const std::unordered_map<ErrorCode, std::string> descriptions = {
            {ErrorCode::None, "No error"},
            {ErrorCode::EncodeError, "Error during OSC encoding"},
            {ErrorCode::DecodeError, "Malformed OSC packet"},
            {ErrorCode::BindError, "Failed to bind server socket"},
            {ErrorCode::SendError, "Failed to send OSC packet"},
            {ErrorCode::AddressError, "Invalid OSC address"},
            {ErrorCode::TypeMismatch, "OSC type mismatch"},
            {ErrorCode::InvalidArgument, "Invalid argument"},
            {ErrorCode::ServerError, "Server error"},
            {ErrorCode::ConfigError, "Invalid configuration"}};

        auto it = descriptions.find(code);
        if (it != descriptions.end()) {
            return it->second;
        }

        return "Unknown error";
    }
}  // namespace picoosc
