/*
 * PicoOSC - Open Sound Control over UDP.
 * This file contains the implementation of the Message class.
 */

#include "picoosc/Message.h"

#include "picoosc/Exceptions.h"

namespace picoosc {
    namespace {
        void validateAddress(const std::string &address) {
            if (address.empty() || address[0] != '/') {
                throw AddressException("Invalid OSC address '" + address +
                                       "' (must start with '/')");
            }
            for (char c : address) {
                if (static_cast<unsigned char>(c) >= 0x80) {
                    throw AddressException("Invalid OSC address '" + address +
                                           "' (non-ASCII character)");
                }
            }
        }
    }  // namespace

    // Constructor for Message class with address validation
    Message::Message(const std::string &address) : address_(address) { validateAddress(address_); }

    Message::Message(const std::string &address, std::vector<Value> arguments)
        : address_(address), arguments_(std::move(arguments)) {
        validateAddress(address_);
    }

    const std::string &Message::getAddress() const { return address_; }

    const std::vector<Value> &Message::getArguments() const { return arguments_; }

    const Value &Message::getArgument(size_t index) const {
        if (index >= arguments_.size()) {
            throw InvalidArgumentException("Argument index " + std::to_string(index) +
                                           " out of range for " + address_);
        }
        return arguments_[index];
    }

    size_t Message::getArgumentCount() const { return arguments_.size(); }

    // Add an Int32 argument (type tag 'i')
    Message &Message::addInt32(int32_t value) {
        arguments_.emplace_back(value);
        return *this;
    }

    // Add a Float argument (type tag 'f')
    Message &Message::addFloat(float value) {
        arguments_.emplace_back(value);
        return *this;
    }

    // Add a String argument (type tag 's')
    Message &Message::addString(const std::string &value) {
        arguments_.emplace_back(value);
        return *this;
    }

    // Add a Blob argument from raw data (type tag 'b')
    Message &Message::addBlob(const void *data, size_t size) {
        arguments_.emplace_back(Blob(data, size));
        return *this;
    }

    // Add a boolean argument (type tag 'T' or 'F')
    Message &Message::addBool(bool value) {
        arguments_.emplace_back(value);
        return *this;
    }

    // Add a Nil argument (type tag 'N')
    Message &Message::addNil() {
        arguments_.push_back(Value::nil());
        return *this;
    }

    // Add an Array of arguments (type tags '[ ... ]')
    Message &Message::addArray(const std::vector<Value> &array) {
        arguments_.emplace_back(Value::Array(array));
        return *this;
    }

    // Add a generic Value argument
    Message &Message::addValue(const Value &value) {
        arguments_.push_back(value);
        return *this;
    }

    std::string Message::toString() const {
        return address_ + " " + Value(arguments_).toString();
    }

    bool Message::operator==(const Message &other) const {
        return address_ == other.address_ && arguments_ == other.arguments_;
    }

    bool Message::operator!=(const Message &other) const { return !(*this == other); }

}  // namespace picoosc
