/*
 *  PicoOSC - Open Sound Control over UDP.
 *  This header file declares the Message class, which represents an OSC message,
 *  including its address and arguments.
 */

#pragma once

#include <string>
#include <vector>

#include "picoosc/Types.h"

namespace picoosc {
    /**
     * @brief The Message class represents an OSC message.
     */
    class Message {
       public:
        /**
         * @brief Construct a new OSC Message object
         * @param address The OSC address (must start with '/')
         * @throws AddressException if the address is empty or does not start with '/'
         */
        explicit Message(const std::string &address);

        /**
         * @brief Construct a message with its arguments
         * @param address The OSC address (must start with '/')
         * @param arguments The argument list
         */
        Message(const std::string &address, std::vector<Value> arguments);

        /**
         * @brief Get the OSC address
         */
        const std::string &getAddress() const;

        /**
         * @brief Get the arguments in this message
         */
        const std::vector<Value> &getArguments() const;

        /**
         * @brief Get one argument
         * @throws InvalidArgumentException if index is out of range
         */
        const Value &getArgument(size_t index) const;

        size_t getArgumentCount() const;

        // Builders, each returning *this for method chaining
        Message &addInt32(int32_t value);
        Message &addFloat(float value);
        Message &addString(const std::string &value);
        Message &addBlob(const void *data, size_t size);
        Message &addBool(bool value);
        Message &addNil();
        Message &addArray(const std::vector<Value> &array);
        Message &addValue(const Value &value);

        /**
         * @brief Short description such as /some/addr ["text", 42]
         */
        std::string toString() const;

        bool operator==(const Message &other) const;
        bool operator!=(const Message &other) const;

       private:
        std::string address_;
        std::vector<Value> arguments_;
    };

}  // namespace picoosc
