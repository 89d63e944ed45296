/*
 *  PicoOSC - Open Sound Control over UDP.
 *  This header file declares the Bundle class and the Packet variant.
 */

#pragma once

#include <functional>
#include <variant>
#include <vector>

#include "picoosc/Message.h"
#include "picoosc/Types.h"

namespace picoosc {

    class Bundle;

    /**
     * @brief One OSC packet: a message or a bundle
     */
    using Packet = std::variant<Message, Bundle>;

    /**
     * @brief The Bundle class represents an OSC bundle, an ordered collection of OSC
     * messages and nested bundles sharing one time tag.
     */
    class Bundle {
       public:
        /**
         * @brief Construct a new Bundle object with the specified time tag
         * @param timeTag The time at which this bundle should be executed (default: immediate)
         */
        explicit Bundle(const TimeTag &timeTag = TimeTag::immediate());

        /**
         * @brief Append a message to this bundle
         * @return Reference to this bundle for method chaining
         */
        Bundle &addMessage(const Message &message);
        Bundle &addMessage(Message &&message);

        /**
         * @brief Append another bundle as a child of this bundle
         * @return Reference to this bundle for method chaining
         */
        Bundle &addBundle(const Bundle &bundle);
        Bundle &addBundle(Bundle &&bundle);

        TimeTag getTimeTag() const;

        /**
         * @brief Elements in the order they were added
         */
        const std::vector<Packet> &elements() const;

        size_t size() const;
        bool isEmpty() const;

        /**
         * @brief Execute a function for each message in the bundle and its sub-bundles,
         * depth-first in element order
         */
        void forEach(const std::function<void(const Message &)> &callback) const;

        bool operator==(const Bundle &other) const;
        bool operator!=(const Bundle &other) const;

       private:
        TimeTag timeTag_;
        std::vector<Packet> elements_;
    };

}  // namespace picoosc
