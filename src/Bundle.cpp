/*
 * PicoOSC - Open Sound Control over UDP.
 * This file contains the implementation of the Bundle class.
 */

#include "picoosc/Bundle.h"

#include <utility>

namespace picoosc {
    // Constructor with time tag
    Bundle::Bundle(const TimeTag &timeTag) : timeTag_(timeTag) {}

    // Add a message to the bundle
    Bundle &Bundle::addMessage(const Message &message) {
        elements_.emplace_back(message);
        return *this;
    }

    Bundle &Bundle::addMessage(Message &&message) {
        elements_.emplace_back(std::move(message));
        return *this;
    }

    // Add a child bundle to this bundle
    Bundle &Bundle::addBundle(const Bundle &bundle) {
        elements_.emplace_back(bundle);
        return *this;
    }

    // Take ownership of a child bundle without copying its elements
    Bundle &Bundle::addBundle(Bundle &&bundle) {
        elements_.emplace_back(std::move(bundle));
        return *this;
    }

    TimeTag Bundle::getTimeTag() const { return timeTag_; }

    const std::vector<Packet> &Bundle::elements() const { return elements_; }

    size_t Bundle::size() const { return elements_.size(); }

    bool Bundle::isEmpty() const { return elements_.empty(); }

    // Execute a function for each message in the bundle and its sub-bundles
    void Bundle::forEach(const std::function<void(const Message &)> &callback) const {
        for (const auto &element : elements_) {
            if (const auto *message = std::get_if<Message>(&element)) {
                callback(*message);
            } else {
                std::get<Bundle>(element).forEach(callback);
            }
        }
    }

    bool Bundle::operator==(const Bundle &other) const {
        return timeTag_ == other.timeTag_ && elements_ == other.elements_;
    }

    bool Bundle::operator!=(const Bundle &other) const { return !(*this == other); }

}  // namespace picoosc
