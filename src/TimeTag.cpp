/*
 * PicoOSC - Open Sound Control over UDP.
 * This file contains the implementation of the TimeTag class,
 * which is responsible for handling OSC time tags.
 */

#include <chrono>
#include <cstdint>

#include "picoosc/Types.h"

namespace picoosc {

    namespace {
        // Seconds between the NTP epoch (1900) and the Unix epoch (1970)
        constexpr uint64_t NTP_UNIX_OFFSET = 2208988800ULL;
    }  // namespace

    // Default constructor (immediate time tag)
    TimeTag::TimeTag() : seconds_(0), fraction_(1) {}

    // Constructor from NTP format
    TimeTag::TimeTag(uint64_t ntp)
        : seconds_(static_cast<uint32_t>((ntp >> 32) & 0xFFFFFFFF)),
          fraction_(static_cast<uint32_t>(ntp & 0xFFFFFFFF)) {}

    // Constructor from seconds and fraction
    TimeTag::TimeTag(uint32_t seconds, uint32_t fraction) : seconds_(seconds), fraction_(fraction) {}

    // Constructor from std::chrono::system_clock::time_point
    TimeTag::TimeTag(std::chrono::system_clock::time_point tp) {
        auto sinceEpoch = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch());
        auto wholeSeconds = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
        uint64_t nanos = static_cast<uint64_t>((sinceEpoch - wholeSeconds).count());

        seconds_ = static_cast<uint32_t>(static_cast<uint64_t>(wholeSeconds.count()) + NTP_UNIX_OFFSET);
        // Round up so converting back to nanoseconds truncates to the same value
        fraction_ = static_cast<uint32_t>(((nanos << 32) + 999999999ULL) / 1000000000ULL);
    }

    // Static method for current time
    TimeTag TimeTag::now() { return TimeTag(std::chrono::system_clock::now()); }

    // Static method for immediate execution time
    TimeTag TimeTag::immediate() { return TimeTag(); }

    // Convert to NTP format
    uint64_t TimeTag::toNTP() const { return (static_cast<uint64_t>(seconds_) << 32) | fraction_; }

    // Convert to std::chrono::system_clock::time_point
    std::chrono::system_clock::time_point TimeTag::toTimePoint() const {
        auto unixSeconds = static_cast<int64_t>(seconds_) - static_cast<int64_t>(NTP_UNIX_OFFSET);
        auto nanos = static_cast<int64_t>((static_cast<uint64_t>(fraction_) * 1000000000ULL) >> 32);
        auto sinceEpoch = std::chrono::seconds(unixSeconds) + std::chrono::nanoseconds(nanos);
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(sinceEpoch));
    }

    uint32_t TimeTag::seconds() const { return seconds_; }

    uint32_t TimeTag::fraction() const { return fraction_; }

    // Check if immediate
    bool TimeTag::isImmediate() const { return seconds_ == 0 && fraction_ == 1; }

    // Comparison operators
    bool TimeTag::operator==(const TimeTag &other) const {
        return seconds_ == other.seconds_ && fraction_ == other.fraction_;
    }

    bool TimeTag::operator!=(const TimeTag &other) const { return !(*this == other); }

    bool TimeTag::operator<(const TimeTag &other) const { return toNTP() < other.toNTP(); }

}  // namespace picoosc
