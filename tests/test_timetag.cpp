#include <gtest/gtest.h>

#include <chrono>

#include "picoosc/Types.h"

using namespace picoosc;

TEST(TimeTag, Immediate) {
    TimeTag immediate = TimeTag::immediate();
    EXPECT_TRUE(immediate.isImmediate());
    EXPECT_EQ(immediate.seconds(), 0u);
    EXPECT_EQ(immediate.fraction(), 1u);
    EXPECT_EQ(immediate.toNTP(), 1u);
    EXPECT_EQ(TimeTag(), immediate);
}

TEST(TimeTag, Now) {
    TimeTag now = TimeTag::now();
    EXPECT_FALSE(now.isImmediate());

    // Seconds since 1900 are well past the Unix epoch offset
    EXPECT_GT(now.seconds(), 2208988800u);
}

TEST(TimeTag, Comparison) {
    TimeTag immediate = TimeTag::immediate();
    TimeTag now = TimeTag::now();
    EXPECT_TRUE(immediate < now);
    EXPECT_FALSE(now < immediate);
    EXPECT_NE(immediate, now);

    EXPECT_TRUE(TimeTag(10u, 5u) < TimeTag(10u, 6u));
    EXPECT_TRUE(TimeTag(10u, 0xFFFFFFFFu) < TimeTag(11u, 0u));
}

TEST(TimeTag, NtpConversion) {
    TimeTag tag(0x83AA7E80u, 0x80000000u);
    EXPECT_EQ(tag.toNTP(), 0x83AA7E8080000000ull);
    EXPECT_EQ(TimeTag(tag.toNTP()), tag);
}

TEST(TimeTag, TimePointConversion) {
    // The Unix epoch is 2208988800 seconds after the NTP epoch
    TimeTag epoch(std::chrono::system_clock::time_point{});
    EXPECT_EQ(epoch.seconds(), 2208988800u);
    EXPECT_EQ(epoch.fraction(), 0u);

    // Half a second is half of the fraction range
    auto halfSecond = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(500)));
    EXPECT_EQ(TimeTag(halfSecond).fraction(), 0x80000000u);

    auto tp = std::chrono::system_clock::now();
    EXPECT_EQ(TimeTag(tp).toTimePoint(), tp);
}
