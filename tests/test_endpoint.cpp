#include <gtest/gtest.h>

#include <map>

#include "picoosc/Endpoint.h"
#include "picoosc/Exceptions.h"

using namespace picoosc;

TEST(Endpoint, Url) {
    Endpoint endpoint("127.0.0.1", 19994);
    EXPECT_EQ(endpoint.url(), "osc.udp://127.0.0.1:19994/");
}

TEST(Endpoint, FromUrl) {
    Endpoint endpoint = Endpoint::fromUrl("osc.udp://localhost:8000/");
    EXPECT_EQ(endpoint.host, "localhost");
    EXPECT_EQ(endpoint.port, 8000);

    // Trailing slash is optional
    EXPECT_EQ(Endpoint::fromUrl("osc.udp://10.0.0.2:9000"), Endpoint("10.0.0.2", 9000));

    // Round trip through url()
    Endpoint original("example.org", 65535);
    EXPECT_EQ(Endpoint::fromUrl(original.url()), original);
}

TEST(Endpoint, InvalidUrls) {
    EXPECT_THROW(Endpoint::fromUrl("osc.tcp://localhost:8000/"), AddressException);
    EXPECT_THROW(Endpoint::fromUrl("localhost:8000"), AddressException);
    EXPECT_THROW(Endpoint::fromUrl("osc.udp://localhost/"), AddressException);
    EXPECT_THROW(Endpoint::fromUrl("osc.udp://:8000/"), AddressException);
    EXPECT_THROW(Endpoint::fromUrl("osc.udp://localhost:80a0/"), AddressException);
    EXPECT_THROW(Endpoint::fromUrl("osc.udp://localhost:65536/"), AddressException);
    EXPECT_THROW(Endpoint::fromUrl("osc.udp://localhost:/"), AddressException);
}

TEST(Endpoint, OrderingAndEquality) {
    Endpoint a("127.0.0.1", 1000);
    Endpoint b("127.0.0.1", 2000);
    Endpoint c("localhost", 1000);

    EXPECT_EQ(a, Endpoint("127.0.0.1", 1000));
    EXPECT_NE(a, b);
    EXPECT_NE(a, c);
    EXPECT_TRUE(a < b);

    // Usable as a map key; equal endpoints collapse to one entry
    std::map<Endpoint, int> counts;
    counts[a]++;
    counts[Endpoint("127.0.0.1", 1000)]++;
    counts[c]++;
    EXPECT_EQ(counts.size(), 2u);
    EXPECT_EQ(counts[a], 2);
}
