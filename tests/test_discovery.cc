#include "prelude.hh"
#include "discovery.hh"
#include <gtest/gtest.h>

using ports_t = std::vector<std::string>;

TEST(FixedDiscovery, ListsPortsInOrder)
{
    auto disc = discovery::fixed(ports_t { "/dev/ttyACM1", "/dev/ttyACM0" });
    ports_t ports = { "stale" };

    EXPECT_EQ(disc.list_ports(ports), TAPE_SUCCESS);
    EXPECT_EQ(ports, (ports_t { "/dev/ttyACM1", "/dev/ttyACM0" }));
}

TEST(FixedDiscovery, EmptyIsNotAnError)
{
    discovery::fixed disc;
    ports_t ports = { "stale" };

    EXPECT_EQ(disc.list_ports(ports), TAPE_SUCCESS);
    EXPECT_TRUE(ports.empty());
}

TEST(FixedDiscovery, ParsesCommaList)
{
    auto disc = discovery::fixed::from_list(" /dev/ttyACM0 ,, /dev/ttyUSB1,\t");
    ports_t ports;

    EXPECT_EQ(disc.len(), 2u);
    ASSERT_EQ(disc.list_ports(ports), TAPE_SUCCESS);
    EXPECT_EQ(ports, (ports_t { "/dev/ttyACM0", "/dev/ttyUSB1" }));
}

TEST(FixedDiscovery, NullOrBlankListIsEmpty)
{
    EXPECT_EQ(discovery::fixed::from_list(nullptr).len(), 0u);
    EXPECT_EQ(discovery::fixed::from_list("").len(), 0u);
    EXPECT_EQ(discovery::fixed::from_list(" , ").len(), 0u);
}
