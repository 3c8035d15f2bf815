#include "../discovery/result_set.hpp"
#include "../discovery/constants.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

using namespace openfan;
using namespace openfan::discovery;

namespace
{

ServiceEntry entry(const std::string& name, int32_t iface = 2,
                   int32_t proto = 0)
{
    return ServiceEntry{iface, proto, name, "_http._tcp", "local"};
}

std::vector<std::string> names(const std::vector<Device>& ds)
{
    std::vector<std::string> out;
    for (const auto& d : ds)
        out.push_back(d.name);
    return out;
}

} // namespace

TEST(DeviceFromServiceName, StripsPrefixTokenOnce)
{
    auto d = deviceFromServiceName("uOpenFan-Desk", kNamePrefix);
    ASSERT_TRUE(d);
    EXPECT_EQ(d->name, "Desk");
    EXPECT_EQ(d->baseUrl, "http://uOpenFan-Desk.local");

    d = deviceFromServiceName("uOpenFan-uOpenFan-X", kNamePrefix);
    ASSERT_TRUE(d);
    EXPECT_EQ(d->name, "uOpenFan-X");
    EXPECT_EQ(d->baseUrl, "http://uOpenFan-uOpenFan-X.local");
}

TEST(DeviceFromServiceName, PrefixWithoutDashKeepsName)
{
    auto d = deviceFromServiceName("uOpenFanLab", kNamePrefix);
    ASSERT_TRUE(d);
    EXPECT_EQ(d->name, "uOpenFanLab");
    EXPECT_EQ(d->baseUrl, "http://uOpenFanLab.local");
}

TEST(DeviceFromServiceName, OtherNamesExcluded)
{
    EXPECT_FALSE(deviceFromServiceName("OtherService", kNamePrefix));
    EXPECT_FALSE(deviceFromServiceName("uopenfan-desk", kNamePrefix));
    EXPECT_FALSE(deviceFromServiceName("My uOpenFan-Desk", kNamePrefix));
    EXPECT_FALSE(deviceFromServiceName("", kNamePrefix));
}

TEST(BuildDevices, ScenarioFromMixedNetwork)
{
    std::set<ServiceEntry> s{entry("uOpenFan-Rack1"), entry("OtherService"),
                             entry("uOpenFan-Desk")};
    auto ds = buildDevices(s, kNamePrefix);
    EXPECT_EQ(names(ds), (std::vector<std::string>{"Desk", "Rack1"}));
}

TEST(BuildDevices, SameInstanceOnSeveralInterfacesIsOneDevice)
{
    std::set<ServiceEntry> s{entry("uOpenFan-Desk", 2, 0),
                             entry("uOpenFan-Desk", 2, 1),
                             entry("uOpenFan-Desk", 3, 0)};
    auto ds = buildDevices(s, kNamePrefix);
    ASSERT_EQ(ds.size(), 1u);
    EXPECT_EQ(ds[0].name, "Desk");
}

TEST(BuildDevices, EmptySetGivesEmptyList)
{
    EXPECT_TRUE(buildDevices({}, kNamePrefix).empty());
}

TEST(ResultSet, AddRemoveReportChange)
{
    ResultSet rs;
    EXPECT_TRUE(rs.add(entry("uOpenFan-Desk")));
    EXPECT_FALSE(rs.add(entry("uOpenFan-Desk")));
    EXPECT_TRUE(rs.add(entry("uOpenFan-Desk", 3)));
    EXPECT_EQ(rs.entries().size(), 2u);

    EXPECT_TRUE(rs.remove(entry("uOpenFan-Desk")));
    EXPECT_FALSE(rs.remove(entry("uOpenFan-Desk")));
    EXPECT_EQ(rs.entries().size(), 1u);

    rs.clear();
    EXPECT_TRUE(rs.entries().empty());
}
