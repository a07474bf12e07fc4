#include <gtest/gtest.h>

#include "ssdp/device/device_registry.hpp"
#include "ssdp/message/ssdp_error.hpp"

#include <algorithm>
#include <thread>

using ssdp::Device;
using ssdp::DeviceRegistry;

namespace
{

Device device(const std::string& usn, const std::string& search_target)
{
    return Device(usn, search_target, "http://10.0.0.1/" + usn);
}

std::vector<std::string> usns(const std::vector<Device>& devices)
{
    std::vector<std::string> result;
    for (const auto& entry : devices)
    {
        result.push_back(entry.usn());
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace

TEST(DeviceRegistry, RegisterAndFind)
{
    DeviceRegistry registry;

    EXPECT_FALSE(registry.register_device(device("uuid:1", "urn:a")));
    ASSERT_TRUE(registry.find("uuid:1"));
    EXPECT_EQ(registry.find("uuid:1")->search_target(), "urn:a");
    EXPECT_FALSE(registry.find("uuid:2"));
    EXPECT_EQ(registry.size(), 1U);
}

TEST(DeviceRegistry, DuplicateUsnKeepsFirst)
{
    DeviceRegistry registry;
    ASSERT_FALSE(registry.register_device(device("uuid:1", "urn:a")));

    auto error_code = registry.register_device(device("uuid:1", "urn:b"));

    EXPECT_EQ(error_code, ssdp::error::duplicate_usn);
    EXPECT_EQ(registry.size(), 1U);
    EXPECT_EQ(registry.find("uuid:1")->search_target(), "urn:a");
}

TEST(DeviceRegistry, EmptyUsnRejected)
{
    DeviceRegistry registry;

    EXPECT_EQ(registry.register_device(device("", "urn:a")), ssdp::error::invalid_device);
    EXPECT_EQ(registry.size(), 0U);
}

TEST(DeviceRegistry, DeregisterIsIdempotent)
{
    DeviceRegistry registry;
    ASSERT_FALSE(registry.register_device(device("uuid:1", "urn:a")));

    EXPECT_TRUE(registry.deregister_device("uuid:1"));
    EXPECT_FALSE(registry.deregister_device("uuid:1"));
    EXPECT_FALSE(registry.deregister_device("uuid:never"));
    EXPECT_EQ(registry.size(), 0U);
}

TEST(DeviceRegistry, TakeRemovesAndReturnsDevice)
{
    DeviceRegistry registry;
    ASSERT_FALSE(registry.register_device(device("uuid:1", "urn:a")));

    auto taken = registry.take("uuid:1");

    ASSERT_TRUE(taken);
    EXPECT_EQ(taken->usn(), "uuid:1");
    EXPECT_EQ(taken->search_target(), "urn:a");
    EXPECT_EQ(registry.size(), 0U);
    EXPECT_FALSE(registry.take("uuid:1"));
}

TEST(DeviceRegistry, TakeLeavesOtherDevices)
{
    DeviceRegistry registry;
    ASSERT_FALSE(registry.register_device(device("uuid:1", "urn:a")));
    ASSERT_FALSE(registry.register_device(device("uuid:2", "urn:b")));

    EXPECT_FALSE(registry.take("uuid:never"));
    ASSERT_TRUE(registry.take("uuid:2"));

    EXPECT_EQ(usns(registry.snapshot()), (std::vector<std::string> {"uuid:1"}));
}

TEST(DeviceRegistry, FindMatchingBySearchTarget)
{
    DeviceRegistry registry;
    ASSERT_FALSE(registry.register_device(device("uuid:1", "urn:a")));
    ASSERT_FALSE(registry.register_device(device("uuid:2", "urn:b")));
    ASSERT_FALSE(registry.register_device(device("uuid:3", "urn:a")));

    EXPECT_EQ(usns(registry.find_matching("urn:a")), (std::vector<std::string> {"uuid:1", "uuid:3"}));
    EXPECT_EQ(usns(registry.find_matching("urn:b")), (std::vector<std::string> {"uuid:2"}));
    EXPECT_TRUE(registry.find_matching("urn:c").empty());
    EXPECT_TRUE(registry.find_matching("URN:A").empty());
}

TEST(DeviceRegistry, WildcardMatchesEverything)
{
    DeviceRegistry registry;
    ASSERT_FALSE(registry.register_device(device("uuid:1", "urn:a")));
    ASSERT_FALSE(registry.register_device(device("uuid:2", "urn:b")));

    EXPECT_EQ(usns(registry.find_matching(DeviceRegistry::search_all)), (std::vector<std::string> {"uuid:1", "uuid:2"}));
    EXPECT_EQ(usns(registry.snapshot()), usns(registry.find_matching("ssdp:all")));
}

TEST(DeviceRegistry, ResultsAreSnapshots)
{
    DeviceRegistry registry;
    ASSERT_FALSE(registry.register_device(device("uuid:1", "urn:a")));

    auto before = registry.find_matching("urn:a");
    ASSERT_FALSE(registry.register_device(device("uuid:2", "urn:a")));
    registry.clear();

    EXPECT_EQ(usns(before), (std::vector<std::string> {"uuid:1"}));
    EXPECT_EQ(registry.size(), 0U);
}

TEST(DeviceRegistry, ConcurrentMutationAndReads)
{
    DeviceRegistry registry;
    constexpr int count = 200;

    std::thread writer(
        [&registry]()
        {
            for (int i = 0; i < count; ++i)
            {
                EXPECT_FALSE(registry.register_device(device("uuid:" + std::to_string(i), "urn:a")));
            }
        });

    for (int i = 0; i < count; ++i)
    {
        // Each snapshot is internally consistent: every entry is a complete device
        for (const auto& entry : registry.find_matching("urn:a"))
        {
            EXPECT_EQ(entry.location(), "http://10.0.0.1/" + entry.usn());
        }
    }
    writer.join();

    EXPECT_EQ(registry.size(), static_cast<std::size_t>(count));
}
