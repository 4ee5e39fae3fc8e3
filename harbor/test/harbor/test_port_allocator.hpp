#pragma once

#include <harbor/process/port_allocator.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace Harbor::Test
{
    class PortAllocatorTests : public ::testing::Test
    {
      protected:
        static PortAllocator::Options smallRange()
        {
            return PortAllocator::Options{.basePort = 40000, .range = 3, .maxAttempts = 10};
        }

        static bool always(unsigned short)
        {
            return true;
        }
    };

    TEST_F(PortAllocatorTests, PortsAreHandedOutRoundRobin)
    {
        PortAllocator ports{smallRange(), &PortAllocatorTests::always};

        EXPECT_EQ(ports.reserve(), 40000);
        EXPECT_EQ(ports.reserve(), 40001);
        EXPECT_EQ(ports.reserve(), 40002);
        EXPECT_EQ(ports.reserve(), std::nullopt);
        EXPECT_EQ(ports.reservedCount(), 3);
    }

    TEST_F(PortAllocatorTests, ReleasedPortCanBeReservedAgain)
    {
        PortAllocator ports{smallRange(), &PortAllocatorTests::always};
        for (int i = 0; i != 3; ++i)
            ASSERT_TRUE(ports.reserve());

        ports.release(40001);
        EXPECT_FALSE(ports.isReserved(40001));
        EXPECT_EQ(ports.reserve(), 40001);
        EXPECT_TRUE(ports.isReserved(40001));
    }

    TEST_F(PortAllocatorTests, PortsInUseByOthersAreSkipped)
    {
        PortAllocator ports{smallRange(), [](unsigned short port) {
                                return port != 40000;
                            }};

        EXPECT_EQ(ports.reserve(), 40001);
        EXPECT_FALSE(ports.isReserved(40000));
    }

    TEST_F(PortAllocatorTests, GivesUpAfterMaxAttempts)
    {
        int probes = 0;
        PortAllocator ports{smallRange(), [&probes](unsigned short) {
                                ++probes;
                                return false;
                            }};

        EXPECT_EQ(ports.reserve(), std::nullopt);
        EXPECT_EQ(probes, 10);
    }

    TEST_F(PortAllocatorTests, EmptyRangeIsRejected)
    {
        const auto options = PortAllocator::makeOptions(40000, 0, 10);
        ASSERT_FALSE(options);
        EXPECT_EQ(options.error().type, HostErrorType::InvalidArgument);

        EXPECT_THROW(
            (PortAllocator{PortAllocator::Options{.basePort = 40000, .range = 0, .maxAttempts = 10}, &always}),
            std::invalid_argument);
    }

    TEST_F(PortAllocatorTests, RangeBeyondTheHighestPortIsRejected)
    {
        const auto options = PortAllocator::makeOptions(65530, 20, 10);
        ASSERT_FALSE(options);
        EXPECT_EQ(options.error().type, HostErrorType::InvalidArgument);

        EXPECT_THROW(
            (PortAllocator{PortAllocator::Options{.basePort = 65530, .range = 20, .maxAttempts = 10}, &always}),
            std::invalid_argument);
    }

    TEST_F(PortAllocatorTests, RangeEndingAtTheHighestPortIsUsable)
    {
        const auto options = PortAllocator::makeOptions(65530, 6, 10);
        ASSERT_TRUE(options);

        PortAllocator ports{*options, &always};
        std::vector<unsigned short> handedOut;
        while (auto port = ports.reserve())
            handedOut.push_back(*port);
        EXPECT_EQ(handedOut, (std::vector<unsigned short>{65530, 65531, 65532, 65533, 65534, 65535}));
    }
}
