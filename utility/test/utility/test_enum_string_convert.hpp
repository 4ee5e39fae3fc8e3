#pragma once

#include <utility/enum_string_convert.hpp>

#include <gtest/gtest.h>

namespace Utility::Test
{
    enum class Weather
    {
        Sunny,
        Rainy
    };
    BOOST_DESCRIBE_ENUM(Weather, Sunny, Rainy)

    class EnumStringConvertTests : public ::testing::Test
    {};

    TEST_F(EnumStringConvertTests, ConvertsBothWays)
    {
        EXPECT_EQ(enumToString(Weather::Rainy), "Rainy");
        EXPECT_EQ(enumFromString<Weather>("Sunny"), Weather::Sunny);
    }

    TEST_F(EnumStringConvertTests, UnknownNameThrows)
    {
        EXPECT_THROW(enumFromString<Weather>("Snowy"), std::invalid_argument);
    }

    TEST_F(EnumStringConvertTests, TryParseReturnsNulloptOnUnknownName)
    {
        EXPECT_FALSE(tryEnumFromString<Weather>("Snowy").has_value());
        EXPECT_EQ(tryEnumFromString<Weather>("Rainy"), Weather::Rainy);
    }
}
