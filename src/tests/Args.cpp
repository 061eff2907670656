//
// Created by Malik T on 07/09/2025.
//
#include <gtest/gtest.h>
#include <cstdint>

#include "../core/Args.hpp"
#include "../core/Exception.hpp"

using namespace flip7::core;

TEST(Args, Whole_Values_Parse)
{
    EXPECT_EQ(ParseNumber<std::uint16_t>("--port", "9002"), 9002u);
    EXPECT_EQ(ParseNumber<std::int64_t>("--sims", "1000"), 1000);
    EXPECT_DOUBLE_EQ(ParseNumber<double>("--weight", "-12.5"), -12.5);
}

TEST(Args, Trailing_Junk_Is_Rejected)
{
    EXPECT_THROW((void)ParseNumber<double>("--weight", "5abc"), error::ConfigError);
    EXPECT_THROW((void)ParseNumber<std::uint32_t>("--players", "3 "), error::ConfigError);
    EXPECT_THROW((void)ParseNumber<std::uint64_t>("--seed", "12x"), error::ConfigError);
}

TEST(Args, Empty_Or_Out_Of_Range_Is_Rejected)
{
    EXPECT_THROW((void)ParseNumber<double>("--weight", ""), error::ConfigError);
    EXPECT_THROW((void)ParseNumber<std::uint16_t>("--port", "70000"), error::ConfigError);
    EXPECT_THROW((void)ParseNumber<std::uint32_t>("--games", "-1"), error::ConfigError);
}
