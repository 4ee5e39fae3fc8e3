#pragma once

#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <fstream>

extern std::filesystem::path programDirectory;

namespace Utility::Test
{
    class TemporaryDirectoryTests : public ::testing::Test
    {};

    TEST_F(TemporaryDirectoryTests, DirectoryIsRemovedWithContents)
    {
        std::filesystem::path path{};
        {
            TemporaryDirectory directory{programDirectory / "temp", true};
            path = directory.path();
            ASSERT_TRUE(std::filesystem::is_directory(path));
            std::ofstream{path / "file.txt"} << "content";
        }
        EXPECT_FALSE(std::filesystem::exists(path));
    }

    TEST_F(TemporaryDirectoryTests, TwoDirectoriesAreDistinct)
    {
        TemporaryDirectory first{programDirectory / "temp"};
        TemporaryDirectory second{programDirectory / "temp"};
        EXPECT_NE(first.path(), second.path());
    }
}
