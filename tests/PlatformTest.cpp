// Platform classification tests
#include "nsis_make/Platform.hpp"

#include <gtest/gtest.h>

using namespace nsismake;

TEST(PlatformTest, ResolvesKnownFamilies) {
    EXPECT_EQ(resolveOsType("Linux"), OsType::Linux);
    EXPECT_EQ(resolveOsType("Mac OS X"), OsType::MacOs);
    EXPECT_EQ(resolveOsType("Darwin"), OsType::MacOs);
    EXPECT_EQ(resolveOsType("Windows 10"), OsType::Windows);
    EXPECT_EQ(resolveOsType("Windows Server 2022"), OsType::Windows);
}

TEST(PlatformTest, UnknownNamesAreOther) {
    EXPECT_EQ(resolveOsType(""), OsType::Other);
    EXPECT_EQ(resolveOsType("FreeBSD"), OsType::Other);
    EXPECT_EQ(resolveOsType("SunOS"), OsType::Other);
    // Prefix match is case-sensitive
    EXPECT_EQ(resolveOsType("linux"), OsType::Other);
}

TEST(PlatformTest, OptionPrefixAndSeparator) {
    EXPECT_STREQ(optionPrefix(OsType::Windows), "/");
    EXPECT_STREQ(optionPrefix(OsType::Linux), "-");
    EXPECT_STREQ(optionPrefix(OsType::MacOs), "-");
    EXPECT_STREQ(optionPrefix(OsType::Other), "-");

    EXPECT_EQ(pathListSeparator(OsType::Windows), ';');
    EXPECT_EQ(pathListSeparator(OsType::Linux), ':');
    EXPECT_EQ(pathListSeparator(OsType::MacOs), ':');
}

TEST(PlatformTest, HostMatchesBuildPlatform) {
#if defined(_WIN32)
    EXPECT_EQ(hostOsType(), OsType::Windows);
#elif defined(__APPLE__)
    EXPECT_EQ(hostOsType(), OsType::MacOs);
#elif defined(__linux__)
    EXPECT_EQ(hostOsType(), OsType::Linux);
#endif
}
