// Path resolver tests with simulated PATH / PATHEXT values
#include "nsis_make/PathResolver.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

using namespace nsismake;
using nsismake::test::TempDir;
using nsismake::test::writeFile;

namespace {

std::string joinPath(const std::vector<fs::path>& dirs, OsType os) {
    std::string out;
    for (const auto& d : dirs) {
        if (!out.empty()) out.push_back(pathListSeparator(os));
        out += d.string();
    }
    return out;
}

} // namespace

TEST(PathResolverTest, SplitOsPathSkipsBlankElements) {
    const auto dirs = splitOsPath("/usr/bin::/opt/nsis/bin: ", OsType::Linux);
    ASSERT_EQ(dirs.size(), 2u);
    EXPECT_EQ(dirs[0], fs::path("/usr/bin"));
    EXPECT_EQ(dirs[1], fs::path("/opt/nsis/bin"));

    EXPECT_TRUE(splitOsPath("", OsType::Linux).empty());
    EXPECT_TRUE(splitOsPath("   ", OsType::Windows).empty());
}

TEST(PathResolverTest, SplitOsPathSkipsInvalidWindowsElements) {
    const auto dirs = splitOsPath(R"(C:\Windows;"C:\Program Files\NSIS";C:\Tools|x;C:\NSIS)", OsType::Windows);
    ASSERT_EQ(dirs.size(), 2u);
    EXPECT_EQ(dirs[0].string(), R"(C:\Windows)");
    EXPECT_EQ(dirs[1].string(), R"(C:\NSIS)");
}

TEST(PathResolverTest, SplitPathExtensionsStripsLeadingDots) {
    const auto exts = splitPathExtensions(".EXE;.BAT;;.CMD;..COM;.", OsType::Windows);
    const std::vector<std::string> expected = { "EXE", "BAT", "CMD", "COM" };
    EXPECT_EQ(exts, expected);

    const auto bare = splitPathExtensions("EXE;BAT", OsType::Windows);
    const std::vector<std::string> expectedBare = { "EXE", "BAT" };
    EXPECT_EQ(bare, expectedBare);
}

TEST(PathResolverTest, GetExtension) {
    EXPECT_FALSE(getExtension("toolX", OsType::Windows).has_value());
    EXPECT_EQ(getExtension("toolX.exe", OsType::Windows).value_or(""), "exe");
    EXPECT_EQ(getExtension("bin/makensis.exe", OsType::Linux).value_or(""), "exe");
    EXPECT_FALSE(getExtension("nsis.d/makensis", OsType::Linux).has_value());
    EXPECT_FALSE(getExtension("toolX.", OsType::Windows).has_value());
}

TEST(PathResolverTest, FindsInSecondDirectoryWithExtension) {
    TempDir dir;
    const fs::path first = dir / "first";
    const fs::path second = dir / "second";
    fs::create_directories(first);
    writeFile(second / "toolX.exe", "");

    const auto found = findInOsPath("toolX", OsType::Windows, joinPath({ first, second }, OsType::Windows), ".exe;.bat");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, fs::canonical(second / "toolX.exe"));
}

TEST(PathResolverTest, FindsWithBarePathExtList) {
    TempDir dir;
    const fs::path first = dir / "first";
    const fs::path second = dir / "second";
    fs::create_directories(first);
    writeFile(second / "toolX.EXE", "");

    const auto found = findInOsPath("toolX", OsType::Windows, joinPath({ first, second }, OsType::Windows), "EXE;BAT");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, fs::canonical(second / "toolX.EXE"));
}

TEST(PathResolverTest, ExtensionOrderTakesPriorityOverDirectoryOrder) {
    TempDir dir;
    const fs::path first = dir / "first";
    const fs::path second = dir / "second";
    writeFile(first / "toolX.bat", "");
    writeFile(second / "toolX.exe", "");

    const auto found = findInOsPath("toolX", OsType::Windows, joinPath({ first, second }, OsType::Windows), ".exe;.bat");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, fs::canonical(second / "toolX.exe"));
}

TEST(PathResolverTest, BareNameIsLastResortOnWindows) {
    TempDir dir;
    const fs::path first = dir / "first";
    const fs::path second = dir / "second";
    writeFile(first / "toolX", "");
    writeFile(second / "toolX.exe", "");

    auto found = findInOsPath("toolX", OsType::Windows, joinPath({ first, second }, OsType::Windows), ".exe");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, fs::canonical(second / "toolX.exe"));

    found = findInOsPath("toolX", OsType::Windows, joinPath({ first, second }, OsType::Windows), ".bat");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, fs::canonical(first / "toolX"));
}

TEST(PathResolverTest, NoExtensionProbingOutsideWindows) {
    TempDir dir;
    const fs::path first = dir / "first";
    const fs::path second = dir / "second";
    writeFile(first / "toolX", "");
    writeFile(second / "toolX.exe", "");

    auto found = findInOsPath("toolX", OsType::Linux, joinPath({ first, second }, OsType::Linux), ".exe");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, fs::canonical(first / "toolX"));

    EXPECT_FALSE(findInOsPath("toolY", OsType::Linux, joinPath({ second }, OsType::Linux), ".exe").has_value());
    writeFile(second / "toolY.exe", "");
    EXPECT_FALSE(findInOsPath("toolY", OsType::Linux, joinPath({ second }, OsType::Linux), ".exe").has_value());
}

TEST(PathResolverTest, NameWithExtensionIsNotExtended) {
    TempDir dir;
    writeFile(dir / "d" / "tool.exe.bat", "");
    EXPECT_FALSE(findInOsPath("tool.exe", OsType::Windows, (dir / "d").string(), ".bat").has_value());
}

TEST(PathResolverTest, DirectoriesAreNotMatches) {
    TempDir dir;
    const fs::path first = dir / "first";
    const fs::path second = dir / "second";
    fs::create_directories(first / "toolX");
    writeFile(second / "toolX", "");

    const auto found = findInOsPath("toolX", OsType::Linux, joinPath({ first, second }, OsType::Linux), "");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, fs::canonical(second / "toolX"));
}

TEST(PathResolverTest, AbsoluteOrMissingReturnsNothing) {
    TempDir dir;
    writeFile(dir / "toolX", "");
    EXPECT_FALSE(findInOsPath(dir / "toolX", OsType::Linux, dir.path().string(), "").has_value());
    EXPECT_FALSE(findInOsPath("nope-not-here", OsType::Linux, dir.path().string(), "").has_value());
    EXPECT_FALSE(findInOsPath(fs::path(), OsType::Linux, dir.path().string(), "").has_value());
}

#if !defined(_WIN32)
TEST(PathResolverTest, ResultIsCanonicalized) {
    TempDir dir;
    const fs::path real = writeFile(dir / "real" / "makensis-3.09", "");
    fs::create_directories(dir / "bin");
    fs::create_symlink(real, dir / "bin" / "makensis");

    const auto found = findInOsPath("makensis", OsType::Linux, (dir / "bin").string(), "");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, fs::canonical(real));
}
#endif

TEST(PathResolverTest, ResolveExecutable) {
    TempDir dir;
    const fs::path bin = writeFile(dir / "makensis", "");
    std::string err;

    EXPECT_EQ(resolveExecutable(bin.string(), hostOsType(), &err), bin);

    err.clear();
    EXPECT_TRUE(resolveExecutable((dir / "missing").string(), hostOsType(), &err).empty());
    EXPECT_NE(err.find("does not exist"), std::string::npos);

    err.clear();
    EXPECT_TRUE(resolveExecutable("  ", hostOsType(), &err).empty());
    EXPECT_FALSE(err.empty());

    err.clear();
    EXPECT_TRUE(resolveExecutable("nsis-make-no-such-binary-9f3a", hostOsType(), &err).empty());
    EXPECT_NE(err.find("OS path"), std::string::npos);
}

TEST(PathResolverTest, FindNsisDirNextToBinary) {
    TempDir dir;
    fs::create_directories(dir / "nsis" / "Stubs");
    writeFile(dir / "nsis" / "Bin" / "makensis.exe", "");
    writeFile(dir / "flat" / "makensis.exe", "");
    fs::create_directories(dir / "flat" / "Stubs");

    auto found = findNsisDir(dir / "nsis" / "Bin" / "makensis.exe", OsType::Windows);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, fs::canonical(dir / "nsis"));

    found = findNsisDir(dir / "flat" / "makensis.exe", OsType::Windows);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, fs::canonical(dir / "flat"));
}

TEST(PathResolverTest, FindNsisDirInShare) {
    TempDir dir;
    writeFile(dir / "usr" / "bin" / "makensis", "");
    fs::create_directories(dir / "usr" / "share" / "nsis" / "Stubs");

    const auto found = findNsisDir(dir / "usr" / "bin" / "makensis", OsType::Linux);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, fs::canonical(dir / "usr" / "share" / "nsis"));
}
