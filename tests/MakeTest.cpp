// End-to-end orchestrator tests against a fake makensis shell script
#include "nsis_make/IArtifactSink.hpp"
#include "nsis_make/Make.hpp"
#include "TestSupport.hpp"

#include <chrono>
#include <fstream>
#include <gtest/gtest.h>

using namespace nsismake;
using nsismake::test::TempDir;
using nsismake::test::writeFile;
using nsismake::test::writeScript;

#if !defined(_WIN32)

namespace {

struct Attached {
    fs::path file;
    std::string type;
    std::string classifier;
};

class RecordingArtifactSink final : public IArtifactSink {
public:
    bool attach(const fs::path& file, const std::string& type,
        const std::string& classifier, std::string* /*error*/) override {
        attached.push_back({ file, type, classifier });
        return true;
    }
    std::vector<Attached> attached;
};

class MakeTest : public ::testing::Test {
protected:
    void SetUp() override {
        makensis = writeScript(dir / "bin" / "makensis",
            "echo \"MakeNSIS fake\"\n"
            "for a in \"$@\"; do echo \"arg:$a\"; done\n"
            "echo \"cwd:$(pwd -P)\"\n"
            "exit ${FAKE_EXIT:-0}\n");
        script = writeFile(dir / "setup.nsi", "Name \"App\"\nSection\nSectionEnd\n");

        config.makensisBin = makensis.string();
        config.scriptFile = script;
        config.baseDirectory = dir.path();
        config.buildDirectory = dir / "target";
        config.headerFile = dir / "target" / "project.nsh";
        config.autoNsisDir = false;
    }

    int run() {
        lines.clear();
        return runMake(config, OsType::Linux, artifacts,
            [this](const std::string& line) { lines.push_back(line); });
    }

    bool sawLine(const std::string& line) const {
        for (const auto& l : lines) if (l == line) return true;
        return false;
    }

    TempDir dir;
    fs::path makensis;
    fs::path script;
    InvocationConfig config;
    RecordingArtifactSink artifacts;
    std::vector<std::string> lines;
};

} // namespace

TEST_F(MakeTest, SuccessfulRunAttachesInstaller) {
    config.outputFile = "app-setup.exe";
    config.classifier = "win64";

    ASSERT_EQ(run(), 0);

    const fs::path expected = dir / "target" / "app-setup-win64.exe";
    EXPECT_TRUE(fs::is_directory(dir / "target"));
    EXPECT_TRUE(sawLine("MakeNSIS fake"));
    EXPECT_TRUE(sawLine("arg:-XOutFile " + expected.string()));
    EXPECT_TRUE(sawLine("arg:-V2"));
    EXPECT_TRUE(sawLine("arg:" + script.string()));
    EXPECT_TRUE(sawLine("cwd:" + dir.path().string()));

    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines.back().rfind("Execution completed in ", 0), 0u);

    ASSERT_EQ(artifacts.attached.size(), 1u);
    EXPECT_EQ(artifacts.attached[0].file, expected);
    EXPECT_EQ(artifacts.attached[0].type, "exe");
    EXPECT_EQ(artifacts.attached[0].classifier, "win64");
}

TEST_F(MakeTest, CompilerFailureKeepsTranscriptAndSkipsHandOff) {
    config.outputFile = "app-setup.exe";
    config.environment["FAKE_EXIT"] = "3";

    EXPECT_EQ(run(), 1);
    EXPECT_TRUE(sawLine("MakeNSIS fake"));
    EXPECT_TRUE(sawLine("arg:-V2"));
    for (const auto& l : lines) EXPECT_EQ(l.rfind("Execution completed", 0), std::string::npos);
    EXPECT_TRUE(artifacts.attached.empty());
}

TEST_F(MakeTest, ScriptConflictPreventsLaunch) {
    writeFile(script, "Name \"App\"\nOutFile \"own.exe\"\n");
    config.outputFile = "app-setup.exe";

    EXPECT_EQ(run(), 1);
    EXPECT_TRUE(lines.empty());
    EXPECT_TRUE(artifacts.attached.empty());
}

TEST_F(MakeTest, MissingCompilerIsFatal) {
    config.makensisBin = (dir / "bin" / "no-makensis").string();
    EXPECT_EQ(run(), 1);
    EXPECT_TRUE(lines.empty());
}

TEST_F(MakeTest, DisabledDoesNothing) {
    config.disabled = true;
    config.makensisBin = (dir / "bin" / "no-makensis").string();
    EXPECT_EQ(run(), 0);
    EXPECT_TRUE(lines.empty());
}

TEST_F(MakeTest, WorkingFolderAddsNoCd) {
    fs::create_directories(dir / "work");
    config.workingFolder = dir / "work";
    writeFile(config.headerFile, "!define PROJECT_NAME \"App\"\n");

    ASSERT_EQ(run(), 0);
    EXPECT_TRUE(sawLine("arg:-X!include " + config.headerFile.string()));
    EXPECT_TRUE(sawLine("arg:-NOCD"));
    EXPECT_TRUE(sawLine("cwd:" + (dir / "work").string()));
    // No output file configured, nothing to hand off
    EXPECT_TRUE(artifacts.attached.empty());
}

TEST_F(MakeTest, AttachCanBeDisabled) {
    config.outputFile = "app-setup.exe";
    config.attachArtifact = false;
    ASSERT_EQ(run(), 0);
    EXPECT_TRUE(artifacts.attached.empty());
}

TEST_F(MakeTest, NsisDirIsPassedToCompiler) {
    writeScript(makensis, "echo \"nsisdir:$NSISDIR\"\n");
    config.nsisDir = dir / "nsis";
    ASSERT_EQ(run(), 0);
    EXPECT_TRUE(sawLine("nsisdir:" + (dir / "nsis").string()));
}

TEST_F(MakeTest, BackgroundProcessDoesNotDelayCompletion) {
    writeScript(makensis, "echo \"compiled\"\nsleep 6 &\nexit 0\n");

    const auto begin = std::chrono::steady_clock::now();
    ASSERT_EQ(run(), 0);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(4));

    EXPECT_TRUE(sawLine("compiled"));
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines.back().rfind("Execution completed in ", 0), 0u);
}

TEST(ArtifactSkipReasonTest, ExplainsMissingHandOff) {
    InvocationConfig config;
    EXPECT_NE(artifactSkipReason(config).find("no output file"), std::string::npos);

    config.outputFile = "app-setup.exe";
    EXPECT_TRUE(artifactSkipReason(config).empty());

    config.attachArtifact = false;
    EXPECT_NE(artifactSkipReason(config).find("disabled"), std::string::npos);
}

TEST(ManifestArtifactSinkTest, AppendsEntries) {
    TempDir dir;
    const fs::path manifest = dir / "out" / "artifacts.txt";
    ManifestArtifactSink sink(manifest);

    std::string err;
    ASSERT_TRUE(sink.attach(dir / "a.exe", "exe", "win64", &err)) << err;
    ASSERT_TRUE(sink.attach(dir / "b.exe", "exe", "", &err)) << err;

    std::ifstream in(manifest);
    std::string l1, l2;
    ASSERT_TRUE(std::getline(in, l1));
    ASSERT_TRUE(std::getline(in, l2));
    EXPECT_EQ(l1, "exe\twin64\t" + (dir / "a.exe").string());
    EXPECT_EQ(l2, "exe\t\t" + (dir / "b.exe").string());
}

#endif
