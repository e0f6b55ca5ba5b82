#include "bootpack/app.hpp"

#include "fake_runner.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

using namespace bootpack;
namespace fs = std::filesystem;

namespace {

constexpr auto METADATA = R"({
  "packages": [
    {"id": "bootloader 0.10.1", "manifest_path": "/registry/bootloader-0.10.1/Cargo.toml"},
    {"id": "kernel 0.1.0", "manifest_path": "/src/kernel/Cargo.toml"}
  ],
  "resolve": {
    "nodes": [
      {"id": "bootloader 0.10.1", "deps": []},
      {"id": "kernel 0.1.0", "deps": [{"name": "bootloader", "pkg": "bootloader 0.10.1"}]}
    ],
    "root": "kernel 0.1.0"
  }
})";

} // namespace

class AppTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        project_dir_ = fs::temp_directory_path() / (std::string("bootpack-app-") + info->name());
        fs::remove_all(project_dir_);
        fs::create_directories(project_dir_);
        runner_.capture_result = CapturedOutput{.status = 0, .out = METADATA};
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(project_dir_, ec);
    }

    int invoke(std::initializer_list<std::string_view> tokens) {
        std::vector<std::string_view> args(tokens);
        return run_app(args, runner_, project_dir_);
    }

    fs::path project_dir_;
    test::FakeRunner runner_;
};

TEST_F(AppTest, ReleaseAndRun) {
    EXPECT_EQ(invoke({"release", "run"}), 0);

    ASSERT_EQ(runner_.captures.size(), 1u);
    ASSERT_EQ(runner_.runs.size(), 3u);
    EXPECT_EQ(runner_.runs[0].args, (std::vector<std::string>{"cargo", "build", "--release"}));
    EXPECT_EQ(runner_.runs[1].args.at(1), "builder");
    EXPECT_EQ(runner_.runs[1].working_dir, std::optional<std::string>("/registry/bootloader-0.10.1"));
    EXPECT_EQ(runner_.runs[1].args.at(5),
              (project_dir_ / "target/x86_64-unknown-caesarsallad/release/brynolv-evper-ofjall-project").string());
    EXPECT_EQ(runner_.runs[2].args.at(0), "qemu-system-x86_64");
    EXPECT_EQ(runner_.runs[2].args.size(), 4u);
}

TEST_F(AppTest, GdbAloneSpawnsNothing) {
    EXPECT_EQ(invoke({"gdb"}), 1);
    EXPECT_TRUE(runner_.captures.empty());
    EXPECT_TRUE(runner_.runs.empty());
}

TEST_F(AppTest, HelpSpawnsNothing) {
    EXPECT_EQ(invoke({"release", "help", "nonsense"}), 0);
    EXPECT_TRUE(runner_.captures.empty());
    EXPECT_TRUE(runner_.runs.empty());
    EXPECT_FALSE(fs::exists(project_dir_ / "out"));
}

TEST_F(AppTest, UnknownOptionExitsWithOne) {
    EXPECT_EQ(invoke({"run", "fast"}), 1);
    EXPECT_TRUE(runner_.runs.empty());
}

TEST_F(AppTest, MetadataFailureStopsBeforeBuilding) {
    runner_.capture_result = CapturedOutput{.status = 101, .out = ""};
    EXPECT_EQ(invoke({}), 1);
    EXPECT_TRUE(runner_.runs.empty());
    EXPECT_FALSE(fs::exists(project_dir_ / "out"));
}

TEST_F(AppTest, MissingBootloaderDependency) {
    OrchestratorConfig config;
    config.bootloader_package = "bootimage";
    std::vector<std::string_view> args;
    EXPECT_EQ(run_app(args, runner_, project_dir_, config), 1);
    EXPECT_EQ(runner_.captures.size(), 1u);
    EXPECT_TRUE(runner_.runs.empty());
}

TEST_F(AppTest, CompileFailureExitCode) {
    runner_.run_results = {101};
    EXPECT_EQ(invoke({"run"}), 101);
    EXPECT_EQ(runner_.runs.size(), 1u);
}

TEST(CollectArgsTest, SkipsProgramName) {
    const char *argv[] = {"bootpack", "release", "run", nullptr};
    EXPECT_EQ(collect_args(3, argv), (std::vector<std::string_view>{"release", "run"}));
    EXPECT_TRUE(collect_args(1, argv).empty());
}

TEST(CollectArgsTest, EmptyArgv) {
    const char *argv[] = {nullptr};
    EXPECT_TRUE(collect_args(0, argv).empty());
}
