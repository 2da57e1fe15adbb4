#include "core/nonogram/evolution/SolverConfigFiles.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace NonoGen;

class SolverConfigFilesTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        testDir_ = std::filesystem::temp_directory_path() / "nonogen_config_files_test";
        std::filesystem::remove_all(testDir_);
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override { std::filesystem::remove_all(testDir_); }

    void writeConfigFile(const std::string& filename, const std::string& content)
    {
        std::ofstream file(testDir_ / filename);
        file << content;
    }

    std::filesystem::path testDir_;
};

TEST_F(SolverConfigFilesTest, OverrideDirectoryIsSearchedFirst)
{
    const SolverConfigFiles files(testDir_);
    const auto paths = files.searchPaths();
    ASSERT_GE(paths.size(), 3u);
    EXPECT_EQ(paths.front(), testDir_);
    EXPECT_EQ(paths[1], std::filesystem::current_path() / "config");
    EXPECT_EQ(paths.back(), std::filesystem::path("/etc/nonogen"));
}

TEST_F(SolverConfigFilesTest, LocalFileShadowsBase)
{
    writeConfigFile("solver.json", R"({"populationSize": 40})");
    writeConfigFile("solver.json.local", R"({"populationSize": 60})");

    const SolverConfigFiles files(testDir_);
    ASSERT_EQ(files.locate("solver.json"), testDir_ / "solver.json.local");

    const auto result = files.loadSolverConfig();
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().populationSize, 60);
}

TEST_F(SolverConfigFilesTest, AbsentKeysKeepDefaults)
{
    writeConfigFile(
        "solver.json",
        R"({"populationSize": 120, "crossoverOperator": "TwoPointRows", "randomSeed": 99})");

    const auto result = SolverConfigFiles(testDir_).loadSolverConfig();
    ASSERT_TRUE(result.isValue());

    const SolverConfig& config = result.value();
    const SolverConfig defaults;
    EXPECT_EQ(config.populationSize, 120);
    EXPECT_EQ(config.crossoverOperator, CrossoverOperator::TwoPointRows);
    EXPECT_EQ(config.randomSeed, std::optional<uint64_t>(99));
    EXPECT_EQ(config.tournamentSize, defaults.tournamentSize);
    EXPECT_DOUBLE_EQ(config.mutationRate, defaults.mutationRate);
    EXPECT_FALSE(config.timeLimitMs.has_value());
}

TEST_F(SolverConfigFilesTest, LoadedConfigIsNormalized)
{
    writeConfigFile("solver.json", R"({"maxGenerations": -4, "slideTries": -1})");

    const auto result = SolverConfigFiles(testDir_).loadSolverConfig();
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().maxGenerations, 0);
    EXPECT_EQ(result.value().slideTries, 0);
}

TEST_F(SolverConfigFilesTest, MalformedFilesAreErrors)
{
    const SolverConfigFiles files(testDir_);

    writeConfigFile("solver.json", "");
    auto empty = files.loadSolverConfig();
    ASSERT_TRUE(empty.isError());
    EXPECT_EQ(empty.errorValue().kind, ConfigFileError::Kind::Malformed);
    EXPECT_EQ(empty.errorValue().path, testDir_ / "solver.json");

    writeConfigFile("solver.json", "not valid json {{{");
    auto broken = files.loadSolverConfig();
    ASSERT_TRUE(broken.isError());
    EXPECT_EQ(broken.errorValue().kind, ConfigFileError::Kind::Malformed);

    writeConfigFile("solver.json", R"({"seeding": "Diagonal"})");
    auto badEnum = files.loadSolverConfig();
    ASSERT_TRUE(badEnum.isError());
    EXPECT_EQ(badEnum.errorValue().kind, ConfigFileError::Kind::Malformed);
    EXPECT_NE(badEnum.errorValue().toString().find("Diagonal"), std::string::npos);

    writeConfigFile("solver.json", R"({"populationSize": "many"})");
    auto badType = files.loadSolverConfig();
    ASSERT_TRUE(badType.isError());
    EXPECT_EQ(badType.errorValue().kind, ConfigFileError::Kind::Malformed);
}

TEST_F(SolverConfigFilesTest, InvalidSolverConfigIsRejected)
{
    writeConfigFile("solver.json", R"({"populationSize": 10, "eliteCount": 10})");

    const auto result = SolverConfigFiles(testDir_).loadSolverConfig();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, ConfigFileError::Kind::Rejected);
    EXPECT_NE(result.errorValue().message.find("eliteCount"), std::string::npos);
}

TEST_F(SolverConfigFilesTest, SweepSpecLoadsAndValidatesEveryCell)
{
    writeConfigFile(
        "sweep.json",
        R"({"base": {"populationSize": 50}, "crossoverRates": [0.4], "seeds": [1, 2]})");
    const SolverConfigFiles files(testDir_);

    const auto loaded = files.loadSweepSpec();
    ASSERT_TRUE(loaded.isValue());
    EXPECT_EQ(loaded.value().base.populationSize, 50);
    EXPECT_EQ(loaded.value().crossoverRates, std::vector<double>{ 0.4 });
    EXPECT_EQ(loaded.value().seeds, (std::vector<uint64_t>{ 1, 2 }));
    EXPECT_EQ(loaded.value().slideTries.size(), 3u);

    writeConfigFile("sweep.json", R"({"mutationRates": [0.2, 1.7]})");
    const auto rejected = files.loadSweepSpec();
    ASSERT_TRUE(rejected.isError());
    EXPECT_EQ(rejected.errorValue().kind, ConfigFileError::Kind::Rejected);
    EXPECT_NE(rejected.errorValue().message.find("mutation=1.7"), std::string::npos);

    writeConfigFile("sweep.json", R"({"base": {"tournamentSize": 0}})");
    const auto badBase = files.loadSweepSpec();
    ASSERT_TRUE(badBase.isError());
    EXPECT_NE(badBase.errorValue().message.find("base"), std::string::npos);
}
