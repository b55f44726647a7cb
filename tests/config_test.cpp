#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <vector>

#include "pqchat/config/config.hpp"
#include "pqchat/crypto/crypto.hpp"
#include "pqchat/utils/logging.hpp"

namespace pqchat::config {
namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
        path_ = std::filesystem::temp_directory_path() /
                ("pqchat_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                 "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".ini");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void write(const std::string& contents) {
        std::ofstream file(path_);
        file << contents;
    }

    std::filesystem::path path_;
};

TEST_F(ConfigTest, DefaultsAreValid) {
    CoreConfig config;
    EXPECT_EQ(config.kem_algorithm, "ML-KEM-768");
    EXPECT_EQ(config.pwhash.opslimit, 3u);
    EXPECT_EQ(config.pwhash.memlimit, 256ULL << 20);

    auto result = validate_config(config);
    EXPECT_TRUE(result.valid);
    EXPECT_THAT(result.errors, IsEmpty());
}

TEST_F(ConfigTest, LoadFromIni) {
    write(
        "# pqchat core\n"
        "[crypto]\n"
        "kem = ML-KEM-1024\n"
        "\n"
        "[vault]\n"
        "opslimit = 4\n"
        "memlimit_mib = 128\n"
        "\n"
        "[service]\n"
        "kdf_workers = 2\n"
        "\n"
        "[logging]\n"
        "level = debug\n"
        "pattern = \"[%l] %v\"\n");

    auto config = load_config(path_.string());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->kem_algorithm, "ML-KEM-1024");
    EXPECT_EQ(config->pwhash.opslimit, 4u);
    EXPECT_EQ(config->pwhash.memlimit, 128ULL << 20);
    EXPECT_EQ(config->kdf_workers, 2u);
    EXPECT_EQ(config->log_level, "debug");
    EXPECT_EQ(config->log_pattern, "[%l] %v");
}

TEST_F(ConfigTest, MissingFile) {
    EXPECT_FALSE(load_config((path_ / "nope.ini").string()).has_value());
}

TEST_F(ConfigTest, NonNumericValueRejected) {
    write("[vault]\nopslimit = lots\n");
    EXPECT_FALSE(load_config(path_.string()).has_value());
}

TEST_F(ConfigTest, NegativeValuesRejected) {
    write("[service]\nkdf_workers = -1\n");
    EXPECT_FALSE(load_config(path_.string()).has_value());

    write("[vault]\nmemlimit = -268435456\n");
    EXPECT_FALSE(load_config(path_.string()).has_value());
}

TEST_F(ConfigTest, MemlimitMibOverflowRejected) {
    // 2^44 + 256 MiB would wrap to exactly 256 MiB when shifted
    write("[vault]\nmemlimit_mib = 17592186044672\n");
    EXPECT_FALSE(load_config(path_.string()).has_value());
}

TEST_F(ConfigTest, UnknownKeysIgnored) {
    write("[crypto]\nkem = ML-KEM-512\nflavour = vanilla\n[extra]\nkey = value\n");

    auto config = load_config(path_.string());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->kem_algorithm, "ML-KEM-512");
}

TEST_F(ConfigTest, SaveThenLoad) {
    CoreConfig config;
    config.kem_algorithm = "ML-KEM-512";
    config.pwhash = crypto::interactive_pwhash_params();
    config.kdf_workers = 3;
    config.log_level = "warn";

    ASSERT_TRUE(save_config(config, path_.string()));

    auto loaded = load_config(path_.string());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->kem_algorithm, config.kem_algorithm);
    EXPECT_EQ(loaded->pwhash.opslimit, config.pwhash.opslimit);
    EXPECT_EQ(loaded->pwhash.memlimit, config.pwhash.memlimit);
    EXPECT_EQ(loaded->kdf_workers, 3u);
    EXPECT_EQ(loaded->log_level, "warn");
}

TEST_F(ConfigTest, MergeKeepsBaseWhereOverlayIsDefault) {
    CoreConfig base;
    base.kem_algorithm = "ML-KEM-1024";
    base.kdf_workers = 4;

    CoreConfig overlay;
    overlay.log_level = "debug";

    auto merged = merge_config(base, overlay);
    EXPECT_EQ(merged.kem_algorithm, "ML-KEM-1024");
    EXPECT_EQ(merged.kdf_workers, 4u);
    EXPECT_EQ(merged.log_level, "debug");
}

TEST_F(ConfigTest, DisallowedKemIsAnError) {
    CoreConfig config;
    config.kem_algorithm = "Kyber768";

    auto result = validate_config(config);
    EXPECT_FALSE(result.valid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_THAT(result.errors[0], HasSubstr("Kyber768"));
}

TEST_F(ConfigTest, WeakWorkFactorIsAnError) {
    CoreConfig config;
    config.pwhash.opslimit = 1;
    config.pwhash.memlimit = 1 << 20;

    EXPECT_FALSE(validate_config(config).valid);
}

TEST_F(ConfigTest, ZeroWorkersIsAnError) {
    CoreConfig config;
    config.kdf_workers = 0;

    EXPECT_FALSE(validate_config(config).valid);
}

TEST_F(ConfigTest, TooManyWorkersIsAnError) {
    CoreConfig config;
    config.kdf_workers = MAX_KDF_WORKERS;
    EXPECT_TRUE(validate_config(config).valid);

    config.kdf_workers = MAX_KDF_WORKERS + 1;
    auto result = validate_config(config);
    EXPECT_FALSE(result.valid);
    EXPECT_THAT(result.errors, ::testing::Contains(HasSubstr("kdf_workers")));

    config.kdf_workers = std::numeric_limits<size_t>::max();
    EXPECT_FALSE(validate_config(config).valid);
}

TEST_F(ConfigTest, WorkerMemoryEstimateDoesNotWrap) {
    CoreConfig config;
    config.kdf_workers = 64;
    config.pwhash.memlimit = (std::numeric_limits<size_t>::max() / 64) + 1;

    auto result = validate_config(config);
    EXPECT_THAT(result.warnings, ::testing::Contains(HasSubstr("4 GiB")));
}

TEST_F(ConfigTest, UnknownLogLevelIsAWarning) {
    CoreConfig config;
    config.log_level = "chatty";

    auto result = validate_config(config);
    EXPECT_TRUE(result.valid);
    EXPECT_THAT(result.warnings, ::testing::Contains(HasSubstr("chatty")));
}

TEST_F(ConfigTest, ParseCli) {
    std::vector<std::string> args = {"pqchat", "--kem", "ML-KEM-512", "--pwhash-ops", "2",
                                     "--pwhash-mem-mib", "64", "--kdf-workers", "2",
                                     "-l", "trace"};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }

    auto config = parse_cli(static_cast<int>(argv.size()), argv.data());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->kem_algorithm, "ML-KEM-512");
    EXPECT_EQ(config->pwhash.opslimit, 2u);
    EXPECT_EQ(config->pwhash.memlimit, 64ULL << 20);
    EXPECT_EQ(config->kdf_workers, 2u);
    EXPECT_EQ(config->log_level, "trace");
}

TEST_F(ConfigTest, ParseCliRejectsUnlistedKem) {
    std::vector<std::string> args = {"pqchat", "--kem", "FrodoKEM-640-AES"};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }

    EXPECT_FALSE(parse_cli(static_cast<int>(argv.size()), argv.data()).has_value());
}

TEST_F(ConfigTest, ParseCliRejectsOversizedMemlimit) {
    std::vector<std::string> args = {"pqchat", "--pwhash-mem-mib", "17592186044672"};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }

    EXPECT_FALSE(parse_cli(static_cast<int>(argv.size()), argv.data()).has_value());
}

TEST(LoggingTest, LevelStrings) {
    using utils::LogLevel;

    EXPECT_EQ(utils::string_to_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(utils::string_to_log_level("WARN"), LogLevel::WARN);
    EXPECT_EQ(utils::string_to_log_level("nonsense"), LogLevel::INFO);
    EXPECT_STREQ(utils::log_level_to_string(LogLevel::ERROR), "error");
    EXPECT_TRUE(utils::is_log_level("critical"));
    EXPECT_FALSE(utils::is_log_level("chatty"));
}

TEST(LoggingTest, InitTwiceKeepsLevel) {
    utils::init_logging(utils::LogLevel::WARN);
    utils::init_logging(utils::LogLevel::DEBUG);
    EXPECT_EQ(utils::get_log_level(), utils::LogLevel::DEBUG);

    utils::set_log_level(utils::LogLevel::INFO);
    EXPECT_EQ(utils::get_log_level(), utils::LogLevel::INFO);
}

}  // namespace
}  // namespace pqchat::config
