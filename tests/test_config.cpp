#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigFileTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("jumprun_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
               "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir);
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    fs::path write(const std::string& name, const std::string& content) {
        auto p = dir / name;
        std::ofstream(p) << content;
        return p;
    }
};

TEST(Config, Defaults) {
    Config c;
    EXPECT_EQ(c.cmd_timeout(), DEFAULT_CMD_TIMEOUT_SECS);
    EXPECT_EQ(c.login_timeout(), DEFAULT_LOGIN_TIMEOUT_SECS);
    EXPECT_FALSE(c.strict_host_key_checking());
    EXPECT_EQ(c.output_format(), "txt");
    EXPECT_EQ(c.identity_files().size(), 3u);
    EXPECT_GE(c.max_parallel(), 1u);
    EXPECT_FALSE(c.log_file().has_value());
}

TEST(Config, ApplyYaml) {
    Config c;
    auto r = c.apply_yaml("cmd_timeout: 30\n"
                          "login_timeout: 45\n"
                          "strict_host_key_checking: true\n"
                          "known_hosts: /tmp/kh\n"
                          "identity_files: [/tmp/a, /tmp/b]\n"
                          "max_parallel: 2\n"
                          "output_format: yaml\n", "inline");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(c.cmd_timeout(), 30);
    EXPECT_EQ(c.login_timeout(), 45);
    EXPECT_TRUE(c.strict_host_key_checking());
    EXPECT_EQ(c.known_hosts(), "/tmp/kh");
    EXPECT_EQ(c.identity_files(), (std::vector<std::string>{"/tmp/a", "/tmp/b"}));
    EXPECT_EQ(c.max_parallel(), 2u);
    EXPECT_EQ(c.output_format(), "yaml");
}

TEST(Config, EmptyDocumentChangesNothing) {
    Config c;
    ASSERT_TRUE(c.apply_yaml("", "empty").is_ok());
    EXPECT_EQ(c.cmd_timeout(), DEFAULT_CMD_TIMEOUT_SECS);
}

TEST(Config, WrongTypeIsError) {
    Config c;
    auto r = c.apply_yaml("cmd_timeout: soon\n", "bad");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("bad"), std::string::npos);
}

TEST(Config, NonPositiveTimeoutIsError) {
    Config c;
    EXPECT_TRUE(c.apply_yaml("login_timeout: 0\n", "bad").is_err());
}

TEST(Config, InvalidYamlIsError) {
    Config c;
    EXPECT_TRUE(c.apply_yaml("cmd_timeout: [1, 2\n", "broken").is_err());
    EXPECT_TRUE(c.apply_yaml("- just\n- a list\n", "list").is_err());
}

TEST(Config, UnknownOutputFormat) {
    Config c;
    EXPECT_TRUE(c.apply_yaml("output_format: json\n", "bad").is_err());
}

TEST_F(ConfigFileTest, LaterLayersOverride) {
    auto a = write("a.yaml", "cmd_timeout: 20\nlogin_timeout: 60\n");
    auto b = write("b.yaml", "cmd_timeout: 25\n");
    auto r = Config::load(std::nullopt, {a, dir / "missing.yaml", b});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.cmd_timeout(), 25);
    EXPECT_EQ(r.value.login_timeout(), 60);
    EXPECT_EQ(r.value.sources().size(), 2u);
}

TEST_F(ConfigFileTest, ExplicitFileWins) {
    auto a = write("a.yaml", "cmd_timeout: 20\n");
    auto e = write("explicit.yaml", "cmd_timeout: 99\n");
    auto r = Config::load(e, {a});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.cmd_timeout(), 99);
}

TEST_F(ConfigFileTest, ExplicitFileMustExist) {
    auto r = Config::load(dir / "nope.yaml", {});
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("not found"), std::string::npos);
}

TEST_F(ConfigFileTest, BrokenLayerFailsLoad) {
    auto a = write("a.yaml", "max_parallel: many\n");
    EXPECT_TRUE(Config::load(std::nullopt, {a}).is_err());
}
