#include <gtest/gtest.h>

#include "poz/config/config.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

using namespace poz::config;
using namespace poz::test;
using poz::ErrorCode;

class ConfigTest : public ::testing::Test {
protected:
  std::filesystem::path writeConfig(const std::string& content) {
    return temp_dir_.createFile(".poznote.conf", content);
  }

  TempDirectory temp_dir_;
  Config::EnvLookup no_env_ = envFrom({});
};

TEST_F(ConfigTest, LoadsAllKeys) {
  auto path = writeConfig(R"(POZNOTE_URL="https://notes.example.com/"
POZNOTE_USER="alice"
POZNOTE_PASS="s3cret"
POZNOTE_USER_ID="42"
POZNOTE_WORKSPACE="Clip"
POZNOTE_ADVANCED_FEATURES="true"
)");

  auto config = Config::resolve(path, no_env_);
  ASSERT_OK(config);
  EXPECT_EQ(config->base_url, "https://notes.example.com");
  EXPECT_EQ(config->username, "alice");
  EXPECT_EQ(config->password, "s3cret");
  EXPECT_EQ(config->user_id, "42");
  EXPECT_EQ(config->workspace, "Clip");
  EXPECT_TRUE(config->advanced_features_enabled);
  EXPECT_EQ(config->request_timeout, std::chrono::seconds(10));
  EXPECT_EQ(config->source_path, path);
}

TEST_F(ConfigTest, AppliesDefaults) {
  auto path = writeConfig(R"(POZNOTE_URL="http://localhost:8080"
POZNOTE_USER="bob"
POZNOTE_PASS="pw"
)");

  auto config = Config::resolve(path, no_env_);
  ASSERT_OK(config);
  EXPECT_EQ(config->workspace, "Poznote");
  EXPECT_EQ(config->user_id, "1");
  EXPECT_FALSE(config->advanced_features_enabled);
}

TEST_F(ConfigTest, MissingCredentialsFails) {
  auto path = writeConfig(R"(POZNOTE_URL="https://notes.example.com"
POZNOTE_USER="alice"
)");

  auto config = Config::resolve(path, no_env_);
  EXPECT_ERROR(config, ErrorCode::kMissingCredentials);
  EXPECT_NE(config.error().message().find(path.string()), std::string::npos);
}

TEST_F(ConfigTest, MissingFileWithoutEnvironmentIsMissingCredentials) {
  auto config = Config::resolve(temp_dir_.path() / "absent.conf", no_env_);
  EXPECT_ERROR(config, ErrorCode::kMissingCredentials);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
  auto path = writeConfig(R"(POZNOTE_URL="https://file.example.com"
POZNOTE_USER="file-user"
POZNOTE_PASS="file-pass"
POZNOTE_WORKSPACE="FromFile"
)");

  auto config = Config::resolve(path, envFrom({{"POZNOTE_USER", "env-user"},
                                               {"POZNOTE_WORKSPACE", "FromEnv"}}));
  ASSERT_OK(config);
  EXPECT_EQ(config->username, "env-user");
  EXPECT_EQ(config->password, "file-pass");
  EXPECT_EQ(config->workspace, "FromEnv");
}

TEST_F(ConfigTest, EnvironmentAloneIsEnough) {
  auto config = Config::resolve(temp_dir_.path() / "absent.conf",
                                envFrom({{"POZNOTE_URL", "https://env.example.com"},
                                         {"POZNOTE_USER", "u"},
                                         {"POZNOTE_PASS", "p"}}));
  ASSERT_OK(config);
  EXPECT_EQ(config->base_url, "https://env.example.com");
}

TEST_F(ConfigTest, AcceptsUnquotedScalars) {
  auto path = writeConfig(R"(POZNOTE_URL="https://notes.example.com"
POZNOTE_USER="alice"
POZNOTE_PASS="s3cret"
POZNOTE_USER_ID=5
POZNOTE_ADVANCED_FEATURES=true
POZNOTE_TIMEOUT=3
)");

  auto config = Config::resolve(path, no_env_);
  ASSERT_OK(config);
  EXPECT_EQ(config->user_id, "5");
  EXPECT_TRUE(config->advanced_features_enabled);
  EXPECT_EQ(config->request_timeout, std::chrono::seconds(3));
}

TEST_F(ConfigTest, AcceptsUnquotedStrings) {
  auto path = writeConfig(R"(POZNOTE_URL=https://notes.example.com
POZNOTE_USER=alice
POZNOTE_PASS=s3cr"et\x
POZNOTE_USER_ID=007
POZNOTE_WORKSPACE=My Notes  # shared workspace
)");

  auto config = Config::resolve(path, no_env_);
  ASSERT_OK(config);
  EXPECT_EQ(config->base_url, "https://notes.example.com");
  EXPECT_EQ(config->username, "alice");
  EXPECT_EQ(config->password, "s3cr\"et\\x");
  EXPECT_EQ(config->user_id, "007");
  EXPECT_EQ(config->workspace, "My Notes");
}

TEST_F(ConfigTest, AcceptsExportPrefixAndComments) {
  auto path = writeConfig(R"(# Poznote credentials
export POZNOTE_URL="https://notes.example.com"
  export POZNOTE_USER='alice'

export POZNOTE_PASS=s3cret
)");

  auto config = Config::resolve(path, no_env_);
  ASSERT_OK(config);
  EXPECT_EQ(config->base_url, "https://notes.example.com");
  EXPECT_EQ(config->username, "alice");
  EXPECT_EQ(config->password, "s3cret");
}

TEST(NormalizeDotenvTest, RewritesAssignments) {
  EXPECT_EQ(normalizeDotenv("A=1\nexport B=two words # note\nC=\"quoted\"\n# comment\n"),
            "A = \"1\"\nB = \"two words\"\nC = \"quoted\"\n# comment\n\n");
  EXPECT_EQ(normalizeDotenv("URL=https://x.example.com/#frag"), "URL = \"https://x.example.com/#frag\"\n");
  EXPECT_EQ(normalizeDotenv("[[["), "[[[\n");
}

TEST_F(ConfigTest, InvalidTimeoutFails) {
  auto path = writeConfig(R"(POZNOTE_URL="https://notes.example.com"
POZNOTE_USER="alice"
POZNOTE_PASS="s3cret"
POZNOTE_TIMEOUT="soon"
)");

  EXPECT_ERROR(Config::resolve(path, no_env_), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, SyntaxErrorIsConfigError) {
  auto path = writeConfig("POZNOTE_URL = \n[[[");
  EXPECT_ERROR(Config::resolve(path, no_env_), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, RejectsMalformedUrl) {
  auto env = [](const std::string& url) {
    return envFrom({{"POZNOTE_URL", url}, {"POZNOTE_USER", "u"}, {"POZNOTE_PASS", "p"}});
  };
  auto missing = temp_dir_.path() / "absent.conf";

  EXPECT_ERROR(Config::resolve(missing, env("notes.example.com")), ErrorCode::kConfigError);
  EXPECT_ERROR(Config::resolve(missing, env("ftp://notes.example.com")), ErrorCode::kConfigError);
  EXPECT_ERROR(Config::resolve(missing, env("https://")), ErrorCode::kConfigError);
  EXPECT_ERROR(Config::resolve(missing, env("https://notes.example.com/?x=1")), ErrorCode::kConfigError);
  EXPECT_OK(Config::resolve(missing, env("https://notes.example.com/poznote")));
}

TEST(AdvancedFlagTest, OnlyLiteralTrueEnables) {
  EXPECT_TRUE(Config::parseAdvancedFlag(std::string("true")));
  EXPECT_TRUE(Config::parseAdvancedFlag(std::string("TRUE")));
  EXPECT_TRUE(Config::parseAdvancedFlag(std::string("True")));

  EXPECT_FALSE(Config::parseAdvancedFlag(std::nullopt));
  EXPECT_FALSE(Config::parseAdvancedFlag(std::string("")));
  EXPECT_FALSE(Config::parseAdvancedFlag(std::string("1")));
  EXPECT_FALSE(Config::parseAdvancedFlag(std::string("yes")));
  EXPECT_FALSE(Config::parseAdvancedFlag(std::string("on")));
  EXPECT_FALSE(Config::parseAdvancedFlag(std::string(" true")));
  EXPECT_FALSE(Config::parseAdvancedFlag(std::string("false")));
}

TEST(ConfigPathTest, DefaultsToDotfileInHome) {
  EXPECT_EQ(Config::defaultConfigPath().filename(), ".poznote.conf");
}
