#include <gtest/gtest.h>
#include <core/config.hpp>
#include <platform/platform.hpp>

TEST(Config, ParsesHopsRunAndLog) {
    auto result = Config::parse(R"(
hops:
  - host: bastion.example
    user: ops
    port: 2222
    retry: 3
    retry_interval: 1
    password: pw
  - host: app.internal
    private_key_file: /keys/app
run:
  timeout: 30
  retry: 2
  retry_interval: 1
  success_exit_code: [0, 3]
  sudo_user: deploy
log:
  file: /tmp/jl.log
  level: debug
)");
    ASSERT_TRUE(result.is_ok()) << result.error;
    const Config& config = result.value;

    ASSERT_EQ(config.hops().size(), 2u);
    const HopConfig& gw = config.hops()[0];
    EXPECT_EQ(gw.host, "bastion.example");
    EXPECT_EQ(gw.port, 2222);
    EXPECT_EQ(gw.retry, 3);
    EXPECT_EQ(gw.retry_interval, 1);
    EXPECT_EQ(gw.password.value(), "pw");

    const HopConfig& target = config.target();
    EXPECT_EQ(target.host, "app.internal");
    EXPECT_EQ(target.port, 22);
    EXPECT_EQ(target.user, "ops");
    EXPECT_EQ(target.private_key_file.value(), "/keys/app");
    EXPECT_FALSE(target.password.has_value());

    EXPECT_EQ(config.run().timeout.value(), 30);
    EXPECT_EQ(config.run().retry, 2);
    EXPECT_EQ(config.run().success_exit_code, std::vector<int>({0, 3}));
    EXPECT_EQ(config.run().sudo_user.value(), "deploy");
    EXPECT_EQ(config.log().file, "/tmp/jl.log");
    EXPECT_EQ(config.log().level, "debug");
}

TEST(Config, DefaultsWhenSectionsAbsent) {
    auto result = Config::parse("hops:\n  - {host: h, user: u}\n");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_FALSE(result.value.run().timeout.has_value());
    EXPECT_EQ(result.value.run().success_exit_code, std::vector<int>({0}));
    EXPECT_EQ(result.value.log().level, "info");
}

TEST(Config, UserInheritedAlongTheChain) {
    auto result = Config::parse(R"(
hops:
  - {host: a, user: first}
  - {host: b}
  - {host: c, user: third}
  - {host: d}
)");
    ASSERT_TRUE(result.is_ok()) << result.error;
    const auto& hops = result.value.hops();
    EXPECT_EQ(hops[1].user, "first");
    EXPECT_EQ(hops[2].user, "third");
    EXPECT_EQ(hops[3].user, "third");
}

TEST(Config, ScalarSuccessCode) {
    auto result = Config::parse("hops: [{host: h, user: u}]\nrun: {success_exit_code: 1}\n");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.run().success_exit_code, std::vector<int>({1}));
}

TEST(Config, Errors) {
    EXPECT_TRUE(Config::parse("run: {retry: 1}\n").is_err());
    EXPECT_TRUE(Config::parse("hops: []\n").is_err());
    EXPECT_TRUE(Config::parse("hops: [{user: u}]\n").is_err());
    EXPECT_TRUE(Config::parse("hops: [{host: h}]\n").is_err());
    EXPECT_TRUE(Config::parse("hops: [{host: h, user: u}]\nrun: {success_exit_code: {a: 1}}\n").is_err());
    EXPECT_TRUE(Config::parse("hops: [{host: h, user: u, port: twenty}]\n").is_err());
    EXPECT_TRUE(Config::parse("hops: [unclosed\n").is_err());
}

TEST(Config, ErrorNamesTheHop) {
    auto result = Config::parse("hops:\n  - {host: a, user: u}\n  - {port: 22}\n");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("hop #2"), std::string::npos);
}

TEST(Config, LoadMissingFile) {
    auto result = Config::load("/nonexistent/jumpline.yaml");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("/nonexistent/jumpline.yaml"), std::string::npos);
}

TEST(ExpandHome, OnlyLeadingTilde) {
    EXPECT_EQ(expand_home("~/.ssh/id"), (platform::home_dir() / ".ssh/id").string());
    EXPECT_EQ(expand_home("/etc/~/x"), "/etc/~/x");
    EXPECT_EQ(expand_home("~other/x"), "~other/x");
}
