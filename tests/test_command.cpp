#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>
#include <core/errors.hpp>
#include <ssh/command.hpp>
#include <ssh/expect.hpp>

TEST(CommandLine, SingleString) {
    EXPECT_EQ(CommandLine("uname -a").joined(), "uname -a");
}

TEST(CommandLine, FragmentsJoinedWithAnd) {
    CommandLine cmd(std::vector<std::string>{"cd /opt", "make", "make install"});
    EXPECT_EQ(cmd.joined(), "cd /opt && make && make install");
}

TEST(CommandLine, EmptyShapesRejected) {
    EXPECT_THROW(CommandLine("").joined(), InvalidArgument);
    EXPECT_THROW(CommandLine("   ").joined(), InvalidArgument);
    EXPECT_THROW(CommandLine(std::vector<std::string>{}).joined(), InvalidArgument);
    EXPECT_THROW(CommandLine(std::vector<std::string>{"ls", " "}).joined(), InvalidArgument);
}

TEST(CommandLine, FromYamlScalarOrSequence) {
    EXPECT_EQ(CommandLine::from_yaml(YAML::Load("hostname")).joined(), "hostname");
    EXPECT_EQ(CommandLine::from_yaml(YAML::Load("[a, b]")).joined(), "a && b");
}

TEST(CommandLine, FromYamlOtherShapeRejected) {
    EXPECT_THROW(CommandLine::from_yaml(YAML::Load("{cmd: ls}")), InvalidArgument);
    EXPECT_THROW(CommandLine::from_yaml(YAML::Load("[[nested]]")), InvalidArgument);
}

TEST(SuccessCodes, DefaultIsZero) {
    SuccessCodes codes;
    EXPECT_TRUE(codes.contains(0));
    EXPECT_FALSE(codes.contains(1));
}

TEST(SuccessCodes, FromYaml) {
    EXPECT_EQ(SuccessCodes::from_yaml(YAML::Load("3")).values(), std::set<int>({3}));
    EXPECT_EQ(SuccessCodes::from_yaml(YAML::Load("[0, 127]")).values(), std::set<int>({0, 127}));
    EXPECT_THROW(SuccessCodes::from_yaml(YAML::Load("{a: 1}")), InvalidArgument);
    EXPECT_THROW(SuccessCodes::from_yaml(YAML::Load("zero")), InvalidArgument);
}

TEST(Silence, Off) {
    EXPECT_EQ(Silence::off().conceal("ls -l"), "ls -l");
    EXPECT_FALSE(Silence::off().suppresses_log());
}

TEST(Silence, OnShowsMarker) {
    Silence s = Silence::on();
    EXPECT_TRUE(s.suppresses_log());
    EXPECT_EQ(s.conceal("mysql -p secret"), "XXXXXXX");
}

TEST(Silence, RedactReplacesEveryMatch) {
    Silence s = Silence::redact({"secret", "[0-9]{4}"});
    EXPECT_FALSE(s.suppresses_log());
    EXPECT_EQ(s.conceal("pin 1234 secret and secret 5678"), "pin XXXXXXX XXXXXXX and XXXXXXX XXXXXXX");
}

TEST(Silence, RedactRejectsBadPattern) {
    EXPECT_THROW(Silence::redact({"[unterminated"}), InvalidArgument);
}

TEST(Impersonate, EscapesDoubleQuotes) {
    EXPECT_EQ(impersonate("echo \"$HOME\"", "app"), "sudo su - app -c \"echo \\\"$HOME\\\"\"");
    EXPECT_EQ(impersonate("whoami", "root"), "sudo su - root -c \"whoami\"");
}

TEST(PrepareCommand, LogFormIsConcealedRemoteFormIsNot) {
    CommandRequest request("login --token abc123");
    request.username = "svc";
    request.silent = Silence::redact({"abc123"});

    PreparedCommand prepared = prepare_command(request);
    EXPECT_EQ(prepared.joined, "login --token abc123");
    EXPECT_EQ(prepared.remote, "sudo su - svc -c \"login --token abc123\"");
    EXPECT_EQ(prepared.for_log, "login --token XXXXXXX");
}

TEST(InputResponder, RepliesInMapOrder) {
    std::vector<std::pair<std::string, std::string>> input = {
        {"name\\?", "bob"}, {"[Pp]assword", "pw"}, {"absent", "x"}};
    InputResponder responder(input);
    auto replies = responder.replies_for("name? Password:");
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(replies[0], "bob\n");
    EXPECT_EQ(replies[1], "pw\n");
    EXPECT_TRUE(responder.replies_for("").empty());
}

TEST(InputResponder, BadPatternRejected) {
    std::vector<std::pair<std::string, std::string>> input = {{"(", "x"}};
    EXPECT_THROW(InputResponder responder(input), InvalidArgument);
}
