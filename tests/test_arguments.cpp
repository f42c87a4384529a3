#include <gtest/gtest.h>
#include <cli/arguments.hpp>

TEST(Arguments, RemoteGroup) {
    auto r = parse_arguments({"-R", "ssh://u:p@h1", "--remote", "h2", "-J", "ssh://j@jump",
                              "--sudo", "--cmd-timeout", "5", "--login-timeout=30",
                              "--strict-host-key-checking", "hostname"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& a = r.value;
    EXPECT_EQ(a.remotes, (std::vector<std::string>{"ssh://u:p@h1", "h2"}));
    EXPECT_EQ(a.jump_hosts, std::vector<std::string>{"ssh://j@jump"});
    EXPECT_TRUE(a.sudo);
    EXPECT_EQ(a.cmd_timeout.value(), 5);
    EXPECT_EQ(a.login_timeout.value(), 30);
    EXPECT_TRUE(a.strict_host_key_checking);
    EXPECT_EQ(a.command, "hostname");
    EXPECT_TRUE(a.command_args.empty());
}

TEST(Arguments, CommandArgumentsUntouched) {
    auto r = parse_arguments({"-R", "ssh://u@h", "run", "ls", "-la", "--sudo"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.command, "run");
    EXPECT_EQ(r.value.command_args, (std::vector<std::string>{"ls", "-la", "--sudo"}));
    EXPECT_FALSE(r.value.sudo);
}

TEST(Arguments, BundledVerbosity) {
    auto r = parse_arguments({"-vvv", "-v", "hostname"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.verbose, 4);
}

TEST(Arguments, GlobalOptions) {
    auto r = parse_arguments({"-q", "--log-file", "/tmp/x.log", "-c", "rc.yaml", "-F", "yaml",
                              "-O", "out.yaml", "--check", "df"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.quiet);
    EXPECT_EQ(r.value.log_file.value(), "/tmp/x.log");
    EXPECT_EQ(r.value.conf.value(), "rc.yaml");
    EXPECT_EQ(r.value.output_format.value(), "yaml");
    EXPECT_EQ(r.value.output_file.value(), "out.yaml");
    EXPECT_TRUE(r.value.check);
}

TEST(Arguments, VersionAndHelp) {
    EXPECT_TRUE(parse_arguments({"-V"}).value.version);
    EXPECT_TRUE(parse_arguments({"--help"}).value.help);
    EXPECT_TRUE(parse_arguments({"-h"}).value.help);
}

TEST(Arguments, Errors) {
    EXPECT_TRUE(parse_arguments({"--bogus"}).is_err());
    EXPECT_TRUE(parse_arguments({"-R"}).is_err());
    EXPECT_TRUE(parse_arguments({"--cmd-timeout", "0", "df"}).is_err());
    EXPECT_TRUE(parse_arguments({"--cmd-timeout", "ten", "df"}).is_err());
    EXPECT_TRUE(parse_arguments({"-F", "json", "df"}).is_err());
    EXPECT_TRUE(parse_arguments({"--sudo=yes", "df"}).is_err());
    EXPECT_TRUE(parse_arguments({"-x"}).is_err());
}

TEST(Arguments, DoubleDashEndsOptions) {
    auto r = parse_arguments({"-R", "ssh://u@h", "--", "run", "x"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.command, "run");
}

TEST(Arguments, RemoteOptionsFromConfigDefaults) {
    auto r = parse_arguments({"-R", "ssh://u@h", "--cmd-timeout", "3", "df"});
    ASSERT_TRUE(r.is_ok());
    auto o = make_remote_options(r.value, 10, 200, true);
    EXPECT_EQ(o.cmd_timeout, 3);
    EXPECT_EQ(o.login_timeout, 200);
    EXPECT_TRUE(o.strict_host_key_checking);
    EXPECT_EQ(o.remotes.size(), 1u);
}
