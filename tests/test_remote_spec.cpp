#include <gtest/gtest.h>
#include <remote/remote_spec.hpp>

static RemoteOptions options_for(std::vector<std::string> remotes) {
    RemoteOptions o;
    o.remotes = std::move(remotes);
    return o;
}

TEST(RemoteSpec, SingleRemote) {
    auto r = resolve_remote_specs(options_for({"ssh://u:p@h1"}));
    ASSERT_TRUE(r.is_ok()) << r.error.message;
    ASSERT_EQ(r.value.size(), 1u);
    EXPECT_TRUE(r.value[0].jump_hosts.empty());
    EXPECT_EQ(r.value[0].end_host.role, HopRole::End);
    EXPECT_EQ(r.value[0].hops().size(), 1u);
    EXPECT_EQ(r.value[0].cmd_timeout.count(), 10);
    EXPECT_EQ(r.value[0].login_timeout.count(), 120);
}

TEST(RemoteSpec, BareHostsShareCredentials) {
    auto r = resolve_remote_specs(options_for({"ssh://user:pw@1.2.3.4:22", "5.6.7.8"}));
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 2u);
    const auto& second = r.value[1].end_host;
    EXPECT_EQ(second.host, "5.6.7.8");
    EXPECT_EQ(second.user.value(), "user");
    EXPECT_EQ(second.secret.value(), "pw");
    EXPECT_EQ(second.port, 22);
}

TEST(RemoteSpec, TemplateIsMostRecentFullUri) {
    auto r = resolve_remote_specs(options_for({"ssh://a:1@h1", "h2", "ssh://b:2@h3:2022", "h4"}));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value[1].end_host.user.value(), "a");
    EXPECT_EQ(r.value[3].end_host.user.value(), "b");
    EXPECT_EQ(r.value[3].end_host.port, 2022);
}

TEST(RemoteSpec, FirstRemoteMustBeComplete) {
    auto r = resolve_remote_specs(options_for({"1.2.3.4"}));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::MalformedRemoteSpec);
}

TEST(RemoteSpec, JumpHostsPrecedeEndHost) {
    auto o = options_for({"ssh://u:p@end"});
    o.jump_hosts = {"ssh://j1@jump1", "ssh://j2@jump2:2200"};
    auto r = resolve_remote_specs(o);
    ASSERT_TRUE(r.is_ok());
    auto hops = r.value[0].hops();
    ASSERT_EQ(hops.size(), 3u);
    EXPECT_EQ(hops[0].host, "jump1");
    EXPECT_EQ(hops[0].role, HopRole::Jump);
    EXPECT_EQ(hops[1].host, "jump2");
    EXPECT_EQ(hops[1].port, 2200);
    EXPECT_EQ(hops[2].host, "end");
    EXPECT_EQ(hops[2].role, HopRole::End);
}

TEST(RemoteSpec, JumpHostMustBeComplete) {
    auto o = options_for({"ssh://u:p@end"});
    o.jump_hosts = {"jump1"};
    auto r = resolve_remote_specs(o);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::MalformedRemoteSpec);
}

TEST(RemoteSpec, IncompleteJumpHostHidesSecret) {
    auto o = options_for({"ssh://u:p@end"});
    o.jump_hosts = {"alice:hunter2@jump"};
    auto r = resolve_remote_specs(o);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.message.find("hunter2"), std::string::npos) << r.error.message;
    EXPECT_NE(r.error.message.find("alice:***@jump"), std::string::npos) << r.error.message;
}

TEST(RemoteSpec, IncompleteFirstRemoteHidesSecret) {
    auto r = resolve_remote_specs(options_for({"alice:hunter2@host"}));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::MalformedRemoteSpec);
    EXPECT_EQ(r.error.message.find("hunter2"), std::string::npos) << r.error.message;
}

TEST(RemoteSpec, SudoTakesEndHostSecret) {
    auto o = options_for({"ssh://u:hunter2@h"});
    o.sudo = true;
    auto r = resolve_remote_specs(o);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value[0].sudo_password.value(), "hunter2");
}

TEST(RemoteSpec, SudoWithoutSecret) {
    auto o = options_for({"ssh://u@h"});
    o.sudo = true;
    auto r = resolve_remote_specs(o);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::MalformedRemoteSpec);
}

TEST(RemoteSpec, TimeoutsMustBePositive) {
    auto o = options_for({"ssh://u@h"});
    o.cmd_timeout = 0;
    EXPECT_TRUE(resolve_remote_specs(o).is_err());
    o.cmd_timeout = 5;
    o.login_timeout = -1;
    EXPECT_TRUE(resolve_remote_specs(o).is_err());
}

TEST(RemoteSpec, OptionsCarriedIntoSpec) {
    auto o = options_for({"ssh://u@h"});
    o.cmd_timeout = 3;
    o.login_timeout = 7;
    o.strict_host_key_checking = true;
    auto r = resolve_remote_specs(o);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value[0].cmd_timeout.count(), 3);
    EXPECT_EQ(r.value[0].login_timeout.count(), 7);
    EXPECT_TRUE(r.value[0].strict_host_key_checking);
    EXPECT_FALSE(r.value[0].sudo_password.has_value());
}

TEST(RemoteSpec, NoRemotes) {
    EXPECT_TRUE(resolve_remote_specs(options_for({})).is_err());
}
