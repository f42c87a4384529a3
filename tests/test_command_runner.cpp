#include <gtest/gtest.h>
#include <exec/command_runner.hpp>
#include <chain/chain_lease.hpp>
#include "fake_transport.hpp"

class CommandRunnerTest : public ::testing::Test {
protected:
    FakeTransport transport;
    CapturedLog captured;
    FakeEvents& events = transport.events;
    FakeHostBehavior behavior;

    RemoteResult<CommandResult> run(const CommandRequest& request, const RemoteSpec& spec) {
        FakeHop hop(spec.end_host, behavior, events);
        CommandRunner runner(captured.log);
        return runner.run(hop, request, spec);
    }
};

TEST(CommandLine, SingleStringIsVerbatim) {
    CommandRequest r;
    r.argv = {"ls -l /tmp | wc -l"};
    EXPECT_EQ(build_command_line(r), "ls -l /tmp | wc -l");
}

TEST(CommandLine, ArgumentsAreQuoted) {
    CommandRequest r;
    r.argv = {"echo", "hello world", "it's"};
    EXPECT_EQ(build_command_line(r), "echo 'hello world' 'it'\\''s'");
}

TEST(CommandLine, SudoPrefix) {
    CommandRequest r;
    r.argv = {"id", "-u"};
    r.sudo = true;
    EXPECT_EQ(build_command_line(r), "sudo -S -p '' id -u");
}

TEST_F(CommandRunnerTest, ReturnsCapturedOutput) {
    behavior.result.stdout_data = "out";
    behavior.result.stderr_data = "err";
    behavior.result.exit_status = 0;

    CommandRequest request;
    request.argv = {"uptime"};
    auto result = run(request, make_spec({}, "end"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.stdout_data, "out");
    EXPECT_EQ(result.value.stderr_data, "err");
    EXPECT_EQ(events.with_prefix("exec"), std::vector<std::string>{"exec end uptime"});
}

TEST_F(CommandRunnerTest, NonZeroExitIsNotAnError) {
    behavior.result.exit_status = 42;
    CommandRequest request;
    request.argv = {"false"};
    auto result = run(request, make_spec({}, "end"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.exit_status, 42);
    EXPECT_FALSE(result.value.exited_cleanly());
}

TEST_F(CommandRunnerTest, SudoPasswordGoesToStdinNotArgv) {
    auto spec = make_spec({}, "end");
    spec.sudo_password = "hunter2";

    CommandRequest request;
    request.argv = {"whoami"};
    request.sudo = true;
    request.input = "payload";
    ASSERT_TRUE(run(request, spec).is_ok());

    auto execs = events.with_prefix("exec");
    ASSERT_EQ(execs.size(), 1u);
    EXPECT_EQ(execs[0], "exec end sudo -S -p '' whoami");
    EXPECT_EQ(execs[0].find("hunter2"), std::string::npos);
    EXPECT_EQ(events.last_input(), "hunter2\npayload");
}

TEST_F(CommandRunnerTest, SudoWithoutPassword) {
    CommandRequest request;
    request.argv = {"whoami"};
    request.sudo = true;
    auto result = run(request, make_spec({}, "end"));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::MalformedRemoteSpec);
    EXPECT_TRUE(events.with_prefix("exec").empty());
}

TEST_F(CommandRunnerTest, PasswordNeverLogged) {
    auto spec = make_spec({}, "end");
    spec.sudo_password = "hunter2";
    CommandRequest request;
    request.argv = {"whoami"};
    request.sudo = true;
    ASSERT_TRUE(run(request, spec).is_ok());
    EXPECT_EQ(captured.text().find("hunter2"), std::string::npos);
}

TEST_F(CommandRunnerTest, EmptyCommand) {
    auto result = run(CommandRequest{}, make_spec({}, "end"));
    ASSERT_TRUE(result.is_err());
}

TEST_F(CommandRunnerTest, TransportLostPropagates) {
    behavior.exec_error = RemoteError{ErrorKind::TransportLost, "dropped"};
    CommandRequest request;
    request.argv = {"sleep 1"};
    auto result = run(request, make_spec({}, "end"));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::TransportLost);
}

TEST_F(CommandRunnerTest, TimeoutLeavesChainReleasable) {
    transport.hosts["end"].exec_hangs = true;
    ChainBuilder builder(transport, HopOptions{}, captured.log);
    auto spec = make_spec({"j1"}, "end");
    spec.cmd_timeout = std::chrono::seconds(1);

    CommandRunner runner(captured.log);
    CommandRequest request;
    request.argv = {"sleep 100"};
    RemoteTask task = [&](const TaskContext& ctx) {
        return runner.run(ctx.end_host, request, ctx.spec, ctx.cancel);
    };

    auto result = run_remote_task(builder, spec, task, nullptr, captured.log);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::CommandTimedOut);
    EXPECT_TRUE(result.cleanup_errors.empty());
    EXPECT_EQ(events.with_prefix("close"), (std::vector<std::string>{"close end", "close j1"}));
}

TEST_F(CommandRunnerTest, CancelAbandonsCommand) {
    behavior.exec_hangs = true;
    auto spec = make_spec({}, "end");
    spec.cmd_timeout = std::chrono::seconds(30);
    std::atomic<bool> cancel{false};

    FakeHop hop(spec.end_host, behavior, events);
    CommandRunner runner(captured.log);
    CommandRequest request;
    request.argv = {"sleep 100"};

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel = true;
    });
    auto result = runner.run(hop, request, spec, &cancel);
    canceller.join();

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::Cancelled);
}
