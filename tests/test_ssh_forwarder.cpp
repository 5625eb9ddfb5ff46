#include <gtest/gtest.h>
#include "../src/ssh_forwarder.hpp"
#include "fakes.hpp"

using quay::SshForwarder;
using quay::testing::FakeCommandRunner;

using Argv = std::vector<std::string>;

TEST(SshForwarderTest, SpawnsLocalForward) {
    FakeCommandRunner runner;
    runner.spawn_result = {true, 31337, ""};
    SshForwarder forwarder(&runner);

    auto result = forwarder.create_forward("8080:localhost:80", "bastion", false);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.pid, 31337);
    ASSERT_EQ(runner.spawned.size(), 1u);
    EXPECT_EQ(runner.spawned[0], (Argv{"ssh", "-f", "-N", "-L", "8080:localhost:80", "bastion"}));
    EXPECT_TRUE(runner.calls.empty());
}

TEST(SshForwarderTest, ReverseUsesDashR) {
    FakeCommandRunner runner;
    SshForwarder forwarder(&runner);

    forwarder.create_forward("9000:localhost:3000", "server", true);

    ASSERT_EQ(runner.spawned.size(), 1u);
    EXPECT_EQ(runner.spawned[0][3], "-R");
}

TEST(SshForwarderTest, SpawnFailureIsReported) {
    FakeCommandRunner runner;
    runner.spawn_result = {false, -1, "fork failed: Resource temporarily unavailable"};
    SshForwarder forwarder(&runner);

    auto result = forwarder.create_forward("8080:localhost:80", "bastion", false);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_message, "fork failed: Resource temporarily unavailable");
}

TEST(SshForwarderTest, BlankArgumentsAreRejected) {
    FakeCommandRunner runner;
    SshForwarder forwarder(&runner);

    EXPECT_FALSE(forwarder.create_forward("", "bastion", false).success);
    EXPECT_FALSE(forwarder.create_forward("8080:localhost:80", "  ", false).success);
    EXPECT_TRUE(runner.spawned.empty());
}
