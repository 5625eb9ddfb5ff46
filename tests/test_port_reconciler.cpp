#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/port_reconciler.hpp"
#include "fakes.hpp"

using quay::PortEntry;
using quay::PortReconciler;
using quay::PortSource;
using quay::SourceError;
using quay::Target;
using quay::testing::make_entry;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::NiceMock;
using ::testing::Return;

class PortReconcilerTest : public ::testing::Test {
protected:
    NiceMock<quay::testing::MockPortCollector> local_;
    NiceMock<quay::testing::MockPortCollector> docker_;
    NiceMock<quay::testing::MockPortCollector> ssh_;
    NiceMock<quay::testing::MockContainerSource> container_;
    NiceMock<quay::testing::MockPortProber> prober_;
    PortReconciler reconciler_{&local_, &docker_, &ssh_, &container_, &prober_};

    void SetUp() override {
        ON_CALL(local_, name()).WillByDefault(Return("local"));
        ON_CALL(docker_, name()).WillByDefault(Return("docker"));
        ON_CALL(ssh_, name()).WillByDefault(Return("ssh"));
    }

    static std::vector<uint16_t> ports_of(const std::vector<PortEntry>& entries) {
        std::vector<uint16_t> ports;
        for (const auto& e : entries) ports.push_back(e.local_port);
        return ports;
    }
};

TEST_F(PortReconcilerTest, DedupDropsLocalShadowedByForward) {
    std::vector<PortEntry> entries = {
        make_entry(PortSource::Local, 9000),
        make_entry(PortSource::Ssh, 9000),
    };

    PortReconciler::dedup_local(entries);

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].source, PortSource::Ssh);
}

TEST_F(PortReconcilerTest, DedupDropsLocalShadowedByDocker) {
    std::vector<PortEntry> entries = {
        make_entry(PortSource::Docker, 5432),
        make_entry(PortSource::Local, 5432),
        make_entry(PortSource::Local, 3000),
    };

    PortReconciler::dedup_local(entries);

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].source, PortSource::Docker);
    EXPECT_EQ(entries[1].local_port, 3000);
}

TEST_F(PortReconcilerTest, DedupKeepsDistinctPorts) {
    std::vector<PortEntry> entries = {
        make_entry(PortSource::Local, 3000),
        make_entry(PortSource::Ssh, 9000),
        make_entry(PortSource::Docker, 5432),
    };
    const auto before = entries;

    PortReconciler::dedup_local(entries);

    EXPECT_EQ(entries, before);
}

TEST_F(PortReconcilerTest, DedupNeverDropsForwards) {
    std::vector<PortEntry> entries = {
        make_entry(PortSource::Ssh, 8080),
        make_entry(PortSource::Docker, 8080),
    };

    PortReconciler::dedup_local(entries);

    EXPECT_EQ(entries.size(), 2u);
}

TEST_F(PortReconcilerTest, ProbeSetDependsOnMode) {
    std::vector<PortEntry> entries = {
        make_entry(PortSource::Local, 3000),
        make_entry(PortSource::Ssh, 9000),
        make_entry(PortSource::Docker, 5432),
        make_entry(PortSource::Docker, 3000),
    };

    EXPECT_THAT(PortReconciler::ports_to_probe(entries, false), ElementsAre(3000, 5432, 9000));
    EXPECT_THAT(PortReconciler::ports_to_probe(entries, true), ElementsAre(9000));
}

TEST_F(PortReconcilerTest, ApplyProbeResultsLeavesUnprobedAlone) {
    std::vector<PortEntry> entries = {
        make_entry(PortSource::Ssh, 9000, false),
        make_entry(PortSource::Local, 22, true),
    };

    PortReconciler::apply_probe_results(entries, {{9000, true}});

    EXPECT_TRUE(entries[0].is_open);
    EXPECT_TRUE(entries[1].is_open);
}

TEST_F(PortReconcilerTest, CollectAllMergesProbesAndSorts) {
    EXPECT_CALL(local_, collect(std::optional<std::string>()))
        .WillOnce(Return(std::vector<PortEntry>{make_entry(PortSource::Local, 8080, false),
                                                make_entry(PortSource::Local, 9000, false)}));
    EXPECT_CALL(docker_, collect(std::optional<std::string>()))
        .WillOnce(Return(std::vector<PortEntry>{make_entry(PortSource::Docker, 5432, false)}));
    EXPECT_CALL(ssh_, collect(std::optional<std::string>()))
        .WillOnce(Return(std::vector<PortEntry>{make_entry(PortSource::Ssh, 9000, false)}));
    EXPECT_CALL(prober_, probe(std::vector<uint16_t>{5432, 8080, 9000}))
        .WillOnce(Return(std::map<uint16_t, bool>{{5432, false}, {8080, true}, {9000, true}}));

    auto entries = reconciler_.collect_all(Target{});

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(ports_of(entries), (std::vector<uint16_t>{8080, 9000, 5432}));
    EXPECT_EQ(entries[1].source, PortSource::Ssh);
    EXPECT_TRUE(reconciler_.last_errors().empty());
}

TEST_F(PortReconcilerTest, RemoteModeScansRemoteButSshStaysLocal) {
    const std::optional<std::string> remote = std::string("user@server");

    auto remote_local = make_entry(PortSource::Local, 22, true);
    EXPECT_CALL(local_, collect(remote)).WillOnce(Return(std::vector<PortEntry>{remote_local}));
    EXPECT_CALL(docker_, collect(remote)).WillOnce(Return(std::vector<PortEntry>{}));
    EXPECT_CALL(ssh_, collect(std::optional<std::string>()))
        .WillOnce(Return(std::vector<PortEntry>{make_entry(PortSource::Ssh, 9000, false)}));
    EXPECT_CALL(prober_, probe(std::vector<uint16_t>{9000}))
        .WillOnce(Return(std::map<uint16_t, bool>{{9000, false}}));

    auto entries = reconciler_.collect_all(Target{remote, std::nullopt});

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].local_port, 22);
    EXPECT_TRUE(entries[0].is_open);
    EXPECT_FALSE(entries[1].is_open);
}

TEST_F(PortReconcilerTest, NothingToProbeSkipsProber) {
    EXPECT_CALL(local_, collect(_)).WillOnce(Return(std::vector<PortEntry>{}));
    EXPECT_CALL(docker_, collect(_)).WillOnce(Return(std::vector<PortEntry>{}));
    EXPECT_CALL(ssh_, collect(_)).WillOnce(Return(std::vector<PortEntry>{}));
    EXPECT_CALL(prober_, probe(_)).Times(0);

    EXPECT_TRUE(reconciler_.collect_all(Target{}).empty());
}

TEST_F(PortReconcilerTest, CollectorErrorsAreGathered) {
    EXPECT_CALL(local_, collect(_)).WillOnce(Return(std::vector<PortEntry>{}));
    EXPECT_CALL(docker_, collect(_)).WillOnce(Return(std::vector<PortEntry>{}));
    EXPECT_CALL(ssh_, collect(_)).WillOnce(Return(std::vector<PortEntry>{}));
    EXPECT_CALL(docker_, get_recent_errors())
        .WillOnce(Return(std::vector<SourceError>{{{}, "docker", "docker: command not found"}}));

    auto entries = reconciler_.collect_all(Target{});

    EXPECT_TRUE(entries.empty());
    ASSERT_EQ(reconciler_.last_errors().size(), 1u);
    EXPECT_EQ(reconciler_.last_errors()[0].message, "docker: command not found");
}

TEST_F(PortReconcilerTest, DockerTargetUsesContainerListingOnly) {
    auto loopback = make_entry(PortSource::Docker, 6379, true);
    loopback.is_loopback = true;
    auto closed = make_entry(PortSource::Docker, 80, false);
    auto open = make_entry(PortSource::Docker, 8000, true);

    EXPECT_CALL(container_, collect_container("web", std::optional<std::string>()))
        .WillOnce(Return(std::vector<PortEntry>{loopback, closed, open}));
    EXPECT_CALL(local_, collect(_)).Times(0);
    EXPECT_CALL(ssh_, collect(_)).Times(0);
    EXPECT_CALL(prober_, probe(_)).Times(0);

    auto entries = reconciler_.collect_all(Target{std::nullopt, std::string("web")});

    EXPECT_EQ(ports_of(entries), (std::vector<uint16_t>{6379, 8000, 80}));
}

TEST_F(PortReconcilerTest, ContainerIpNeedsDockerTarget) {
    auto none = reconciler_.get_container_ip(Target{});
    EXPECT_FALSE(none.ip);

    EXPECT_CALL(container_, get_container_ip("web", std::optional<std::string>("srv")))
        .WillOnce(Return(quay::ContainerIpResult{std::string("172.17.0.2"), ""}));
    auto found = reconciler_.get_container_ip(Target{std::string("srv"), std::string("web")});
    EXPECT_EQ(found.ip, "172.17.0.2");
}
