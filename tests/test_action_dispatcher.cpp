#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/action_dispatcher.hpp"
#include "../src/mock_data.hpp"
#include "../src/port_killer.hpp"
#include "fakes.hpp"
#include <filesystem>
#include <memory>
#include <unistd.h>

using quay::ActionDispatcher;
using quay::ActionType;
using quay::Connections;
using quay::ForwardResult;
using quay::KillResult;
using quay::PortEntry;
using quay::PortReconciler;
using quay::PortSource;
using quay::Popup;
using quay::SessionState;
using quay::SourceError;
using quay::testing::make_entry;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class ActionDispatcherTest : public ::testing::Test {
protected:
    NiceMock<quay::testing::MockPortCollector> local_;
    NiceMock<quay::testing::MockPortCollector> docker_;
    NiceMock<quay::testing::MockPortCollector> ssh_;
    NiceMock<quay::testing::MockContainerSource> container_;
    NiceMock<quay::testing::MockPortProber> prober_;
    NiceMock<quay::testing::MockPortKiller> killer_;
    NiceMock<quay::testing::MockForwardLauncher> forwarder_;
    PortReconciler reconciler_{&local_, &docker_, &ssh_, &container_, &prober_};

    SessionState state_;
    std::string temp_dir_;

    void SetUp() override {
        char template_path[] = "/tmp/quay_dispatch_XXXXXX";
        temp_dir_ = mkdtemp(template_path);
        ASSERT_FALSE(temp_dir_.empty());

        ON_CALL(local_, name()).WillByDefault(Return("local"));
        ON_CALL(docker_, name()).WillByDefault(Return("docker"));
        ON_CALL(ssh_, name()).WillByDefault(Return("ssh"));
        ON_CALL(prober_, probe(_)).WillByDefault(Return(std::map<uint16_t, bool>{}));
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    void local_returns(std::vector<PortEntry> entries) {
        ON_CALL(local_, collect(_)).WillByDefault(Return(entries));
    }

    void docker_fails(const std::string& message) {
        ON_CALL(docker_, get_recent_errors())
            .WillByDefault(Return(std::vector<SourceError>{{{}, "docker", message}}));
    }

    std::unique_ptr<ActionDispatcher> make_dispatcher(bool mock, Connections* connections = nullptr) {
        auto dispatcher = std::make_unique<ActionDispatcher>(&reconciler_, &killer_, &forwarder_,
                                                             connections, mock);
        dispatcher->set_connections_path(std::filesystem::path(temp_dir_) / "connections.json");
        return dispatcher;
    }

    void send(ActionDispatcher& dispatcher, const std::string& keys) {
        for (char c : keys) {
            dispatcher.handle_key(state_, c);
        }
    }

    std::string status() const {
        return state_.status ? state_.status->text : "";
    }
};

TEST_F(ActionDispatcherTest, StartLoadsRecords) {
    local_returns({make_entry(PortSource::Local, 3000), make_entry(PortSource::Local, 8080)});
    auto dispatcher = make_dispatcher(false);

    dispatcher->start(state_);

    EXPECT_EQ(state_.all_records.size(), 2u);
    EXPECT_EQ(state_.view.size(), 2u);
    EXPECT_FALSE(state_.mock_mode);
    EXPECT_FALSE(state_.status);
}

TEST_F(ActionDispatcherTest, StartInMockModeUsesDemoData) {
    EXPECT_CALL(local_, collect(_)).Times(0);
    auto dispatcher = make_dispatcher(true);

    dispatcher->start(state_);

    EXPECT_TRUE(state_.mock_mode);
    EXPECT_EQ(state_.all_records, quay::make_mock_entries());
    EXPECT_EQ(status(), "[mock] Loaded mock data");
}

TEST_F(ActionDispatcherTest, NoDataIsReportedOnce) {
    docker_fails("docker: command not found");
    auto dispatcher = make_dispatcher(false);

    dispatcher->start(state_);
    EXPECT_EQ(status(), "Load failed: docker: command not found");

    state_.status.reset();
    state_.auto_refresh = true;
    state_.refresh_period_ticks = 1;
    dispatcher->on_tick(state_);
    EXPECT_FALSE(state_.status);

    // A manual refresh reports again
    dispatcher->handle_key(state_, 'r');
    EXPECT_EQ(status(), "Refresh failed: docker: command not found");
}

TEST_F(ActionDispatcherTest, PartialFailureStillShowsData) {
    local_returns({make_entry(PortSource::Local, 3000)});
    docker_fails("docker: command not found");
    auto dispatcher = make_dispatcher(false);

    dispatcher->start(state_);
    dispatcher->handle_key(state_, 'r');

    EXPECT_EQ(state_.all_records.size(), 1u);
    EXPECT_EQ(status(), "Refreshed");
}

TEST_F(ActionDispatcherTest, AutoRefreshToggle) {
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    dispatcher->handle_key(state_, 'a');
    EXPECT_TRUE(state_.auto_refresh);
    EXPECT_EQ(status(), "Auto-refresh ON");

    dispatcher->handle_key(state_, 'a');
    EXPECT_FALSE(state_.auto_refresh);
    EXPECT_EQ(status(), "Auto-refresh OFF");
}

TEST_F(ActionDispatcherTest, AutoRefreshReloadsWhenDue) {
    local_returns({make_entry(PortSource::Local, 3000)});
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    local_returns({make_entry(PortSource::Local, 3000), make_entry(PortSource::Local, 4000)});
    state_.auto_refresh = true;
    state_.refresh_period_ticks = 2;

    dispatcher->on_tick(state_);
    EXPECT_EQ(state_.all_records.size(), 1u);
    dispatcher->on_tick(state_);
    EXPECT_EQ(state_.all_records.size(), 2u);
}

TEST_F(ActionDispatcherTest, QuitKeys) {
    auto dispatcher = make_dispatcher(true);
    dispatcher->start(state_);

    dispatcher->handle_key(state_, 'q');
    EXPECT_TRUE(state_.should_quit);

    state_.should_quit = false;
    dispatcher->handle_key(state_, quay::kKeyCtrlC);
    EXPECT_TRUE(state_.should_quit);
}

TEST_F(ActionDispatcherTest, SearchNarrowsTheView) {
    auto dispatcher = make_dispatcher(true);
    dispatcher->start(state_);

    send(*dispatcher, "/redis");
    EXPECT_EQ(state_.input_mode, quay::InputMode::Search);
    ASSERT_EQ(state_.view.size(), 1u);
    EXPECT_EQ(state_.view[0].local_port, 6379);

    // q is text while searching
    dispatcher->handle_key(state_, 'q');
    EXPECT_FALSE(state_.should_quit);
    EXPECT_TRUE(state_.view.empty());

    dispatcher->handle_key(state_, 127);
    EXPECT_EQ(state_.search_query, "redis");
    dispatcher->handle_key(state_, '\n');
    EXPECT_EQ(state_.input_mode, quay::InputMode::Normal);
    EXPECT_EQ(state_.view.size(), 1u);
}

TEST_F(ActionDispatcherTest, FilterKeys) {
    auto dispatcher = make_dispatcher(true);
    dispatcher->start(state_);

    dispatcher->handle_key(state_, '3');
    EXPECT_EQ(state_.filter, quay::Filter::Docker);
    EXPECT_EQ(state_.view.size(), 3u);

    dispatcher->handle_key(state_, '2');
    EXPECT_EQ(state_.view.size(), 2u);

    dispatcher->handle_key(state_, '0');
    EXPECT_EQ(state_.view.size(), state_.all_records.size());
}

TEST_F(ActionDispatcherTest, DetailsAndHelpPopups) {
    auto dispatcher = make_dispatcher(true);
    dispatcher->start(state_);

    dispatcher->handle_key(state_, '\n');
    EXPECT_EQ(state_.popup, Popup::Details);

    // Popup keys do not leak through to the list
    dispatcher->handle_key(state_, 'j');
    EXPECT_EQ(state_.selected_index, 0u);
    dispatcher->handle_key(state_, 'q');
    EXPECT_EQ(state_.popup, Popup::None);
    EXPECT_FALSE(state_.should_quit);

    dispatcher->handle_key(state_, '?');
    EXPECT_EQ(state_.popup, Popup::Help);
    dispatcher->handle_key(state_, quay::kKeyEscape);
    EXPECT_EQ(state_.popup, Popup::None);
}

TEST_F(ActionDispatcherTest, DetailsNeedsASelection) {
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    dispatcher->handle_key(state_, '\n');
    EXPECT_EQ(state_.popup, Popup::None);
}

TEST_F(ActionDispatcherTest, KillSelectedLocalProcess) {
    auto entry = make_entry(PortSource::Local, 3000);
    entry.pid = 1234;
    local_returns({entry});
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    EXPECT_CALL(killer_, kill_entry(entry, _)).WillOnce(Return(KillResult{true, ""}));
    dispatcher->handle_key(state_, 'K');

    EXPECT_EQ(status(), "Killed process on port 3000");
}

TEST_F(ActionDispatcherTest, KillFailureIsPrefixed) {
    local_returns({make_entry(PortSource::Local, 3000)});
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    EXPECT_CALL(killer_, kill_entry(_, _)).WillOnce(Return(KillResult{false, "No PID found for port 3000"}));
    dispatcher->handle_key(state_, 'K');

    EXPECT_EQ(status(), "Kill failed: No PID found for port 3000");
}

TEST_F(ActionDispatcherTest, ContainerKillMessages) {
    state_.target.docker_target = "web";
    auto entry = make_entry(PortSource::Docker, 8000);
    ON_CALL(container_, collect_container(_, _)).WillByDefault(Return(std::vector<PortEntry>{entry}));
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    EXPECT_CALL(killer_, kill_entry(_, _))
        .WillOnce(Return(KillResult{false, quay::PortKiller::kNoContainerPidMessage}))
        .WillOnce(Return(KillResult{true, ""}));

    dispatcher->handle_key(state_, 'K');
    EXPECT_EQ(status(), quay::PortKiller::kNoContainerPidMessage);

    state_.all_records[0].pid = 42;
    state_.apply_filter();
    dispatcher->handle_key(state_, 'K');
    EXPECT_EQ(status(), "Killed PID 42 in container");
}

TEST_F(ActionDispatcherTest, MockKillRemovesRow) {
    auto dispatcher = make_dispatcher(true);
    dispatcher->start(state_);
    const size_t before = state_.all_records.size();
    const uint16_t port = state_.selected_record()->local_port;

    EXPECT_CALL(killer_, kill_entry(_, _)).Times(0);
    dispatcher->handle_key(state_, 'K');

    EXPECT_EQ(state_.all_records.size(), before - 1);
    EXPECT_EQ(status(), "[mock] Removed port " + std::to_string(port));
}

TEST_F(ActionDispatcherTest, KillWithEmptyViewDoesNothing) {
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    EXPECT_CALL(killer_, kill_entry(_, _)).Times(0);
    dispatcher->handle_key(state_, 'K');
    EXPECT_FALSE(state_.status);
}

TEST_F(ActionDispatcherTest, ForwardPopupSubmit) {
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    dispatcher->handle_key(state_, 'f');
    ASSERT_EQ(state_.popup, Popup::ForwardDraft);

    // Local Port, Remote Host, Remote Port, SSH Host
    send(*dispatcher, "8080\tlocalhost\t80\tbastion");

    EXPECT_CALL(forwarder_, create_forward("8080:localhost:80", "bastion", false))
        .WillOnce(Return(ForwardResult{true, 555, ""}));
    dispatcher->handle_key(state_, '\n');

    EXPECT_EQ(state_.popup, Popup::None);
    EXPECT_EQ(status(), "Forward created (PID: 555)");
}

TEST_F(ActionDispatcherTest, InvalidForwardKeepsPopupOpen) {
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    dispatcher->handle_key(state_, 'f');
    send(*dispatcher, "abc");

    EXPECT_CALL(forwarder_, create_forward(_, _, _)).Times(0);
    dispatcher->handle_key(state_, '\n');

    EXPECT_EQ(state_.popup, Popup::ForwardDraft);
    EXPECT_EQ(status(), "Invalid forward: Local Port, Remote Host, Remote Port, SSH Host");
    EXPECT_EQ(state_.forward_draft.local_port, "abc");
}

TEST_F(ActionDispatcherTest, ForwardFailureIsReported) {
    auto entry = make_entry(PortSource::Local, 3000);
    entry.ssh_host = "bastion";
    local_returns({entry});
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    dispatcher->handle_key(state_, 'f');
    EXPECT_CALL(forwarder_, create_forward("3000:localhost:3000", "bastion", false))
        .WillOnce(Return(ForwardResult{false, -1, "ssh: not found"}));
    dispatcher->handle_key(state_, '\n');

    EXPECT_EQ(status(), "Forward failed: ssh: not found");
}

TEST_F(ActionDispatcherTest, EscapeDiscardsForwardDraft) {
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    dispatcher->handle_key(state_, 'f');
    send(*dispatcher, "123");
    dispatcher->handle_key(state_, quay::kKeyEscape);

    EXPECT_EQ(state_.popup, Popup::None);
    EXPECT_FALSE(state_.should_quit);
    EXPECT_EQ(state_.forward_draft.local_port, "");
}

TEST_F(ActionDispatcherTest, MockForwardAddsRow) {
    auto dispatcher = make_dispatcher(true);
    dispatcher->start(state_);
    const size_t before = state_.all_records.size();

    dispatcher->handle_key(state_, 'f');
    state_.forward_draft = quay::ForwardDraft{};
    send(*dispatcher, "7777\tdb\t5432\tjump");

    EXPECT_CALL(forwarder_, create_forward(_, _, _)).Times(0);
    dispatcher->handle_key(state_, '\n');

    EXPECT_EQ(state_.all_records.size(), before + 1);
    EXPECT_EQ(status(), "[mock] Forward created");
}

TEST_F(ActionDispatcherTest, QuickForwardNeedsRemoteMode) {
    local_returns({make_entry(PortSource::Local, 3000)});
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    dispatcher->handle_key(state_, 'F');
    EXPECT_EQ(status(), "Quick Forward requires --remote mode");

    state_.target.docker_target = "web";
    dispatcher->handle_key(state_, 'F');
    EXPECT_EQ(status(), "Quick Forward for local Docker not yet supported");
}

TEST_F(ActionDispatcherTest, QuickForwardInRemoteMode) {
    state_.target.remote_host = "user@server";
    local_returns({make_entry(PortSource::Local, 5432)});
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    EXPECT_CALL(forwarder_, create_forward("5432:localhost:5432", "user@server", false))
        .WillOnce(Return(ForwardResult{true, 999, ""}));
    dispatcher->handle_key(state_, 'F');

    EXPECT_EQ(status(), "Forward :5432 -> user@server:5432 (PID: 999)");
}

TEST_F(ActionDispatcherTest, QuickForwardToContainerAddress) {
    state_.target = {std::string("user@server"), std::string("web")};
    ON_CALL(container_, collect_container(_, _))
        .WillByDefault(Return(std::vector<PortEntry>{make_entry(PortSource::Docker, 8000)}));
    ON_CALL(container_, get_container_ip(_, _))
        .WillByDefault(Return(quay::ContainerIpResult{std::string("172.17.0.2"), ""}));
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);
    ASSERT_EQ(state_.container_ip, "172.17.0.2");

    EXPECT_CALL(forwarder_, create_forward("8000:172.17.0.2:8000", "user@server", false))
        .WillOnce(Return(ForwardResult{true, 1000, ""}));
    dispatcher->handle_key(state_, 'F');
}

TEST_F(ActionDispatcherTest, QuickForwardWithoutContainerIp) {
    state_.target = {std::string("user@server"), std::string("web")};
    ON_CALL(container_, collect_container(_, _))
        .WillByDefault(Return(std::vector<PortEntry>{make_entry(PortSource::Docker, 8000)}));
    ON_CALL(container_, get_container_ip(_, _))
        .WillByDefault(Return(quay::ContainerIpResult{std::nullopt, "no such container"}));
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);
    EXPECT_EQ(status(), "Container IP lookup failed: no such container");

    EXPECT_CALL(forwarder_, create_forward(_, _, _)).Times(0);
    dispatcher->handle_key(state_, 'F');
    EXPECT_EQ(status(), "Container IP not available");
}

TEST_F(ActionDispatcherTest, LaunchPreset) {
    quay::Preset preset;
    preset.name = "db";
    preset.local_port = 15432;
    preset.remote_host = "db.internal";
    preset.remote_port = 5432;
    preset.ssh_host = "bastion";
    state_.presets = {preset};
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    dispatcher->handle_key(state_, 'p');
    ASSERT_EQ(state_.popup, Popup::Presets);

    EXPECT_CALL(forwarder_, create_forward("15432:db.internal:5432", "bastion", false))
        .WillOnce(Return(ForwardResult{true, 77, ""}));
    dispatcher->handle_key(state_, '\n');

    EXPECT_EQ(state_.popup, Popup::None);
    EXPECT_EQ(status(), "Forward created (PID: 77)");
}

TEST_F(ActionDispatcherTest, EmptyPresetListJustCloses) {
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    dispatcher->handle_key(state_, 'p');
    EXPECT_CALL(forwarder_, create_forward(_, _, _)).Times(0);
    dispatcher->handle_key(state_, '\n');
    EXPECT_EQ(state_.popup, Popup::None);
}

TEST_F(ActionDispatcherTest, SwitchConnectionChangesTarget) {
    state_.connections.push_back({"prod", std::string("user@prod"), std::nullopt});
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    EXPECT_CALL(local_, collect(std::optional<std::string>("user@prod")))
        .WillOnce(Return(std::vector<PortEntry>{}));
    dispatcher->handle_key(state_, ']');

    EXPECT_EQ(state_.active_connection_index, 1u);
    EXPECT_EQ(state_.target.remote_host, "user@prod");
    EXPECT_EQ(status(), "Connection: prod");
}

TEST_F(ActionDispatcherTest, SingleConnectionIgnoresSwitchKeys) {
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    dispatcher->handle_key(state_, ']');
    dispatcher->handle_key(state_, '[');

    EXPECT_EQ(state_.active_connection_index, 0u);
    EXPECT_FALSE(state_.status);
}

TEST_F(ActionDispatcherTest, AddConnectionIsSaved) {
    Connections connections;
    auto dispatcher = make_dispatcher(false, &connections);
    state_.connections = connections.all_with_local();
    dispatcher->start(state_);

    dispatcher->handle_key(state_, 'c');
    ASSERT_EQ(state_.popup, Popup::Connections);
    dispatcher->handle_key(state_, 'a');
    ASSERT_EQ(state_.connection_popup_mode, quay::ConnectionPopupMode::AddNew);

    send(*dispatcher, "staging\tuser@staging\t");
    dispatcher->handle_key(state_, '\n');

    EXPECT_EQ(status(), "Added connection 'staging'");
    EXPECT_EQ(state_.connection_popup_mode, quay::ConnectionPopupMode::List);
    ASSERT_EQ(state_.connections.size(), 2u);
    EXPECT_EQ(state_.connections[1].remote_host, "user@staging");
    EXPECT_FALSE(state_.connections[1].docker_target);

    auto saved = Connections::load_from(std::filesystem::path(temp_dir_) / "connections.json");
    ASSERT_EQ(saved.connection.size(), 1u);
    EXPECT_EQ(saved.connection[0].name, "staging");
}

TEST_F(ActionDispatcherTest, AddConnectionNeedsName) {
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    send(*dispatcher, "ca");
    dispatcher->handle_key(state_, '\n');

    EXPECT_EQ(status(), "Connection name is required");
    EXPECT_EQ(state_.connection_popup_mode, quay::ConnectionPopupMode::AddNew);

    // Esc in the form returns to the list, a second Esc closes the popup
    dispatcher->handle_key(state_, quay::kKeyEscape);
    EXPECT_EQ(state_.popup, Popup::Connections);
    EXPECT_EQ(state_.connection_popup_mode, quay::ConnectionPopupMode::List);
    dispatcher->handle_key(state_, quay::kKeyEscape);
    EXPECT_EQ(state_.popup, Popup::None);
}

TEST_F(ActionDispatcherTest, LocalConnectionCannotBeDeleted) {
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    send(*dispatcher, "cd");

    EXPECT_EQ(status(), "Cannot delete the Local connection");
    EXPECT_EQ(state_.connections.size(), 1u);
}

TEST_F(ActionDispatcherTest, DeletingActiveConnectionFallsBackToLocal) {
    Connections connections;
    connections.add({"prod", std::string("user@prod"), std::nullopt});
    connections.add({"dev", std::string("user@dev"), std::nullopt});
    state_.connections = connections.all_with_local();
    state_.active_connection_index = 1;
    state_.apply_connection();
    auto dispatcher = make_dispatcher(false, &connections);
    dispatcher->start(state_);

    dispatcher->handle_key(state_, 'c');
    EXPECT_EQ(state_.connection_selected, 1u);
    dispatcher->handle_key(state_, 'd');

    EXPECT_EQ(state_.connections.size(), 2u);
    EXPECT_EQ(state_.connections[1].name, "dev");
    EXPECT_EQ(state_.active_connection_index, 0u);
    EXPECT_FALSE(state_.target.remote_host);
    ASSERT_EQ(connections.connection.size(), 1u);
}

TEST_F(ActionDispatcherTest, DeletingEarlierConnectionKeepsActiveOne) {
    Connections connections;
    connections.add({"prod", std::string("user@prod"), std::nullopt});
    connections.add({"dev", std::string("user@dev"), std::nullopt});
    state_.connections = connections.all_with_local();
    auto dispatcher = make_dispatcher(false, &connections);
    dispatcher->start(state_);

    state_.active_connection_index = 2;
    dispatcher->handle_key(state_, 'c');
    dispatcher->handle_key(state_, 'k');
    EXPECT_EQ(state_.connection_selected, 1u);
    dispatcher->handle_key(state_, 'd');

    EXPECT_EQ(status(), "Deleted connection 'prod'");
    EXPECT_EQ(state_.active_connection_index, 1u);
    EXPECT_EQ(state_.active_connection()->name, "dev");
}

TEST_F(ActionDispatcherTest, ActivateConnectionFromPopup) {
    state_.connections.push_back({"web", std::nullopt, std::string("web")});
    ON_CALL(container_, get_container_ip(_, _))
        .WillByDefault(Return(quay::ContainerIpResult{std::string("172.17.0.9"), ""}));
    auto dispatcher = make_dispatcher(false);
    dispatcher->start(state_);

    send(*dispatcher, "cj\n");

    EXPECT_EQ(state_.popup, Popup::None);
    EXPECT_EQ(state_.active_connection_index, 1u);
    EXPECT_EQ(state_.target.docker_target, "web");
    EXPECT_EQ(state_.container_ip, "172.17.0.9");
}
