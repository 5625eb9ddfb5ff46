#include <gtest/gtest.h>
#include "../src/viewmodels/session_view_model.hpp"
#include "fakes.hpp"

using quay::Filter;
using quay::PortEntry;
using quay::PortSource;
using quay::Popup;
using quay::SessionState;
using quay::testing::make_entry;

class SessionStateTest : public ::testing::Test {
protected:
    SessionState state_;

    void SetUp() override {
        auto node = make_entry(PortSource::Local, 3000);
        node.process_name = "node";
        auto forward = make_entry(PortSource::Ssh, 9000);
        forward.process_name = "ssh";
        forward.remote_host = "db.internal";
        forward.remote_port = 5432;
        auto postgres = make_entry(PortSource::Docker, 5432);
        postgres.process_name = "Postgres";
        postgres.remote_host = "postgres";
        auto closed = make_entry(PortSource::Local, 8080, false);
        closed.process_name = "python";

        state_.set_records({node, forward, postgres, closed});
    }
};

TEST_F(SessionStateTest, ViewMatchesRecordsWithoutFilter) {
    EXPECT_EQ(state_.view.size(), 4u);
    EXPECT_EQ(state_.view, state_.all_records);
    ASSERT_NE(state_.selected_record(), nullptr);
    EXPECT_EQ(state_.selected_record()->local_port, 3000);
}

TEST_F(SessionStateTest, SourceFilter) {
    state_.set_filter(Filter::Local);
    ASSERT_EQ(state_.view.size(), 2u);
    for (const auto& entry : state_.view) {
        EXPECT_EQ(entry.source, PortSource::Local);
    }

    state_.set_filter(Filter::Docker);
    ASSERT_EQ(state_.view.size(), 1u);
    EXPECT_EQ(state_.view[0].local_port, 5432);
}

TEST_F(SessionStateTest, SearchIsCaseInsensitiveOverProcessPortAndRemote) {
    state_.search_query = "POSTGRES";
    state_.apply_filter();
    ASSERT_EQ(state_.view.size(), 1u);
    EXPECT_EQ(state_.view[0].source, PortSource::Docker);

    state_.search_query = "808";
    state_.apply_filter();
    ASSERT_EQ(state_.view.size(), 1u);
    EXPECT_EQ(state_.view[0].local_port, 8080);

    state_.search_query = "internal";
    state_.apply_filter();
    ASSERT_EQ(state_.view.size(), 1u);
    EXPECT_EQ(state_.view[0].local_port, 9000);

    // 5432 is a remote port for the forward but only matches the container's local port
    state_.search_query = "5432";
    state_.apply_filter();
    ASSERT_EQ(state_.view.size(), 1u);
    EXPECT_EQ(state_.view[0].source, PortSource::Docker);
}

TEST_F(SessionStateTest, FilterAndSearchCombine) {
    state_.set_filter(Filter::Local);
    state_.search_query = "python";
    state_.apply_filter();

    ASSERT_EQ(state_.view.size(), 1u);
    EXPECT_EQ(state_.view[0].local_port, 8080);

    state_.set_filter(Filter::Ssh);
    EXPECT_TRUE(state_.view.empty());
    EXPECT_EQ(state_.selected_record(), nullptr);
}

TEST_F(SessionStateTest, SelectionClampsWhenViewShrinks) {
    state_.last();
    EXPECT_EQ(state_.selected_index, 3u);

    state_.set_filter(Filter::Local);
    EXPECT_EQ(state_.selected_index, 1u);

    state_.set_filter(Filter::Ssh);
    EXPECT_EQ(state_.selected_index, 0u);
}

TEST_F(SessionStateTest, NavigationWraps) {
    state_.previous();
    EXPECT_EQ(state_.selected_index, 3u);
    state_.next();
    EXPECT_EQ(state_.selected_index, 0u);
    state_.next();
    state_.next();
    EXPECT_EQ(state_.selected_index, 2u);
    state_.first();
    EXPECT_EQ(state_.selected_index, 0u);

    state_.select_row(2);
    EXPECT_EQ(state_.selected_index, 2u);
    state_.select_row(99);
    EXPECT_EQ(state_.selected_index, 2u);
}

TEST_F(SessionStateTest, NavigationOnEmptyViewIsNoop) {
    state_.set_records({});
    state_.next();
    state_.previous();
    state_.last();
    EXPECT_EQ(state_.selected_index, 0u);
    EXPECT_EQ(state_.selected_record(), nullptr);
}

TEST_F(SessionStateTest, StatusExpiresAfterItsTicks) {
    state_.set_status("Refreshed");
    for (uint32_t i = 0; i + 1 < SessionState::kStatusTicks; ++i) {
        state_.tick();
    }
    ASSERT_TRUE(state_.status);
    EXPECT_EQ(state_.status->text, "Refreshed");

    state_.tick();
    EXPECT_FALSE(state_.status);
}

TEST_F(SessionStateTest, RefreshIsDueEveryPeriod) {
    state_.refresh_period_ticks = 4;
    EXPECT_FALSE(state_.should_refresh());

    for (int i = 0; i < 4; ++i) state_.tick();
    EXPECT_FALSE(state_.should_refresh());

    state_.auto_refresh = true;
    EXPECT_TRUE(state_.should_refresh());
    state_.tick();
    EXPECT_FALSE(state_.should_refresh());
}

TEST_F(SessionStateTest, ConnectionsCycleAndApplyTarget) {
    state_.connections.push_back({"prod", std::string("user@prod"), std::nullopt});
    state_.connections.push_back({"web", std::string("user@prod"), std::string("web")});
    state_.container_ip = "172.17.0.2";

    EXPECT_TRUE(state_.has_multiple_connections());

    state_.next_connection();
    state_.apply_connection();
    EXPECT_EQ(state_.target.remote_host, "user@prod");
    EXPECT_FALSE(state_.target.docker_target);
    EXPECT_FALSE(state_.container_ip);

    state_.prev_connection();
    state_.prev_connection();
    EXPECT_EQ(state_.active_connection_index, 2u);
    state_.apply_connection();
    EXPECT_EQ(state_.target.docker_target, "web");

    state_.next_connection();
    state_.apply_connection();
    EXPECT_FALSE(state_.is_remote());
    EXPECT_FALSE(state_.is_docker_target());
}

TEST_F(SessionStateTest, PresetCursorWraps) {
    quay::Preset a;
    a.name = "a";
    quay::Preset b;
    b.name = "b";
    state_.presets = {a, b};

    state_.preset_previous();
    EXPECT_EQ(state_.selected_preset()->name, "b");
    state_.preset_next();
    EXPECT_EQ(state_.selected_preset()->name, "a");
}

TEST_F(SessionStateTest, ForwardDraftUsesContainerIpOnlyForDockerTarget) {
    state_.target.remote_host = "server";
    state_.container_ip = "172.17.0.2";

    state_.open_forward_draft();
    EXPECT_EQ(state_.popup, Popup::ForwardDraft);
    EXPECT_FALSE(state_.forward_draft.remote_host_locked);
    EXPECT_TRUE(state_.forward_draft.ssh_host_locked);

    state_.close_popup();
    state_.target.docker_target = "web";
    state_.open_forward_draft();
    EXPECT_TRUE(state_.forward_draft.remote_host_locked);
    EXPECT_EQ(state_.forward_draft.remote_host, "172.17.0.2");
}

TEST_F(SessionStateTest, ClosingPopupDiscardsDrafts) {
    state_.open_forward_draft();
    // Cursor starts on the empty SSH host
    state_.forward_draft.insert_char('h');
    EXPECT_EQ(state_.forward_draft.ssh_host, "h");
    state_.close_popup();
    EXPECT_EQ(state_.popup, Popup::None);
    EXPECT_EQ(state_.forward_draft.ssh_host, "");

    state_.popup = Popup::Connections;
    state_.connection_popup_mode = quay::ConnectionPopupMode::AddNew;
    state_.connection_draft.name = "half typed";
    state_.close_popup();
    EXPECT_EQ(state_.connection_popup_mode, quay::ConnectionPopupMode::List);
    EXPECT_EQ(state_.connection_draft.name, "");
}

TEST(FilterTest, FromString) {
    EXPECT_EQ(quay::filter_from_string("SSH"), Filter::Ssh);
    EXPECT_EQ(quay::filter_from_string("docker"), Filter::Docker);
    EXPECT_EQ(quay::filter_from_string("local"), Filter::Local);
    EXPECT_EQ(quay::filter_from_string("whatever"), Filter::All);
    EXPECT_STREQ(quay::filter_label(Filter::Ssh), "SSH");
}
