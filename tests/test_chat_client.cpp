#include <catch2/catch.hpp>
#include "channel_state.hpp"
#include "chat_client.hpp"
#include "mock_http_client.hpp"
#include "mock_transport.hpp"

using namespace chansync;
using json = nlohmann::json;

static const std::string kPrefix = "/xyzen/api/v1";
static const std::string kUserId = "11111111-1111-1111-1111-111111111111";
static const std::string kReplyId = "22222222-2222-2222-2222-222222222222";

static Config client_config() {
    Config cfg;
    cfg.backend.url = "http://backend";
    return cfg;
}

struct ClientFixture {
    ManualClock clock;
    MockHttpClient http;
    MockTransportFactory transports;
    ChatClient client{clock.loop, http, transports.factory(), client_config()};
    std::vector<NotificationEvent> notes;

    ClientFixture() {
        transports.auto_connect = true;
        transports.loop = &clock.loop;
        subscribe<NotificationEvent>(client.bus(), [this](const NotificationEvent& e) {
            notes.push_back(e);
        });

        http.route("GET", kPrefix + "/sessions/", 200, json::array({{
            {"id", "s1"}, {"name", "Main"}, {"agent_id", "a1"},
            {"provider_id", "p1"}, {"model", "m1"}, {"knowledge_set_id", "ks1"},
            {"topics", json::array({{{"id", "t1"}, {"name", "Topic one"}},
                                    {{"id", "t2"}, {"name", "Topic two"}}})}
        }}).dump());
        http.route("GET", kPrefix + "/topics/t1/messages", 200, json::array({
            {{"id", kUserId}, {"role", "user"}, {"content", "question"}},
            {{"id", kReplyId}, {"role", "assistant"}, {"content", "answer"}},
        }).dump());
        http.route("GET", kPrefix + "/topics/t1/token-stats", 200, R"({"total_tokens": 99})");
        http.route("GET", kPrefix + "/topics/t2/messages", 200, "[]");
        http.route("GET", kPrefix + "/topics/t2/token-stats", 200, "{}");
    }

    std::shared_ptr<MockTransportState> activate(const std::string& topic) {
        auto r = client.activate(topic);
        REQUIRE(r.ok);
        REQUIRE(r.connected);
        return transports.last(topic);
    }
};

// ── History and activation ──────────────────────────────────────

TEST_CASE("ChatClient: fetch_history loads sessions", "[client]") {
    ClientFixture f;
    REQUIRE(f.client.fetch_history().ok);
    REQUIRE(f.client.sessions().size() == 1);
    REQUIRE(f.client.sessions()[0].topics.size() == 2);
}

TEST_CASE("ChatClient: fetch_history failure is reported", "[client]") {
    ClientFixture f;
    f.http.route("GET", kPrefix + "/sessions/", 500, "down");
    auto r = f.client.fetch_history();
    REQUIRE_FALSE(r.ok);
    REQUIRE_FALSE(r.error.empty());
}

TEST_CASE("ChatClient: activate loads, reconciles and connects", "[client]") {
    ClientFixture f;
    auto t = f.activate("t1");
    REQUIRE(t);
    REQUIRE(f.client.active_topic() == "t1");
    REQUIRE(f.client.connected("t1"));

    const Channel* ch = f.client.channel("t1");
    REQUIRE(ch->title == "Topic one");
    REQUIRE(ch->agent_id == "a1");
    REQUIRE(ch->model == "m1");
    REQUIRE(ch->knowledge_set_id == std::string("ks1"));
    REQUIRE(ch->token_usage == 99);
    REQUIRE(f.client.messages("t1").size() == 2);
    REQUIRE(f.http.count("GET", kPrefix + "/sessions/") == 1);
}

TEST_CASE("ChatClient: activating the active connected topic is a no-op", "[client]") {
    ClientFixture f;
    f.activate("t1");
    int calls = f.http.call_count;
    auto r = f.client.activate("t1");
    REQUIRE(r.ok);
    REQUIRE(r.connected);
    REQUIRE(f.http.call_count == calls);
    REQUIRE(f.transports.count("t1") == 1);
}

TEST_CASE("ChatClient: unknown topic after refetch", "[client]") {
    ClientFixture f;
    auto r = f.client.activate("ghost");
    REQUIRE_FALSE(r.ok);
    REQUIRE(r.error == "unknown topic");
    REQUIRE(f.client.active_topic().empty());
}

TEST_CASE("ChatClient: concurrent activation is refused", "[client]") {
    ClientFixture f;
    {
        auto held = f.client.pending_ops().try_acquire("activate:t1");
        REQUIRE(held);
        auto r = f.client.activate("t1");
        REQUIRE_FALSE(r.ok);
        REQUIRE(r.error == "activation already in progress");
    }
    REQUIRE_FALSE(f.client.pending_ops().pending("activate:t1"));
    REQUIRE(f.client.activate("t1").ok);
}

TEST_CASE("ChatClient: switching topics closes the idle connection", "[client]") {
    ClientFixture f;
    auto t1 = f.activate("t1");
    auto t2 = f.activate("t2");
    REQUIRE(t1->closed);
    REQUIRE_FALSE(f.client.connected("t1"));
    REQUIRE(f.client.connected("t2"));
    REQUIRE(f.client.connections().primary_topic() == "t2");
}

TEST_CASE("ChatClient: switching back promotes a background stream", "[client]") {
    ClientFixture f;
    auto t1 = f.activate("t1");
    REQUIRE(f.client.send("t1", "long task").ok);
    f.activate("t2");
    REQUIRE_FALSE(t1->closed);

    auto r = f.client.activate("t1");
    REQUIRE(r.ok);
    REQUIRE(f.transports.count("t1") == 1);
    REQUIRE(f.client.connections().is_primary("t1"));
}

TEST_CASE("ChatClient: activate_for_agent creates a session when none exists", "[client]") {
    ClientFixture f;
    f.http.route("GET", kPrefix + "/sessions/by-agent/a9", 404, "");
    f.http.route("POST", kPrefix + "/sessions/", 200, R"({"id": "s9", "name": "New Session", "agent_id": "a9"})");
    f.http.route("POST", kPrefix + "/topics/", 200, R"({"id": "t9", "name": "New Chat"})");
    f.http.route("GET", kPrefix + "/topics/t9/messages", 200, "[]");
    f.http.route("GET", kPrefix + "/topics/t9/token-stats", 200, "{}");

    auto r = f.client.activate_for_agent("a9");
    REQUIRE(r.ok);
    REQUIRE(r.topic_id == "t9");
    REQUIRE(f.client.active_topic() == "t9");
    REQUIRE(f.client.channel("t9")->agent_id == "a9");
    REQUIRE(f.client.channel("t9")->title == "New Chat");
    REQUIRE(f.client.sessions().front().id == "s9");
}

TEST_CASE("ChatClient: activate_for_agent reuses the newest topic", "[client]") {
    ClientFixture f;
    f.http.route("GET", kPrefix + "/sessions/by-agent/a1", 200, json{
        {"id", "s1"}, {"agent_id", "a1"},
        {"topics", json::array({{{"id", "t2"}, {"name", "Topic two"}},
                                {{"id", "t1"}, {"name", "Topic one"}}})}}.dump());
    auto r = f.client.activate_for_agent("a1");
    REQUIRE(r.ok);
    REQUIRE(r.topic_id == "t2");
    REQUIRE(f.http.count("POST", kPrefix + "/topics/") == 0);
}

TEST_CASE("ChatClient: create_default_channel failure notifies", "[client]") {
    ClientFixture f;
    f.http.route("POST", kPrefix + "/sessions/", 500, "nope");
    auto r = f.client.create_default_channel();
    REQUIRE_FALSE(r.ok);
    REQUIRE(f.notes.size() == 1);
    REQUIRE(f.notes[0].title == "Could not create chat");
}

// ── Messaging ───────────────────────────────────────────────────

TEST_CASE("ChatClient: send attaches the knowledge context", "[client]") {
    ClientFixture f;
    auto t = f.activate("t1");
    auto r = f.client.send("t1", "what is new?");
    REQUIRE(r.ok);
    REQUIRE(t->sent.back()["context"]["knowledge_set_id"] == "ks1");
    REQUIRE(f.client.responding("t1"));
}

TEST_CASE("ChatClient: full exchange settles the channel", "[client]") {
    ClientFixture f;
    auto t = f.activate("t1");
    auto r = f.client.send("t1", "hi");
    t->deliver("message_ack", {{"message_id", "33333333-3333-3333-3333-333333333333"},
                               {"client_id", r.client_id}});
    t->deliver("loading", json::object());
    t->deliver("streaming_start", {{"stream_id", "st"}});
    t->deliver("streaming_chunk", {{"stream_id", "st"}, {"content", "hello back"}});
    t->deliver("streaming_end", {{"stream_id", "st"}});

    const auto& msgs = f.client.messages("t1");
    REQUIRE(msgs.size() == 4);
    REQUIRE(msgs[2].status == MessageStatus::Completed);
    REQUIRE(msgs[3].content == "hello back");
    REQUIRE_FALSE(f.client.responding("t1"));
}

TEST_CASE("ChatClient: delete_message rejects unsaved ids", "[client]") {
    ClientFixture f;
    auto t = f.activate("t1");
    t->deliver("streaming_chunk", {{"stream_id", "st"}, {"content", "x"}});
    f.clock.advance(16);

    auto r = f.client.delete_message("t1", "st");
    REQUIRE_FALSE(r.ok);
    REQUIRE(r.error == "The message is still streaming.");
    REQUIRE(f.notes.back().level == "warning");

    r = f.client.delete_message("t1", "c-local");
    REQUIRE(r.error == "The message has not been saved yet.");
}

TEST_CASE("ChatClient: delete_message removes a persisted message", "[client]") {
    ClientFixture f;
    f.activate("t1");
    f.http.route("DELETE", kPrefix + "/messages/" + kReplyId, 200, "");
    REQUIRE(f.client.delete_message("t1", kReplyId).ok);
    REQUIRE(f.client.messages("t1").size() == 1);
}

TEST_CASE("ChatClient: delete_message failure keeps the message", "[client]") {
    ClientFixture f;
    f.activate("t1");
    f.http.route("DELETE", kPrefix + "/messages/" + kReplyId, 500, "");
    REQUIRE_FALSE(f.client.delete_message("t1", kReplyId).ok);
    REQUIRE(f.client.messages("t1").size() == 2);
    REQUIRE(f.notes.back().message == "Failed to delete message");
}

TEST_CASE("ChatClient: edit with truncation regenerates", "[client]") {
    ClientFixture f;
    auto t = f.activate("t1");
    f.http.route("PATCH", kPrefix + "/messages/" + kUserId, 200, json{
        {"message", {{"id", kUserId}, {"role", "user"}, {"content", "better question"}}},
        {"deleted_count", 1}, {"regenerate", true}}.dump());

    REQUIRE(f.client.edit_message("t1", kUserId, "better question", true).ok);
    const auto& msgs = f.client.messages("t1");
    REQUIRE(msgs.size() == 2);
    REQUIRE(msgs[0].content == "better question");
    REQUIRE(msgs[1].is_loading);
    REQUIRE(t->sent.back() == json{{"type", "regenerate"}});
    REQUIRE(f.client.responding("t1"));
}

TEST_CASE("ChatClient: edit without truncation keeps later messages", "[client]") {
    ClientFixture f;
    f.activate("t1");
    f.http.route("PATCH", kPrefix + "/messages/" + kUserId, 200, json{
        {"message", {{"id", kUserId}, {"content", "typo fixed"}}}}.dump());
    REQUIRE(f.client.edit_message("t1", kUserId, "typo fixed", false).ok);
    REQUIRE(f.client.messages("t1").size() == 2);
    REQUIRE(f.client.messages("t1")[0].content == "typo fixed");
    REQUIRE_FALSE(f.client.edit_message("t1", "missing", "x", false).ok);
}

TEST_CASE("ChatClient: abort through the client", "[client]") {
    ClientFixture f;
    auto t = f.activate("t1");
    t->deliver("loading", json::object());
    REQUIRE(f.client.abort("t1").ok);
    REQUIRE(f.client.aborting("t1"));
    t->deliver("stream_aborted", {{"reason", "user"}});
    REQUIRE_FALSE(f.client.aborting("t1"));
    REQUIRE_FALSE(f.client.responding("t1"));
    REQUIRE_FALSE(f.client.abort("ghost").ok);
}

// ── Tool calls ──────────────────────────────────────────────────

static void request_tool_call(MockTransportState& t) {
    t.deliver("tool_call_request", {{"id", "tc1"}, {"name", "delete_file"},
                                    {"arguments", {{"path", "/tmp/x"}}},
                                    {"status", "waiting_confirmation"}});
}

TEST_CASE("ChatClient: confirm a tool call", "[client]") {
    ClientFixture f;
    auto t = f.activate("t1");
    request_tool_call(*t);

    REQUIRE(f.client.confirm_tool_call("t1", "tc1").ok);
    REQUIRE(t->sent.back() == make_tool_call_confirm("tc1"));
    ToolCall* tc = find_tool_call(*f.client.store().find("t1"), "tc1");
    REQUIRE(tc->status == ToolCallStatus::Executing);

    auto again = f.client.confirm_tool_call("t1", "tc1");
    REQUIRE_FALSE(again.ok);
    REQUIRE(again.error == "tool call is executing");
}

TEST_CASE("ChatClient: cancel a tool call", "[client]") {
    ClientFixture f;
    auto t = f.activate("t1");
    request_tool_call(*t);
    REQUIRE(f.client.responding("t1"));

    REQUIRE(f.client.cancel_tool_call("t1", "tc1").ok);
    REQUIRE(t->sent.back()["data"]["reason"] == "Cancelled by user");
    ToolCall* tc = find_tool_call(*f.client.store().find("t1"), "tc1");
    REQUIRE(tc->status == ToolCallStatus::Failed);
    REQUIRE(tc->error == "Cancelled by user");
    REQUIRE_FALSE(f.client.responding("t1"));

    REQUIRE_FALSE(f.client.cancel_tool_call("t1", "tc1").ok);
    REQUIRE_FALSE(f.client.cancel_tool_call("t1", "nope").ok);
}

// ── Topics and sessions ─────────────────────────────────────────

TEST_CASE("ChatClient: rename_topic trims and propagates", "[client]") {
    ClientFixture f;
    f.activate("t1");
    f.http.route("PATCH", kPrefix + "/topics/t1", 200, R"({"id": "t1", "name": "Renamed"})");
    int renames = 0;
    subscribe<TopicRenamedEvent>(f.client.bus(), [&](const TopicRenamedEvent&) { renames++; });

    REQUIRE(f.client.rename_topic("t1", "  Renamed  ").ok);
    REQUIRE(json::parse(f.http.last_body)["name"] == "Renamed");
    REQUIRE(f.client.channel("t1")->title == "Renamed");
    REQUIRE(f.client.sessions()[0].topics[0].name == "Renamed");
    REQUIRE(renames == 1);

    REQUIRE_FALSE(f.client.rename_topic("t1", "   ").ok);
}

TEST_CASE("ChatClient: server-side rename updates the session list", "[client]") {
    ClientFixture f;
    auto t = f.activate("t1");
    t->deliver("topic_updated", {{"id", "t1"}, {"name", "Auto title"}});
    REQUIRE(f.client.sessions()[0].topics[0].name == "Auto title");
    REQUIRE(f.client.channel("t1")->title == "Auto title");
}

TEST_CASE("ChatClient: delete_topic releases the channel", "[client]") {
    ClientFixture f;
    auto t = f.activate("t1");
    f.http.route("DELETE", kPrefix + "/topics/t1", 204, "");
    REQUIRE(f.client.delete_topic("t1").ok);
    REQUIRE(t->closed);
    REQUIRE_FALSE(f.client.channel("t1"));
    REQUIRE(f.client.active_topic().empty());
    REQUIRE(f.client.sessions()[0].topics.size() == 1);
    REQUIRE(f.client.messages("t1").empty());
}

TEST_CASE("ChatClient: delete_topic failure keeps the channel", "[client]") {
    ClientFixture f;
    f.activate("t1");
    f.http.route("DELETE", kPrefix + "/topics/t1", 500, "");
    REQUIRE_FALSE(f.client.delete_topic("t1").ok);
    REQUIRE(f.client.channel("t1"));
}

TEST_CASE("ChatClient: clear_session_topics releases every channel", "[client]") {
    ClientFixture f;
    f.activate("t1");
    f.activate("t2");
    f.http.route("DELETE", kPrefix + "/sessions/s1/topics", 204, "");
    REQUIRE(f.client.clear_session_topics("s1").ok);
    REQUIRE(f.client.store().size() == 0);
    REQUIRE(f.client.sessions()[0].topics.empty());
    REQUIRE(f.client.connections().open_topics().empty());
}

TEST_CASE("ChatClient: update_session_config reaches open channels", "[client]") {
    ClientFixture f;
    f.activate("t1");
    f.http.route("PATCH", kPrefix + "/sessions/s1", 200, R"({"id": "s1", "model": "m2"})");
    SessionUpdate update;
    update.model = "m2";
    update.knowledge_set_id = "";
    REQUIRE(f.client.update_session_config("s1", update).ok);
    REQUIRE(f.client.channel("t1")->model == "m2");
    REQUIRE_FALSE(f.client.channel("t1")->knowledge_set_id);
    REQUIRE(f.client.channel("t1")->provider_id == "p1");
}

TEST_CASE("ChatClient: stale stream is reconciled", "[client]") {
    ClientFixture f;
    auto t = f.activate("t1");
    t->deliver("loading", json::object());
    int fetches = f.http.count("GET", kPrefix + "/topics/t1/messages");

    const SyncConfig sync;
    f.clock.advance(sync.stale_timeout_ms + sync.stale_check_interval_ms + 1);
    REQUIRE(f.http.count("GET", kPrefix + "/topics/t1/messages") == fetches + 1);
    REQUIRE_FALSE(f.client.responding("t1"));
    REQUIRE(f.client.messages("t1").size() == 2);
}

TEST_CASE("ChatClient: disconnect clears connection state", "[client]") {
    ClientFixture f;
    auto t = f.activate("t1");
    f.client.disconnect();
    REQUIRE(t->closed);
    REQUIRE_FALSE(f.client.connected("t1"));
}
