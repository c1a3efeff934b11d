#include "backend_connection.hpp"
#include "chat_client.hpp"
#include "config.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "event_loop.hpp"
#include "http.hpp"
#include "line_reader.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <atomic>
#include <csignal>
#include <unordered_map>
#include <unistd.h>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: chansync [options]\n"
              << "\n"
              << "Options:\n"
              << "  --topic ID           Open an existing topic\n"
              << "  --agent ID           Open the latest topic of an agent (created if needed)\n"
              << "  -m, --message MSG    Send a single message, print the reply and exit\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /topics              List sessions and topics\n"
              << "  /switch ID           Switch to another topic\n"
              << "  /new                 Start a new topic\n"
              << "  /abort               Stop the current response\n"
              << "  /retry [ID]          Resend a failed message (default: the last one)\n"
              << "  /confirm ID          Approve a tool call\n"
              << "  /cancel ID           Reject a tool call\n"
              << "  /delete ID           Delete a saved message\n"
              << "  /rename NAME         Rename the current topic\n"
              << "  /status              Show connection and channel state\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  CHANSYNC_BACKEND_URL Backend base URL (default: http://localhost:48196)\n"
              << "  CHANSYNC_WS_URL      WebSocket base URL (default: derived from backend URL)\n"
              << "  CHANSYNC_TOKEN       Bearer token\n";
}

// Text shown for an assistant message: its content, or the streamed phase
// output while an agent is running.
static std::string display_text(const chansync::Message& m) {
    if (!m.content.empty() || !m.execution) return m.content;
    std::string text;
    for (const auto& phase : m.execution->phases) text += phase.streamed_content;
    return text;
}

// Prints assistant output of the active topic incrementally.
class StreamPrinter {
public:
    explicit StreamPrinter(const chansync::ChatClient& client) : client_(client) {}

    void update(const std::string& topic_id) {
        if (topic_id != client_.active_topic()) return;
        const auto& msgs = client_.messages(topic_id);
        if (msgs.empty()) return;
        const chansync::Message& m = msgs.back();
        if (m.role != chansync::Role::Assistant) return;

        auto& state = printed_[m.client_id];
        std::string text = display_text(m);
        if (text.size() > state.length) {
            std::cout << text.substr(state.length) << std::flush;
            state.length = text.size();
        }
        for (const auto& tc : m.tool_calls) report_tool_call(tc);
        if (m.execution) {
            for (const auto& phase : m.execution->phases) {
                for (const auto& tc : phase.tool_calls) report_tool_call(tc);
            }
        }
        if (!chansync::is_in_flight(m.status) && !m.has_running_execution() && !state.done) {
            state.done = true;
            if (m.status == chansync::MessageStatus::Cancelled) std::cout << " [stopped]";
            if (m.status == chansync::MessageStatus::Failed && m.error)
                std::cout << "[failed: " << m.error->message << "]";
            std::cout << "\n";
        }
    }

private:
    struct State {
        size_t length = 0;
        bool done = false;
    };

    void report_tool_call(const chansync::ToolCall& tc) {
        if (tc.status != chansync::ToolCallStatus::WaitingConfirmation) return;
        if (!announced_.emplace(tc.id, true).second) return;
        std::cout << "\n[tool] " << tc.name << " needs confirmation: /confirm " << tc.id
                  << " or /cancel " << tc.id << "\n";
    }

    const chansync::ChatClient& client_;
    std::unordered_map<std::string, State> printed_;
    std::unordered_map<std::string, bool> announced_;
};

static void print_status(const chansync::ChatClient& client) {
    const chansync::Channel* ch = client.active_channel();
    if (!ch) {
        std::cout << "No active topic.\n";
        return;
    }
    std::cout << "Topic: " << ch->title << " (" << ch->id << ")\n"
              << "Session: " << ch->session_id << "\n"
              << "Connected: " << (ch->connected ? "yes" : "no") << "\n"
              << "Responding: " << (ch->responding ? "yes" : "no") << "\n"
              << "Messages: " << ch->messages.size() << "\n"
              << "Tokens: " << ch->token_usage << "\n";
    if (!ch->model.empty()) std::cout << "Model: " << ch->model << "\n";
    if (ch->error) std::cout << "Error: " << *ch->error << "\n";
}

static void print_topics(chansync::ChatClient& client) {
    auto result = client.fetch_history();
    if (!result.ok) {
        std::cout << "Could not load topics: " << result.error << "\n";
        return;
    }
    for (const auto& s : client.sessions()) {
        std::cout << s.name << " [" << s.id << "]\n";
        for (const auto& t : s.topics) {
            std::cout << (t.id == client.active_topic() ? "  * " : "    ")
                      << t.name << "  " << t.id << "\n";
        }
    }
}

static std::string last_failed_message(const chansync::ChatClient& client) {
    const auto& msgs = client.messages(client.active_topic());
    for (auto it = msgs.rbegin(); it != msgs.rend(); ++it) {
        if (it->role == chansync::Role::User && it->status == chansync::MessageStatus::Failed)
            return it->id;
    }
    return {};
}

static void report(const chansync::CommandResult& r, const char* done) {
    if (r.ok) {
        std::cout << done << "\n";
    } else {
        std::cout << "Error: " << r.error << "\n";
    }
}

// Returns false when the REPL should exit.
static bool handle_line(chansync::ChatClient& client, const std::string& raw,
                        const std::string& agent) {
    std::string line = chansync::trim(raw);
    if (line.empty()) return true;
    const std::string& topic = client.active_topic();

    if (line[0] != '/') {
        if (topic.empty()) {
            std::cout << "No active topic. Use /new or /switch ID.\n";
            return true;
        }
        auto sent = client.send(topic, line);
        if (!sent.ok) std::cout << "Error: " << sent.error << "\n";
        return true;
    }

    size_t space = line.find(' ');
    std::string cmd = line.substr(0, space);
    std::string arg = space == std::string::npos ? "" : chansync::trim(line.substr(space + 1));

    if (cmd == "/quit" || cmd == "/exit") {
        return false;
    } else if (cmd == "/help") {
        print_usage();
    } else if (cmd == "/status") {
        print_status(client);
    } else if (cmd == "/topics") {
        print_topics(client);
    } else if (cmd == "/switch" && !arg.empty()) {
        auto r = client.activate(arg);
        if (!r.ok) std::cout << "Error: " << r.error << "\n";
        else std::cout << "Switched to " << arg << (r.connected ? "" : " (offline)") << "\n";
    } else if (cmd == "/new") {
        auto r = client.create_default_channel(agent);
        if (!r.ok) std::cout << "Error: " << r.error << "\n";
        else std::cout << "New topic " << r.topic_id << "\n";
    } else if (cmd == "/abort") {
        report(client.abort(topic), "Stopping...");
    } else if (cmd == "/retry") {
        std::string id = arg.empty() ? last_failed_message(client) : arg;
        if (id.empty()) {
            std::cout << "Nothing to retry.\n";
        } else {
            auto r = client.retry(topic, id);
            if (!r.ok) std::cout << "Error: " << r.error << "\n";
        }
    } else if (cmd == "/confirm" && !arg.empty()) {
        report(client.confirm_tool_call(topic, arg), "Confirmed.");
    } else if (cmd == "/cancel" && !arg.empty()) {
        report(client.cancel_tool_call(topic, arg), "Cancelled.");
    } else if (cmd == "/delete" && !arg.empty()) {
        report(client.delete_message(topic, arg), "Deleted.");
    } else if (cmd == "/rename" && !arg.empty()) {
        report(client.rename_topic(topic, arg), "Renamed.");
    } else {
        std::cout << "Unknown command: " << line << "\n";
    }
    return true;
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string message;
    std::string topic_id;
    std::string agent_id;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--topic") == 0 && i + 1 < argc) {
            topic_id = argv[++i];
        } else if (std::strcmp(argv[i], "--agent") == 0 && i + 1 < argc) {
            agent_id = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // Initialize
    chansync::http_init();
    auto config = chansync::Config::load();
    if (agent_id.empty()) agent_id = config.default_agent;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    chansync::http_set_abort_flag(&g_shutdown);

    chansync::EventLoop loop;
    chansync::PlatformHttpClient http_client;
    chansync::ChatClient client(loop, http_client,
                                chansync::make_backend_transport_factory(loop, config),
                                config);

    StreamPrinter printer(client);
    chansync::subscribe<chansync::ChannelUpdatedEvent>(client.bus(),
        [&printer](const chansync::ChannelUpdatedEvent& ev) { printer.update(ev.topic_id); });
    chansync::subscribe<chansync::NotificationEvent>(client.bus(),
        [](const chansync::NotificationEvent& ev) {
            std::cout << "\n[" << ev.level << "] " << ev.title;
            if (!ev.message.empty()) std::cout << ": " << ev.message;
            std::cout << "\n";
        });
    chansync::subscribe<chansync::ConnectionStatusEvent>(client.bus(),
        [&client](const chansync::ConnectionStatusEvent& ev) {
            if (ev.topic_id == client.active_topic() && !ev.error.empty())
                std::cout << "\n[connection] " << ev.error << "\n";
        });

    // Signals only set the flag; the loop notices it here.
    loop.call_every(200, [&loop] {
        if (g_shutdown.load()) loop.stop();
    });

    chansync::ActivateResult opened;
    if (!topic_id.empty()) {
        opened = client.activate(topic_id);
    } else if (!agent_id.empty()) {
        opened = client.activate_for_agent(agent_id);
    } else {
        opened = client.create_default_channel();
    }
    if (!opened.ok) {
        std::cerr << "Error: " << opened.error << "\n";
        chansync::http_cleanup();
        return 1;
    }

    // Single message mode
    if (!message.empty()) {
        auto sent = client.send(opened.topic_id, message);
        if (!sent.ok) {
            std::cerr << "Error: " << sent.error << "\n";
            chansync::http_cleanup();
            return 1;
        }
        loop.run_until([&client, &opened] {
            return !client.responding(opened.topic_id);
        }, 10 * 60 * 1000);
        client.disconnect();
        chansync::http_cleanup();
        return 0;
    }

    // Interactive REPL
    const chansync::Channel* ch = client.active_channel();
    std::cout << "chansync\n"
              << "Topic: " << (ch ? ch->title : opened.topic_id)
              << (opened.connected ? "" : " (offline)") << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    // stdin is read on its own thread; lines are handled on the loop.
    chansync::LineReader input(STDIN_FILENO,
        [&loop, &client, &agent_id](const std::string& line) {
            loop.post([&client, &loop, &agent_id, line] {
                if (!handle_line(client, line, agent_id)) loop.stop();
            });
        },
        [&loop] { loop.stop(); });
    if (!input.start()) {
        std::cerr << "Error: cannot read from stdin\n";
        chansync::http_cleanup();
        return 1;
    }

    loop.run();
    g_shutdown.store(true);
    input.stop();

    client.disconnect();
    chansync::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
