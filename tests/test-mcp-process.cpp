#ifdef NDEBUG
#undef NDEBUG
#endif

#include "mcp/mcp-client.hpp"
#include "mcp/mcp-error.hpp"
#include "mcp/mcp-log.hpp"
#include "mcp/process-transport.hpp"

#include <cassert>
#include <chrono>
#include <cstdio>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>

using json = mcp::json;

namespace {

std::string g_server;

template <typename E, typename F>
bool throws(F && fn) {
    try {
        fn();
    } catch (const E &) {
        return true;
    }
    return false;
}

struct log_capture {
    std::mutex               mtx;
    std::vector<std::string> lines;

    bool contains(const std::string & text) {
        std::lock_guard<std::mutex> lock(mtx);
        for (const auto & line : lines) {
            if (line.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }
};

void capture_log(enum mcp_log_level level, const char * text, void * user_data) {
    auto * capture = (log_capture *) user_data;
    {
        std::lock_guard<std::mutex> lock(capture->mtx);
        capture->lines.push_back(text);
    }
    mcp_log_callback_default(level, text, nullptr);
}

std::unique_ptr<mcp::Client> spawn_ready(const std::vector<std::string> & args = {},
                                         const mcp::mcp_client_params & params = {}) {
    std::unique_ptr<mcp::Client> client = mcp::Client::spawn(g_server, args, params);
    client->initialize();
    return client;
}

} // namespace

static void test_spawn_missing_executable() {
    assert(throws<mcp::SpawnError>([] {
        mcp::ProcessTransport::spawn("/nonexistent/mcp-server-binary");
    }));

    try {
        mcp::Client::spawn("/nonexistent/mcp-server-binary", { "--flag" });
        assert(false);
    } catch (const mcp::SpawnError & e) {
        const std::string what = e.what();
        assert(what.find("/nonexistent/mcp-server-binary") != std::string::npos);
    }
}

static void test_full_flow() {
    mcp::mcp_client_params params;
    params.client_name = "test-mcp-process";
    params.session.kill_grace_ms = 2000;

    std::unique_ptr<mcp::Client> client = mcp::Client::spawn(g_server, { "--quiet" }, params);

    const mcp::server_info info = client->initialize();
    assert(info.protocol_version == "2024-11-05");
    assert(info.server.name == "mcp-stub-server");
    assert(info.capabilities.contains("tools"));
    assert(info.instructions && *info.instructions == "test server");

    client->ping();

    const std::vector<mcp::tool> tools = client->list_all_tools();
    assert(tools.size() == 5);
    assert(tools[0].name == "echo");
    assert(tools[4].name == "fail");

    const mcp::page<mcp::tool> first = client->list_tools();
    assert(first.items.size() == 2);
    assert(first.next_cursor && *first.next_cursor == "page2");

    const mcp::call_tool_result echo = client->call_tool("echo", {{"text", "hello there"}});
    assert(!echo.is_error);
    assert(echo.content.at(0).at("text") == "hello there");

    // exactly one initialized notification, and not before the initialize request
    const mcp::call_tool_result stats = client->call_tool("stats");
    const json counters = json::parse(stats.content.at(0).at("text").get<std::string>());
    assert(counters.at("initialized") == 1);
    assert(counters.at("initialized_early") == false);

    try {
        client->call_tool("fail");
        assert(false);
    } catch (const mcp::CallError & e) {
        assert(e.code() == mcp::ERROR_INVALID_PARAMS);
        assert(e.data().at("tool") == "fail");
    }

    const std::vector<mcp::resource> resources = client->list_all_resources();
    assert(resources.size() == 1);
    assert(resources[0].uri == "stub://hello");

    const json contents = client->read_resource("stub://hello");
    assert(contents.at(0).at("text") == "hello");
    assert(contents.at(0).at("mimeType") == "text/plain");

    client->close();
    assert(client->session().state() == mcp::session_state::closed);

    // the stub exits on its own once its stdin is closed
    const mcp::exit_status status = client->session().transport().wait();
    assert(status.success());
}

static void test_server_crash() {
    std::unique_ptr<mcp::Client> client = spawn_ready({ "--quiet" });

    assert(throws<mcp::TransportClosedError>([&] { client->call_tool("crash"); }));

    client->session().wait_closed();

    assert(throws<mcp::TransportClosedError>([&] { client->ping(); }));

    const mcp::exit_status status = client->session().transport().wait();
    assert(status.signal == 0);
    assert(status.code == 3);
}

static void test_close_hung_server() {
    mcp::mcp_client_params params;
    params.session.kill_grace_ms = 50;

    std::unique_ptr<mcp::Client> client = spawn_ready({ "--quiet" }, params);

    mcp::Session & session = client->session();

    // hang blocks the stub's read loop, a bounded call gives up on it
    mcp::call_options opts;
    opts.timeout_ms = 100;
    assert(throws<mcp::CancellationError>([&] { client->call_tool("hang", json::object(), opts); }));

    const auto t_start = std::chrono::steady_clock::now();
    client->close();
    const auto elapsed = std::chrono::steady_clock::now() - t_start;

    assert(elapsed < std::chrono::seconds(5));
    assert(session.state() == mcp::session_state::closed);

    const mcp::exit_status status = session.transport().wait();
    assert(status.signal == SIGKILL);
}

// leave the stub stuck in its read loop, so nothing written from now on is read
static void hang_peer(mcp::Client & client) {
    mcp::call_options opts;
    opts.timeout_ms = 100;
    assert(throws<mcp::CancellationError>([&] { client.call_tool("hang", json::object(), opts); }));
}

static void test_close_peer_not_reading() {
    mcp::mcp_client_params params;
    params.session.kill_grace_ms = 100;

    std::unique_ptr<mcp::Client> client = spawn_ready({ "--quiet" }, params);
    mcp::Session & session = client->session();

    hang_peer(*client);

    // far larger than the pipe buffer, this call stays blocked in its write
    const std::string big(1 << 20, 'x');
    auto echo = std::async(std::launch::async, [&] { client->call_tool("echo", {{"text", big}}); });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    // queued behind the blocked write
    auto ping = std::async(std::launch::async, [&] { client->ping(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    assert(session.n_pending() == 2);

    const auto t_start = std::chrono::steady_clock::now();
    client->close();
    const auto elapsed = std::chrono::steady_clock::now() - t_start;

    assert(elapsed < std::chrono::seconds(5));
    assert(session.state() == mcp::session_state::closed);

    assert(echo.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    assert(ping.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    assert(throws<mcp::TransportClosedError>([&] { echo.get(); }));
    assert(throws<mcp::TransportClosedError>([&] { ping.get(); }));

    assert(session.transport().wait().signal == SIGKILL);
}

static void test_close_pipe_full() {
    mcp::mcp_client_params params;
    params.session.kill_grace_ms = 100;

    std::unique_ptr<mcp::Client> client = spawn_ready({ "--quiet" }, params);
    mcp::Session & session = client->session();

    hang_peer(*client);

    // fill the pipe, nobody is left holding the write
    const std::string big(1 << 20, 'x');
    const auto t_write = std::chrono::steady_clock::now();
    assert(throws<mcp::TransportClosedError>([&] { session.transport().write(big.data(), big.size(), 100); }));
    assert(std::chrono::steady_clock::now() - t_write < std::chrono::seconds(5));

    // the exit notification cannot go out either
    const auto t_start = std::chrono::steady_clock::now();
    client->close();
    const auto elapsed = std::chrono::steady_clock::now() - t_start;

    assert(elapsed < std::chrono::seconds(5));
    assert(session.state() == mcp::session_state::closed);
    assert(session.transport().wait().signal == SIGKILL);
}

static void test_peer_exits_before_start() {
    for (int i = 0; i < 20; i++) {
        std::unique_ptr<mcp::Transport> transport = mcp::ProcessTransport::spawn("true");

        // let it exit before anyone watches it
        std::this_thread::sleep_for(std::chrono::milliseconds(i % 2 == 0 ? 20 : 0));

        mcp::Session session(std::move(transport));
        session.start();
        session.wait_closed();

        assert(throws<mcp::SessionClosedError>([&] { session.call("ping"); }));

        session.close();
        assert(session.state() == mcp::session_state::closed);

        const mcp::exit_status status = session.transport().wait();
        assert(status.success());
    }
}

static void test_kill_is_idempotent() {
    std::unique_ptr<mcp::ProcessTransport> transport = mcp::ProcessTransport::spawn(g_server, { "--quiet" });
    assert(transport->pid() > 0);

    int n_exits = 0;
    transport->start([&n_exits](const mcp::exit_status &) { n_exits++; });

    assert(!transport->wait_for(50));

    transport->kill();
    transport->kill();

    const mcp::exit_status status = transport->wait();
    assert(status.signal == SIGKILL);
    assert(!status.success());
    assert(transport->exited());

    // after the exit, nothing is signalled
    transport->kill();
    assert(transport->wait_for(0));

    transport->join();
    assert(n_exits == 1);

    assert(throws<mcp::TransportClosedError>([&] {
        const std::string line = "{}\n";
        transport->write(line.data(), line.size());
    }));
}

static void test_stderr_monitor() {
    log_capture capture;
    mcp_log_set(capture_log, &capture);

    {
        std::unique_ptr<mcp::Client> client = spawn_ready();
        client->ping();
        client->close();
    }

    mcp_log_set(nullptr, nullptr);

    assert(capture.contains("peer reported: error: simulated failure"));
    assert(!capture.contains("peer reported: stub server ready"));
}

int main(int argc, char ** argv) {
    if (argc < 2) {
        fprintf(stderr, "usage: %s path/to/mcp-stub-server\n", argv[0]);
        return 1;
    }
    g_server = argv[1];

    test_spawn_missing_executable();
    test_full_flow();
    test_server_crash();
    test_close_hung_server();
    test_close_peer_not_reading();
    test_close_pipe_full();
    test_peer_exits_before_start();
    test_kill_is_idempotent();
    test_stderr_monitor();

    fprintf(stderr, "%s: all tests passed\n", __FILE__);
    return 0;
}
