#include <gtest/gtest.h>
#include "taskmcp/codec.hpp"
#include "taskmcp/server.hpp"
#include "taskmcp/transport/stdio_transport.hpp"
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <set>
#include <thread>

using namespace taskmcp;
using namespace std::chrono_literals;

namespace {

ToolEntry sleeping_tool(std::string name, std::chrono::milliseconds delay) {
    ToolEntry tool;
    tool.name = std::move(name);
    tool.description = "Sleeps, then echoes its parameters";
    tool.handler = [delay](const nlohmann::json& params) {
        std::this_thread::sleep_for(delay);
        ToolResult r;
        r.content.push_back(JsonContent{params});
        return r;
    };
    return tool;
}

/// A Server serving a StdioTransport over two pipes. Output is read on a
/// background thread so the server never blocks on a full pipe.
class StdioHarness {
public:
    StdioHarness(const Registry& registry, Server::Options opts) : server_(std::move(opts), registry) {
        if (pipe(in_) < 0 || pipe(out_) < 0) throw std::runtime_error("pipe failed");

        auto transport = std::make_unique<StdioTransport>(in_[0], out_[1]);
        serve_thread_ = std::thread([this, t = std::move(transport)]() mutable {
            server_.serve(std::move(t));
        });
        read_thread_ = std::thread([this] {
            char buf[4096];
            ssize_t n;
            while ((n = ::read(out_[0], buf, sizeof(buf))) > 0) {
                std::lock_guard<std::mutex> lock(mutex_);
                output_.append(buf, static_cast<size_t>(n));
            }
        });
    }

    ~StdioHarness() {
        finish();
        ::close(out_[0]);
    }

    void send_line(const std::string& line) {
        std::string data = line + "\n";
        ASSERT_EQ(::write(in_[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void send(const nlohmann::json& message) { send_line(message.dump()); }

    /// Close input, wait for serve() to drain, and return every response line.
    std::vector<nlohmann::json> finish() {
        if (in_[1] >= 0) {
            ::close(in_[1]);
            in_[1] = -1;
        }
        if (serve_thread_.joinable()) serve_thread_.join();
        if (read_thread_.joinable()) read_thread_.join();
        return responses();
    }

    /// Responses received so far.
    std::vector<nlohmann::json> responses() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<nlohmann::json> out;
        size_t start = 0;
        size_t nl;
        while ((nl = output_.find('\n', start)) != std::string::npos) {
            out.push_back(Codec::parse(output_.substr(start, nl - start)));
            start = nl + 1;
        }
        return out;
    }

    Server& server() { return server_; }

private:
    Server server_;
    int in_[2];
    int out_[2];
    std::thread serve_thread_;
    std::thread read_thread_;
    std::mutex mutex_;
    std::string output_;
};

Server::Options options(int threads, std::chrono::milliseconds timeout = 30000ms) {
    Server::Options opts;
    opts.server_info.name = "stdio-e2e";
    opts.thread_pool_size = threads;
    opts.request_timeout = timeout;
    return opts;
}

} // anonymous namespace

TEST(StdioE2E, DiscoverRoundTrip) {
    Registry registry;
    registry.add_tool(sleeping_tool("echo", 0ms));
    StdioHarness harness(registry, options(2));

    harness.send({{"id", 1}, {"type", "discover"}});
    auto responses = harness.finish();

    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[0]["type"], "discover_response");
    EXPECT_EQ(responses[0]["name"], "stdio-e2e");
    EXPECT_EQ(responses[0]["tools"][0]["name"], "echo");
}

TEST(StdioE2E, MalformedLineDoesNotStopServing) {
    Registry registry;
    StdioHarness harness(registry, options(1));

    harness.send_line("{not json");
    // Give the error response time to go out before the next request.
    std::this_thread::sleep_for(50ms);
    harness.send({{"id", "after"}, {"type", "discover"}});
    auto responses = harness.finish();

    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0]["error"], "Failed to process request: invalid JSON");
    EXPECT_EQ(responses[0]["id"].get<std::string>().rfind("error_", 0), 0u);
    EXPECT_EQ(responses[1]["id"], "after");
    EXPECT_EQ(responses[1]["type"], "discover_response");
}

TEST(StdioE2E, FastRequestOvertakesSlowOne) {
    Registry registry;
    registry.add_tool(sleeping_tool("createTask", 200ms));
    registry.add_tool(sleeping_tool("listTasks", 5ms));
    StdioHarness harness(registry, options(2));

    harness.send({{"id", "slow"}, {"type", "invoke"}, {"tool", "createTask"}});
    harness.send({{"id", "fast"}, {"type", "invoke"}, {"tool", "listTasks"}});
    auto responses = harness.finish();

    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0]["id"], "fast");
    EXPECT_EQ(responses[1]["id"], "slow");
}

TEST(StdioE2E, EveryRequestAnsweredExactlyOnce) {
    Registry registry;
    registry.add_tool(sleeping_tool("echo", 1ms));
    StdioHarness harness(registry, options(4));

    constexpr int N = 200;
    for (int i = 0; i < N; ++i) {
        harness.send({{"id", i}, {"type", "invoke"}, {"tool", "echo"},
                      {"parameters", {{"n", i}}}});
    }
    auto responses = harness.finish();

    ASSERT_EQ(responses.size(), static_cast<size_t>(N));
    std::set<int> seen;
    for (const auto& r : responses) {
        int id = r["id"].get<int>();
        EXPECT_EQ(r["content"][0]["json"]["n"], id);
        EXPECT_TRUE(seen.insert(id).second) << "duplicate response for id " << id;
    }
}

TEST(StdioE2E, TimeoutAnswersOnceAndDropsLateResult) {
    Registry registry;
    registry.add_tool(sleeping_tool("stuck", 300ms));
    registry.add_tool(sleeping_tool("quick", 0ms));
    StdioHarness harness(registry, options(2, 50ms));

    harness.send({{"id", "stuck-1"}, {"type", "invoke"}, {"tool", "stuck"}});
    harness.send({{"id", "quick-1"}, {"type", "invoke"}, {"tool", "quick"}});
    auto responses = harness.finish();

    ASSERT_EQ(responses.size(), 2u);
    nlohmann::json stuck;
    for (const auto& r : responses) {
        if (r["id"] == "stuck-1") stuck = r;
    }
    ASSERT_FALSE(stuck.is_null());
    EXPECT_EQ(stuck["error"], "Request timed out after 50 ms");
}

TEST(StdioE2E, StalledHandlersDoNotDelayOtherRequests) {
    Registry registry;
    registry.add_tool(sleeping_tool("stall", 1500ms));
    // More stalled requests than initial workers, and no deadline to hide behind.
    StdioHarness harness(registry, options(2, 0ms));

    for (int i = 0; i < 4; ++i) {
        harness.send({{"id", "stall-" + std::to_string(i)}, {"type", "invoke"}, {"tool", "stall"}});
    }
    harness.send({{"id", "d1"}, {"type", "discover"}});

    auto deadline = std::chrono::steady_clock::now() + 1000ms;
    std::vector<nlohmann::json> seen;
    while (std::chrono::steady_clock::now() < deadline) {
        seen = harness.responses();
        if (!seen.empty()) break;
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0]["id"], "d1");
    EXPECT_EQ(seen[0]["type"], "discover_response");

    auto responses = harness.finish();
    EXPECT_EQ(responses.size(), 5u);
}

TEST(StdioE2E, ZeroTimeoutWaitsForHandler) {
    Registry registry;
    registry.add_tool(sleeping_tool("slowish", 100ms));
    StdioHarness harness(registry, options(1, 0ms));

    harness.send({{"id", 1}, {"type", "invoke"}, {"tool", "slowish"}});
    auto responses = harness.finish();

    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0]["type"], "invoke_response");
}

TEST(StdioE2E, EndOfInputDrainsInFlightRequests) {
    Registry registry;
    registry.add_tool(sleeping_tool("work", 100ms));
    StdioHarness harness(registry, options(2));

    for (int i = 0; i < 4; ++i) {
        harness.send({{"id", i}, {"type", "invoke"}, {"tool", "work"}});
    }
    // Input closes while all four are still queued or running.
    auto responses = harness.finish();

    ASSERT_EQ(responses.size(), 4u);
    for (const auto& r : responses) {
        EXPECT_EQ(r["type"], "invoke_response");
    }
}

TEST(StdioE2E, HandleAnswersWithoutTransport) {
    Registry registry;
    registry.add_tool(sleeping_tool("echo", 0ms));
    Server server(options(1), registry);

    auto r = nlohmann::json(server.handle({{"id", 3}, {"type", "invoke"}, {"tool", "echo"},
                                           {"parameters", {{"x", 1}}}}));
    EXPECT_EQ(r["id"], 3);
    EXPECT_EQ(r["content"][0]["json"]["x"], 1);
    EXPECT_FALSE(server.is_running());
}

TEST(StdioE2E, ShutdownStopsServing) {
    Registry registry;
    StdioHarness harness(registry, options(1));

    harness.send({{"id", 1}, {"type", "discover"}});
    std::this_thread::sleep_for(100ms);
    EXPECT_TRUE(harness.server().is_running());
    harness.server().shutdown();
    auto responses = harness.finish();

    EXPECT_FALSE(harness.server().is_running());
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0]["id"], 1);
}
