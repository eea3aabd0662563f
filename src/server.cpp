#include "taskmcp/server.hpp"
#include "taskmcp/dispatcher.hpp"
#include "taskmcp/error.hpp"
#include "taskmcp/request_tracker.hpp"
#include "taskmcp/transport/http_transport.hpp"
#include "taskmcp/transport/stdio_transport.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace taskmcp {

struct Server::Impl {
    Options opts;
    Dispatcher dispatcher;
    RequestTracker tracker;

    // Transport references for sending and shutdown
    ITransport* transport{nullptr};
    HttpServerTransport* http_transport{nullptr};
    std::mutex transport_mutex;

    std::atomic<bool> running{false};

    // Thread pool. Starts with thread_pool_size workers and adds one whenever
    // a task is queued with no idle worker to take it.
    std::vector<std::thread> thread_pool;
    std::queue<std::function<void()>> task_queue;
    std::mutex pool_mutex;
    std::condition_variable pool_cv;
    std::atomic<bool> pool_running{false};
    size_t idle_workers{0};

    // Timeout watchdog
    std::thread watchdog;
    std::mutex watchdog_mutex;
    std::condition_variable watchdog_cv;
    bool watchdog_stop{false};

    Impl(Options o, const Registry& registry)
        : opts(std::move(o)), dispatcher(registry, opts.server_info) {}

    void start_thread_pool() {
        std::lock_guard<std::mutex> lock(pool_mutex);
        pool_running = true;
        int size = std::max(1, opts.thread_pool_size);
        for (int i = 0; i < size; ++i) {
            spawn_worker();
        }
    }

    /// Caller holds pool_mutex.
    void spawn_worker() {
        thread_pool.emplace_back([this] {
            std::unique_lock<std::mutex> lock(pool_mutex);
            while (true) {
                ++idle_workers;
                pool_cv.wait(lock, [this] {
                    return !task_queue.empty() || !pool_running;
                });
                --idle_workers;
                if (!pool_running && task_queue.empty()) return;
                auto task = std::move(task_queue.front());
                task_queue.pop();

                lock.unlock();
                task();
                lock.lock();
            }
        });
    }

    /// Waits for queued tasks to finish before joining.
    void stop_thread_pool() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            pool_running = false;
        }
        pool_cv.notify_all();
        // Workers are only added while pool_running, so the list is stable here.
        for (auto& t : thread_pool) {
            if (t.joinable()) t.join();
        }
        thread_pool.clear();
    }

    /// A handler stuck on the task store must not delay unrelated requests,
    /// so a task never waits behind busy workers.
    void dispatch_to_pool(std::function<void()> fn) {
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            task_queue.push(std::move(fn));
            if (task_queue.size() > idle_workers) {
                spawn_worker();
                spdlog::debug("Worker pool grew to {} threads", thread_pool.size());
            }
        }
        pool_cv.notify_one();
    }

    void start_watchdog() {
        if (opts.request_timeout.count() <= 0) return;
        {
            std::lock_guard<std::mutex> lock(watchdog_mutex);
            watchdog_stop = false;
        }
        auto interval = std::clamp(opts.request_timeout / 10,
                                   std::chrono::milliseconds(1),
                                   std::chrono::milliseconds(100));
        watchdog = std::thread([this, interval] {
            std::unique_lock<std::mutex> lock(watchdog_mutex);
            while (!watchdog_stop) {
                watchdog_cv.wait_for(lock, interval, [this] { return watchdog_stop; });
                lock.unlock();
                expire_requests();
                lock.lock();
            }
        });
    }

    void stop_watchdog() {
        {
            std::lock_guard<std::mutex> lock(watchdog_mutex);
            watchdog_stop = true;
        }
        watchdog_cv.notify_all();
        if (watchdog.joinable()) watchdog.join();
    }

    void expire_requests() {
        auto expired = tracker.expire(opts.request_timeout);
        for (auto& id : expired) {
            spdlog::warn("Request id={} timed out after {} ms", id.dump(),
                         opts.request_timeout.count());
            send(Response::failure(std::move(id),
                "Request timed out after " + std::to_string(opts.request_timeout.count()) + " ms"));
        }
    }

    void send(const Response& response) {
        std::lock_guard<std::mutex> lock(transport_mutex);
        if (!transport) {
            spdlog::warn("No transport, dropping response id={}", response.id.dump());
            return;
        }
        try {
            transport->send(response);
        } catch (const TransportError& e) {
            spdlog::warn("Could not send response id={}: {}", response.id.dump(), e.what());
        }
    }

    void on_message(nlohmann::json message) {
        nlohmann::json id;
        if (message.is_object()) {
            if (auto it = message.find("id"); it != message.end()) id = *it;
        }
        Ticket ticket = tracker.open(id);

        dispatch_to_pool([this, ticket, message = std::move(message)] {
            Response response = dispatcher.dispatch(message);
            if (!tracker.close(ticket)) {
                spdlog::warn("Dropping late response for id={}", response.id.dump());
                return;
            }
            send(response);
        });
    }

    void on_error(std::exception_ptr error) {
        try {
            std::rethrow_exception(error);
        } catch (const ParseError& e) {
            spdlog::warn("Rejected undecodable line: {}", e.what());
            send(Response::decode_failure());
        } catch (const std::exception& e) {
            spdlog::error("Transport error: {}", e.what());
        }
    }
};

Server::Server(Options opts, const Registry& registry)
    : impl_(std::make_unique<Impl>(std::move(opts), registry)) {
}

Server::~Server() {
    if (impl_) {
        impl_->stop_thread_pool();
        impl_->stop_watchdog();
    }
}

Response Server::handle(const nlohmann::json& message) const {
    return impl_->dispatcher.dispatch(message);
}

void Server::serve(std::unique_ptr<ITransport> transport) {
    impl_->running = true;
    impl_->start_thread_pool();
    impl_->start_watchdog();

    auto* t = transport.get();
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = t;
    }

    std::exception_ptr failure;
    try {
        t->start(
            [this](nlohmann::json msg) { impl_->on_message(std::move(msg)); },
            [this](std::exception_ptr e) { impl_->on_error(std::move(e)); });
    } catch (const TransportError& e) {
        spdlog::error("Transport failed: {}", e.what());
        failure = std::current_exception();
    }

    // Input is finished; let in-flight requests complete or time out.
    impl_->stop_thread_pool();
    impl_->stop_watchdog();

    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
    }
    t->shutdown();
    impl_->running = false;
    if (failure) std::rethrow_exception(failure);
}

void Server::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void Server::serve_http(const std::string& host, uint16_t port) {
    HttpServerTransport::Options opts;
    opts.host = host;
    opts.port = port;
    HttpServerTransport http(opts);
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->http_transport = &http;
    }
    impl_->running = true;

    try {
        http.start([this](const nlohmann::json& message) { return handle(message); });
    } catch (const TransportError&) {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->http_transport = nullptr;
        impl_->running = false;
        throw;
    }

    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    impl_->http_transport = nullptr;
    impl_->running = false;
}

void Server::shutdown() {
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
    if (impl_->http_transport) {
        impl_->http_transport->shutdown();
    }
}

bool Server::is_running() const {
    return impl_->running;
}

} // namespace taskmcp
