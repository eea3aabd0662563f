#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace taskmcp {

/// StdioTransport reads newline-delimited JSON from stdin and writes to stdout.
///
/// A background writer thread owns the output fd, so each queued response is
/// one uninterrupted line. Reaching end of input returns from start() but
/// keeps the writer alive; responses still in flight are written until
/// shutdown() is called and the queue is empty.
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (for testing).
    /// Takes ownership of both descriptors.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const Response& response) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(const MessageCallback& on_message, const ErrorCallback& on_error);
    void handle_line(std::string line, const MessageCallback& on_message,
                     const ErrorCallback& on_error);
    void write_loop();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::thread writer_thread_;

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;

    int wakeup_pipe_[2]{-1, -1};  // interrupts poll() in read_loop
};

} // namespace taskmcp
