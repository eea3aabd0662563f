#include "taskmcp/transport/stdio_transport.hpp"
#include "taskmcp/error.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace taskmcp {

namespace {

constexpr const char* WHITESPACE = " \t\r\n\f\v";

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(WHITESPACE);
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(WHITESPACE);
    return s.substr(begin, end - begin + 1);
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (writer_thread_.joinable()) writer_thread_.join();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    // shutdown() before start(): nothing to serve.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    connected_ = true;

    if (::pipe(wakeup_pipe_) < 0) {
        running_ = false;
        connected_ = false;
        throw TransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);

    writer_thread_ = std::thread([this]() { write_loop(); });
    if (!shutdown_requested_.load()) {
        read_loop(on_message, on_error);
    }
    running_ = false;
    connected_ = false;
}

void StdioTransport::read_loop(const MessageCallback& on_message,
                               const ErrorCallback& on_error) {
    std::string buffer;
    buffer.reserve(4096);

    char chunk[4096];

    while (running_) {
        // poll() lets shutdown() interrupt a blocking read via the wakeup pipe.
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }

        if (fds[1].revents & POLLIN) break;

        // POLLHUP without POLLIN still needs a read() to observe EOF.
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (!running_) break;
            if (on_error) {
                on_error(std::make_exception_ptr(
                    TransportError(std::string("Read error: ") + std::strerror(errno))));
            }
            break;
        }
        if (n == 0) {
            // A final line without a trailing newline still counts.
            if (!buffer.empty()) {
                handle_line(std::move(buffer), on_message, on_error);
                buffer.clear();
            }
            spdlog::debug("stdio transport reached end of input");
            break;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        size_t pos = 0;
        while (true) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;
            handle_line(buffer.substr(pos, nl - pos), on_message, on_error);
            pos = nl + 1;
        }

        if (pos > 0) {
            buffer.erase(0, pos);
        }
    }
}

void StdioTransport::handle_line(std::string line, const MessageCallback& on_message,
                                 const ErrorCallback& on_error) {
    line = trim(line);
    if (line.empty()) return;

    nlohmann::json message;
    try {
        message = Codec::parse(line);
    } catch (const ParseError& e) {
        if (on_error) on_error(std::make_exception_ptr(e));
        return;
    }
    on_message(std::move(message));
}

void StdioTransport::write_loop() {
    bool broken = false;
    while (true) {
        std::string msg_to_write;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return !write_queue_.empty() || shutdown_requested_.load();
            });

            if (write_queue_.empty()) break;  // shutdown requested and drained
            msg_to_write = std::move(write_queue_.front());
            write_queue_.pop();
        }
        if (broken) continue;

        msg_to_write += '\n';
        const char* data = msg_to_write.data();
        size_t remaining = msg_to_write.size();

        while (remaining > 0) {
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                spdlog::error("stdio transport write failed: {}", std::strerror(errno));
                broken = true;
                break;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}

void StdioTransport::send(const Response& response) {
    // Responses queued before start() are written once the writer runs.
    if (shutdown_requested_.load()) {
        throw TransportError("Transport shut down");
    }
    std::string serialized = Codec::serialize(response);
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(serialized));
    }
    write_cv_.notify_one();
}

void StdioTransport::shutdown() {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (shutdown_requested_.exchange(true)) return;
    }
    write_cv_.notify_all();
    if (running_.exchange(false) && wakeup_pipe_[1] >= 0) {
        char b = 1;
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            spdlog::warn("stdio transport wakeup failed: {}", std::strerror(errno));
        }
    }
    connected_ = false;
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace taskmcp
