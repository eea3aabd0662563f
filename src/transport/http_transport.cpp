#include "taskmcp/transport/http_transport.hpp"
#include "taskmcp/codec.hpp"
#include "taskmcp/error.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace taskmcp {

namespace {

const char* const JSON_TYPE = "application/json";

void set_cors_headers(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

} // anonymous namespace

HttpServerTransport::HttpServerTransport(Options opts)
    : opts_(std::move(opts))
    , server_(std::make_unique<httplib::Server>()) {
}

HttpServerTransport::~HttpServerTransport() {
    shutdown();
}

void HttpServerTransport::setup_routes() {
    server_->Post(opts_.mcp_path, [this](const httplib::Request& req, httplib::Response& res) {
        set_cors_headers(res);

        nlohmann::json message;
        try {
            message = Codec::parse(req.body);
        } catch (const ParseError& e) {
            spdlog::warn("Rejected undecodable HTTP request body: {}", e.what());
            res.status = 400;
            res.set_content(Codec::serialize(Response::decode_failure()), JSON_TYPE);
            return;
        }

        try {
            Response response = handler_(message);
            res.status = 200;
            res.set_content(Codec::serialize(response), JSON_TYPE);
        } catch (const std::exception& e) {
            spdlog::error("HTTP request handling failed: {}", e.what());
            res.status = 500;
            nlohmann::json id;
            if (message.is_object() && message.contains("id")) id = message["id"];
            res.set_content(Codec::serialize(Response::failure(id, e.what())), JSON_TYPE);
        }
    });

    // CORS pre-flight is answered for any path.
    server_->Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        set_cors_headers(res);
        res.status = 204;
    });

    const std::string path = opts_.mcp_path;
    server_->set_error_handler([path](const httplib::Request&, httplib::Response& res) {
        if (res.status != 404 || !res.body.empty()) return;
        nlohmann::json body = {
            {"error", "Not found"},
            {"message", "This server only accepts POST requests to " + path + " endpoint"}
        };
        res.set_content(body.dump(), JSON_TYPE);
    });
}

void HttpServerTransport::start(RequestHandler handler) {
    if (running_.exchange(true)) return;
    handler_ = std::move(handler);

    setup_routes();

    int port = 0;
    if (opts_.port == 0) {
        port = server_->bind_to_any_port(opts_.host);
    } else if (server_->bind_to_port(opts_.host, opts_.port)) {
        port = opts_.port;
    }

    {
        std::lock_guard<std::mutex> lock(bind_mutex_);
        bound_port_ = static_cast<uint16_t>(port > 0 ? port : 0);
        bind_settled_ = true;
    }
    bind_cv_.notify_all();

    if (port <= 0) {
        running_ = false;
        throw TransportError("Failed to start HTTP server on " + opts_.host + ":" +
                             std::to_string(opts_.port));
    }

    spdlog::info("HTTP transport listening on http://{}:{}{}", opts_.host, port, opts_.mcp_path);
    server_->listen_after_bind();
    running_ = false;
}

uint16_t HttpServerTransport::wait_until_bound() {
    std::unique_lock<std::mutex> lock(bind_mutex_);
    bind_cv_.wait(lock, [this] { return bind_settled_; });
    return bound_port_.load();
}

void HttpServerTransport::shutdown() {
    if (!running_.exchange(false)) return;
    server_->stop();
}

bool HttpServerTransport::is_running() const {
    return running_;
}

} // namespace taskmcp
