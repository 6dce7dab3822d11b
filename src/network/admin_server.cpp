#include "cirrus/network/admin_server.hpp"

#include "cirrus/transfer/protocol.hpp"

#include <spdlog/spdlog.h>

#include <istream>
#include <sstream>

namespace cirrus::network {
namespace {

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

AdminResponse json_response(int status, const nlohmann::json& body) {
    return AdminResponse{status, body.dump()};
}

AdminResponse error_response(int status, const std::string& message) {
    return json_response(status, nlohmann::json{{"error", message}});
}

std::string strip_query(const std::string& target) {
    const auto pos = target.find('?');
    return pos == std::string::npos ? target : target.substr(0, pos);
}

} // namespace

AdminResponse route_admin_request(transfer::TransferEngine& engine,
                                  const std::string& method,
                                  const std::string& target) {
    namespace protocol = transfer::protocol;
    const std::string path = strip_query(target);

    if (path == "/status") {
        if (method != "GET") {
            return error_response(405, "Use GET");
        }
        return json_response(200, protocol::encode(engine.queue_status()));
    }
    if (path == "/status/detailed") {
        if (method != "GET") {
            return error_response(405, "Use GET");
        }
        return json_response(200, protocol::encode(engine.detailed_status()));
    }
    if (path == "/health") {
        if (method != "GET") {
            return error_response(405, "Use GET");
        }
        return json_response(200, protocol::encode(engine.health()));
    }
    if (path == "/maintenance/cleanup-stuck") {
        if (method != "POST") {
            return error_response(405, "Use POST");
        }
        return json_response(200, protocol::encode(engine.cleanup_stuck()));
    }
    if (path == "/maintenance/repair-folders") {
        if (method != "POST") {
            return error_response(405, "Use POST");
        }
        return json_response(200, protocol::encode(engine.repair_folders()));
    }
    return error_response(404, "No route for " + path);
}

// ──────────────────────────────────────────────────────────
// AdminConnection
// ──────────────────────────────────────────────────────────

AdminConnection::AdminConnection(tcp::socket socket, transfer::TransferEngine& engine)
    : socket_(std::move(socket))
    , engine_(engine)
    , buffer_(16 * 1024) {}

void AdminConnection::start() {
    do_read();
}

void AdminConnection::do_read() {
    auto self = shared_from_this();

    // The request head is all the admin routes need; bodies are ignored
    asio::async_read_until(socket_, buffer_, "\r\n\r\n",
        [this, self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("[Admin] read error: {}", ec.message());
                }
                if (ec == asio::error::not_found) {
                    do_write(error_response(400, "Request head too large"));
                }
                return;
            }

            std::istream stream(&buffer_);
            std::string request_line;
            std::getline(stream, request_line);
            if (!request_line.empty() && request_line.back() == '\r') {
                request_line.pop_back();
            }

            std::istringstream parts(request_line);
            std::string method;
            std::string target;
            std::string version;
            parts >> method >> target >> version;
            if (method.empty() || target.empty() || version.rfind("HTTP/", 0) != 0) {
                do_write(error_response(400, "Malformed request line"));
                return;
            }

            spdlog::info("[Admin] {} {}", method, target);

            AdminResponse response;
            try {
                response = route_admin_request(engine_, method, target);
            } catch (const std::exception& e) {
                spdlog::error("[Admin] handler threw: {}", e.what());
                response = error_response(500, "Internal server error");
            }
            do_write(response);
        });
}

void AdminConnection::do_write(const AdminResponse& response) {
    auto self = shared_from_this();

    std::ostringstream oss;
    oss << "HTTP/1.1 " << response.status << ' ' << reason_phrase(response.status) << "\r\n"
        << "Content-Type: application/json\r\n"
        << "Content-Length: " << response.body.size() << "\r\n"
        << "Connection: close\r\n"
        << "\r\n"
        << response.body;
    auto data = std::make_shared<std::string>(oss.str());

    asio::async_write(socket_, asio::buffer(*data),
        [this, self, data](boost::system::error_code ec, std::size_t bytes) {
            if (!ec) {
                spdlog::debug("[Admin] sent {} bytes", bytes);
                boost::system::error_code shutdown_ec;
                socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
            } else if (ec != asio::error::operation_aborted) {
                spdlog::debug("[Admin] write error: {}", ec.message());
            }
        });
}

// ──────────────────────────────────────────────────────────
// AdminServer
// ──────────────────────────────────────────────────────────

AdminServer::AdminServer(transfer::TransferEngine& engine, std::uint16_t port)
    : engine_(engine)
    , io_context_()
    , acceptor_(io_context_, tcp::endpoint(asio::ip::address_v4::loopback(), port))
    , port_(acceptor_.local_endpoint().port()) {
    spdlog::info("[Admin] listening on 127.0.0.1:{}", port_);
    do_accept();
}

AdminServer::~AdminServer() {
    stop();
}

void AdminServer::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::thread([this]() { io_context_.run(); });
}

void AdminServer::stop() {
    io_context_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void AdminServer::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::make_shared<AdminConnection>(std::move(socket), engine_)->start();
            } else if (ec == asio::error::operation_aborted) {
                return;
            } else {
                spdlog::error("[Admin] accept error: {}", ec.message());
            }
            do_accept();
        });
}

} // namespace cirrus::network
