#pragma once

#include "cirrus/transfer/engine.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace cirrus::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct AdminResponse {
    int status = 200;
    std::string body;           ///< JSON
};

/**
 * @brief Map one admin request onto the engine
 *
 * ROUTES:
 * GET  /status                     queue summary
 * GET  /status/detailed            queue items, mappings, tracking sizes
 * GET  /health                     liveness probe
 * POST /maintenance/cleanup-stuck  staleness sweep
 * POST /maintenance/repair-folders drop orphaned pending folders
 */
AdminResponse route_admin_request(transfer::TransferEngine& engine,
                                  const std::string& method,
                                  const std::string& target);

/**
 * @brief One accepted admin connection
 *
 * Reads the request head, answers, closes. Kept alive by the
 * shared_ptr captured in each pending async operation.
 */
class AdminConnection : public std::enable_shared_from_this<AdminConnection> {
public:
    AdminConnection(tcp::socket socket, transfer::TransferEngine& engine);

    void start();

private:
    void do_read();
    void do_write(const AdminResponse& response);

    tcp::socket socket_;
    transfer::TransferEngine& engine_;
    asio::streambuf buffer_;
};

/**
 * @brief Administrative HTTP endpoint on its own io_context thread
 *
 * USAGE:
 * AdminServer admin(engine, 8081);
 * admin.start();
 * // ...
 * admin.stop();
 *
 * Port 0 binds an ephemeral port, see port().
 */
class AdminServer {
public:
    AdminServer(transfer::TransferEngine& engine, std::uint16_t port);
    ~AdminServer();

    AdminServer(const AdminServer&) = delete;
    AdminServer& operator=(const AdminServer&) = delete;

    void start();
    void stop();

    std::uint16_t port() const { return port_; }

private:
    void do_accept();

    transfer::TransferEngine& engine_;
    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::uint16_t port_;
    std::thread thread_;
};

} // namespace cirrus::network
