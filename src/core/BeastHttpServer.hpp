#ifndef BEAST_HTTP_SERVER_HPP
#define BEAST_HTTP_SERVER_HPP

#include <boost/beast/core.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

#include "../interfaces/ILogger.hpp"
#include "../config/AppConfig.hpp"
#include "HttpServerSession.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class CacheAdminService;

// Accept loop for the admin endpoints. Throws std::runtime_error when the endpoint
// cannot be bound.
class BeastHttpServer : public std::enable_shared_from_this<BeastHttpServer> {
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<CacheAdminService> admin_service_;
    std::shared_ptr<ILogger> logger_;
    const AppConfig& config_;
    std::mutex sessions_mutex_;
    std::unordered_set<std::shared_ptr<HttpServerSession>> active_sessions_;

public:
    BeastHttpServer(
        net::io_context& ioc,
        tcp::endpoint endpoint,
        std::shared_ptr<CacheAdminService> service,
        std::shared_ptr<ILogger> logger,
        const AppConfig& config);

    void run();
    void stop();

    // Useful when constructed with port 0.
    unsigned short port() const;
    std::size_t activeSessionCount();

private:
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
    void on_session_finish(std::shared_ptr<HttpServerSession> session);
    void check(const beast::error_code& ec, const std::string& step);
};

#endif // BEAST_HTTP_SERVER_HPP
