#include "BeastHttpServer.hpp"

#include <boost/asio/strand.hpp>
#include <sstream>
#include <stdexcept>

#include "CacheAdminService.hpp"

BeastHttpServer::BeastHttpServer(
    net::io_context& ioc,
    tcp::endpoint endpoint,
    std::shared_ptr<CacheAdminService> service,
    std::shared_ptr<ILogger> logger,
    const AppConfig& config)
    : ioc_(ioc),
      acceptor_(ioc),
      admin_service_(std::move(service)),
      logger_(std::move(logger)),
      config_(config) {
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    check(ec, "open acceptor");
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    check(ec, "set_option");
    acceptor_.bind(endpoint, ec);
    check(ec, "bind " + endpoint.address().to_string() + ":" + std::to_string(endpoint.port()));
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    check(ec, "listen");
}

void BeastHttpServer::check(const beast::error_code& ec, const std::string& step) {
    if (ec) {
        logger_->error("BeastHttpServer " + step + " error: " + ec.message());
        throw std::runtime_error("Failed to " + step + ": " + ec.message());
    }
}

void BeastHttpServer::run() {
    logger_->setup("Admin server listening on port " + std::to_string(port()));
    do_accept();
}

void BeastHttpServer::stop() {
    logger_->info("BeastHttpServer stopping...");
    beast::error_code ec;
    acceptor_.cancel(ec);
    if (ec) logger_->error("BeastHttpServer acceptor cancel error: " + ec.message());
    acceptor_.close(ec);
    if (ec) logger_->error("BeastHttpServer acceptor close error: " + ec.message());

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (const auto& session : active_sessions_) {
        if (session) session->stop();
    }
    active_sessions_.clear();
    logger_->info("BeastHttpServer stopped accepting new connections.");
}

unsigned short BeastHttpServer::port() const {
    beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

std::size_t BeastHttpServer::activeSessionCount() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return active_sessions_.size();
}

void BeastHttpServer::do_accept() {
    // Each connection gets its own strand since ioc may run on several threads.
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&BeastHttpServer::on_accept, shared_from_this()));
}

void BeastHttpServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        logger_->error("BeastHttpServer accept error: " + ec.message());
        return do_accept();
    }

    auto self = shared_from_this();
    auto session = std::make_shared<HttpServerSession>(
        std::move(socket),
        admin_service_,
        logger_,
        config_,
        [self](std::shared_ptr<HttpServerSession> finished) {
            self->on_session_finish(std::move(finished));
        });

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        active_sessions_.insert(session);
    }
    session->run();
    do_accept();
}

void BeastHttpServer::on_session_finish(std::shared_ptr<HttpServerSession> session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (active_sessions_.erase(session) == 0) {
        std::ostringstream oss;
        oss << static_cast<void*>(session.get());
        logger_->debug("BeastHttpServer session " + oss.str() + " finished after server stop.");
    }
}
