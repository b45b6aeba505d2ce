#ifndef HTTP_SERVER_SESSION_HPP
#define HTTP_SERVER_SESSION_HPP

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class CacheAdminService;

// One admin connection. Requests are read in order, handed to the admin service, and
// the responses are written back in the order they complete.
class HttpServerSession : public std::enable_shared_from_this<HttpServerSession> {
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::shared_ptr<CacheAdminService> admin_service_;
    std::shared_ptr<ILogger> logger_;
    const AppConfig& config_;
    std::function<void(std::shared_ptr<HttpServerSession>)> on_finish_callback_;

    std::deque<std::shared_ptr<http::response<http::string_body>>> response_queue_;
    bool write_in_progress_ = false;

    // Closes the socket when a write has not completed within WRITE_STALL_TIMEOUT.
    net::steady_timer write_stall_timer_;
    std::atomic<bool> current_write_op_completed_{false};

    http::request<http::string_body> req_;
    bool last_request_keep_alive_ = true;

    static constexpr std::chrono::seconds READ_TIMEOUT{30};
    static constexpr std::chrono::seconds WRITE_STALL_TIMEOUT{5};

public:
    HttpServerSession(
        tcp::socket&& socket,
        std::shared_ptr<CacheAdminService> service,
        std::shared_ptr<ILogger> logger,
        const AppConfig& config,
        std::function<void(std::shared_ptr<HttpServerSession>)> on_finish)
        : stream_(std::move(socket)),
          admin_service_(std::move(service)),
          logger_(std::move(logger)),
          config_(config),
          on_finish_callback_(std::move(on_finish)),
          write_stall_timer_(stream_.get_executor()) {
        logger_->debug("HttpServerSession " + id() + " created.");
    }

    ~HttpServerSession() {
        logger_->debug("HttpServerSession " + id() + " destroyed.");
        write_stall_timer_.cancel();
    }

    void run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&HttpServerSession::do_read, shared_from_this()));
    }

    // Called by the server on shutdown; pending operations complete with an error.
    void stop() {
        current_write_op_completed_.store(true);
        write_stall_timer_.cancel();

        beast::error_code ec;
        if (stream_.socket().is_open()) {
            stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
            if (ec && ec != beast::errc::not_connected) {
                logger_->error("HttpServerSession " + id() + " socket shutdown error during stop: " + ec.message());
            }
            ec = {};
            stream_.socket().close(ec);
            if (ec) {
                logger_->error("HttpServerSession " + id() + " socket close error during stop: " + ec.message());
            }
        }
    }

private:
    std::string id() const {
        std::ostringstream oss;
        oss << static_cast<const void*>(this);
        return oss.str();
    }

    void do_read() {
        req_ = {};
        stream_.expires_after(READ_TIMEOUT);
        http::async_read(stream_, buffer_, req_,
                         beast::bind_front_handler(&HttpServerSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        if (ec == http::error::end_of_stream) {
            return do_close();
        }
        if (ec) {
            if (ec != net::error::operation_aborted && ec != beast::error::timeout) {
                logger_->error("HttpServerSession " + id() + " read error: " + ec.message());
            }
            return do_close();
        }
        logger_->debug("HttpServerSession " + id() + " read " + std::to_string(bytes_transferred) +
                       " bytes, " + std::string(req_.method_string()) + " " + std::string(req_.target()));
        last_request_keep_alive_ = req_.keep_alive();
        handle_request(std::move(req_));
    }

    // Implemented in HttpServerSession.cpp
    void handle_request(http::request<http::string_body>&& req);

    // nullopt drops the request without a response.
    void send_response(std::optional<http::response<http::string_body>>&& opt_res);

    void do_write() {
        if (response_queue_.empty()) {
            write_in_progress_ = false;
            return;
        }
        if (!stream_.socket().is_open()) {
            logger_->error("HttpServerSession " + id() + " socket closed before write, dropping " +
                           std::to_string(response_queue_.size()) + " queued response(s).");
            response_queue_.clear();
            write_in_progress_ = false;
            return do_close();
        }

        write_in_progress_ = true;
        auto self = shared_from_this();
        auto response = response_queue_.front();

        current_write_op_completed_.store(false);
        write_stall_timer_.expires_after(WRITE_STALL_TIMEOUT);
        write_stall_timer_.async_wait([self](beast::error_code ec_timer) {
            if (self->current_write_op_completed_.load() || ec_timer == net::error::operation_aborted) {
                return;
            }
            if (ec_timer) {
                self->logger_->error("HttpServerSession " + self->id() + " write timer error: " + ec_timer.message());
                return;
            }
            self->logger_->error("HttpServerSession " + self->id() + " write stalled for " +
                                 std::to_string(WRITE_STALL_TIMEOUT.count()) + "s, closing socket.");
            boost::system::error_code close_ec;
            if (self->stream_.socket().is_open()) {
                self->stream_.socket().close(close_ec);
            }
        });

        http::async_write(stream_, *response,
                          beast::bind_front_handler(&HttpServerSession::on_write, self, response->keep_alive()));
    }

    void on_write(bool keep_alive, beast::error_code ec, std::size_t bytes_transferred) {
        const bool stalled = current_write_op_completed_.exchange(true);
        write_stall_timer_.cancel();

        if (stalled || ec) {
            if (ec && ec != net::error::operation_aborted) {
                logger_->error("HttpServerSession " + id() + " write error: " + ec.message());
            }
            response_queue_.clear();
            write_in_progress_ = false;
            return do_close();
        }

        logger_->debug("HttpServerSession " + id() + " wrote " + std::to_string(bytes_transferred) + " bytes.");
        if (!response_queue_.empty()) {
            response_queue_.pop_front();
        }
        if (!response_queue_.empty()) {
            return do_write();
        }
        write_in_progress_ = false;
        if (!keep_alive) {
            return do_close();
        }
        do_read();
    }

    void do_close() {
        current_write_op_completed_.store(true);
        write_stall_timer_.cancel();

        boost::system::error_code ec;
        if (stream_.socket().is_open()) {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
        if (ec && ec != beast::errc::not_connected) {
            logger_->debug("HttpServerSession " + id() + " shutdown: " + ec.message());
        }

        if (on_finish_callback_) {
            auto cb = std::move(on_finish_callback_);
            on_finish_callback_ = nullptr;
            net::dispatch(stream_.get_executor(), beast::bind_front_handler(std::move(cb), shared_from_this()));
        }
    }
};

#endif // HTTP_SERVER_SESSION_HPP
