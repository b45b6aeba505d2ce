#include "HttpServerSession.hpp"

#include <iterator>

#include <boost/asio/post.hpp>

#include "CacheAdminService.hpp"

void HttpServerSession::handle_request(http::request<http::string_body>&& req) {
    if (!admin_service_) {
        logger_->error("HttpServerSession " + id() + ": admin service is null.");
        http::response<http::string_body> res{http::status::internal_server_error, req.version()};
        res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        res.set(http::field::content_type, "application/json");
        res.keep_alive(req.keep_alive());
        res.body() = R"({"success": false, "error": "Service not available"})";
        res.prepare_payload();
        return send_response(std::move(res));
    }

    // The service answers from a worker thread; hop back onto the stream's executor
    // before touching the session.
    admin_service_->processRequest(std::move(req),
        [self = shared_from_this()](std::optional<http::response<http::string_body>> opt_res) {
            net::post(self->stream_.get_executor(),
                      [self, res = std::move(opt_res)]() mutable {
                          self->send_response(std::move(res));
                      });
        });
}

void HttpServerSession::send_response(std::optional<http::response<http::string_body>>&& opt_res) {
    if (!opt_res) {
        logger_->warn("HttpServerSession " + id() + " request dropped without a response.");
        if (write_in_progress_) {
            return;
        }
        return last_request_keep_alive_ ? do_read() : do_close();
    }

    if (response_queue_.size() >= config_.max_response_queue_size) {
        // The front response may be mid-write; drop the oldest one behind it instead.
        auto victim = write_in_progress_ ? std::next(response_queue_.begin()) : response_queue_.begin();
        if (victim != response_queue_.end()) {
            logger_->warn("HttpServerSession " + id() + " response queue full (" +
                          std::to_string(response_queue_.size()) + "), discarding oldest response (status " +
                          std::to_string((*victim)->result_int()) + ").");
            response_queue_.erase(victim);
        }
    }

    response_queue_.push_back(std::make_shared<http::response<http::string_body>>(std::move(*opt_res)));
    if (!write_in_progress_) {
        do_write();
    }
}
