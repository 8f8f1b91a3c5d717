#include "protocols/http/Session.hpp"
#include "log/Registry.hpp"

using namespace tf::log;

namespace tf::http {

Session::Session(tcp::socket socket, std::shared_ptr<const Router> router)
    : socket_(std::move(socket)), router_(std::move(router)) { buffer_.max_size(8192); }

void Session::run() {
    do_read();
}

void Session::do_read() {
    auto self = shared_from_this();

    req_ = {};
    http::async_read(socket_, buffer_, req_,
                     [self](beast::error_code ec, std::size_t bytes) {
                         self->on_read(ec, bytes);
                     });
}

void Session::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == http::error::end_of_stream) return do_close();

    if (ec) {
        Registry::http()->debug("[Session] Read error: {}", ec.message());
        return;
    }

    Registry::http()->debug("[Session] Read {} bytes: {}", bytes, std::string(req_.target().data(), req_.target().size()));

    auto self = shared_from_this();

    try {
        auto res = router_->route(req_);

        std::visit([self](auto&& response) {
            using T = std::decay_t<decltype(response)>;
            const bool close = response.need_eof();
            auto msg = std::make_shared<T>(std::forward<decltype(response)>(response));
            http::async_write(self->socket_, *msg,
                              [self, msg, close](beast::error_code ec, std::size_t bytes) {
                                  self->on_write(close, ec, bytes);
                              });
        }, std::move(res));
    } catch (const std::exception& e) {
        Registry::http()->error("[Session] Exception during request handling: {}", e.what());

        auto err = std::make_shared<StringResponse>(
            Router::makeTextResponse(req_, http::status::internal_server_error, "Internal server error"));
        http::async_write(socket_, *err,
            [self, err](beast::error_code ec, std::size_t bytes) {
                self->on_write(true, ec, bytes);
            });
    }
}

void Session::on_write(const bool close, beast::error_code ec, const std::size_t) {
    if (ec) {
        Registry::http()->debug("[Session] Write error: {}", ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void Session::do_close() {
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected)
        Registry::http()->debug("[Session] Shutdown error: {}", ec.message());
}

}
