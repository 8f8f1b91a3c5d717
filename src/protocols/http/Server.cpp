#include "protocols/http/Server.hpp"
#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "log/Registry.hpp"

using namespace tf::log;

namespace tf::http {

Server::Server(net::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<const Router> router)
    : acceptor_(ioc), router_(std::move(router)) {
    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.bind(endpoint, ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) throw beast::system_error(ec);
}

void Server::run() {
    const auto ep = acceptor_.local_endpoint();
    Registry::http()->info("[Server] Serving thumbnails on {}:{}", ep.address().to_string(), ep.port());
    do_accept();
}

void Server::stop() {
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) Registry::http()->warn("[Server] Error closing acceptor: {}", ec.message());
}

void Server::do_accept() {
    acceptor_.async_accept(net::make_strand(acceptor_.get_executor()),
                           [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (!ec) std::make_shared<Session>(std::move(socket), self->router_)->run();
        else Registry::http()->warn("[Server] Accept error: {}", ec.message());
        if (self->acceptor_.is_open()) self->do_accept();
    });
}

}
