#pragma once

#include <boost/beast/core.hpp>
#include <boost/asio.hpp>
#include <memory>

namespace tf::http {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class Router;

class Server : public std::enable_shared_from_this<Server> {
public:
    Server(net::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<const Router> router);

    void run();
    void stop();

    [[nodiscard]] tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    std::shared_ptr<const Router> router_;
};

}
