#pragma once

#include <boost/beast/http.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tf::thumb { class Service; }

namespace tf::http {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using StringResponse = http::response<http::string_body>;
using BinaryResponse = http::response<http::vector_body<uint8_t>>;
using Response = std::variant<StringResponse, BinaryResponse>;

// GET /thumb/{url-encoded key} -> image/jpeg, GET /stats -> JSON
class Router {
public:
    explicit Router(thumb::Service& service);

    Response route(const Request& req) const;

    // Percent-decoding; '+' is left as-is. nullopt on malformed escapes.
    static std::optional<std::string> urlDecode(std::string_view in);

    static StringResponse makeTextResponse(const Request& req, http::status status, const std::string& body);

private:
    thumb::Service& service_;

    Response handleThumb(const Request& req, std::string_view encodedKey) const;
    Response handleStats(const Request& req) const;
};

}
