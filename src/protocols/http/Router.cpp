#include "protocols/http/Router.hpp"
#include "thumb/Service.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace tf::http;
using namespace tf::log;

namespace {

constexpr std::string_view THUMB_PREFIX = "/thumb/";

int hexValue(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}

Router::Router(thumb::Service& service) : service_(service) {}

std::optional<std::string> Router::urlDecode(const std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size()) return std::nullopt;
        const int hi = hexValue(in[i + 1]);
        const int lo = hexValue(in[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<char>(hi << 4 | lo));
        i += 2;
    }
    return out;
}

StringResponse Router::makeTextResponse(const Request& req, const http::status status, const std::string& body) {
    StringResponse res{status, req.version()};
    res.set(http::field::content_type, "text/plain");
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

Response Router::route(const Request& req) const {
    if (req.method() != http::verb::get)
        return makeTextResponse(req, http::status::method_not_allowed, "Only GET is supported");

    const auto raw = req.target();
    std::string_view target(raw.data(), raw.size());
    if (const auto q = target.find('?'); q != std::string_view::npos) target = target.substr(0, q);

    if (target.starts_with(THUMB_PREFIX)) return handleThumb(req, target.substr(THUMB_PREFIX.size()));
    if (target == "/stats") return handleStats(req);

    return makeTextResponse(req, http::status::not_found, "Not found");
}

Response Router::handleThumb(const Request& req, const std::string_view encodedKey) const {
    const auto key = urlDecode(encodedKey);
    if (!key || key->empty()) return makeTextResponse(req, http::status::bad_request, "Invalid thumbnail key");

    auto bytes = service_.lookupThumbnail(*key);
    if (!bytes) {
        Registry::http()->debug("[Router] No thumbnail for {}", *key);
        return makeTextResponse(req, http::status::not_found, "Thumbnail not found");
    }

    BinaryResponse res{http::status::ok, req.version()};
    res.set(http::field::content_type, "image/jpeg");
    res.set(http::field::cache_control, "no-cache");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(*bytes);
    res.prepare_payload();
    return res;
}

Response Router::handleStats(const Request& req) const {
    const nlohmann::json j = service_.getCacheStats();

    StringResponse res{http::status::ok, req.version()};
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = j.dump();
    res.prepare_payload();
    return res;
}
