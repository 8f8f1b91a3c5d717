#include <gtest/gtest.h>
#include "protocols/http/Router.hpp"
#include "thumb/Service.hpp"
#include "fakes.hpp"

#include <nlohmann/json.hpp>

using namespace tf::http;
using namespace tf::test;

class RouterTest : public ::testing::Test {
protected:
    InMemoryStore store;
    FakeDecoder decoder;
    CollectingSink sink;
    tf::thumb::Service service{tf::config::ThumbnailConfig{}, store, decoder, sink};
    Router router{service};

    static Request get(const std::string& target) {
        Request req{http::verb::get, target, 11};
        req.keep_alive(true);
        return req;
    }
};

TEST_F(RouterTest, UrlDecode) {
    EXPECT_EQ(Router::urlDecode("%2Fa%20b%3A%3Ac.png"), "/a b::c.png");
    EXPECT_EQ(Router::urlDecode("plain"), "plain");
    EXPECT_FALSE(Router::urlDecode("%2"));
    EXPECT_FALSE(Router::urlDecode("%zz"));
}

TEST_F(RouterTest, ServesStoredThumbnail) {
    store.save({"/lib/a b.jpg", bytesFor("/lib/a b.jpg"), 1, 0, tf::types::Category::File});

    const auto res = router.route(get("/thumb/%2Flib%2Fa%20b.jpg"));
    ASSERT_TRUE(std::holds_alternative<BinaryResponse>(res));
    const auto& ok = std::get<BinaryResponse>(res);
    EXPECT_EQ(ok.result(), http::status::ok);
    const auto type = ok[http::field::content_type];
    EXPECT_EQ(std::string(type.data(), type.size()), "image/jpeg");
    EXPECT_EQ(ok.body(), bytesFor("/lib/a b.jpg"));
}

TEST_F(RouterTest, MissingThumbnailIs404) {
    const auto res = router.route(get("/thumb/%2Fnope.jpg"));
    ASSERT_TRUE(std::holds_alternative<StringResponse>(res));
    EXPECT_EQ(std::get<StringResponse>(res).result(), http::status::not_found);
}

TEST_F(RouterTest, MalformedKeyIs400) {
    const auto res = router.route(get("/thumb/%G1"));
    EXPECT_EQ(std::get<StringResponse>(res).result(), http::status::bad_request);
}

TEST_F(RouterTest, StatsAsJson) {
    const auto res = router.route(get("/stats"));
    const auto& s = std::get<StringResponse>(res);
    EXPECT_EQ(s.result(), http::status::ok);
    const auto j = nlohmann::json::parse(s.body());
    EXPECT_TRUE(j.contains("memory_count"));
    EXPECT_TRUE(j.contains("queue_length"));
}

TEST_F(RouterTest, RejectsOtherMethodsAndPaths) {
    Request post{http::verb::post, "/stats", 11};
    EXPECT_EQ(std::get<StringResponse>(router.route(post)).result(), http::status::method_not_allowed);
    EXPECT_EQ(std::get<StringResponse>(router.route(get("/elsewhere"))).result(), http::status::not_found);
}
