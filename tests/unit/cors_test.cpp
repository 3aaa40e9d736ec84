#include <courier/fetch/cors.h>
#include <courier/fetch/cors_cache.h>
#include <courier/fetch/request.h>

#include <gtest/gtest.h>

#include <atomic>
#include <limits>
#include <thread>
#include <vector>

using namespace courier;
using namespace courier::fetch;

namespace {

url::URL U(const std::string& s) {
    return *url::parse(s);
}

Request cors_request(const std::string& target = "http://api.test/data",
                     const std::string& origin = "http://app.test/") {
    Request request(U(target), U(origin).origin());
    request.mode = RequestMode::Cors;
    return request;
}

net::HeaderMap headers(std::initializer_list<std::pair<std::string, std::string>> entries) {
    net::HeaderMap map;
    for (const auto& [name, value] : entries) {
        map.append(name, value);
    }
    return map;
}

} // namespace

// ===========================================================================
// Safelists
// ===========================================================================

TEST(CorsSafelistTest, RequestHeaders) {
    EXPECT_TRUE(cors::is_cors_safelisted_request_header("Accept", "text/html"));
    EXPECT_TRUE(cors::is_cors_safelisted_request_header("Content-Language", "en"));
    EXPECT_TRUE(cors::is_cors_safelisted_request_header("Content-Type", "text/plain; charset=utf-8"));
    EXPECT_FALSE(cors::is_cors_safelisted_request_header("Content-Type", "application/json"));
    EXPECT_FALSE(cors::is_cors_safelisted_request_header("X-Custom", "1"));
    EXPECT_FALSE(cors::is_cors_safelisted_request_header("Accept", std::string(129, 'a')));
}

TEST(CorsSafelistTest, UnsafeNamesSortedAndUnique) {
    auto map = headers({{"X-B", "1"}, {"Accept", "*/*"}, {"x-a", "2"}, {"X-b", "3"},
                        {"Content-Type", "application/json"}});
    auto names = cors::unsafe_request_header_names(map);
    EXPECT_EQ(names, (std::vector<std::string>{"content-type", "x-a", "x-b"}));
}

TEST(CorsSafelistTest, ResponseHeaders) {
    EXPECT_TRUE(cors::is_cors_safelisted_response_header("Content-Type"));
    EXPECT_TRUE(cors::is_cors_safelisted_response_header("expires"));
    EXPECT_FALSE(cors::is_cors_safelisted_response_header("Date"));
    EXPECT_TRUE(cors::is_forbidden_response_header("Set-Cookie"));
    EXPECT_TRUE(cors::is_forbidden_response_header("set-cookie2"));
    EXPECT_FALSE(cors::is_forbidden_response_header("Cookie"));
}

TEST(CorsSafelistTest, ExposedHeaderNames) {
    auto map = headers({{"Access-Control-Expose-Headers", "X-One, x-two"},
                        {"Access-Control-Expose-Headers", "X-Three"}});
    EXPECT_EQ(cors::exposed_header_names(map),
              (std::vector<std::string>{"x-one", "x-two", "x-three"}));
    EXPECT_TRUE(cors::exposed_header_names(net::HeaderMap{}).empty());
}

TEST(CorsSafelistTest, MaxAge) {
    EXPECT_EQ(cors::parse_max_age(headers({{"Access-Control-Max-Age", " 600 "}})), 600u);
    EXPECT_FALSE(cors::parse_max_age(headers({{"Access-Control-Max-Age", "-1"}})).has_value());
    EXPECT_FALSE(cors::parse_max_age(headers({{"Access-Control-Max-Age", "10s"}})).has_value());
    EXPECT_FALSE(cors::parse_max_age(net::HeaderMap{}).has_value());
}

// ===========================================================================
// cors_check
// ===========================================================================

TEST(CorsCheckTest, WildcardWithoutCredentials) {
    auto request = cors_request();
    EXPECT_TRUE(cors::cors_check(request, headers({{"Access-Control-Allow-Origin", "*"}})));

    request.credentials_mode = CredentialsMode::Include;
    EXPECT_FALSE(cors::cors_check(request, headers({{"Access-Control-Allow-Origin", "*"},
                                                    {"Access-Control-Allow-Credentials", "true"}})));
}

TEST(CorsCheckTest, ExactOriginMatch) {
    auto request = cors_request();
    EXPECT_TRUE(cors::cors_check(request, headers({{"Access-Control-Allow-Origin", "http://app.test"}})));
    EXPECT_TRUE(cors::cors_check(request, headers({{"Access-Control-Allow-Origin", "HTTP://APP.TEST"}})));
    EXPECT_FALSE(cors::cors_check(request, headers({{"Access-Control-Allow-Origin", "http://evil.test"}})));
    EXPECT_FALSE(cors::cors_check(request, headers({{"Access-Control-Allow-Origin", "http://app.test/"}})));
    EXPECT_FALSE(cors::cors_check(request, headers({{"Access-Control-Allow-Origin", "http://app.test:8080"}})));
}

TEST(CorsCheckTest, MissingOrRepeatedHeaderFails) {
    auto request = cors_request();
    EXPECT_FALSE(cors::cors_check(request, net::HeaderMap{}));
    EXPECT_FALSE(cors::cors_check(request, headers({{"Access-Control-Allow-Origin", "*"},
                                                    {"Access-Control-Allow-Origin", "*"}})));
    EXPECT_FALSE(cors::cors_check(request, headers({{"Access-Control-Allow-Origin",
                                                     "http://app.test, http://other.test"}})));
}

TEST(CorsCheckTest, OpaqueOriginMatchesNull) {
    Request request(U("http://api.test/"));
    request.mode = RequestMode::Cors;
    EXPECT_TRUE(cors::cors_check(request, headers({{"Access-Control-Allow-Origin", "null"}})));
}

TEST(CorsCheckTest, CredentialsNeedAllowCredentials) {
    auto request = cors_request();
    request.credentials_mode = CredentialsMode::Include;
    EXPECT_FALSE(cors::cors_check(request, headers({{"Access-Control-Allow-Origin", "http://app.test"}})));
    EXPECT_FALSE(cors::cors_check(request, headers({{"Access-Control-Allow-Origin", "http://app.test"},
                                                    {"Access-Control-Allow-Credentials", "TRUE"}})));
    EXPECT_TRUE(cors::cors_check(request, headers({{"Access-Control-Allow-Origin", "http://app.test"},
                                                   {"Access-Control-Allow-Credentials", "true"}})));
}

// ===========================================================================
// CorsCache
// ===========================================================================

class CorsCacheTest : public ::testing::Test {
protected:
    CorsCacheTest()
        : now_(std::chrono::system_clock::time_point{} + std::chrono::hours(1000)),
          cache_([this]() { return now_; }) {}

    void advance(std::chrono::seconds by) { now_ += by; }

    std::chrono::system_clock::time_point now_;
    CorsCache cache_;
};

TEST_F(CorsCacheTest, EmptyCacheMatchesNothing) {
    auto request = cors_request();
    EXPECT_FALSE(cache_.match_method(request, "PUT"));
    EXPECT_FALSE(cache_.match_header(request, "x-custom"));
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(CorsCacheTest, InsertThenMatch) {
    auto request = cors_request();
    cache_.insert(request, 60, {"PUT", "DELETE"}, {"X-Custom"});

    EXPECT_TRUE(cache_.match_method(request, "PUT"));
    EXPECT_TRUE(cache_.match_method(request, "DELETE"));
    EXPECT_FALSE(cache_.match_method(request, "PATCH"));
    EXPECT_TRUE(cache_.match_header(request, "x-custom"));
    EXPECT_TRUE(cache_.match_header(request, "X-CUSTOM"));
    EXPECT_EQ(cache_.size(), 3u);
}

TEST_F(CorsCacheTest, MethodsAreCaseSensitive) {
    auto request = cors_request();
    cache_.insert(request, 60, {"PUT"}, {});
    EXPECT_FALSE(cache_.match_method(request, "put"));
}

TEST_F(CorsCacheTest, EntriesExpire) {
    auto request = cors_request();
    cache_.insert(request, 10, {"PUT"}, {"x-custom"});

    advance(std::chrono::seconds(9));
    EXPECT_TRUE(cache_.match_method(request, "PUT"));

    advance(std::chrono::seconds(1));
    EXPECT_FALSE(cache_.match_method(request, "PUT"));
    EXPECT_FALSE(cache_.match_header(request, "x-custom"));
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(CorsCacheTest, HugeMaxAgeIsClamped) {
    auto request = cors_request();
    cache_.insert(request, std::numeric_limits<uint64_t>::max(), {"PUT"}, {"x-custom"});
    EXPECT_TRUE(cache_.match_method(request, "PUT"));

    advance(std::chrono::seconds(7199));
    EXPECT_TRUE(cache_.match_header(request, "x-custom"));

    advance(std::chrono::seconds(1));
    EXPECT_FALSE(cache_.match_method(request, "PUT"));
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(CorsCacheTest, InsertRefreshesExpiry) {
    auto request = cors_request();
    cache_.insert(request, 10, {"PUT"}, {});
    advance(std::chrono::seconds(8));
    cache_.insert(request, 10, {"PUT"}, {});
    advance(std::chrono::seconds(8));
    EXPECT_TRUE(cache_.match_method(request, "PUT"));
}

TEST_F(CorsCacheTest, KeyedByOriginAndUrl) {
    auto request = cors_request();
    cache_.insert(request, 60, {"PUT"}, {});

    EXPECT_FALSE(cache_.match_method(cors_request("http://api.test/other"), "PUT"));
    EXPECT_FALSE(cache_.match_method(cors_request("http://api.test/data", "http://else.test/"), "PUT"));
    EXPECT_TRUE(cache_.match_method(cors_request(), "PUT"));
}

TEST_F(CorsCacheTest, CredentialedEntryCoversAnonymousRequest) {
    auto credentialed = cors_request();
    credentialed.credentials_mode = CredentialsMode::Include;
    cache_.insert(credentialed, 60, {"PUT"}, {});

    auto anonymous = cors_request();
    EXPECT_TRUE(cache_.match_method(anonymous, "PUT"));
    EXPECT_TRUE(cache_.match_method(credentialed, "PUT"));
}

TEST_F(CorsCacheTest, AnonymousEntryDoesNotCoverCredentialedRequest) {
    cache_.insert(cors_request(), 60, {"PUT"}, {});

    auto credentialed = cors_request();
    credentialed.credentials_mode = CredentialsMode::Include;
    EXPECT_FALSE(cache_.match_method(credentialed, "PUT"));
}

TEST_F(CorsCacheTest, RemoveDropsBothCredentialModes) {
    auto credentialed = cors_request();
    credentialed.credentials_mode = CredentialsMode::Include;
    cache_.insert(credentialed, 60, {"PUT"}, {});
    cache_.insert(cors_request(), 60, {"DELETE"}, {});
    cache_.insert(cors_request("http://api.test/kept"), 60, {"PUT"}, {});

    cache_.remove(cors_request());
    EXPECT_FALSE(cache_.match_method(cors_request(), "PUT"));
    EXPECT_FALSE(cache_.match_method(cors_request(), "DELETE"));
    EXPECT_TRUE(cache_.match_method(cors_request("http://api.test/kept"), "PUT"));
    EXPECT_EQ(cache_.size(), 1u);

    cache_.clear();
    EXPECT_EQ(cache_.size(), 0u);
}

TEST(CorsCacheConcurrencyTest, ConcurrentInsertAndMatch) {
    CorsCache cache;
    std::atomic<int> matched{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, &matched, t]() {
            auto request = cors_request("http://api.test/" + std::to_string(t));
            for (int i = 0; i < 100; ++i) {
                cache.insert(request, 60, {"PUT"}, {"x-" + std::to_string(i)});
                if (cache.match_header(request, "x-" + std::to_string(i))) {
                    matched.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(matched.load(), 800);
    EXPECT_EQ(cache.size(), 8u * 101u);
}
