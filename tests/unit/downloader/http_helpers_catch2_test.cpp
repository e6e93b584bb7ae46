#include <catch2/catch_test_macros.hpp>

#include <kfetch/downloader/downloader.hpp>

#include "common/fake_site.h"

#include <chrono>
#include <string>

using namespace kfetch::downloader;
using kfetch::test::FakeSite;
using namespace std::chrono_literals;

TEST_CASE("hostOf: authority extraction", "[downloader][http]") {
    CHECK(hostOf("https://n1.kemono.su/data/ab/cd/file.jpg") == "n1.kemono.su");
    CHECK(hostOf("https://N2.Kemono.SU:8443/data/x") == "n2.kemono.su");
    CHECK(hostOf("http://user:pw@proxy.local:3128") == "proxy.local");
    CHECK(hostOf("https://kemono.su?o=50") == "kemono.su");
    CHECK(hostOf("https://[::1]:8080/data") == "[::1]");
    CHECK(hostOf("/data/ab/cd/file.jpg").empty());
    CHECK(hostOf("").empty());
}

TEST_CASE("fetchText: whole body or the adapter's error", "[downloader][http]") {
    FakeSite site;
    auto& post = site.addPost("1001", "hello");
    const auto url = site.addFile(post, "note.txt", "some text body");

    SECTION("Collects the body") {
        auto body = fetchText(site, url, {}, RequestOptions{});
        REQUIRE(body.ok());
        CHECK(body.value() == "some text body");
    }

    SECTION("Propagates HTTP errors with their status") {
        auto body = fetchText(site, "https://n1.kemono.test/data/missing", {}, RequestOptions{});
        REQUIRE_FALSE(body.ok());
        CHECK(body.error().code == ErrorCode::ClientError);
        REQUIRE(body.error().httpStatus.has_value());
        CHECK(*body.error().httpStatus == 404);
    }

    SECTION("Sends the given headers") {
        std::vector<Header> headers{{"Cookie", "session=abc"}};
        REQUIRE(fetchText(site, url, headers, RequestOptions{}).ok());
        auto seen = site.lastHeaders();
        REQUIRE(seen.size() == 1);
        CHECK(seen[0].name == "Cookie");
        CHECK(seen[0].value == "session=abc");
    }
}

TEST_CASE("IntegrityVerifier: SHA-256", "[downloader][integrity]") {
    auto v = makeIntegrityVerifierSha256();
    const std::string abc = "abc";

    SECTION("Known digest") {
        v->update(std::as_bytes(std::span<const char>(abc.data(), abc.size())));
        CHECK(v->finalize().hex ==
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    SECTION("Incremental updates match a single update") {
        v->update(std::as_bytes(std::span<const char>(abc.data(), 1)));
        v->update(std::as_bytes(std::span<const char>(abc.data() + 1, 2)));
        CHECK(v->finalize().hex == kfetch::test::sha256Hex("abc"));
    }

    SECTION("Reset discards earlier input") {
        v->update(std::as_bytes(std::span<const char>(abc.data(), abc.size())));
        v->reset();
        CHECK(v->finalize().hex ==
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    }
}

TEST_CASE("RateLimiter: token buckets", "[downloader][ratelimit]") {
    auto limiter = makeRateLimiter();

    SECTION("Unlimited never waits") {
        limiter->setLimits(RateLimit{});
        const auto start = std::chrono::steady_clock::now();
        for (int i = 0; i < 100; ++i)
            limiter->acquire("n1.kemono.test", 1 << 20, {});
        CHECK(std::chrono::steady_clock::now() - start < 500ms);
    }

    SECTION("Global limit paces transfers after the initial burst") {
        limiter->setLimits(RateLimit{10000, 0});
        const auto start = std::chrono::steady_clock::now();
        limiter->acquire("a", 10000, {}); // burst
        limiter->acquire("a", 2000, {});  // ~200 ms of refill
        CHECK(std::chrono::steady_clock::now() - start >= 150ms);
    }

    SECTION("Cancel returns early") {
        limiter->setLimits(RateLimit{1000, 0});
        limiter->acquire("a", 1000, {});
        const auto start = std::chrono::steady_clock::now();
        limiter->acquire("a", 1000, [] { return true; });
        CHECK(std::chrono::steady_clock::now() - start < 500ms);
    }
}
