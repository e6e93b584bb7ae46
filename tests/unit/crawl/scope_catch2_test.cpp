#include <catch2/catch_test_macros.hpp>

#include <kfetch/crawl/scope.hpp>
#include <kfetch/crawl/types.hpp>

using namespace kfetch::crawl;
using kfetch::downloader::ErrorCode;

TEST_CASE("parseProfileUrl: creator targets", "[crawl][target]") {
    SECTION("Kemono profile") {
        auto t = parseProfileUrl("https://kemono.su/patreon/user/12345");
        REQUIRE(t.ok());
        CHECK(t.value().site == "kemono.su");
        CHECK(t.value().service == "patreon");
        CHECK(t.value().creatorId == "12345");
        CHECK(t.value().key() == "patreon/12345");
    }

    SECTION("Coomer profile with trailing path and query") {
        auto t = parseProfileUrl("https://Coomer.su/onlyfans/user/some.creator/post/9?o=50");
        REQUIRE(t.ok());
        CHECK(t.value().site == "coomer.su");
        CHECK(t.value().service == "onlyfans");
        CHECK(t.value().creatorId == "some.creator");
    }

    SECTION("Rejected URLs") {
        CHECK_FALSE(parseProfileUrl("kemono.su/patreon/user/1").ok());
        CHECK_FALSE(parseProfileUrl("ftp://kemono.su/patreon/user/1").ok());
        CHECK_FALSE(parseProfileUrl("https://kemono.su/patreon/1").ok());
        CHECK_FALSE(parseProfileUrl("https://kemono.su/patreon/user").ok());
        CHECK_FALSE(parseProfileUrl("https://kemono.su").ok());
        auto bad = parseProfileUrl("https://kemono.su/../user/1");
        REQUIRE_FALSE(bad.ok());
        CHECK(bad.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("isSafePathComponent and finalPathFor", "[crawl][paths]") {
    CHECK(isSafePathComponent("1001"));
    CHECK(isSafePathComponent("image_01.jpg"));
    CHECK(isSafePathComponent("名前.png"));
    CHECK_FALSE(isSafePathComponent(""));
    CHECK_FALSE(isSafePathComponent("."));
    CHECK_FALSE(isSafePathComponent(".."));
    CHECK_FALSE(isSafePathComponent("a/b"));
    CHECK_FALSE(isSafePathComponent("a\\b"));
    CHECK_FALSE(isSafePathComponent("c:x"));
    CHECK_FALSE(isSafePathComponent(std::string("a\nb")));

    CreatorTarget target{"kemono.su", "patreon", "42"};
    CHECK(finalPathFor("/out", target, "1001", "a.jpg") ==
          std::filesystem::path("/out/patreon/42/1001/a.jpg"));
}

TEST_CASE("parseOffsetRange: listing windows", "[crawl][scope]") {
    SECTION("All") {
        for (const char* text : {"all", "", "  all "}) {
            auto s = parseOffsetRange(text, 50);
            REQUIRE(s.ok());
            CHECK(s.value().startOffset == 0);
            CHECK_FALSE(s.value().endOffset.has_value());
        }
    }

    SECTION("Single offset covers one page") {
        auto s = parseOffsetRange("100", 50);
        REQUIRE(s.ok());
        CHECK(s.value().startOffset == 100);
        REQUIRE(s.value().endOffset.has_value());
        CHECK(*s.value().endOffset == 150);
        CHECK(s.value().containsOffset(100));
        CHECK(s.value().containsOffset(149));
        CHECK_FALSE(s.value().containsOffset(150));
        CHECK_FALSE(s.value().containsOffset(99));
    }

    SECTION("Explicit and open bounds") {
        auto a = parseOffsetRange("50-200", 50);
        REQUIRE(a.ok());
        CHECK(a.value().startOffset == 50);
        CHECK(*a.value().endOffset == 200);

        auto b = parseOffsetRange("start-100", 50);
        REQUIRE(b.ok());
        CHECK(b.value().startOffset == 0);
        CHECK(*b.value().endOffset == 100);

        auto c = parseOffsetRange("150-end", 50);
        REQUIRE(c.ok());
        CHECK(c.value().startOffset == 150);
        CHECK_FALSE(c.value().endOffset.has_value());
    }

    SECTION("Invalid ranges") {
        CHECK_FALSE(parseOffsetRange("abc", 50).ok());
        CHECK_FALSE(parseOffsetRange("10-x", 50).ok());
        CHECK_FALSE(parseOffsetRange("-5", 50).ok());
        auto empty = parseOffsetRange("100-100", 50);
        REQUIRE_FALSE(empty.ok());
        CHECK(empty.error().code == ErrorCode::InvalidArgument);
        CHECK_FALSE(parseOffsetRange("200-100", 50).ok());
    }
}

TEST_CASE("parsePostFilter: ids and id ranges", "[crawl][scope]") {
    SECTION("Single id") {
        auto f = parsePostFilter("1001");
        REQUIRE(f.ok());
        CHECK(f.value().matches("1001"));
        CHECK_FALSE(f.value().matches("1002"));
    }

    SECTION("Numeric range compares numerically") {
        auto f = parsePostFilter("90-1000");
        REQUIRE(f.ok());
        CHECK(f.value().matches("90"));
        CHECK(f.value().matches("500"));
        CHECK(f.value().matches("1000"));
        CHECK_FALSE(f.value().matches("89"));
        CHECK_FALSE(f.value().matches("1001"));
    }

    SECTION("Reversed bounds are swapped") {
        auto f = parsePostFilter("1000-90");
        REQUIRE(f.ok());
        CHECK(f.value().first == "90");
        CHECK(f.value().last == "1000");
    }

    SECTION("Invalid filters") {
        CHECK_FALSE(parsePostFilter("").ok());
        CHECK_FALSE(parsePostFilter("5-").ok());
        CHECK_FALSE(parsePostFilter("-5").ok());
    }
}
