#include <catch2/catch_test_macros.hpp>

#include <kfetch/crawl/media_extractor.hpp>

#include <set>
#include <string>

using namespace kfetch::crawl;

namespace {

RawAttachment att(std::string name, std::string path,
                  std::optional<std::string> server = "https://n1.kemono.su") {
    RawAttachment a;
    a.name = std::move(name);
    a.path = std::move(path);
    a.server = std::move(server);
    return a;
}

PostRecord post(std::vector<RawAttachment> attachments, std::string content = {}) {
    PostRecord p;
    p.id = "1001";
    p.creatorId = "42";
    p.service = "patreon";
    p.attachments = std::move(attachments);
    p.content = std::move(content);
    return p;
}

MediaExtractor extractor() {
    ExtractorOptions opts;
    opts.fallbackServer = "https://kemono.su";
    return MediaExtractor(opts);
}

const std::string kSha = "0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef";

} // namespace

TEST_CASE("MediaExtractor: URLs and order", "[crawl][extract]") {
    auto files = extractor().extract(post({att("cover.png", "/aa/bb/cover.png"),
                                           att("b.zip", "/data/cc/dd/b.zip", "https://n2.kemono.su/"),
                                           att("c.txt", "/ee/ff/c.txt", std::nullopt)}));
    REQUIRE(files.size() == 3);
    CHECK(files[0].url == "https://n1.kemono.su/data/aa/bb/cover.png");
    CHECK(files[0].host == "n1.kemono.su");
    CHECK(files[1].url == "https://n2.kemono.su/data/cc/dd/b.zip");
    CHECK(files[2].url == "https://kemono.su/data/ee/ff/c.txt");
    for (std::size_t i = 0; i < files.size(); ++i) {
        CHECK(files[i].index == i);
        CHECK(files[i].postId == "1001");
    }
    CHECK(files[0].filename == "cover.png");
}

TEST_CASE("MediaExtractor: duplicate names become unique", "[crawl][extract]") {
    SECTION("Two attachments named x.jpg") {
        auto files = extractor().extract(
            post({att("x.jpg", "/aa/bb/first.jpg"), att("x.jpg", "/cc/dd/second.jpg")}));
        REQUIRE(files.size() == 2);
        CHECK(files[0].filename == "x.jpg");
        CHECK(files[1].filename == "x_1.jpg");
    }

    SECTION("Collisions ignore case and padding follows the descriptor count") {
        std::vector<RawAttachment> atts;
        for (int i = 0; i < 11; ++i)
            atts.push_back(att(i == 10 ? "IMG.JPG" : "img.jpg", "/p/" + std::to_string(i) + ".jpg"));
        auto files = extractor().extract(post(atts));
        REQUIRE(files.size() == 11);
        CHECK(files[0].filename == "img.jpg");
        CHECK(files[1].filename == "img_01.jpg");
        CHECK(files[10].filename == "IMG_10.JPG");
        std::set<std::string> names;
        for (const auto& f : files)
            names.insert(f.filename);
        CHECK(names.size() == 11);
    }

    SECTION("Names are stable across extractions") {
        auto p = post({att("x.jpg", "/aa/1.jpg"), att("x.jpg", "/aa/2.jpg"), att("", "/aa/x.jpg")});
        auto first = extractor().extract(p);
        auto second = extractor().extract(p);
        REQUIRE(first.size() == second.size());
        for (std::size_t i = 0; i < first.size(); ++i)
            CHECK(first[i].filename == second[i].filename);
    }
}

TEST_CASE("MediaExtractor: filename fallbacks and sanitizing", "[crawl][extract]") {
    CHECK(MediaExtractor::sanitizeFilename("my file?.jpg") == "my_file.jpg");
    CHECK(MediaExtractor::sanitizeFilename("a/b\\c*d\"e<f>g|h") == "abcdefgh");
    CHECK(MediaExtractor::sanitizeFilename(std::string("tab\there")) == "tabhere");
    CHECK(MediaExtractor::sanitizeFilename("..").empty());
    CHECK(MediaExtractor::sanitizeFilename("///").empty());

    SECTION("Remote name missing: basename of the path") {
        auto files = extractor().extract(post({att("", "/aa/bb/photo%20one.png")}));
        REQUIRE(files.size() == 1);
        CHECK(files[0].filename == "photo_one.png");
    }

    SECTION("Nothing usable: the index") {
        auto files = extractor().extract(post({att("???", "/aa/bb/")}));
        REQUIRE(files.size() == 1);
        CHECK(files[0].filename == "0");
    }

    SECTION("Staging suffix is never a final name") {
        auto files = extractor().extract(post({att("video.part", "/aa/v.part")}));
        REQUIRE(files.size() == 1);
        CHECK(files[0].filename == "video.part_");
    }

    SECTION("Long names are capped and keep their extension") {
        ExtractorOptions opts;
        opts.fallbackServer = "https://kemono.su";
        opts.maxFilenameBytes = 20;
        auto files = MediaExtractor(opts).extract(post({att(std::string(50, 'a') + ".jpg", "/x.jpg")}));
        REQUIRE(files.size() == 1);
        CHECK(files[0].filename.size() <= 20);
        CHECK(files[0].filename.substr(files[0].filename.size() - 4) == ".jpg");
    }
}

TEST_CASE("MediaExtractor: checksums, sizes and duplicates", "[crawl][extract]") {
    auto a = att("pic.jpg", "/01/23/" + kSha + ".jpg");
    a.size = 777;
    auto files = extractor().extract(post({a, att("copy.jpg", "/01/23/" + kSha + ".jpg"),
                                           att("plain.jpg", "/aa/bb/plain.jpg")}));
    // Same URL listed twice: one descriptor
    REQUIRE(files.size() == 2);
    CHECK(files[0].expectedSha256 == std::optional<std::string>(kSha));
    CHECK(files[0].expectedBytes == std::optional<std::uint64_t>(777));
    CHECK_FALSE(files[1].expectedSha256.has_value());
    CHECK_FALSE(files[1].expectedBytes.has_value());
}

TEST_CASE("MediaExtractor: inline references in content", "[crawl][extract]") {
    const std::string content =
        R"(<p><img src="/data/aa/bb/inline.png?f=Inline%20Pic.png"></p>)"
        R"(<a href='https://n4.kemono.su/data/cc/dd/doc.pdf'>doc</a>)"
        R"(<a href="https://example.com/elsewhere.html">no</a>)"
        R"(<img src="https://n1.kemono.su/data/aa/bb/cover.png">)";

    SECTION("Appended after attachments, duplicates dropped") {
        auto files = extractor().extract(post({att("cover.png", "/aa/bb/cover.png")}, content));
        REQUIRE(files.size() == 3);
        CHECK(files[0].filename == "cover.png");
        CHECK(files[1].url == "https://kemono.su/data/aa/bb/inline.png");
        CHECK(files[1].filename == "Inline_Pic.png");
        CHECK(files[2].url == "https://n4.kemono.su/data/cc/dd/doc.pdf");
        CHECK(files[2].filename == "doc.pdf");
    }

    SECTION("Disabled") {
        ExtractorOptions opts;
        opts.fallbackServer = "https://kemono.su";
        opts.includeInline = false;
        auto files = MediaExtractor(opts).extract(post({}, content));
        CHECK(files.empty());
    }
}

TEST_CASE("MediaExtractor: long attribute values in content", "[crawl][extract]") {
    const std::string dataUri(200 * 1024, 'A');
    const std::string content = R"(<p><IMG SRC = "data:image/png;base64,)" + dataUri +
                                R"("></p><a href="/data/ab/cd/x.jpg">x</a><img src=")";

    auto files = extractor().extract(post({}, content));
    REQUIRE(files.size() == 1);
    CHECK(files[0].url == "https://kemono.su/data/ab/cd/x.jpg");
    CHECK(files[0].filename == "x.jpg");
}
