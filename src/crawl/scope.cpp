#include <kfetch/crawl/scope.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace kfetch::crawl {

using downloader::Error;
using downloader::ErrorCode;
using downloader::Expected;

namespace {

bool isDigits(std::string_view s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::optional<std::size_t> toSize(std::string_view s) {
    std::size_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

// -1, 0, 1 with numeric ordering for digit strings
int compareIds(std::string_view a, std::string_view b) {
    if (isDigits(a) && isDigits(b)) {
        auto strip = [](std::string_view s) {
            auto nz = s.find_first_not_of('0');
            return nz == std::string_view::npos ? std::string_view("0") : s.substr(nz);
        };
        a = strip(a);
        b = strip(b);
        if (a.size() != b.size())
            return a.size() < b.size() ? -1 : 1;
    }
    int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

} // namespace

bool PostFilter::matches(std::string_view postId) const {
    return compareIds(first, postId) <= 0 && compareIds(postId, last) <= 0;
}

Expected<CrawlScope> parseOffsetRange(std::string_view text, std::size_t pageSize) {
    text = trimView(text);
    CrawlScope scope;
    if (text.empty() || text == "all")
        return scope;

    auto invalid = [&text]() {
        return Error{ErrorCode::InvalidArgument,
                     "invalid range '" + std::string(text) +
                         "' (expected all, <offset>, <start>-<end>, start-<end> or <start>-end)"};
    };

    auto dash = text.find('-');
    if (dash == std::string_view::npos) {
        auto n = toSize(text);
        if (!n)
            return invalid();
        scope.startOffset = *n;
        scope.endOffset = *n + pageSize;
        return scope;
    }

    auto lhs = trimView(text.substr(0, dash));
    auto rhs = trimView(text.substr(dash + 1));
    if (lhs != "start") {
        auto n = toSize(lhs);
        if (!n)
            return invalid();
        scope.startOffset = *n;
    }
    if (rhs != "end") {
        auto n = toSize(rhs);
        if (!n)
            return invalid();
        scope.endOffset = *n;
    }
    if (scope.endOffset && *scope.endOffset <= scope.startOffset) {
        return Error{ErrorCode::InvalidArgument,
                     "invalid range '" + std::string(text) + "': end must be greater than start"};
    }
    return scope;
}

Expected<PostFilter> parsePostFilter(std::string_view text) {
    text = trimView(text);
    if (text.empty())
        return Error{ErrorCode::InvalidArgument, "empty post filter"};

    PostFilter filter;
    auto dash = text.find('-');
    if (dash == std::string_view::npos) {
        filter.first = filter.last = std::string(text);
        return filter;
    }
    auto a = trimView(text.substr(0, dash));
    auto b = trimView(text.substr(dash + 1));
    if (a.empty() || b.empty())
        return Error{ErrorCode::InvalidArgument,
                     "invalid post filter '" + std::string(text) + "' (expected <id> or <id1>-<id2>)"};
    if (compareIds(a, b) > 0)
        std::swap(a, b);
    filter.first = std::string(a);
    filter.last = std::string(b);
    return filter;
}

} // namespace kfetch::crawl
