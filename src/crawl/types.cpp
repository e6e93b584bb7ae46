#include <kfetch/crawl/types.hpp>

#include <algorithm>
#include <cctype>

namespace kfetch::crawl {

bool isSafePathComponent(std::string_view s) noexcept {
    if (s.empty() || s == "." || s == "..")
        return false;
    return std::none_of(s.begin(), s.end(), [](char ch) {
        auto c = static_cast<unsigned char>(ch);
        return c < 0x20 || c == 0x7f || c == '/' || c == '\\' || c == ':';
    });
}

Expected<CreatorTarget> parseProfileUrl(std::string_view url) {
    auto fail = [&url](const char* why) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("invalid profile URL '") + std::string(url) + "': " + why};
    };

    auto scheme = url.find("://");
    if (scheme == std::string_view::npos)
        return fail("missing scheme");
    std::string schemeLower;
    for (char c : url.substr(0, scheme))
        schemeLower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (schemeLower != "https" && schemeLower != "http")
        return fail("scheme must be http or https");

    CreatorTarget target;
    target.site = downloader::hostOf(url);
    if (target.site.empty())
        return fail("missing host");

    auto rest = url.substr(scheme + 3);
    auto slash = rest.find('/');
    if (slash == std::string_view::npos)
        return fail("expected /<service>/user/<id>");
    auto path = rest.substr(slash + 1);
    if (auto q = path.find_first_of("?#"); q != std::string_view::npos)
        path = path.substr(0, q);

    std::vector<std::string_view> parts;
    while (!path.empty()) {
        auto next = path.find('/');
        auto part = path.substr(0, next);
        if (!part.empty())
            parts.push_back(part);
        if (next == std::string_view::npos)
            break;
        path = path.substr(next + 1);
    }

    if (parts.size() < 3 || parts[1] != "user")
        return fail("expected /<service>/user/<id>");
    target.service = std::string(parts[0]);
    target.creatorId = std::string(parts[2]);
    if (!isSafePathComponent(target.service) || !isSafePathComponent(target.creatorId))
        return fail("service or creator id is not a valid name");
    return target;
}

std::filesystem::path finalPathFor(const std::filesystem::path& root, const CreatorTarget& target,
                                   std::string_view postId, std::string_view filename) {
    return root / target.service / target.creatorId / std::string(postId) / std::string(filename);
}

} // namespace kfetch::crawl
