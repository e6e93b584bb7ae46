#include <kfetch/downloader/downloader.hpp>

#include <cctype>

namespace kfetch::downloader {

std::string hostOf(std::string_view url) {
    auto scheme = url.find("://");
    if (scheme == std::string_view::npos)
        return {};
    auto rest = url.substr(scheme + 3);
    auto end = rest.find_first_of("/?#");
    auto authority = rest.substr(0, end);
    // Drop userinfo
    if (auto at = authority.rfind('@'); at != std::string_view::npos)
        authority = authority.substr(at + 1);
    // Drop port (IPv6 literals keep their brackets)
    if (!authority.empty() && authority.front() == '[') {
        if (auto close = authority.find(']'); close != std::string_view::npos)
            authority = authority.substr(0, close + 1);
    } else if (auto colon = authority.find(':'); colon != std::string_view::npos) {
        authority = authority.substr(0, colon);
    }
    std::string out;
    out.reserve(authority.size());
    for (unsigned char c : authority)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

Expected<std::string> fetchText(IHttpAdapter& http, std::string_view url,
                                const std::vector<Header>& headers, const RequestOptions& options,
                                const ShouldCancel& shouldCancel) {
    std::string body;
    auto onResponse = [&body](const ResponseInfo& info) -> Expected<void> {
        body.clear();
        if (info.contentLength && *info.contentLength < (64ull << 20))
            body.reserve(static_cast<std::size_t>(*info.contentLength));
        return {};
    };
    auto sink = [&body](std::span<const std::byte> data) -> Expected<void> {
        body.append(reinterpret_cast<const char*>(data.data()), data.size());
        return {};
    };
    auto r = http.get(url, headers, 0, options, onResponse, sink, shouldCancel);
    if (!r.ok())
        return r.error();
    return body;
}

} // namespace kfetch::downloader
