#include <kfetch/crawl/media_extractor.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <utility>

namespace kfetch::crawl {

namespace {

struct Candidate {
    std::string url;
    std::string name; // remote name, unsanitized
    std::string path;
    std::optional<std::uint64_t> size;
};

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isAbsoluteUrl(std::string_view s) {
    return s.rfind("https://", 0) == 0 || s.rfind("http://", 0) == 0;
}

std::string_view stripQuery(std::string_view s) {
    auto q = s.find_first_of("?#");
    return q == std::string_view::npos ? s : s.substr(0, q);
}

std::string_view basenameOf(std::string_view path) {
    path = stripQuery(path);
    auto slash = path.find_last_of('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

std::string joinServer(std::string_view server, std::string_view path) {
    std::string out(server);
    while (!out.empty() && out.back() == '/')
        out.pop_back();
    if (path.rfind("/data/", 0) != 0)
        out += "/data";
    if (path.empty() || path.front() != '/')
        out.push_back('/');
    out.append(path);
    return out;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string percentDecode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i] == '+' ? ' ' : s[i]);
    }
    return out;
}

// "?f=<name>" on inline links carries the original file name
std::string queryFileName(std::string_view url) {
    auto q = url.find('?');
    if (q == std::string_view::npos)
        return {};
    auto query = url.substr(q + 1);
    if (auto hash = query.find('#'); hash != std::string_view::npos)
        query = query.substr(0, hash);
    while (!query.empty()) {
        auto amp = query.find('&');
        auto param = query.substr(0, amp);
        if (param.rfind("f=", 0) == 0)
            return percentDecode(param.substr(2));
        if (amp == std::string_view::npos)
            break;
        query = query.substr(amp + 1);
    }
    return {};
}

std::optional<std::string> sha256FromPath(std::string_view path) {
    auto base = basenameOf(path);
    auto dot = base.find('.');
    auto stem = base.substr(0, dot);
    if (stem.size() != 64)
        return std::nullopt;
    if (!std::all_of(stem.begin(), stem.end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; }))
        return std::nullopt;
    return toLower(stem);
}

std::pair<std::string, std::string> splitExtension(const std::string& name) {
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0)
        return {name, std::string()};
    return {name.substr(0, dot), name.substr(dot)};
}

std::string padIndex(std::size_t index, std::size_t width) {
    std::string digits = std::to_string(index);
    if (digits.size() < width)
        digits.insert(0, width - digits.size(), '0');
    return digits;
}

std::size_t digitCount(std::size_t n) {
    std::size_t d = 1;
    while (n >= 10) {
        n /= 10;
        ++d;
    }
    return d;
}

// Cut to at most `limit` bytes without splitting a UTF-8 sequence, keeping the extension
std::string capLength(const std::string& name, std::size_t limit) {
    if (limit == 0 || name.size() <= limit)
        return name;
    auto [stem, ext] = splitExtension(name);
    if (ext.size() >= limit / 2)
        ext.clear();
    std::size_t keep = std::min(limit - ext.size(), stem.size());
    while (keep > 0 && (static_cast<unsigned char>(stem[keep]) & 0xC0) == 0x80)
        --keep;
    return stem.substr(0, keep) + ext;
}

// Quoted src=/href= values that point into /data/. Linear in the content length.
std::vector<std::string> inlineReferences(const std::string& content) {
    std::vector<std::string> refs;
    const std::string lower = toLower(content);
    auto skipSpace = [&lower](std::size_t i) {
        while (i < lower.size() && std::isspace(static_cast<unsigned char>(lower[i])))
            ++i;
        return i;
    };

    std::size_t i = 0;
    while (i < lower.size()) {
        std::size_t keyLen = 0;
        if (lower.compare(i, 3, "src") == 0)
            keyLen = 3;
        else if (lower.compare(i, 4, "href") == 0)
            keyLen = 4;
        if (keyLen == 0) {
            ++i;
            continue;
        }
        std::size_t j = skipSpace(i + keyLen);
        if (j >= lower.size() || lower[j] != '=') {
            i += keyLen;
            continue;
        }
        j = skipSpace(j + 1);
        if (j >= lower.size() || (lower[j] != '"' && lower[j] != '\'')) {
            i = j;
            continue;
        }
        const std::size_t begin = j + 1;
        const std::size_t end = content.find_first_of("\"'", begin);
        if (end == std::string::npos)
            break;
        std::string_view value(content.data() + begin, end - begin);
        if (auto data = value.find("/data/");
            data != std::string_view::npos && data + 6 < value.size())
            refs.emplace_back(value);
        i = end + 1;
    }
    return refs;
}

} // namespace

MediaExtractor::MediaExtractor(ExtractorOptions options) : options_(std::move(options)) {}

std::string MediaExtractor::sanitizeFilename(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char ch : name) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c == 0x7f)
            continue;
        switch (ch) {
            case '\\':
            case '/':
            case '*':
            case '?':
            case '"':
            case '<':
            case '>':
            case '|':
                continue;
            case ' ':
                out.push_back('_');
                break;
            default:
                out.push_back(ch);
        }
    }
    if (out == "." || out == "..")
        out.clear();
    return out;
}

std::vector<FileDescriptor> MediaExtractor::extract(const PostRecord& post) const {
    std::vector<Candidate> candidates;
    std::unordered_set<std::string> urls;

    auto add = [&](Candidate c) {
        if (c.url.empty())
            return;
        if (!urls.insert(c.url).second) {
            spdlog::debug("Post {}: dropping duplicate reference {}", post.id, c.url);
            return;
        }
        candidates.push_back(std::move(c));
    };

    for (const auto& a : post.attachments) {
        if (a.path.empty())
            continue;
        Candidate c;
        if (isAbsoluteUrl(a.path)) {
            c.url = a.path;
        } else {
            const std::string& server = a.server ? *a.server : options_.fallbackServer;
            if (server.empty()) {
                spdlog::warn("Post {}: no server for {}, skipping", post.id, a.path);
                continue;
            }
            c.url = joinServer(server, a.path);
        }
        c.name = a.name;
        c.path = a.path;
        c.size = a.size;
        add(std::move(c));
    }

    if (options_.includeInline && !post.content.empty()) {
        for (const auto& ref : inlineReferences(post.content)) {
            Candidate c;
            std::string_view bare = stripQuery(ref);
            if (isAbsoluteUrl(ref)) {
                c.url = std::string(bare);
            } else if (!options_.fallbackServer.empty()) {
                c.url = joinServer(options_.fallbackServer, bare);
            } else {
                continue;
            }
            auto dataPos = c.url.find("/data/");
            c.path = dataPos == std::string::npos ? std::string(bare) : c.url.substr(dataPos + 5);
            c.name = queryFileName(ref);
            add(std::move(c));
        }
    }

    std::vector<FileDescriptor> out;
    out.reserve(candidates.size());
    const std::size_t width = digitCount(candidates.size());
    std::unordered_set<std::string> usedNames;

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        auto& c = candidates[i];
        std::string name = sanitizeFilename(c.name);
        if (name.empty())
            name = sanitizeFilename(percentDecode(basenameOf(c.path)));
        if (name.empty())
            name = padIndex(i, width);
        // A name ending in ".part" would share a path with another file's staging file
        if (const auto lower = toLower(name);
            lower.size() >= 5 && lower.compare(lower.size() - 5, 5, ".part") == 0)
            name.push_back('_');
        name = capLength(name, options_.maxFilenameBytes);

        while (usedNames.count(toLower(name)) != 0) {
            auto [stem, ext] = splitExtension(name);
            name = stem + "_" + padIndex(i, width) + ext;
        }
        usedNames.insert(toLower(name));

        FileDescriptor d;
        d.url = std::move(c.url);
        d.filename = std::move(name);
        d.postId = post.id;
        d.expectedBytes = c.size;
        d.expectedSha256 = sha256FromPath(c.path);
        d.host = downloader::hostOf(d.url);
        d.index = i;
        out.push_back(std::move(d));
    }
    return out;
}

} // namespace kfetch::crawl
