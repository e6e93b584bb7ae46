#include <kfetch/crawl/page_parser.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <string>
#include <unordered_map>

namespace kfetch::crawl {

using json = nlohmann::json;

namespace {

// Ids and names arrive as strings or numbers depending on the service
std::string asText(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return {};
    if (it->is_string())
        return it->get<std::string>();
    if (it->is_number_integer())
        return std::to_string(it->get<long long>());
    if (it->is_number_unsigned())
        return std::to_string(it->get<unsigned long long>());
    return {};
}

using ServerIndex = std::unordered_map<std::string, std::string>;

void indexServers(const json& root, const char* key, ServerIndex& out) {
    auto it = root.find(key);
    if (it == root.end() || !it->is_array())
        return;
    for (const auto& perPost : *it) {
        if (!perPost.is_array())
            continue;
        for (const auto& item : perPost) {
            if (!item.is_object())
                continue;
            auto path = asText(item, "path");
            auto server = asText(item, "server");
            if (!path.empty() && !server.empty())
                out.emplace(std::move(path), std::move(server));
        }
    }
}

std::optional<RawAttachment> toAttachment(const json& j, const ServerIndex& servers) {
    if (!j.is_object())
        return std::nullopt;
    RawAttachment a;
    a.name = asText(j, "name");
    a.path = asText(j, "path");
    if (a.path.empty())
        return std::nullopt;
    if (auto s = servers.find(a.path); s != servers.end())
        a.server = s->second;
    else if (auto server = asText(j, "server"); !server.empty())
        a.server = std::move(server);
    if (auto sz = j.find("size"); sz != j.end() && sz->is_number_unsigned())
        a.size = sz->get<std::uint64_t>();
    else if (sz != j.end() && sz->is_number_integer() && sz->get<long long>() >= 0)
        a.size = static_cast<std::uint64_t>(sz->get<long long>());
    return a;
}

std::optional<PostRecord> toPost(const json& j, const ServerIndex& servers) {
    if (!j.is_object())
        return std::nullopt;
    PostRecord post;
    post.id = asText(j, "id");
    if (!isSafePathComponent(post.id))
        return std::nullopt;
    post.creatorId = asText(j, "user");
    post.service = asText(j, "service");
    post.title = asText(j, "title");
    post.published = asText(j, "published");
    post.content = asText(j, "content");

    if (auto f = j.find("file"); f != j.end()) {
        if (auto a = toAttachment(*f, servers))
            post.attachments.push_back(std::move(*a));
    }
    if (auto atts = j.find("attachments"); atts != j.end() && atts->is_array()) {
        for (const auto& entry : *atts) {
            if (auto a = toAttachment(entry, servers))
                post.attachments.push_back(std::move(*a));
        }
    }
    post.rawJson = j.dump();
    return post;
}

} // namespace

Expected<Page> parsePage(std::string_view body) {
    json root = json::parse(body.begin(), body.end(), nullptr, false);
    if (root.is_discarded())
        return Error{ErrorCode::MalformedResponse, "listing page is not valid JSON"};

    Page page;
    ServerIndex servers;
    const json* results = nullptr;

    if (root.is_array()) {
        results = &root;
    } else if (root.is_object()) {
        auto r = root.find("results");
        if (r == root.end() || !r->is_array())
            return Error{ErrorCode::MalformedResponse, "listing page has no results array"};
        results = &*r;
        if (auto props = root.find("props"); props != root.end() && props->is_object()) {
            if (auto c = props->find("count"); c != props->end() && c->is_number_integer() &&
                                               c->get<long long>() >= 0) {
                page.totalCount = static_cast<std::size_t>(c->get<long long>());
            }
            if (auto name = asText(*props, "name"); !name.empty())
                page.creatorName = std::move(name);
        }
        indexServers(root, "result_previews", servers);
        indexServers(root, "result_attachments", servers);
    } else {
        return Error{ErrorCode::MalformedResponse, "listing page is neither an object nor an array"};
    }

    page.rawEntries = results->size();
    std::size_t position = 0;
    for (const auto& entry : *results) {
        auto post = toPost(entry, servers);
        const std::size_t here = position++;
        if (!post) {
            ++page.malformed;
            spdlog::warn("Skipping malformed post entry: {}",
                         entry.dump().substr(0, 120));
            continue;
        }
        post->listingPosition = here;
        page.posts.push_back(std::move(*post));
    }
    return page;
}

} // namespace kfetch::crawl
