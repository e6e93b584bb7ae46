// In-process stand-in for a Kemono-style site: a paginated creator listing plus the
// file servers it points at. Failures, range handling and latency are scriptable.

#pragma once

#include <kfetch/downloader/downloader.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace kfetch::test {

inline std::string sha256Hex(std::string_view data) {
    auto v = downloader::makeIntegrityVerifierSha256();
    v->update(std::as_bytes(std::span<const char>(data.data(), data.size())));
    return v->finalize().hex;
}

inline downloader::Error httpError(int status) {
    downloader::Error e;
    e.httpStatus = status;
    e.message = "HTTP " + std::to_string(status);
    if (status == 401 || status == 403)
        e.code = downloader::ErrorCode::AuthenticationFailed;
    else if (status == 429)
        e.code = downloader::ErrorCode::RateLimited;
    else if (status >= 500)
        e.code = downloader::ErrorCode::ServerError;
    else
        e.code = downloader::ErrorCode::ClientError;
    return e;
}

inline downloader::Error networkError() {
    return downloader::Error{downloader::ErrorCode::NetworkError, "connection reset"};
}

struct FakeAttachment {
    std::string name;
    std::string path;
    std::string server;
};

struct FakePost {
    std::string id;
    std::string title;
    std::string content;
    std::vector<FakeAttachment> files; // files[0] is listed as the primary "file"
};

struct FakeFile {
    std::string body;
    std::deque<downloader::Error> failures; // returned, one per request, before serving
    bool ignoreRange{false};                // answer Range requests with a full 200
    std::optional<std::size_t> sendOnly;    // stop the body early, Content-Length unchanged
    std::chrono::milliseconds chunkDelay{0}; // pause before each body chunk (a slow server)
};

class FakeSite final : public downloader::IHttpAdapter {
public:
    struct Request {
        std::string url;
        std::uint64_t offset{0};
    };

    std::string site{"kemono.test"};
    std::string service{"patreon"};
    std::string creator{"42"};
    std::string creatorName{"Test Creator"};
    std::size_t pageSize{50};
    std::chrono::milliseconds fileDelay{0};
    std::size_t chunkSize{4096};

    std::map<std::size_t, std::deque<downloader::Error>> listingFailures; // by offset
    std::map<std::size_t, std::deque<std::string>> listingBodies;         // raw overrides
    std::function<void(std::size_t offset)> beforeListing;
    std::function<void(const std::string& url)> beforeFile;

    std::string listingPrefix() const {
        return "https://" + site + "/api/v1/" + service + "/user/" + creator +
               "/posts-legacy?o=";
    }

    FakePost& addPost(std::string id, std::string title = {}) {
        posts.push_back(FakePost{std::move(id), std::move(title), {}, {}});
        return posts.back();
    }

    // Newer posts come first in the listing
    FakePost& prependPost(std::string id, std::string title = {}) {
        posts.push_front(FakePost{std::move(id), std::move(title), {}, {}});
        return posts.front();
    }

    /**
     * Register a file under a content-addressed path ("/ab/cd/<sha256>.<ext>") and list
     * it on `post`. Returns the download URL.
     */
    std::string addFile(FakePost& post, const std::string& name, std::string body,
                        const std::string& server = "https://n1.kemono.test") {
        const auto sha = sha256Hex(body);
        auto dot = name.find_last_of('.');
        std::string ext = dot == std::string::npos ? "" : name.substr(dot);
        std::string path = "/" + sha.substr(0, 2) + "/" + sha.substr(2, 2) + "/" + sha + ext;
        return addFileAt(post, name, path, std::move(body), server);
    }

    std::string addFileAt(FakePost& post, const std::string& name, const std::string& path,
                          std::string body, const std::string& server = "https://n1.kemono.test") {
        std::string url = server + "/data" + path;
        files_[url].body = std::move(body);
        post.files.push_back(FakeAttachment{name, path, server});
        return url;
    }

    FakeFile& file(const std::string& url) { return files_.at(url); }

    std::string pageBody(std::size_t offset) const {
        nlohmann::json results = nlohmann::json::array();
        nlohmann::json attachmentServers = nlohmann::json::array();
        for (std::size_t i = offset; i < posts.size() && i < offset + pageSize; ++i) {
            const auto& p = posts[i];
            nlohmann::json post{{"id", p.id},
                                {"user", creator},
                                {"service", service},
                                {"title", p.title},
                                {"content", p.content},
                                {"published", "2024-01-01T00:00:00"},
                                {"file", nlohmann::json::object()},
                                {"attachments", nlohmann::json::array()}};
            nlohmann::json servers = nlohmann::json::array();
            for (std::size_t f = 0; f < p.files.size(); ++f) {
                nlohmann::json entry{{"name", p.files[f].name}, {"path", p.files[f].path}};
                if (f == 0)
                    post["file"] = entry;
                else
                    post["attachments"].push_back(entry);
                servers.push_back({{"server", p.files[f].server},
                                   {"name", p.files[f].name},
                                   {"path", p.files[f].path}});
            }
            results.push_back(std::move(post));
            attachmentServers.push_back(std::move(servers));
        }
        nlohmann::json page{{"props", {{"count", posts.size()}, {"name", creatorName}}},
                            {"results", std::move(results)},
                            {"result_previews", nlohmann::json::array()},
                            {"result_attachments", std::move(attachmentServers)}};
        return page.dump();
    }

    downloader::Expected<downloader::ResponseInfo>
    get(std::string_view url, const std::vector<downloader::Header>& headers,
        std::uint64_t offset, const downloader::RequestOptions&,
        const downloader::ResponseCallback& onResponse, const downloader::ByteSink& sink,
        const downloader::ShouldCancel& shouldCancel) override {
        const std::string u(url);
        {
            std::lock_guard<std::mutex> lk(mutex_);
            requests_.push_back(Request{u, offset});
            lastHeaders_ = headers;
        }
        if (u.rfind(listingPrefix(), 0) == 0)
            return serveListing(u, onResponse, sink);
        return serveFile(u, offset, onResponse, sink, shouldCancel);
    }

    std::vector<Request> requests() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return requests_;
    }

    std::vector<downloader::Header> lastHeaders() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return lastHeaders_;
    }

    std::size_t listingRequests() const {
        auto all = requests();
        return static_cast<std::size_t>(std::count_if(all.begin(), all.end(), [&](const Request& r) {
            return r.url.rfind(listingPrefix(), 0) == 0;
        }));
    }

    std::size_t fileRequests() const { return requests().size() - listingRequests(); }

    std::size_t requestsFor(const std::string& url) const {
        auto all = requests();
        return static_cast<std::size_t>(
            std::count_if(all.begin(), all.end(), [&](const Request& r) { return r.url == url; }));
    }

    std::size_t maxActive() const { return maxActive_.load(); }

    std::size_t maxActiveFor(const std::string& host) const {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = maxPerHost_.find(host);
        return it == maxPerHost_.end() ? 0 : it->second;
    }

    std::deque<FakePost> posts;

private:
    downloader::Expected<downloader::ResponseInfo>
    serveListing(const std::string& url, const downloader::ResponseCallback& onResponse,
                 const downloader::ByteSink& sink) {
        const std::size_t offset = std::stoul(url.substr(listingPrefix().size()));
        if (beforeListing)
            beforeListing(offset);

        std::string body;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (auto f = listingFailures.find(offset); f != listingFailures.end() && !f->second.empty()) {
                auto err = f->second.front();
                f->second.pop_front();
                return err;
            }
            if (auto b = listingBodies.find(offset); b != listingBodies.end() && !b->second.empty()) {
                body = b->second.front();
                b->second.pop_front();
            } else {
                body = pageBody(offset);
            }
        }
        downloader::ResponseInfo info;
        info.status = 200;
        info.contentLength = body.size();
        if (onResponse) {
            auto r = onResponse(info);
            if (!r.ok())
                return r.error();
        }
        auto s = sink(std::as_bytes(std::span<const char>(body.data(), body.size())));
        if (!s.ok())
            return s.error();
        return info;
    }

    downloader::Expected<downloader::ResponseInfo>
    serveFile(const std::string& url, std::uint64_t offset,
              const downloader::ResponseCallback& onResponse, const downloader::ByteSink& sink,
              const downloader::ShouldCancel& shouldCancel) {
        if (beforeFile)
            beforeFile(url);

        std::string data;
        downloader::ResponseInfo info;
        std::optional<std::size_t> sendOnly;
        std::chrono::milliseconds chunkDelay{0};
        {
            std::lock_guard<std::mutex> lk(mutex_);
            auto it = files_.find(url);
            if (it == files_.end())
                return httpError(404);
            auto& f = it->second;
            if (!f.failures.empty()) {
                auto err = f.failures.front();
                f.failures.pop_front();
                return err;
            }
            if (offset > 0 && !f.ignoreRange) {
                if (offset >= f.body.size())
                    return httpError(416);
                info.status = 206;
                info.partialContent = true;
                data = f.body.substr(static_cast<std::size_t>(offset));
            } else {
                info.status = 200;
                data = f.body;
            }
            info.contentLength = data.size();
            sendOnly = f.sendOnly;
            chunkDelay = f.chunkDelay;
        }
        if (sendOnly && *sendOnly < data.size())
            data.resize(*sendOnly);

        if (onResponse) {
            auto r = onResponse(info);
            if (!r.ok())
                return r.error();
        }

        const std::string host = downloader::hostOf(url);
        enter(host);
        if (fileDelay.count() > 0)
            std::this_thread::sleep_for(fileDelay);

        std::size_t pos = 0;
        downloader::Expected<downloader::ResponseInfo> result = info;
        while (pos < data.size()) {
            if (chunkDelay.count() > 0)
                std::this_thread::sleep_for(chunkDelay);
            if (shouldCancel && shouldCancel()) {
                result = downloader::Error{downloader::ErrorCode::Cancelled, "cancelled"};
                break;
            }
            const std::size_t n = std::min(chunkSize, data.size() - pos);
            auto s = sink(std::as_bytes(std::span<const char>(data.data() + pos, n)));
            if (!s.ok()) {
                result = s.error();
                break;
            }
            pos += n;
        }
        leave(host);
        return result;
    }

    void enter(const std::string& host) {
        std::lock_guard<std::mutex> lk(mutex_);
        auto now = ++active_;
        if (now > maxActive_.load())
            maxActive_.store(now);
        auto& h = activePerHost_[host];
        ++h;
        auto& m = maxPerHost_[host];
        m = std::max(m, h);
    }

    void leave(const std::string& host) {
        std::lock_guard<std::mutex> lk(mutex_);
        --active_;
        --activePerHost_[host];
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, FakeFile> files_;
    std::vector<Request> requests_;
    std::vector<downloader::Header> lastHeaders_;
    std::size_t active_{0};
    std::atomic<std::size_t> maxActive_{0};
    std::unordered_map<std::string, std::size_t> activePerHost_;
    std::unordered_map<std::string, std::size_t> maxPerHost_;
};

} // namespace kfetch::test
