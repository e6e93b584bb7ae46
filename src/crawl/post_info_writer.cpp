#include <kfetch/crawl/post_info_writer.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <system_error>

namespace kfetch::crawl {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

fs::path creatorDir(const fs::path& root, const CreatorTarget& target) {
    return root / target.service / target.creatorId;
}

Expected<fs::path> writeJsonFile(const fs::path& path, const json& doc) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Failed to create " + path.parent_path().string() + ": " + ec.message()};
    }
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.good())
            return Error{ErrorCode::IoError, "Failed to open " + tmp.string()};
        out << doc.dump(4, ' ', false, json::error_handler_t::replace) << '\n';
        if (!out.good())
            return Error{ErrorCode::IoError, "Failed to write " + tmp.string()};
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Error{ErrorCode::IoError, "Failed to rename into " + path.string()};
    }
    return path;
}

} // namespace

Expected<fs::path> writePostInfo(const fs::path& root, const CreatorTarget& target,
                                 const PostRecord& post, const std::vector<FileDescriptor>& files) {
    json doc;
    doc["id"] = post.id;
    doc["user"] = post.creatorId.empty() ? target.creatorId : post.creatorId;
    doc["service"] = post.service.empty() ? target.service : post.service;
    doc["title"] = post.title;
    doc["published"] = post.published;
    doc["link"] = "https://" + target.site + "/" + target.service + "/user/" + target.creatorId +
                  "/post/" + post.id;
    doc["listing_position"] = post.listingPosition;

    json fileList = json::array();
    for (const auto& f : files) {
        json entry{{"filename", f.filename}, {"url", f.url}};
        if (f.expectedBytes)
            entry["size"] = *f.expectedBytes;
        if (f.expectedSha256)
            entry["sha256"] = *f.expectedSha256;
        fileList.push_back(std::move(entry));
    }
    doc["files"] = std::move(fileList);

    json raw = json::parse(post.rawJson, nullptr, false);
    if (!raw.is_discarded())
        doc["post"] = std::move(raw);

    auto path = creatorDir(root, target) / ".posts" / (post.id + ".json");
    return writeJsonFile(path, doc);
}

Expected<fs::path> writeCreatorProfile(const fs::path& root, const CreatorTarget& target,
                                       const std::optional<std::string>& name,
                                       const std::optional<std::size_t>& postCount) {
    json doc;
    doc["id"] = target.creatorId;
    doc["service"] = target.service;
    doc["site"] = target.site;
    doc["name"] = name ? json(*name) : json(nullptr);
    doc["post_count"] = postCount ? json(*postCount) : json(nullptr);
    doc["updated"] = std::chrono::duration_cast<std::chrono::seconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    auto r = writeJsonFile(creatorDir(root, target) / "profile.json", doc);
    if (r.ok())
        spdlog::debug("Wrote creator profile {}", r.value().string());
    return r;
}

} // namespace kfetch::crawl
