#pragma once

#include <kfetch/crawl/types.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kfetch::crawl {

/**
 * <root>/<service>/<creator>/.posts/<post id>.json: the post as listed plus the files
 * derived from it. Written through a temporary file and a rename.
 */
Expected<std::filesystem::path> writePostInfo(const std::filesystem::path& root,
                                              const CreatorTarget& target, const PostRecord& post,
                                              const std::vector<FileDescriptor>& files);

/**
 * <root>/<service>/<creator>/profile.json: creator name and post count as reported by
 * the listing.
 */
Expected<std::filesystem::path> writeCreatorProfile(const std::filesystem::path& root,
                                                    const CreatorTarget& target,
                                                    const std::optional<std::string>& name,
                                                    const std::optional<std::size_t>& postCount);

} // namespace kfetch::crawl
