//
// On disk layout of downloaded archives: downloads/<id>/<page> and downloads/<id>/thumbs/<page>
//

#ifndef LRR_CLIENT_DOWNLOADLAYOUT_H
#define LRR_CLIENT_DOWNLOADLAYOUT_H

#include "../Settings.h"
#include <cstdint>
#include <filesystem>
#include <string>

inline auto archiveDirectory(const std::filesystem::path& root, const std::string& id) -> std::filesystem::path {
    return root / id;
}

inline auto thumbDirectory(const std::filesystem::path& root, const std::string& id) -> std::filesystem::path {
    return archiveDirectory(root, id) / THUMBS_DIRECTORY_NAME;
}

inline auto pagePath(const std::filesystem::path& root, const std::string& id, uint32_t page) -> std::filesystem::path {
    return archiveDirectory(root, id) / std::to_string(page);
}

inline auto thumbPath(const std::filesystem::path& root, const std::string& id, uint32_t page) -> std::filesystem::path {
    return thumbDirectory(root, id) / std::to_string(page);
}

#endif //LRR_CLIENT_DOWNLOADLAYOUT_H
