#include "ArchiveTypes.h"
#include "GeneralUtils.h"
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

// The server is inconsistent about booleans, some fields come back as "true"/"1" strings
auto readJsonBool(const nlohmann::json& json, const std::string& key) -> bool {
    auto iter = json.find(key);
    if (iter == json.end() || iter->is_null()) {
        return false;
    }

    if (iter->is_boolean()) {
        return iter->get<bool>();
    }

    if (iter->is_number()) {
        return iter->get<int64_t>() != 0;
    }

    if (iter->is_string()) {
        auto value = iter->get<std::string>();
        return value == "true" || value == "1";
    }

    return false;
}

auto readJsonUint(const nlohmann::json& json, const std::string& key) -> uint64_t {
    auto iter = json.find(key);
    if (iter == json.end() || iter->is_null()) {
        return 0;
    }

    if (iter->is_number()) {
        return iter->get<uint64_t>();
    }

    if (iter->is_string()) {
        try {
            return std::stoull(iter->get<std::string>());
        } catch (std::exception&) {
            return 0;
        }
    }

    return 0;
}

namespace {
    auto readDateAdded(const std::string& tags) -> int64_t {
        std::vector<std::string> vTags;
        boost::split(vTags, tags, boost::is_any_of(","), boost::token_compress_on);

        for (auto& tag : vTags) {
            boost::trim(tag);
            const std::string prefix = "date_added:";
            if (tag.rfind(prefix, 0) == 0) {
                try {
                    return std::stoll(tag.substr(prefix.size()));
                } catch (std::exception&) {
                    return 0;
                }
            }
        }

        return 0;
    }
}

auto sArchive::fromJson(const nlohmann::json& json) -> sArchive {
    sArchive archive;
    archive.id = json.value("arcid", "");
    archive.title = json.value("title", "");
    archive.tags = json.value("tags", "");
    archive.isNew = readJsonBool(json, "isnew");
    archive.pageCount = static_cast<uint32_t>(readJsonUint(json, "pagecount"));
    archive.progress = static_cast<uint32_t>(readJsonUint(json, "progress"));
    archive.dateAdded = readDateAdded(archive.tags);
    return archive;
}

auto sSearchResult::fromJson(const nlohmann::json& json) -> sSearchResult {
    sSearchResult result;

    auto data = json.find("data");
    if (data != json.end() && data->is_array()) {
        for (const auto& archive : *data) {
            result.archives.push_back(sArchive::fromJson(archive));
        }
    }

    result.totalFiltered = readJsonUint(json, "recordsFiltered");
    result.total = readJsonUint(json, "recordsTotal");
    return result;
}

auto sCategory::fromJson(const nlohmann::json& json) -> sCategory {
    sCategory category;
    category.id = json.value("id", "");
    category.name = json.value("name", "");
    category.search = json.value("search", "");
    category.pinned = readJsonBool(json, "pinned");

    auto archives = json.find("archives");
    if (archives != json.end() && archives->is_array()) {
        for (const auto& archive : *archives) {
            category.archives.push_back(archive.get<std::string>());
        }
    }

    return category;
}

void to_json(nlohmann::json& json, const sHeader& header) {
    json = nlohmann::json{{"name", header.name}, {"value", header.value}};
}

void from_json(const nlohmann::json& json, sHeader& header) {
    json.at("name").get_to(header.name);
    json.at("value").get_to(header.value);
}

TagSuggestion::TagSuggestion(const std::string& tagText, const std::string& namespaceText, uint32_t weight)
        : tag_(toLower(tagText)), namespace_(toLower(namespaceText)), weight_(weight) {
    displayTag_ = namespace_.empty() ? tag_ : namespace_ + ":" + tag_;
}

auto TagSuggestion::contains(const std::string& query) const -> bool {
    auto lowerQuery = toLower(query);

    // Only match against the namespace when the user has typed one
    if (lowerQuery.find(':') == std::string::npos) {
        return tag_.find(lowerQuery) != std::string::npos;
    }

    return displayTag_.find(lowerQuery) != std::string::npos;
}
