//
// Value types exchanged with the archive server
//

#ifndef LRR_CLIENT_ARCHIVETYPES_H
#define LRR_CLIENT_ARCHIVETYPES_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Lenient readers for fields the server sends either as numbers or as strings
auto readJsonBool(const nlohmann::json& json, const std::string& key) -> bool;
auto readJsonUint(const nlohmann::json& json, const std::string& key) -> uint64_t;

enum class eSortMethod {
    Alpha,
    Date
};

struct sArchive
{
    std::string id;
    std::string title;
    std::string tags;
    bool isNew = false;
    uint32_t pageCount = 0;
    uint32_t progress = 0;
    int64_t dateAdded = 0;

    static auto fromJson(const nlohmann::json& json) -> sArchive;
};

struct sCategory
{
    std::string id;
    std::string name;
    std::string search;
    bool pinned = false;
    std::vector<std::string> archives;

    // Dynamic categories are saved searches, static ones carry an explicit archive list
    [[nodiscard]] auto isStatic() const -> bool { return search.empty(); }

    static auto fromJson(const nlohmann::json& json) -> sCategory;
};

// One page of results from /api/search
struct sSearchResult
{
    std::vector<sArchive> archives;
    uint64_t totalFiltered = 0;
    uint64_t total = 0;

    static auto fromJson(const nlohmann::json& json) -> sSearchResult;
};

// A user defined request header
struct sHeader
{
    std::string name;
    std::string value;

    auto operator==(const sHeader& other) const -> bool = default;
};

void to_json(nlohmann::json& json, const sHeader& header);
void from_json(const nlohmann::json& json, sHeader& header);

class TagSuggestion {
public:
    TagSuggestion(const std::string& tagText, const std::string& namespaceText, uint32_t weight);

    auto contains(const std::string& query) const -> bool;

    auto displayTag() const -> const std::string& { return displayTag_; }

    auto weight() const -> uint32_t { return weight_; }

private:
    std::string tag_;
    std::string namespace_;
    std::string displayTag_;
    uint32_t weight_;
};

#endif //LRR_CLIENT_ARCHIVETYPES_H
