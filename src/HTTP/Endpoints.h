//
// The server endpoints this client talks to. Placeholders ({}) are filled positionally.
//

#ifndef LRR_CLIENT_ENDPOINTS_H
#define LRR_CLIENT_ENDPOINTS_H

#include <initializer_list>
#include <string>

struct sEndpoint {
    const char* method;
    const char* pathTemplate;

    // Substitutes the arguments for the {} placeholders in order
    auto path(std::initializer_list<std::string> args = {}) const -> std::string;
};

constexpr sEndpoint INFO_ENDPOINT                   {"GET",    "/api/info"};
constexpr sEndpoint ARCHIVE_LIST_ENDPOINT           {"GET",    "/api/archives"};
constexpr sEndpoint ARCHIVE_DELETE_ENDPOINT         {"DELETE", "/api/archives/{}"};
constexpr sEndpoint ARCHIVE_CLEAR_NEW_ENDPOINT      {"DELETE", "/api/archives/{}/isnew"};
constexpr sEndpoint ARCHIVE_PROGRESS_ENDPOINT       {"PUT",    "/api/archives/{}/progress/{}"};
constexpr sEndpoint ARCHIVE_THUMBNAIL_ENDPOINT      {"GET",    "/api/archives/{}/thumbnail"};
constexpr sEndpoint ARCHIVE_SET_THUMBNAIL_ENDPOINT  {"PUT",    "/api/archives/{}/thumbnail"};
constexpr sEndpoint ARCHIVE_EXTRACT_ENDPOINT        {"POST",   "/api/archives/{}/extract"};
constexpr sEndpoint SEARCH_ENDPOINT                 {"GET",    "/api/search"};
constexpr sEndpoint SEARCH_RANDOM_ENDPOINT          {"GET",    "/api/search/random"};
constexpr sEndpoint CATEGORY_LIST_ENDPOINT          {"GET",    "/api/categories"};
constexpr sEndpoint CATEGORY_CREATE_ENDPOINT        {"PUT",    "/api/categories"};
constexpr sEndpoint CATEGORY_ADD_ARCHIVE_ENDPOINT   {"PUT",    "/api/categories/{}/{}"};
constexpr sEndpoint CATEGORY_REMOVE_ARCHIVE_ENDPOINT{"DELETE", "/api/categories/{}/{}"};
constexpr sEndpoint TEMP_FOLDER_ENDPOINT            {"DELETE", "/api/tempfolder"};
constexpr sEndpoint DATABASE_STATS_ENDPOINT         {"GET",    "/api/database/stats"};
constexpr sEndpoint MINION_STATUS_ENDPOINT          {"GET",    "/api/minion/{}"};
// Raw page images are addressed by the paths the extract call returns
constexpr sEndpoint RAW_PATH_ENDPOINT               {"GET",    "{}"};

#endif //LRR_CLIENT_ENDPOINTS_H
