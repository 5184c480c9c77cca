#include "ArchiveIndex.h"
#include "../Lib/GeneralUtils.h"
#include <algorithm>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <iostream>
#include <mutex>
#include <utility>

ArchiveIndex::ArchiveIndex(std::shared_ptr<ServerClient> serverClient) : pServerClient(std::move(serverClient)) {}

auto ArchiveIndex::refresh(std::stop_token token) -> bool {
    auto archives = pServerClient->downloadArchiveList(std::move(token));
    if (!archives) {
        return false;
    }

    std::cout << "APP: Indexed " << archives->size() << " archives" << std::endl;
    setArchives(std::move(*archives));
    return true;
}

auto ArchiveIndex::isLoaded() const -> bool {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return bLoaded;
}

void ArchiveIndex::setArchives(std::vector<sArchive> archives) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    vArchives = std::move(archives);
    bLoaded = true;
}

auto ArchiveIndex::size() const -> size_t {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return vArchives.size();
}

auto ArchiveIndex::getArchive(const std::string& id) const -> std::optional<sArchive> {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto iter = std::find_if(vArchives.begin(), vArchives.end(), [&id](const auto& archive) { return archive.id == id; });
    if (iter == vArchives.end()) {
        return std::nullopt;
    }

    return *iter;
}

auto ArchiveIndex::query(const std::string& filter, eSortMethod sortMethod, bool descending, bool onlyNew) const -> std::vector<sArchive> {
    std::vector<sArchive> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& archive : vArchives) {
            if (onlyNew && !archive.isNew) {
                continue;
            }

            if (filter.empty() || matches(archive, filter)) {
                result.push_back(archive);
            }
        }
    }

    sort(result, sortMethod, descending);
    return result;
}

auto ArchiveIndex::matches(const sArchive& archive, const std::string& filter) -> bool {
    std::vector<std::string> vTerms;
    boost::split(vTerms, filter, boost::is_any_of(" \t,"), boost::token_compress_on);

    std::vector<std::string> vTags;
    boost::split(vTags, archive.tags, boost::is_any_of(","), boost::token_compress_on);
    for (auto& tag : vTags) {
        boost::trim(tag);
    }

    for (auto term : vTerms) {
        if (term.empty()) {
            continue;
        }

        auto negate = term.front() == '-';
        if (negate) {
            term.erase(0, 1);
            if (term.empty()) {
                continue;
            }
        }

        bool found;
        if (term.find(':') != std::string::npos) {
            found = std::any_of(vTags.begin(), vTags.end(), [&term](const auto& tag) { return boost::icontains(tag, term); });
        } else {
            found = boost::icontains(archive.title, term) || boost::icontains(archive.tags, term);
        }

        if (found == negate) {
            return false;
        }
    }

    return true;
}

void ArchiveIndex::sort(std::vector<sArchive>& archives, eSortMethod sortMethod, bool descending) {
    std::stable_sort(archives.begin(), archives.end(), [sortMethod, descending](const auto& first, const auto& second) {
        if (sortMethod == eSortMethod::Date) {
            return descending ? first.dateAdded > second.dateAdded : first.dateAdded < second.dateAdded;
        }

        auto firstTitle = toLower(first.title);
        auto secondTitle = toLower(second.title);
        return descending ? firstTitle > secondTitle : firstTitle < secondTitle;
    });
}
