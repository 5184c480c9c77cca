#include "HeaderStore.h"
#include "../Lib/GeneralUtils.h"
#include <fstream>
#include <iostream>
#include <utility>

HeaderStore::HeaderStore(std::filesystem::path file) : file(std::move(file)) {}

auto HeaderStore::load() const -> std::vector<sHeader> {
    std::error_code errorCode;
    if (!std::filesystem::exists(file, errorCode)) {
        return {};
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        std::cerr << "APP: Unable to open header file " << file << std::endl;
        return {};
    }

    try {
        return nlohmann::json::parse(input).get<std::vector<sHeader>>();
    } catch (nlohmann::json::exception& e) {
        std::cerr << "APP: Header file " << file << " is corrupt, ignoring it" << std::endl;
        dumpExceptions(e);
        return {};
    }
}

auto HeaderStore::save(const std::vector<sHeader>& headers) const -> bool {
    std::error_code errorCode;
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path(), errorCode);
    }
    if (errorCode) {
        std::cerr << "APP: Unable to create " << file.parent_path() << ": " << errorCode.message() << std::endl;
        return false;
    }

    // Credentials can live in custom headers, the file is made private before anything is written to it
    if (!std::filesystem::exists(file, errorCode)) {
        std::ofstream create(file);
        if (!create.is_open()) {
            std::cerr << "APP: Unable to create header file " << file << std::endl;
            return false;
        }
    }

    std::filesystem::permissions(
            file,
            std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
            std::filesystem::perm_options::replace,
            errorCode
    );
    if (errorCode) {
        std::cerr << "APP: Unable to restrict permissions of " << file << ": " << errorCode.message() << std::endl;
        return false;
    }

    std::ofstream output(file, std::ios::trunc);
    if (!output.is_open()) {
        std::cerr << "APP: Unable to write header file " << file << std::endl;
        return false;
    }

    output << nlohmann::json(headers).dump();
    if (!output) {
        std::cerr << "APP: Unable to write header file " << file << std::endl;
        return false;
    }

    return true;
}
