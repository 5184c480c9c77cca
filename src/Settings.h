//
// Process configuration for the archive server client
//

#ifndef LRR_CLIENT_SETTINGS_H
#define LRR_CLIENT_SETTINGS_H

#include <cstdint>
#include <cstdlib>
#include <string>

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
inline auto GET_ENV(const std::string &variable, const std::string &_default) -> std::string {
    // NOLINTNEXTLINE(clang-analyzer-cplusplus.StringChecker,concurrency-mt-unsafe)
    return std::getenv(variable.c_str()) != nullptr ? std::string(std::getenv(variable.c_str())) : _default;
}

#define SERVER_ADDRESS              GET_ENV("LRR_SERVER_ADDRESS", "")
#define SERVER_API_KEY              GET_ENV("LRR_API_KEY", "")
#define DATA_DIRECTORY              GET_ENV("LRR_DATA_DIR", "./lrr_data")
#define VERBOSE_MESSAGES            (GET_ENV("LRR_VERBOSE_MESSAGES", "0") == "1")

constexpr const char* HEADER_FILE_NAME = "headers.json";
constexpr const char* DOWNLOADS_DIRECTORY_NAME = "downloads";
constexpr const char* THUMBS_DIRECTORY_NAME = "thumbs";

const uint32_t DOWNLOAD_CONCURRENCY = 3;

const uint32_t JOB_POLL_INTERVAL_MILLISECONDS = 100;

const uint32_t HTTP_CONNECT_TIMEOUT_SECONDS = 5;
const uint32_t HTTP_READ_TIMEOUT_SECONDS = 60;
const uint32_t HTTP_WORKER_POOL_SIZE = 4;

const uint32_t SERVER_DEFAULT_PAGE_SIZE = 100;

#ifdef BUILD_TESTS
    const uint16_t TEST_HTTP_PORT = 23456;
    const uint32_t TEST_HTTP_WORKER_POOL_SIZE = 8;
#endif

#endif //LRR_CLIENT_SETTINGS_H
