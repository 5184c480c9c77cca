#ifndef LRR_CLIENT_TEST_UTILS_H
#define LRR_CLIENT_TEST_UTILS_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <client_http.hpp>
#include <server_http.hpp>

auto randomInt(uint64_t start, uint64_t end) -> uint64_t;
auto generateRandomData(uint32_t count) -> std::shared_ptr<std::vector<uint8_t>>;
auto readFile(const std::filesystem::path& file) -> std::string;
void writeFile(const std::filesystem::path& file, const std::string& content);

// Polls predicate until it holds or timeout passes, returns the last result
auto waitFor(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) -> bool;

/**
 * RAII class for creating a temporary directory that is automatically cleaned up
 * Uses portable std::filesystem for temporary directory and random names
 */
class TemporaryDirectory
{
public:
    TemporaryDirectory();
    ~TemporaryDirectory();

    TemporaryDirectory(const TemporaryDirectory&)                    = delete;
    auto operator=(const TemporaryDirectory&) -> TemporaryDirectory& = delete;
    TemporaryDirectory(TemporaryDirectory&&)                         = delete;
    auto operator=(TemporaryDirectory&&) -> TemporaryDirectory&      = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path&
    {
        return directory;
    }

private:
    std::filesystem::path directory;
};

using TestHttpServer = SimpleWeb::Server<SimpleWeb::HTTP>;
using TestHttpClient = SimpleWeb::Client<SimpleWeb::HTTP>;

#endif  // LRR_CLIENT_TEST_UTILS_H
