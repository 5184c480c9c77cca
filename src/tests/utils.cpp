#include "utils.h"

#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>
#include <thread>

std::shared_ptr<std::default_random_engine> rng =
    nullptr;  // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

auto randomInt(uint64_t start, uint64_t end) -> uint64_t
{
    if (!rng)
    {
        rng = std::make_shared<std::default_random_engine>(std::chrono::system_clock::now().time_since_epoch().count());
    }

    std::uniform_int_distribution<uint64_t> rng_dist(start, end);
    return rng_dist(*rng);
}

auto generateRandomData(uint32_t count) -> std::shared_ptr<std::vector<uint8_t>>
{
    auto result = std::make_shared<std::vector<uint8_t>>();
    result->reserve(count);

    for (uint32_t i = 0; i < count; i++)
    {
        result->push_back(randomInt(0, std::numeric_limits<uint8_t>::max()));
    }

    return result;
}

auto readFile(const std::filesystem::path& file) -> std::string
{
    std::ifstream stream(file, std::ios::binary);
    std::stringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

void writeFile(const std::filesystem::path& file, const std::string& content)
{
    std::ofstream stream(file, std::ios::binary | std::ios::trunc);
    if (!stream.is_open())
    {
        throw std::runtime_error("Failed to write test file: " + file.string());
    }
    stream << content;
}

auto waitFor(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) -> bool
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
        {
            return true;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    return predicate();
}

TemporaryDirectory::TemporaryDirectory()
{
    std::stringstream name;
    name << "lrr_client_test_" << std::hex << std::setfill('0') << std::setw(16)
         << randomInt(0, std::numeric_limits<uint64_t>::max());

    directory = std::filesystem::temp_directory_path() / name.str();
    std::filesystem::create_directories(directory);
}

TemporaryDirectory::~TemporaryDirectory()
{
    // Ignore errors during cleanup
    std::error_code errorCode;
    std::filesystem::remove_all(directory, errorCode);
}
