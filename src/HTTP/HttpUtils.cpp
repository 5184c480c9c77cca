#include "HttpUtils.h"

auto parseStatusCode(const std::string& statusLine) -> int {
    // Simple-Web-Server reports the status as "200 OK"
    try {
        return std::stoi(statusLine);
    } catch (std::exception&) {
        return 0;
    }
}

auto buildQueryString(const std::vector<std::pair<std::string, std::string>>& params) -> std::string {
    std::string result;
    for (const auto& [name, value] : params) {
        result += result.empty() ? "?" : "&";
        result += name + "=" + value;
    }
    return result;
}
