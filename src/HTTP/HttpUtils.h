//
// Helpers for building request query strings and reading response status lines
//

#ifndef LRR_CLIENT_HTTPUTILS_H
#define LRR_CLIENT_HTTPUTILS_H

#include <string>
#include <utility>
#include <vector>

auto parseStatusCode(const std::string& statusLine) -> int;

// Builds "?a=1&b=2" from already encoded values, empty when there are no parameters
auto buildQueryString(const std::vector<std::pair<std::string, std::string>>& params) -> std::string;

#endif //LRR_CLIENT_HTTPUTILS_H
