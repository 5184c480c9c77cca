#include "Endpoints.h"

auto sEndpoint::path(std::initializer_list<std::string> args) const -> std::string {
    std::string result(pathTemplate);

    size_t position = 0;
    for (const auto& arg : args) {
        position = result.find("{}", position);
        if (position == std::string::npos) {
            break;
        }

        result.replace(position, 2, arg);
        position += arg.size();
    }

    return result;
}
