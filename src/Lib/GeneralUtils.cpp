#include "GeneralUtils.h"
#include <algorithm>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/remove_whitespace.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <cctype>
#include <cstdint>
#include <exception>
#include <folly/String.h>
#include <folly/experimental/exception_tracer/ExceptionTracer.h>
#include <iostream>
#include <string>
#include <thread>

// From https://github.com/kenba/via-httplib/blob/master/include/via/http/authentication/base64.hpp
auto base64Encode(std::string input) -> std::string
{
    // The input must be in multiples of 3, otherwise the transformation
    // may overflow the input buffer, so pad with zero.
    const uint32_t num_pad_chars((3 - input.size() % 3) % 3);
    input.append(num_pad_chars, 0);

    // Transform to Base64
    using boost::archive::iterators::transform_width, boost::archive::iterators::base64_from_binary;
    // NOLINTNEXTLINE (cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    using ItBase64T = base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;
    std::string output(ItBase64T(input.begin()),
                       ItBase64T(input.end() - num_pad_chars));

    // Pad blank characters with =
    output.append(num_pad_chars, '=');

    return output;
}

// From https://github.com/kenba/via-httplib/blob/master/include/via/http/authentication/base64.hpp
auto base64Decode(std::string input) -> std::string
{
    using boost::archive::iterators::transform_width, boost::archive::iterators::remove_whitespace, boost::archive::iterators::binary_from_base64;

    // NOLINTNEXTLINE (cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    using ItBinaryT = transform_width<binary_from_base64<remove_whitespace<std::string::const_iterator>>, 8, 6>;

    try
    {
        // If the input isn't a multiple of 4, pad with =
        const uint32_t num_pad_chars((4 - input.size() % 4) % 4);
        input.append(num_pad_chars, '=');

        const uint32_t pad_chars(std::count(input.begin(), input.end(), '='));
        std::replace(input.begin(), input.end(), '=', 'A');
        std::string output(ItBinaryT(input.begin()), ItBinaryT(input.end()));
        output.erase(output.end() - pad_chars, output.end());
        return output;
    }
    catch (std::exception& e)
    {
        dumpExceptions(e);
        return {""};
    }
}

// Query style escaping, space becomes '+'
auto urlEncode(const std::string& input) -> std::string
{
    return folly::uriEscape<std::string>(input, folly::UriEscapeMode::QUERY);
}

auto toLower(std::string input) -> std::string
{
    std::transform(input.begin(), input.end(), input.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });
    return input;
}

void dumpExceptions(std::exception& exception) {
    std::cerr << "--- Exception: " << exception.what() << '\n';
    auto exceptions = folly::exception_tracer::getCurrentExceptions();
    for (auto& exc : exceptions) {
        std::cerr << exc << "\n";
    }
}

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
auto acceptingConnections(uint16_t port) -> bool {
    using boost::asio::io_context, boost::asio::ip::tcp;
    using ec = boost::system::error_code;

    bool result = false;

    for (auto counter = 0; counter < 10 && !result; counter++) {
        try {
            io_context svc;
            tcp::socket socket(svc);
            boost::asio::steady_timer tim(svc, std::chrono::milliseconds(100));

            tim.async_wait([&](ec) { socket.cancel(); });
            socket.async_connect({boost::asio::ip::make_address("127.0.0.1"), port}, [&](ec errorCode) {
                result = !errorCode;
                tim.cancel();
            });

            svc.run();
        } catch (boost::system::system_error& error) {
            std::cerr << "Port check on " << port << " failed: " << error.what() << std::endl;
        }

        if (!result) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    return result;
}
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
