//
// Small helpers shared by every component
//

#ifndef LRR_CLIENT_GENERALUTILS_H
#define LRR_CLIENT_GENERALUTILS_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string>

auto base64Encode(std::string input) -> std::string;
auto base64Decode(std::string input) -> std::string;
auto urlEncode(const std::string& input) -> std::string;
auto toLower(std::string input) -> std::string;
void dumpExceptions(std::exception& exception);
auto acceptingConnections(uint16_t port) -> bool;

struct InterruptableTimer {
    // Returns false if killed
    template<class R, class P>
    auto wait_for( std::chrono::duration<R,P> const& time ) const -> bool {
        std::unique_lock<std::mutex> lock(m);
        return !cv.wait_for(lock, time, [&]{ return terminate; });
    }

    // Returns false if killed or if the stop token was triggered while waiting
    template<class R, class P>
    auto wait_for( std::chrono::duration<R,P> const& time, std::stop_token token ) const -> bool {
        std::unique_lock<std::mutex> lock(m);
        return !cv.wait_for(lock, token, time, [&]{ return terminate; }) && !token.stop_requested();
    }

    void stop() {
        std::unique_lock<std::mutex> const lock(m);
        terminate = true;
        cv.notify_all();
    }

private:
    mutable std::condition_variable_any cv;
    mutable std::mutex m;
    bool terminate = false;
};

#endif //LRR_CLIENT_GENERALUTILS_H
