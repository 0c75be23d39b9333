/**
 * @file diagnostics.cpp
 * @brief FileSink implementation.
 */

#include <flowtuple/diagnostics.hpp>

#include <chrono>
#include <ctime>

namespace flowtuple {

void FileSink::write(const char* line) noexcept {
    if (out_ == nullptr) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    char ts[16] = "??:??:??";
    if (localtime_r(&t, &local) != nullptr) {
        std::strftime(ts, sizeof(ts), "%H:%M:%S", &local);
    }

    std::fprintf(out_, "%s %s\n", ts, line);
}

} // namespace flowtuple
