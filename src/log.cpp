#include <rotator/log.hpp>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace rotator {

static std::atomic<bool> verbose_mode{false};

void set_verbose(bool on) {
    verbose_mode.store(on);
}

bool verbose() {
    return verbose_mode.load();
}

static void vlog(const char* component, bool stamp, const char* fmt, va_list args) {
    char msg[1024];
    vsnprintf(msg, sizeof(msg), fmt, args);

    // One write per line so worker threads do not interleave
    std::ostringstream line;
    if (stamp) {
        auto now = std::chrono::system_clock::now();
        auto now_time_t = std::chrono::system_clock::to_time_t(now);
        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&now_time_t, &tm_buf);
        char time_buf[32];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        line << "[" << time_buf << "." << std::setfill('0') << std::setw(3)
             << now_ms.count() << "]";
    }
    line << "[" << component << "] " << msg << "\n";
    std::cerr << line.str();
}

void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose_mode) return;

    va_list args;
    va_start(args, fmt);
    vlog(component, true, fmt, args);
    va_end(args);
}

void log_info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(component, false, fmt, args);
    va_end(args);
}

void fatal(const char* component, const char* msg) {
    std::cerr << "[" << component << "] FATAL: " << msg << std::endl;
    std::abort();
}

} // namespace rotator
