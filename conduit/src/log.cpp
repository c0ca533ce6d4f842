#include <conduit/log.hpp>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <fcntl.h>
#include <unistd.h>

namespace conduit::log {

namespace {

std::atomic<bool> verbose_mode{false};
std::mutex write_mutex;

void write_line(const char* component, const char* prefix, const char* fmt, va_list args) {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&now_time_t, &local);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local);

    std::lock_guard<std::mutex> lock(write_mutex);
    std::fprintf(stderr, "[%s.%03d][%s] %s", time_buf,
                 static_cast<int>(now_ms.count()), component, prefix);
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
    std::fflush(stderr);
}

}  // anonymous namespace

void set_verbose(bool on) {
    verbose_mode.store(on);
}

bool verbose() {
    return verbose_mode.load();
}

void debug(const char* component, const char* fmt, ...) {
    if (!verbose_mode) return;

    va_list args;
    va_start(args, fmt);
    write_line(component, "", fmt, args);
    va_end(args);
}

void info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(component, "", fmt, args);
    va_end(args);
}

void warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(component, "WARNING: ", fmt, args);
    va_end(args);
}

void error(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(component, "ERROR: ", fmt, args);
    va_end(args);
}

bool redirect_to_file(const std::string& path) {
    int log_fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (log_fd < 0) {
        return false;
    }
    std::fflush(stdout);
    std::fflush(stderr);
    dup2(log_fd, STDOUT_FILENO);
    dup2(log_fd, STDERR_FILENO);
    close(log_fd);
    return true;
}

} // namespace conduit::log
