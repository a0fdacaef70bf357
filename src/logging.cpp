#include "dlist/logging.hpp"

#include <chrono>
#include <ctime>
#include <iostream>

namespace dlist {

namespace {

std::ostream* g_log_stream = nullptr;

std::string_view base_name(std::string_view path) noexcept {
    auto pos = path.find_last_of('/');
    return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

} // namespace

void set_log_stream(std::ostream* stream) noexcept {
    g_log_stream = stream;
}

void write_log_line(const std::source_location& location, std::string_view message) {
    auto time_t_val = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&time_t_val, &local);
    char time_str[20];
    std::strftime(time_str, sizeof(time_str), "%Y-%m-%d %H:%M:%S", &local);

    std::ostream& out = g_log_stream ? *g_log_stream : std::cerr;
    out << std::format("[{}] {}:{} - {}\n",
                       time_str,
                       base_name(location.file_name()),
                       location.line(),
                       message);
}

} // namespace dlist
