#ifndef DLIST_LOGGING_HPP
#define DLIST_LOGGING_HPP

#include <format>
#include <iosfwd>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

namespace dlist {

// Format string that remembers where it was written, so the variadic
// arguments can follow it without fighting a defaulted source_location.
struct LogFormat {
    template<typename S>
        requires std::is_convertible_v<const S&, std::string_view>
    LogFormat(const S& text, std::source_location loc = std::source_location::current())
        : format(text), location(loc) {}

    std::string_view format;
    std::source_location location;
};

// Redirects log output (std::cerr by default). Passing nullptr restores std::cerr.
void set_log_stream(std::ostream* stream) noexcept;

// Writes one "[YYYY-mm-dd HH:MM:SS] file:line - message" line to the log stream.
void write_log_line(const std::source_location& location, std::string_view message);

template<typename... Args>
void log_message(LogFormat format, const Args&... args) {
    write_log_line(format.location, std::vformat(format.format, std::make_format_args(args...)));
}

/*

Example Usage:
log_message("erase rejected: slot {} generation {}", 7, 3);

Output:
[2025-03-06 18:05:12] list.hpp:212 - erase rejected: slot 7 generation 3

*/

} // namespace dlist

#endif // DLIST_LOGGING_HPP
