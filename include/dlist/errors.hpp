#ifndef DLIST_ERRORS_HPP
#define DLIST_ERRORS_HPP

#include <expected>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace dlist {

enum class list_errc {
    empty_list = 1,    // pop/front/back with no value nodes
    invalid_iterator,  // erased node, cleared list or destroyed list
    foreign_iterator,  // iterator handed to a list that does not own it
    sentinel_access,   // value/erase on a sentinel, or stepping past one
};

[[nodiscard]] const std::error_category& list_category() noexcept;

[[nodiscard]] inline std::error_code make_error_code(list_errc e) noexcept {
    return {static_cast<int>(e), list_category()};
}

// Non-throwing entry points report through std::expected, like the rest of the code base.
template<typename T>
using Result = std::expected<T, std::error_code>;

class EmptyListError : public std::out_of_range {
public:
    explicit EmptyListError(const std::string& what) : std::out_of_range(what) {}

    [[nodiscard]] std::error_code code() const noexcept { return make_error_code(list_errc::empty_list); }
};

class InvalidIteratorError : public std::logic_error {
public:
    InvalidIteratorError(list_errc reason, const std::string& what)
        : std::logic_error(what), reason_(reason) {}

    [[nodiscard]] std::error_code code() const noexcept { return make_error_code(reason_); }

private:
    list_errc reason_;
};

// Throws EmptyListError for list_errc::empty_list and InvalidIteratorError for
// everything else. With `log` set the rejection is logged first.
[[noreturn]] void raise_error(list_errc reason,
                              std::string_view what,
                              bool log,
                              const std::source_location& location = std::source_location::current());

} // namespace dlist

template<>
struct std::is_error_code_enum<dlist::list_errc> : std::true_type {};

#endif // DLIST_ERRORS_HPP
