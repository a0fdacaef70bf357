#include "dlist/errors.hpp"
#include "dlist/logging.hpp"

namespace dlist {

namespace {

class ListCategory final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "dlist"; }

    [[nodiscard]] std::string message(int value) const override {
        switch (static_cast<list_errc>(value)) {
            case list_errc::empty_list:
                return "list is empty";
            case list_errc::invalid_iterator:
                return "iterator no longer refers to a node of a live list";
            case list_errc::foreign_iterator:
                return "iterator belongs to a different list";
            case list_errc::sentinel_access:
                return "operation not allowed on a boundary position";
        }
        return "unknown dlist error";
    }
};

} // namespace

const std::error_category& list_category() noexcept {
    static const ListCategory category;
    return category;
}

void raise_error(list_errc reason, std::string_view what, bool log, const std::source_location& location) {
    if (log) {
        log_message(LogFormat("rejected: {} ({})", location), what, list_category().message(static_cast<int>(reason)));
    }
    if (reason == list_errc::empty_list) {
        throw EmptyListError(std::string(what));
    }
    throw InvalidIteratorError(reason, std::string(what));
}

} // namespace dlist
