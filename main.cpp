#include <cstdlib>       // EXIT_SUCCESS, EXIT_FAILURE
#include <exception>     // std::exception
#include <iostream>      // std::cout, std::cerr
#include <string>
#include <string_view>

#include "dlist/list.hpp"
#include "dlist/logging.hpp"

namespace {

void print(std::string_view label, dlist::List<std::string>& list) {
    std::cout << label << ":";
    for (const auto& item : list) {
        std::cout << ' ' << item;
    }
    std::cout << " (" << list.size() << " items)\n";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        dlist::ListConfig config;
        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];
            if (arg == "--verbose") {
                config.log_errors = true;
            } else {
                std::cerr << "usage: " << argv[0] << " [--verbose]\n";
                return EXIT_FAILURE;
            }
        }

        dlist::List<std::string> list({"foo", "bar", "baz"}, config);
        print("initial", list);

        auto bar = list.begin().next();
        list.begin().insert_after({"quz"});
        print("after insert", list);

        list.erase(list.end().previous());
        print("after erase", list);

        // `bar` was taken before both edits and still points at its node.
        std::cout << "held iterator: " << *bar << '\n';

        auto stale = bar;
        list.erase(bar);
        try {
            std::cout << *stale << '\n';
        } catch (const dlist::InvalidIteratorError& e) {
            dlist::log_message("stale iterator rejected: {} [{}]", e.what(), e.code().message());
        }

        while (!list.empty()) {
            std::cout << "popped " << list.pop_back() << '\n';
        }

        auto missing = list.try_pop_front();
        if (!missing) {
            std::cout << "empty list: " << missing.error().message() << '\n';
        }
        return EXIT_SUCCESS;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}
