#ifndef DLIST_LIST_HPP
#define DLIST_LIST_HPP

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>

#include "dlist/common.hpp"
#include "dlist/errors.hpp"
#include "dlist/slot_store.hpp"

namespace dlist {

// Any input range whose elements convert to T.
template<typename R, typename T>
concept ItemRange = std::ranges::input_range<R>
                 && std::convertible_to<std::ranges::range_reference_t<R>, T>;

// Doubly linked list with stable iterators. An Iterator keeps pointing at
// its element across any insertion or removal of other elements, and every
// use of an iterator whose element (or list) is gone throws instead of
// touching freed memory.
template<typename T>
class List {
    struct Core {
        explicit Core(const ListConfig& cfg) : store(cfg.initial_capacity), config(cfg) {}

        SlotStore<T> store;
        ListConfig config;
    };

public:
    class Iterator {
    public:
        using iterator_category = std::bidirectional_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = T*;
        using reference = T&;

        Iterator() = default; // singular: equal only to other singular iterators, never valid

        [[nodiscard]] T& value() const {
            auto core = checked();
            if (is_sentinel(index_)) {
                raise_error(list_errc::sentinel_access, "cannot dereference a boundary position", core->config.log_errors);
            }
            return core->store.value(index_);
        }

        reference operator*() const { return value(); }
        pointer operator->() const { return &value(); }

        [[nodiscard]] Iterator next() const {
            auto core = checked();
            if (index_ == TAIL_SLOT) {
                raise_error(list_errc::sentinel_access, "cannot advance past the end", core->config.log_errors);
            }
            return at(core->store.next(index_));
        }

        [[nodiscard]] Iterator previous() const {
            auto core = checked();
            if (index_ == HEAD_SLOT) {
                raise_error(list_errc::sentinel_access, "cannot step before the beginning", core->config.log_errors);
            }
            return at(core->store.prev(index_));
        }

        Iterator& operator++() {
            *this = next();
            return *this;
        }

        Iterator operator++(int) {
            Iterator tmp = *this;
            ++*this;
            return tmp;
        }

        Iterator& operator--() {
            *this = previous();
            return *this;
        }

        Iterator operator--(int) {
            Iterator tmp = *this;
            --*this;
            return tmp;
        }

        // New nodes go right after this one, in the given order; this iterator keeps its node.
        void insert_after(std::initializer_list<T> items) { insert_after<std::initializer_list<T>>(std::move(items)); }

        template<ItemRange<T> R>
        void insert_after(R&& items) {
            auto core = checked();
            if (index_ == TAIL_SLOT) {
                raise_error(list_errc::sentinel_access, "cannot insert after the end", core->config.log_errors);
            }
            core->store.insert_after(index_, std::forward<R>(items));
        }

        void insert_before(std::initializer_list<T> items) { insert_before<std::initializer_list<T>>(std::move(items)); }

        template<ItemRange<T> R>
        void insert_before(R&& items) {
            auto core = checked();
            if (index_ == HEAD_SLOT) {
                raise_error(list_errc::sentinel_access, "cannot insert before the beginning", core->config.log_errors);
            }
            core->store.insert_before(index_, std::forward<R>(items));
        }

        [[nodiscard]] bool valid() const noexcept {
            auto core = core_.lock();
            return core && core->store.is_linked(index_, generation_);
        }

        [[nodiscard]] bool is_end() const noexcept { return valid() && index_ == TAIL_SLOT; }

        bool operator==(const Iterator& other) const noexcept {
            return index_ == other.index_
                && generation_ == other.generation_
                && !core_.owner_before(other.core_)
                && !other.core_.owner_before(core_);
        }

        bool operator!=(const Iterator& other) const noexcept {
            return !(*this == other);
        }

    private:
        std::weak_ptr<Core> core_;
        SlotIndex index_{NO_SLOT};
        Generation generation_{0};

        Iterator(std::weak_ptr<Core> core, SlotIndex index, Generation generation) noexcept
            : core_(std::move(core)), index_(index), generation_(generation) {}

        Iterator at(SlotIndex index) const {
            auto core = core_.lock();
            return Iterator(core_, index, core->store.generation(index));
        }

        // Live core of a list that still links this iterator's node, or a throw.
        std::shared_ptr<Core> checked() const {
            auto core = core_.lock();
            if (!core) {
                raise_error(list_errc::invalid_iterator, "iterator outlived its list", false);
            }
            if (!core->store.is_linked(index_, generation_)) {
                raise_error(list_errc::invalid_iterator, "iterator refers to an erased node", core->config.log_errors);
            }
            return core;
        }

        friend class List;
    };

    using value_type = T;
    using size_type = std::size_t;
    using reference = T&;
    using const_reference = const T&;
    using iterator = Iterator;

    List() : List(ListConfig{}) {}
    explicit List(const ListConfig& config) : core_(std::make_shared<Core>(config)) {}

    List(std::initializer_list<T> items, const ListConfig& config = {}) : List(config) {
        push_back(items);
    }

    template<ItemRange<T> R>
        requires (!std::same_as<std::remove_cvref_t<R>, List>)
    explicit List(R&& items, const ListConfig& config = {}) : List(config) {
        push_back(std::forward<R>(items));
    }

    // Dropping the core releases every node iteratively; outstanding iterators see it expire.
    ~List() = default;

    List(const List&) = delete;
    List& operator=(const List&) = delete;

    // Nodes and the iterators into them follow the move; the source is left empty.
    List(List&& other) : core_(std::make_shared<Core>(other.core_->config)) {
        core_.swap(other.core_);
    }

    List& operator=(List&& other) {
        if (this != &other) {
            auto fresh = std::make_shared<Core>(other.core_->config);
            core_ = std::exchange(other.core_, std::move(fresh));
        }
        return *this;
    }

    [[nodiscard]] const ListConfig& config() const noexcept { return core_->config; }

    void push_back(std::initializer_list<T> items) { store().insert_before(TAIL_SLOT, items); }

    template<ItemRange<T> R>
    void push_back(R&& items) { store().insert_before(TAIL_SLOT, std::forward<R>(items)); }

    void push_front(std::initializer_list<T> items) { store().insert_after(HEAD_SLOT, items); }

    template<ItemRange<T> R>
    void push_front(R&& items) { store().insert_after(HEAD_SLOT, std::forward<R>(items)); }

    template<typename... Args>
    Iterator emplace_back(Args&&... args) {
        return make_iterator(store().emplace_before(TAIL_SLOT, std::forward<Args>(args)...));
    }

    template<typename... Args>
    Iterator emplace_front(Args&&... args) {
        return make_iterator(store().emplace_after(HEAD_SLOT, std::forward<Args>(args)...));
    }

    T pop_back() {
        require_items("No items to pop from the list");
        return store().take(store().last());
    }

    T pop_front() {
        require_items("No items to shift from the list");
        return store().take(store().first());
    }

    [[nodiscard]] T& front() {
        require_items("front() called on an empty list");
        return store().value(store().first());
    }

    [[nodiscard]] const T& front() const {
        require_items("front() called on an empty list");
        return store().value(store().first());
    }

    [[nodiscard]] T& back() {
        require_items("back() called on an empty list");
        return store().value(store().last());
    }

    [[nodiscard]] const T& back() const {
        require_items("back() called on an empty list");
        return store().value(store().last());
    }

    Result<T> try_pop_back() {
        if (empty()) {
            return std::unexpected(make_error_code(list_errc::empty_list));
        }
        return store().take(store().last());
    }

    Result<T> try_pop_front() {
        if (empty()) {
            return std::unexpected(make_error_code(list_errc::empty_list));
        }
        return store().take(store().first());
    }

    [[nodiscard]] Result<T> try_front() const {
        if (empty()) {
            return std::unexpected(make_error_code(list_errc::empty_list));
        }
        return store().value(store().first());
    }

    [[nodiscard]] Result<T> try_back() const {
        if (empty()) {
            return std::unexpected(make_error_code(list_errc::empty_list));
        }
        return store().value(store().last());
    }

    [[nodiscard]] bool empty() const noexcept { return store().empty(); }

    // Walks the chain: O(n).
    [[nodiscard]] size_type size() const noexcept { return store().count(); }

    [[nodiscard]] std::vector<T> to_vector() const {
        std::vector<T> items;
        for (SlotIndex i = store().first(); i != TAIL_SLOT; i = store().next(i)) {
            items.push_back(store().value(i));
        }
        return items;
    }

    [[nodiscard]] Iterator begin() noexcept { return make_iterator(store().first()); }
    [[nodiscard]] Iterator end() noexcept { return make_iterator(TAIL_SLOT); }

    // Unlinks the node under `it` and returns an iterator to whatever followed it
    // (end() when it was the last one). `it` and all of its copies become invalid.
    Iterator erase(Iterator it) {
        bool log = core_->config.log_errors;
        auto owner = it.core_.lock();
        if (!owner) {
            raise_error(list_errc::invalid_iterator, "erase through an iterator whose list is gone", log);
        }
        if (owner != core_) {
            raise_error(list_errc::foreign_iterator, "erase through an iterator of another list", log);
        }
        if (is_sentinel(it.index_)) {
            raise_error(list_errc::sentinel_access, "cannot erase a boundary position", log);
        }
        if (!store().is_linked(it.index_, it.generation_)) {
            raise_error(list_errc::invalid_iterator, "erase through an iterator to an erased node", log);
        }

        SlotIndex following = store().next(it.index_);
        store().remove(it.index_);
        return make_iterator(following);
    }

    // Every value iterator is invalidated; begin() == end() afterwards.
    void clear() noexcept { store().clear(); }

private:
    std::shared_ptr<Core> core_; // never shared; iterators only hold weak references

    SlotStore<T>& store() noexcept { return core_->store; }
    const SlotStore<T>& store() const noexcept { return core_->store; }

    Iterator make_iterator(SlotIndex index) const noexcept {
        return Iterator(core_, index, store().generation(index));
    }

    void require_items(const char* what) const {
        if (empty()) {
            raise_error(list_errc::empty_list, what, core_->config.log_errors);
        }
    }
};

} // namespace dlist

#endif // DLIST_LIST_HPP
