#ifndef DLIST_SLOT_STORE_HPP
#define DLIST_SLOT_STORE_HPP

#include <bit>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "dlist/common.hpp"

namespace dlist {

/*
Node store behind a List.

    slots_:  [ head | tail | a | b | (free) | c ]
    chain:     head <-> a <-> c <-> b <-> tail

Links are slot indices, not pointers, so there are no ownership cycles.
A released slot bumps its generation and goes on the free list; a handle
that captured the old generation can always tell that it went stale.
*/
template<typename T>
class SlotStore {
public:
    explicit SlotStore(std::size_t initial_capacity = 0) {
        if (initial_capacity > 0) {
            slots_.reserve(std::bit_ceil(initial_capacity) + 2);
        }
        free_.reserve(slots_.capacity());
        slots_.emplace_back(); // head
        slots_.emplace_back(); // tail
        slots_[HEAD_SLOT].next = TAIL_SLOT;
        slots_[HEAD_SLOT].linked = true;
        slots_[TAIL_SLOT].prev = HEAD_SLOT;
        slots_[TAIL_SLOT].linked = true;
    }

    ~SlotStore() { clear(); }

    SlotStore(const SlotStore&) = delete;
    SlotStore& operator=(const SlotStore&) = delete;
    SlotStore(SlotStore&&) = delete;
    SlotStore& operator=(SlotStore&&) = delete;

    [[nodiscard]] SlotIndex next(SlotIndex index) const noexcept { return slots_[index].next; }
    [[nodiscard]] SlotIndex prev(SlotIndex index) const noexcept { return slots_[index].prev; }
    [[nodiscard]] SlotIndex first() const noexcept { return slots_[HEAD_SLOT].next; }
    [[nodiscard]] SlotIndex last() const noexcept { return slots_[TAIL_SLOT].prev; }

    [[nodiscard]] Generation generation(SlotIndex index) const noexcept { return slots_[index].generation; }

    // True while `index` is part of the chain and has not been released since `gen` was captured.
    [[nodiscard]] bool is_linked(SlotIndex index, Generation gen) const noexcept {
        return index < slots_.size() && slots_[index].linked && slots_[index].generation == gen;
    }

    [[nodiscard]] T& value(SlotIndex index) noexcept { return *slots_[index].value; }
    [[nodiscard]] const T& value(SlotIndex index) const noexcept { return *slots_[index].value; }

    [[nodiscard]] bool empty() const noexcept { return first() == TAIL_SLOT; }

    // O(n): the count is never cached.
    [[nodiscard]] std::size_t count() const noexcept {
        std::size_t n = 0;
        for (SlotIndex i = first(); i != TAIL_SLOT; i = slots_[i].next) {
            ++n;
        }
        return n;
    }

    [[nodiscard]] std::size_t slot_count() const noexcept { return slots_.size(); }
    [[nodiscard]] std::size_t free_count() const noexcept { return free_.size(); }

    template<typename... Args>
    SlotIndex emplace_after(SlotIndex pos, Args&&... args) {
        auto value = std::make_unique<T>(std::forward<Args>(args)...);
        reserve_slots(1);
        SlotIndex index = acquire(std::move(value));
        link_after(pos, index);
        return index;
    }

    template<typename... Args>
    SlotIndex emplace_before(SlotIndex pos, Args&&... args) {
        return emplace_after(slots_[pos].prev, std::forward<Args>(args)...);
    }

    // Splices every item after `pos`, keeping their order. All values are
    // built before the chain is touched, so a throwing copy leaves it as it was.
    template<typename Range>
    void insert_after(SlotIndex pos, Range&& items) {
        std::vector<std::unique_ptr<T>> staged;
        for (auto&& item : items) {
            staged.push_back(std::make_unique<T>(std::forward<decltype(item)>(item)));
        }
        reserve_slots(staged.size());
        for (auto& value : staged) {
            SlotIndex index = acquire(std::move(value));
            link_after(pos, index);
            pos = index;
        }
    }

    template<typename Range>
    void insert_before(SlotIndex pos, Range&& items) {
        insert_after(slots_[pos].prev, std::forward<Range>(items));
    }

    // Unlinks a value slot and hands its item back to the caller.
    T take(SlotIndex index) {
        T item = std::move(*slots_[index].value);
        remove(index);
        return item;
    }

    void remove(SlotIndex index) noexcept {
        unlink(index);
        release(index);
    }

    // Releases every value slot, walking from the head so no recursion is involved.
    void clear() noexcept {
        SlotIndex current = first();
        while (current != TAIL_SLOT) {
            SlotIndex next_index = slots_[current].next;
            release(current);
            current = next_index;
        }
        slots_[HEAD_SLOT].next = TAIL_SLOT;
        slots_[TAIL_SLOT].prev = HEAD_SLOT;
    }

private:
    struct Slot {
        std::unique_ptr<T> value;   // null for sentinels and free slots
        SlotIndex prev{NO_SLOT};
        SlotIndex next{NO_SLOT};
        Generation generation{0};
        bool linked{false};
    };

    std::vector<Slot> slots_;
    std::vector<SlotIndex> free_; // released slots, reused LIFO

    // Guarantees that the next `n` acquisitions cannot throw.
    void reserve_slots(std::size_t n) {
        if (n > free_.size()) {
            std::size_t needed = slots_.size() + (n - free_.size());
            if (needed > slots_.capacity()) {
                slots_.reserve(std::bit_ceil(needed));
            }
        }
        free_.reserve(slots_.capacity()); // release() must never allocate
    }

    SlotIndex acquire(std::unique_ptr<T> value) noexcept {
        SlotIndex index;
        if (!free_.empty()) {
            index = free_.back();
            free_.pop_back();
        } else {
            index = static_cast<SlotIndex>(slots_.size());
            slots_.emplace_back();
        }
        slots_[index].value = std::move(value);
        return index;
    }

    void link_after(SlotIndex pos, SlotIndex index) noexcept {
        Slot& node = slots_[index];
        node.prev = pos;
        node.next = slots_[pos].next;
        slots_[node.next].prev = index;
        slots_[pos].next = index;
        node.linked = true;
    }

    void unlink(SlotIndex index) noexcept {
        Slot& node = slots_[index];
        slots_[node.prev].next = node.next;
        slots_[node.next].prev = node.prev;
        node.linked = false;
    }

    // The generation bump is what invalidates every handle to the slot.
    void release(SlotIndex index) noexcept {
        Slot& node = slots_[index];
        node.value.reset();
        node.prev = NO_SLOT;
        node.next = NO_SLOT;
        node.linked = false;
        ++node.generation;
        free_.push_back(index);
    }
};

} // namespace dlist

#endif // DLIST_SLOT_STORE_HPP
