#include <gtest/gtest.h>
#include "dlist/slot_store.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using dlist::SlotStore;
using dlist::SlotIndex;
using dlist::HEAD_SLOT;
using dlist::TAIL_SLOT;

namespace {

template<typename T>
std::vector<T> forward_walk(const SlotStore<T>& store) {
    std::vector<T> out;
    for (SlotIndex i = store.first(); i != TAIL_SLOT; i = store.next(i)) {
        out.push_back(store.value(i));
    }
    return out;
}

template<typename T>
std::vector<T> backward_walk(const SlotStore<T>& store) {
    std::vector<T> out;
    for (SlotIndex i = store.last(); i != HEAD_SLOT; i = store.prev(i)) {
        out.insert(out.begin(), store.value(i));
    }
    return out;
}

struct Counted {
    static inline int alive = 0;
    int id;
    explicit Counted(int i) : id(i) { ++alive; }
    Counted(const Counted& other) : id(other.id) { ++alive; }
    ~Counted() { --alive; }
};

} // namespace

TEST(SlotStoreTest, FreshStoreLinksSentinelsToEachOther) {
    SlotStore<int> store;
    EXPECT_TRUE(store.empty());
    EXPECT_EQ(store.first(), TAIL_SLOT);
    EXPECT_EQ(store.last(), HEAD_SLOT);
    EXPECT_EQ(store.count(), 0u);
    EXPECT_EQ(store.slot_count(), 2u);
    EXPECT_TRUE(store.is_linked(HEAD_SLOT, 0));
    EXPECT_TRUE(store.is_linked(TAIL_SLOT, 0));
}

TEST(SlotStoreTest, InsertKeepsBothDirectionsConsistent) {
    SlotStore<int> store;
    store.insert_before(TAIL_SLOT, std::vector<int>{1, 2, 3});
    store.insert_after(HEAD_SLOT, std::vector<int>{-1, 0});

    std::vector<int> expected{-1, 0, 1, 2, 3};
    EXPECT_EQ(forward_walk(store), expected);
    EXPECT_EQ(backward_walk(store), expected);
    EXPECT_EQ(store.count(), 5u);
}

TEST(SlotStoreTest, EmplaceReturnsLinkedSlot) {
    SlotStore<std::string> store;
    SlotIndex a = store.emplace_before(TAIL_SLOT, "a");
    SlotIndex c = store.emplace_after(a, "c");
    SlotIndex b = store.emplace_before(c, 3, 'b');

    EXPECT_EQ(store.value(b), "bbb");
    EXPECT_EQ(store.next(a), b);
    EXPECT_EQ(store.prev(c), b);
    EXPECT_EQ(forward_walk(store), (std::vector<std::string>{"a", "bbb", "c"}));
}

TEST(SlotStoreTest, RemoveBumpsGenerationAndRecyclesSlot) {
    SlotStore<int> store;
    SlotIndex a = store.emplace_before(TAIL_SLOT, 10);
    auto gen = store.generation(a);

    EXPECT_EQ(store.take(a), 10);
    EXPECT_FALSE(store.is_linked(a, gen));
    EXPECT_EQ(store.free_count(), 1u);
    EXPECT_TRUE(store.empty());

    SlotIndex reused = store.emplace_before(TAIL_SLOT, 20);
    EXPECT_EQ(reused, a);
    EXPECT_EQ(store.free_count(), 0u);
    EXPECT_FALSE(store.is_linked(reused, gen));
    EXPECT_TRUE(store.is_linked(reused, store.generation(reused)));
}

TEST(SlotStoreTest, OutOfRangeIndexIsNeverLinked) {
    SlotStore<int> store;
    EXPECT_FALSE(store.is_linked(1000, 0));
    EXPECT_FALSE(store.is_linked(dlist::NO_SLOT, 0));
}

TEST(SlotStoreTest, ClearReleasesEveryValueOnce) {
    Counted::alive = 0;
    {
        SlotStore<Counted> store;
        for (int i = 0; i < 100; ++i) {
            store.emplace_before(TAIL_SLOT, i);
        }
        EXPECT_EQ(Counted::alive, 100);

        store.clear();
        EXPECT_EQ(Counted::alive, 0);
        EXPECT_TRUE(store.empty());
        EXPECT_EQ(store.free_count(), 100u);

        store.emplace_before(TAIL_SLOT, 7);
        EXPECT_EQ(Counted::alive, 1);
    }
    EXPECT_EQ(Counted::alive, 0);
}

TEST(SlotStoreTest, LongChainTearsDownIteratively) {
    Counted::alive = 0;
    {
        SlotStore<Counted> store;
        for (int i = 0; i < 200000; ++i) {
            store.emplace_before(TAIL_SLOT, i);
        }
    }
    EXPECT_EQ(Counted::alive, 0);
}

TEST(SlotStoreTest, ThrowingCopyLeavesChainUntouched) {
    struct Fussy {
        int v;
        explicit Fussy(int x) : v(x) {}
        Fussy(const Fussy& other) : v(other.v) {
            if (v < 0) {
                throw std::runtime_error("negative");
            }
        }
    };

    SlotStore<Fussy> store;
    store.emplace_before(TAIL_SLOT, 1);
    std::vector<Fussy> batch{Fussy(2), Fussy(3)};
    batch.emplace_back(-1);

    EXPECT_THROW(store.insert_before(TAIL_SLOT, batch), std::runtime_error);
    EXPECT_EQ(store.count(), 1u);
    EXPECT_EQ(store.value(store.first()).v, 1);
}

TEST(SlotStoreTest, InitialCapacityIsReserved) {
    SlotStore<int> store(5);
    for (int i = 0; i < 8; ++i) {
        store.emplace_before(TAIL_SLOT, i);
    }
    EXPECT_EQ(store.count(), 8u);
    EXPECT_EQ(store.slot_count(), 10u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
