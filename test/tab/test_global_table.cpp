/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>
#include "tab/tab.hpp"
#include "test_helpers.h"

using namespace ktab;
using namespace ktab::tab;
using ktab::testing::Counter;
using ktab::testing::Other;
using ktab::testing::Tracked;
using ktab::testing::FailingPageFrameAllocator;
using ktab::testing::CountingTracker;

namespace {
    TableConfig full_version_space() {
        TableConfig cfg;
        cfg.max_version_before_tombstone = version_policy::kMaxVersionBeforeTombstone;
        cfg.zombie_tombs = false;
        return cfg;
    }

    int read_value(const Tab<Counter>& t) {
        return t.with([](const Counter& c) { return c.value; });
    }
}

class GlobalTableTest : public ::testing::Test {
protected:
    memmgr::HostPhysMemory mem{ktab::testing::kTestFrames};
    FailingPageFrameAllocator pfa{mem.allocator()};
    std::unique_ptr<GlobalTable> table;

    void SetUp() override {
        table = std::make_unique<GlobalTable>(pfa, mem.translator(), full_version_space());
    }

    void TearDown() override {
        table.reset();
    }
};

TEST_F(GlobalTableTest, AddThenReadBack) {
    for (int v : {0, 1, -5, 42, 1 << 30}) {
        auto t = table->add(Counter{v});
        ASSERT_TRUE(t.has_value());
        EXPECT_EQ(read_value(*t), v);
    }
}

TEST_F(GlobalTableTest, FirstTabLayout) {
    auto t = table->add(Counter{1});
    ASSERT_TRUE(t);
    EXPECT_TRUE(t->id().is_dynamic());
    EXPECT_EQ(t->id().slot_address(), 0u);
    EXPECT_EQ(t->id().version(), 1u);
    EXPECT_EQ(t->use_count(), 1u);

    // root, L1, L2 and one SlotList
    EXPECT_EQ(table->get_stats().pages_allocated, 4u);
    EXPECT_EQ(table->minted(), 1u);
}

TEST_F(GlobalTableTest, RefcountFollowsCopies) {
    auto t = table->add(Counter{9});
    ASSERT_TRUE(t);
    const TabId id = t->id();

    std::vector<Tab<Counter>> copies;
    for (int i = 0; i < 5; ++i) {
        copies.push_back(*t);
    }
    EXPECT_EQ(t->use_count(), 6u);

    // Five drops leave the slot alive
    copies.clear();
    EXPECT_EQ(t->use_count(), 1u);
    EXPECT_EQ(table->get_stats().tabs_freed, 0u);
    EXPECT_TRUE(table->lookup_any(id).has_value());

    // The sixth frees it
    t.reset();
    EXPECT_EQ(table->get_stats().tabs_freed, 1u);
    EXPECT_FALSE(table->lookup_any(id).has_value());
}

TEST_F(GlobalTableTest, MovedFromHandleHoldsNothing) {
    auto t = table->add(Counter{3});
    ASSERT_TRUE(t);
    Tab<Counter> moved = std::move(*t);
    EXPECT_FALSE(static_cast<bool>(*t));
    EXPECT_EQ(t->use_count(), 0u);
    EXPECT_EQ(moved.use_count(), 1u);

    Tab<Counter> assigned = moved;
    EXPECT_EQ(moved.use_count(), 2u);
    assigned = std::move(moved);
    EXPECT_EQ(assigned.use_count(), 1u);

    t.reset();
    EXPECT_EQ(table->get_stats().tabs_freed, 0u);
    EXPECT_EQ(read_value(assigned), 3);
}

TEST_F(GlobalTableTest, FreedThenImmediatelyQueried) {
    TabId id;
    {
        auto t = table->add(Counter{5});
        ASSERT_TRUE(t);
        id = t->id();
    }
    EXPECT_FALSE(table->lookup_any(id).has_value());
    EXPECT_FALSE(table->lookup<Counter>(id).has_value());
}

TEST_F(GlobalTableTest, StaleIdAfterReuseDoesNotResolve) {
    TabId old_id;
    {
        auto t = table->add(Counter{1});
        ASSERT_TRUE(t);
        old_id = t->id();
    }

    auto t2 = table->add(Counter{2});
    ASSERT_TRUE(t2);
    // LIFO free list hands the same address back with the next version
    EXPECT_EQ(t2->id().slot_address(), old_id.slot_address());
    EXPECT_EQ(t2->id().version(), old_id.version() + 1);

    EXPECT_FALSE(table->lookup_any(old_id).has_value());
    auto again = table->lookup<Counter>(t2->id());
    ASSERT_TRUE(again);
    EXPECT_EQ(read_value(*again), 2);
}

namespace {
    // Remembers the ids user counts were reported under
    class UserIdTracker : public TabTracker {
    public:
        void on_user_add(TabId id, uint64_t) override { added.push_back(id); }
        void on_user_remove(TabId id, uint64_t) override { removed.push_back(id); }

        std::vector<TabId> added;
        std::vector<TabId> removed;
    };
}

TEST_F(GlobalTableTest, StaleLookupCountsAgainstOccupant) {
    TabId old_id;
    {
        auto t = table->add(Counter{1});
        ASSERT_TRUE(t);
        old_id = t->id();
    }
    auto occupant = table->add(Counter{2});
    ASSERT_TRUE(occupant);
    ASSERT_NE(occupant->id(), old_id);

    UserIdTracker ids;
    table->set_tracker(&ids);
    EXPECT_FALSE(table->lookup_any(old_id).has_value());
    table->set_tracker(nullptr);

    ASSERT_EQ(ids.added.size(), 1u);
    ASSERT_EQ(ids.removed.size(), 1u);
    EXPECT_EQ(ids.added[0], occupant->id());
    EXPECT_EQ(ids.removed[0], occupant->id());
    EXPECT_EQ(occupant->use_count(), 1u);
}

TEST_F(GlobalTableTest, LookupWrongTypeIsEmpty) {
    auto t = table->add(Counter{11});
    ASSERT_TRUE(t);
    EXPECT_FALSE(table->lookup<Other>(t->id()).has_value());
    EXPECT_EQ(t->use_count(), 1u);

    auto any = table->lookup_any(t->id());
    ASSERT_TRUE(any);
    EXPECT_EQ(any->ty(), TabType::Module);
    EXPECT_EQ(any->id(), t->id());
    EXPECT_EQ(t->use_count(), 2u);

    auto wrong = std::move(*any).try_into<Other>();
    EXPECT_FALSE(wrong.has_value());
    EXPECT_TRUE(static_cast<bool>(*any));
    EXPECT_EQ(t->use_count(), 2u);

    auto right = std::move(*any).try_into<Counter>();
    ASSERT_TRUE(right.has_value());
    EXPECT_FALSE(static_cast<bool>(*any));
    EXPECT_EQ(t->use_count(), 2u);
    EXPECT_EQ(read_value(*right), 11);
}

TEST_F(GlobalTableTest, IntoAnyTransfersReference) {
    auto t = table->add(Counter{4});
    ASSERT_TRUE(t);
    const TabId id = t->id();

    AnyTab any = std::move(*t).into_any();
    EXPECT_EQ(any.id(), id);
    EXPECT_EQ(any.use_count(), 1u);
    EXPECT_EQ(any.ty(), TabType::Module);

    AnyTab copy = any;
    EXPECT_EQ(any.use_count(), 2u);
}

TEST_F(GlobalTableTest, UnknownIdsDoNotResolveOrAllocate) {
    auto t = table->add(Counter{1});
    ASSERT_TRUE(t);
    const uint64_t pages = table->get_stats().pages_allocated;

    // Static id, never-minted address, and a minted address in an
    // untouched part of the trie
    EXPECT_FALSE(table->lookup_any(uint64_t{42}).has_value());
    EXPECT_FALSE(table->lookup_any(TabId::from_parts(1, 1)).has_value());
    EXPECT_FALSE(table->lookup_any(TabId::from_parts(1000000, 1)).has_value());
    EXPECT_FALSE(table->lookup_any(TabId::from_parts(0, 1).raw() & ~id_layout::kDynamicBit).has_value());

    EXPECT_EQ(table->get_stats().pages_allocated, pages);
    EXPECT_EQ(table->get_stats().lookup_misses, 4u);
}

TEST_F(GlobalTableTest, ConcreteScenario) {
    auto first = table->add(Counter{42});
    ASSERT_TRUE(first);
    const TabId x = first->id();

    auto found = table->lookup<Counter>(x);
    ASSERT_TRUE(found);
    EXPECT_EQ(read_value(*found), 42);
    EXPECT_EQ(table->get_stats().pages_allocated, 4u);

    std::vector<Tab<Counter>> tabs;
    for (int i = 0; i < 200; ++i) {
        auto t = table->add(Counter{1000 + i});
        ASSERT_TRUE(t);
        tabs.push_back(std::move(*t));
    }
    // 201 slots span two SlotList pages
    EXPECT_EQ(table->get_stats().pages_allocated, 5u);
    EXPECT_EQ(tabs.back().id().l2_index(), 1u);

    auto early = table->lookup<Counter>(x);
    ASSERT_TRUE(early);
    EXPECT_EQ(read_value(*early), 42);

    auto late = table->lookup<Counter>(tabs.back().id());
    ASSERT_TRUE(late);
    EXPECT_EQ(read_value(*late), 1199);

    for (size_t i = 0; i < tabs.size(); ++i) {
        auto t = table->lookup<Counter>(tabs[i].id().raw());
        ASSERT_TRUE(t) << "tab " << i;
        EXPECT_EQ(read_value(*t), 1000 + static_cast<int>(i));
    }
}

TEST_F(GlobalTableTest, WithMutModifiesPayload) {
    auto t = table->add(Counter{1});
    ASSERT_TRUE(t);
    int old = t->with_mut([](Counter& c) {
        int prev = c.value;
        c.value = 99;
        return prev;
    });
    EXPECT_EQ(old, 1);

    auto other = table->lookup<Counter>(t->id());
    ASSERT_TRUE(other);
    EXPECT_EQ(read_value(*other), 99);
}

TEST_F(GlobalTableTest, PayloadDestroyedOnLastDrop) {
    std::atomic<int> live{0};
    {
        auto t = table->add(Tracked(&live));
        ASSERT_TRUE(t);
        EXPECT_EQ(live.load(), 1);
        {
            Tab<Tracked> copy = *t;
            AnyTab any = Tab<Tracked>(copy).into_any();
        }
        EXPECT_EQ(live.load(), 1);
    }
    EXPECT_EQ(live.load(), 0);
}

TEST_F(GlobalTableTest, ConcurrentAddNeverIssuesTwice) {
    const int kThreads = 8;
    const int kPerThread = 500;
    std::vector<std::vector<Tab<Counter>>> held(kThreads);
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            while (!go.load()) std::this_thread::yield();
            for (int i = 0; i < kPerThread; ++i) {
                auto tab = table->add(Counter{t * 100000 + i});
                if (tab) held[t].push_back(std::move(*tab));
            }
        });
    }
    go.store(true);
    for (auto& th : threads) th.join();

    std::set<uint64_t> ids;
    std::set<uint64_t> addresses;
    for (int t = 0; t < kThreads; ++t) {
        ASSERT_EQ(held[t].size(), static_cast<size_t>(kPerThread));
        for (int i = 0; i < kPerThread; ++i) {
            const Tab<Counter>& tab = held[t][i];
            ids.insert(tab.id().raw());
            addresses.insert(tab.id().slot_address());
            EXPECT_EQ(read_value(tab), t * 100000 + i);
        }
    }
    EXPECT_EQ(ids.size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(addresses.size(), static_cast<size_t>(kThreads * kPerThread));
}

TEST_F(GlobalTableTest, ConcurrentChurnBalances) {
    const int kThreads = 8;
    const int kIterations = 2000;
    std::atomic<int> errors{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kIterations; ++i) {
                const int v = t * 100000 + i;
                auto tab = table->add(Counter{v});
                if (!tab) {
                    errors++;
                    continue;
                }
                auto again = table->lookup<Counter>(tab->id());
                if (!again || read_value(*again) != v) errors++;
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(errors.load(), 0);
    auto stats = table->get_stats();
    EXPECT_EQ(stats.tabs_added, static_cast<uint64_t>(kThreads * kIterations));
    EXPECT_EQ(stats.tabs_freed, stats.tabs_added);
    // Reuse keeps the footprint near the number of threads
    EXPECT_LE(table->minted(), static_cast<uint64_t>(kThreads * 2));
}

TEST_F(GlobalTableTest, LookupRacingWithDropNeverResurrects) {
    auto t = table->add(Counter{7});
    ASSERT_TRUE(t);
    const TabId id = t->id();

    std::atomic<bool> stop{false};
    std::atomic<int> bad{0};
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            while (!stop.load()) {
                auto found = table->lookup<Counter>(id);
                if (found && read_value(*found) != 7) bad++;
            }
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    t.reset();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    stop.store(true);
    for (auto& th : readers) th.join();

    EXPECT_EQ(bad.load(), 0);
    EXPECT_FALSE(table->lookup_any(id).has_value());
    EXPECT_EQ(table->get_stats().tabs_freed, 1u);
}

TEST_F(GlobalTableTest, OutOfMemoryOnFirstAdd) {
    std::atomic<int> live{0};
    pfa.fail_all();

    auto t = table->add(Tracked(&live));
    EXPECT_FALSE(t.has_value());
    EXPECT_EQ(live.load(), 0);
    EXPECT_GE(table->get_stats().alloc_failures, 1u);

    pfa.allow_all();
    auto ok = table->add(Counter{1});
    ASSERT_TRUE(ok);
    // The address minted during the failure is not reused
    EXPECT_EQ(ok->id().slot_address(), 1u);
    EXPECT_EQ(table->minted(), 2u);
}

TEST_F(GlobalTableTest, OutOfMemoryPartwayDownTheTrie) {
    pfa.allow(2);  // root and L1 only
    EXPECT_FALSE(table->add(Counter{1}).has_value());
    EXPECT_EQ(table->get_stats().pages_allocated, 2u);

    pfa.allow_all();
    auto ok = table->add(Counter{2});
    ASSERT_TRUE(ok);
    EXPECT_EQ(table->get_stats().pages_allocated, 4u);
    EXPECT_EQ(read_value(*ok), 2);
}

TEST_F(GlobalTableTest, InvalidConfigRejected) {
    TableConfig cfg;
    cfg.max_version_before_tombstone = 100;
    EXPECT_THROW({ GlobalTable bad(pfa, mem.translator(), cfg); }, std::invalid_argument);

    cfg.max_version_before_tombstone = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
    cfg.max_version_before_tombstone = (1ull << 30) - 1;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
    cfg.max_version_before_tombstone = 255;
    EXPECT_NO_THROW(cfg.validate());
}

TEST_F(GlobalTableTest, TrackerSeesEvents) {
    CountingTracker counting;
    table->set_tracker(&counting);
    {
        auto t = table->add(Counter{1});
        ASSERT_TRUE(t);
        EXPECT_EQ(counting.adds.load(), 1);
        EXPECT_EQ(counting.page_allocs.load(), 4);

        Tab<Counter> copy = *t;
        EXPECT_EQ(counting.user_adds.load(), 1);

        read_value(copy);
        copy.with_mut([](Counter& c) { c.value++; });
        EXPECT_EQ(counting.read_locks.load(), 1);
        EXPECT_EQ(counting.read_unlocks.load(), 1);
        EXPECT_EQ(counting.write_locks.load(), 1);
        EXPECT_EQ(counting.write_unlocks.load(), 1);
    }
    EXPECT_EQ(counting.user_removes.load(), 2);
    EXPECT_EQ(counting.frees.load(), 1);
    EXPECT_EQ(counting.tombs.load(), 0);
    table->set_tracker(nullptr);
}

TEST_F(GlobalTableTest, OtherCoreCannotWriteWhileHeld) {
    auto t = table->add(Counter{0});
    ASSERT_TRUE(t);
    Slot* slot = table->try_get_slot(t->id());
    ASSERT_NE(slot, nullptr);

    auto other_core_try_write = [slot]() {
        bool got = false;
        std::thread b([&]() {
            got = slot->try_lock_write(current_core_id());
            if (got) slot->unlock_write();
        });
        b.join();
        return got;
    };

    t->with_mut([&](Counter& c) {
        EXPECT_FALSE(other_core_try_write());
        // Same core may nest
        t->with_mut([](Counter& inner) { inner.value += 1; });
        c.value += 1;
        EXPECT_FALSE(other_core_try_write());
    });
    EXPECT_TRUE(other_core_try_write());
    EXPECT_EQ(read_value(*t), 2);
}

TEST_F(GlobalTableTest, ReaderWaitsForWriter) {
    auto t = table->add(Counter{0});
    ASSERT_TRUE(t);
    std::atomic<bool> writing{false};
    std::atomic<int> seen{-1};
    std::thread reader;

    t->with_mut([&](Counter& c) {
        writing.store(true);
        reader = std::thread([&]() { seen.store(read_value(*t)); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        EXPECT_EQ(seen.load(), -1);
        c.value = 5;
    });
    reader.join();
    EXPECT_EQ(seen.load(), 5);
}

class TombstoneTest : public ::testing::Test {
protected:
    memmgr::HostPhysMemory mem{64};
};

TEST_F(TombstoneTest, SaturatedSlotIsRetired) {
    TableConfig cfg = TableConfig::debug_tombs();
    cfg.zombie_tombs = false;
    GlobalTable table(mem.allocator(), mem.translator(), cfg);

    auto bystander = table.add(Counter{-1});
    ASSERT_TRUE(bystander);
    ASSERT_EQ(bystander->id().slot_address(), 0u);

    TabId last;
    for (int i = 1; i <= 255; ++i) {
        auto t = table.add(Counter{i});
        ASSERT_TRUE(t);
        ASSERT_EQ(t->id().slot_address(), 1u) << "cycle " << i;
        ASSERT_EQ(t->id().version(), static_cast<uint64_t>(i));
        last = t->id();
    }
    EXPECT_EQ(last.version(), 255u);
    EXPECT_EQ(table.get_stats().tombs, 1u);

    // The retired address never comes back
    for (int i = 0; i < 20; ++i) {
        auto t = table.add(Counter{i});
        ASSERT_TRUE(t);
        EXPECT_NE(t->id().slot_address(), 1u);
    }
    EXPECT_FALSE(table.lookup_any(last).has_value());
    EXPECT_EQ(table.minted(), 3u);

    auto still = table.lookup<Counter>(bystander->id());
    ASSERT_TRUE(still);
    EXPECT_EQ(read_value(*still), -1);
}

TEST_F(TombstoneTest, ZombieTombsKeepReusing) {
    TableConfig cfg = TableConfig::debug_tombs();
    cfg.zombie_tombs = true;
    GlobalTable table(mem.allocator(), mem.translator(), cfg);

    for (int i = 1; i <= 255; ++i) {
        auto t = table.add(Counter{i});
        ASSERT_TRUE(t);
    }
    auto wrapped = table.add(Counter{0});
    ASSERT_TRUE(wrapped);
    EXPECT_EQ(wrapped->id().slot_address(), 0u);
    EXPECT_EQ(wrapped->id().version(), 0u);
    EXPECT_EQ(table.get_stats().tombs, 0u);
    EXPECT_EQ(table.minted(), 1u);

    auto found = table.lookup<Counter>(wrapped->id());
    ASSERT_TRUE(found);
    EXPECT_EQ(read_value(*found), 0);
}

TEST(GlobalTableSingletonTest, SingleInstance) {
    GlobalTable& a = GlobalTable::get();
    GlobalTable& b = GlobalTable::get();
    EXPECT_EQ(&a, &b);

    auto t = a.add(Counter{314});
    ASSERT_TRUE(t);
    auto found = b.lookup<Counter>(t->id());
    ASSERT_TRUE(found);
    EXPECT_EQ(read_value(*found), 314);
}

#ifndef NDEBUG
using GlobalTableDeathTest = GlobalTableTest;

TEST_F(GlobalTableDeathTest, ReadInsideOwnWriteAborts) {
    auto t = table->add(Counter{1});
    ASSERT_TRUE(t);
    EXPECT_DEATH({
        t->with_mut([&](Counter&) {
            read_value(*t);
        });
    }, "deadlock");
}

TEST_F(GlobalTableDeathTest, EmptyHandleAccessAborts) {
    auto t = table->add(Counter{1});
    ASSERT_TRUE(t);
    Tab<Counter> moved = std::move(*t);
    EXPECT_DEATH(read_value(*t), "with\\(\\) on an empty tab");
    EXPECT_DEATH(t->with_mut([](Counter& c) { c.value = 2; }), "with_mut\\(\\) on an empty tab");

    AnyTab any = std::move(moved).into_any();
    AnyTab other = std::move(any);
    EXPECT_DEATH(any.ty(), "type of an empty tab");
    EXPECT_EQ(other.ty(), TabType::Module);
}
#endif
