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
#include <cstring>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>
#include "memmgr/host_phys_memory.h"
#include "memmgr/page_frame_allocator.h"

using namespace ktab::memmgr;

class PageFrameAllocatorTest : public ::testing::Test {
protected:
    HostPhysMemory mem{16};
};

TEST_F(PageFrameAllocatorTest, FramesAreAlignedAndDistinct) {
    std::set<PhysAddr> seen;
    for (size_t i = 0; i < mem.frame_count(); ++i) {
        auto frame = mem.allocator().allocate();
        ASSERT_TRUE(frame.has_value()) << "frame " << i;
        EXPECT_TRUE(is_page_aligned(*frame));
        EXPECT_GE(*frame, HostPhysMemory::kDefaultPhysBase);
        EXPECT_LT(*frame, HostPhysMemory::kDefaultPhysBase + mem.frame_count() * kPageSize);
        EXPECT_TRUE(seen.insert(*frame).second) << "frame handed out twice";
    }
    EXPECT_EQ(mem.frames_in_use(), mem.frame_count());
}

TEST_F(PageFrameAllocatorTest, FirstFrameIsPhysBase) {
    auto frame = mem.allocator().allocate();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(*frame, HostPhysMemory::kDefaultPhysBase);
}

TEST_F(PageFrameAllocatorTest, FreedFramesComeBackLastInFirstOut) {
    PageFrameAllocator& pfa = mem.allocator();
    auto a = pfa.allocate();
    auto b = pfa.allocate();
    auto c = pfa.allocate();
    ASSERT_TRUE(a && b && c);

    pfa.free(*a);
    pfa.free(*c);
    EXPECT_EQ(mem.frames_in_use(), 1u);

    auto first = pfa.allocate();
    auto second = pfa.allocate();
    ASSERT_TRUE(first && second);
    EXPECT_EQ(*first, *c);
    EXPECT_EQ(*second, *a);
    EXPECT_EQ(mem.frames_in_use(), 3u);
}

TEST_F(PageFrameAllocatorTest, ReusedFrameIsZeroed) {
    PageFrameAllocator& pfa = mem.allocator();
    auto frame = pfa.allocate();
    ASSERT_TRUE(frame);

    auto* bytes = static_cast<unsigned char*>(mem.translator().translate(*frame));
    std::memset(bytes, 0xAB, kPageSize);
    pfa.free(*frame);

    auto again = pfa.allocate();
    ASSERT_TRUE(again);
    ASSERT_EQ(*again, *frame);
    for (size_t i = 0; i < kPageSize; ++i) {
        ASSERT_EQ(bytes[i], 0u) << "byte " << i;
    }
}

TEST_F(PageFrameAllocatorTest, ExhaustionIsEmptyAndRecoverable) {
    PageFrameAllocator& pfa = mem.allocator();
    std::vector<PhysAddr> frames;
    while (auto f = pfa.allocate()) {
        frames.push_back(*f);
    }
    EXPECT_EQ(frames.size(), mem.frame_count());
    EXPECT_FALSE(pfa.allocate().has_value());

    pfa.free(frames.back());
    auto f = pfa.allocate();
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(*f, frames.back());
    EXPECT_FALSE(pfa.allocate().has_value());
}

TEST_F(PageFrameAllocatorTest, LinearTranslation) {
    const PhysTranslator& xlat = mem.translator();
    auto* base = static_cast<unsigned char*>(xlat.translate(HostPhysMemory::kDefaultPhysBase));
    auto* third = static_cast<unsigned char*>(xlat.translate(HostPhysMemory::kDefaultPhysBase + 2 * kPageSize));
    EXPECT_EQ(third - base, static_cast<std::ptrdiff_t>(2 * kPageSize));
}

TEST(HostPhysMemoryTest, ZeroFramesRejected) {
    EXPECT_THROW({ HostPhysMemory empty(0); }, std::invalid_argument);
}

TEST(HostPhysMemoryTest, CustomPhysBase) {
    HostPhysMemory mem(4, 0x200000);
    auto f = mem.allocator().allocate();
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(*f, 0x200000u);
}

TEST(LockedPageFrameAllocatorTest, ConcurrentCoresNeverShareAFrame) {
    const int kThreads = 8;
    const int kPerThread = 32;
    HostPhysMemory mem(kThreads * kPerThread);
    std::atomic<bool> go{false};
    std::vector<std::vector<PhysAddr>> got(kThreads);
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            for (int i = 0; i < kPerThread; ++i) {
                auto f = mem.allocator().allocate();
                if (f) got[t].push_back(*f);
                // Churn a little so the free stack is exercised concurrently
                if (i % 4 == 3 && !got[t].empty()) {
                    mem.allocator().free(got[t].back());
                    got[t].pop_back();
                }
            }
        });
    }
    go.store(true);
    for (auto& th : threads) th.join();

    std::set<PhysAddr> all;
    size_t total = 0;
    for (const auto& v : got) {
        for (PhysAddr f : v) {
            all.insert(f);
            ++total;
        }
    }
    EXPECT_EQ(all.size(), total);
    EXPECT_EQ(mem.frames_in_use(), total);
}
