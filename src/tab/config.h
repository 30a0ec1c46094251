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

#pragma once
#include <cstdint>
#include <cstddef>

#include "../memmgr/phys.h"

// Build switches (see CMakeLists.txt):
//   KTAB_ZOMBIE_TOMBS  wrap saturated versions back to zero instead of
//                      retiring the slot. Reintroduces ABA risk.
//   KTAB_DEBUG_TOMBS   debug builds only: retire slots after 255 versions
//                      so tombstoning can be exercised quickly.

namespace ktab {
namespace tab {

// Tab id layout: [63] dynamic marker, [62:29] slot address, [28:0] version
namespace id_layout {
    constexpr uint32_t kVersionBits = 29;
    constexpr uint32_t kSlotAddrBits = 34;
    constexpr uint32_t kLevelBits = 9;        // each of the three intermediate levels
    constexpr uint32_t kLeafBits = 7;         // slots per SlotList page

    constexpr uint64_t kDynamicBit = 1ull << 63;
    constexpr uint64_t kVersionMask = (1ull << kVersionBits) - 1;
    constexpr uint64_t kSlotAddrMask = ((1ull << kSlotAddrBits) - 1) << kVersionBits;
    constexpr uint64_t kMaxSlotAddresses = 1ull << kSlotAddrBits;

    // Shifts of the four trie indices within a raw id
    constexpr uint32_t kL0Shift = 54;
    constexpr uint32_t kL1Shift = 45;
    constexpr uint32_t kL2Shift = 36;
    constexpr uint32_t kLeafShift = kVersionBits;

    constexpr uint64_t kLevelMask = (1ull << kLevelBits) - 1;  // 511
    constexpr uint64_t kLeafMask = (1ull << kLeafBits) - 1;    // 127

    static_assert(kL0Shift + kLevelBits == 63, "L0 index must end below the dynamic bit");
    static_assert(kL1Shift == kL0Shift - kLevelBits && kL2Shift == kL1Shift - kLevelBits &&
                  kLeafShift == kL2Shift - kLeafBits, "levels must be contiguous");
    static_assert(3 * kLevelBits + kLeafBits == kSlotAddrBits, "slot address is split 9/9/9/7");
}

// Trie page geometry
namespace geometry {
    constexpr size_t kPageSize = memmgr::kPageSize;
    constexpr size_t kSubTableEntries = 1u << id_layout::kLevelBits;  // 512
    constexpr size_t kSlotsPerList = 1u << id_layout::kLeafBits;      // 128
    constexpr size_t kSlotSize = kPageSize / kSlotsPerList;           // 32
}

// Slot word layouts
namespace slot_layout {
    // ver_ty: [63:56] type tag, [28:0] version
    constexpr uint32_t kTypeShift = 56;
    constexpr uint64_t kVersionMask = id_layout::kVersionMask;

    // lock: [63] writer held, [62:31] owning core id, [30:0] count
    constexpr uint64_t kWriterBit = 1ull << 63;
    constexpr uint32_t kCoreShift = 31;
    constexpr uint64_t kCountMask = (1ull << 31) - 1;
}

// Free list sentinel: no free slot
constexpr uint64_t kNoFreeSlot = ~uint64_t{0};

// Version policy
namespace version_policy {
    // Must be 2^k - 1; also used as a mask
    constexpr uint64_t kMaxVersionBeforeTombstone = (1ull << id_layout::kVersionBits) - 1;
    constexpr uint64_t kDebugMaxVersionBeforeTombstone = 255;

    constexpr const char* kDebugTombsEnvVar = "KTAB_DEBUG_TOMBS";

#if defined(KTAB_DEBUG_TOMBS) && !defined(NDEBUG)
    constexpr uint64_t kDefaultMaxVersion = kDebugMaxVersionBeforeTombstone;
#else
    constexpr uint64_t kDefaultMaxVersion = kMaxVersionBeforeTombstone;
#endif

#ifdef KTAB_ZOMBIE_TOMBS
    constexpr bool kZombieTombs = true;
#else
    constexpr bool kZombieTombs = false;
#endif
}

} // namespace tab
} // namespace ktab
