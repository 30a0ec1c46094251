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

#include <cstddef>

#include "page_frame_allocator.h"
#include "phys.h"

namespace ktab {
    namespace memmgr {

        /**
         * Simulated physical memory for hosted builds.
         *
         * Reserves an anonymous mapping of `frame_count` pages and presents
         * it as physical memory starting at `phys_base` (non-zero, so a null
         * physical address never names a real frame). Frames are served by a
         * FILO allocator behind a mutex.
         */
        class HostPhysMemory {
        public:
            static constexpr PhysAddr kDefaultPhysBase = 0x100000;      // 1 MiB
            static constexpr size_t kDefaultMemoryMB = 64;
            static constexpr const char* kMemoryEnvVar = "KTAB_HOST_MEMORY_MB";

            explicit HostPhysMemory(size_t frame_count, PhysAddr phys_base = kDefaultPhysBase);
            ~HostPhysMemory();

            HostPhysMemory(const HostPhysMemory&) = delete;
            HostPhysMemory& operator=(const HostPhysMemory&) = delete;

            PageFrameAllocator& allocator() { return locked_; }
            const PhysTranslator& translator() const { return xlat_; }

            size_t frame_count() const { return frame_count_; }
            // Diagnostic; only meaningful while no other thread allocates
            size_t frames_in_use() const { return filo_.frames_in_use(); }

            /**
             * Process-wide host memory backing GlobalTable::get(). Sized from
             * KTAB_HOST_MEMORY_MB on first use and never unmapped.
             */
            static HostPhysMemory& instance();

        private:
            static size_t compute_frame_count();
            static void* map_region(size_t frame_count);

            void* base_;
            size_t frame_count_;
            LinearTranslator xlat_;
            FiloPageFrameAllocator filo_;
            LockedPageFrameAllocator locked_;
        };

    } // namespace memmgr
} // namespace ktab
