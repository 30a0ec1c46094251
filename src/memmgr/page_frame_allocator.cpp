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

#include "page_frame_allocator.h"
#include "../util/panic.h"

#include <cstring>

namespace ktab {
    namespace memmgr {

        FiloPageFrameAllocator::FiloPageFrameAllocator(const PhysTranslator& xlat,
                                                       PhysAddr first_frame,
                                                       size_t frame_count)
            : xlat_(xlat),
              first_frame_(first_frame),
              end_(first_frame + frame_count * kPageSize),
              frame_count_(frame_count),
              bump_(first_frame) {
            KTAB_DEBUG_ASSERT(is_page_aligned(first_frame), "first frame must be page aligned");
        }

        std::optional<PhysAddr> FiloPageFrameAllocator::allocate() {
            if (last_free_ != kNoFrame) {
                PhysAddr frame = last_free_;
                void* page = xlat_.translate(frame);
                PhysAddr next;
                std::memcpy(&next, page, sizeof(next));
                last_free_ = next;
                std::memset(page, 0, kPageSize);
                ++in_use_;
                return frame;
            }

            if (bump_ < end_) {
                // Never handed out before, still zero from the mapping
                PhysAddr frame = bump_;
                bump_ += kPageSize;
                ++in_use_;
                return frame;
            }

            return std::nullopt;
        }

        void FiloPageFrameAllocator::free(PhysAddr frame) {
            KTAB_DEBUG_ASSERT(is_page_aligned(frame), "freed frame is not page aligned");
            KTAB_DEBUG_ASSERT(owns(frame) && frame < bump_, "freed frame was never allocated here");
            KTAB_DEBUG_ASSERT(in_use_ > 0, "more frames freed than allocated");

            void* page = xlat_.translate(frame);
            std::memcpy(page, &last_free_, sizeof(last_free_));
            last_free_ = frame;
            --in_use_;
        }

    } // namespace memmgr
} // namespace ktab
