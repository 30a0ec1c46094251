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
#include <mutex>
#include <optional>

#include "phys.h"

namespace ktab {
    namespace memmgr {

        /**
         * Allocates physical memory one page frame (4 KiB) at a time.
         *
         * Returned frames are page aligned, zeroed, not in use and not
         * overlapping any other allocated frame. An empty optional means
         * the system is out of memory; bookkeeping never aborts.
         *
         * Implementations are not required to be thread safe; share one
         * between cores through LockedPageFrameAllocator.
         */
        class PageFrameAllocator {
        public:
            virtual ~PageFrameAllocator() = default;

            virtual std::optional<PhysAddr> allocate() = 0;

            /**
             * Returns a frame. The frame must have come from allocate(),
             * must not be in use and must not already be free.
             */
            virtual void free(PhysAddr frame) = 0;
        };

        /**
         * First in, last out page frame allocator over a contiguous range
         * of frames.
         *
         * Freed frames form a stack threaded through the frames themselves:
         * the first eight bytes of a free frame hold the address of the frame
         * freed before it. Frames never handed out are served from a bump
         * pointer, so the stack only ever holds frames that were returned.
         */
        class FiloPageFrameAllocator : public PageFrameAllocator {
        public:
            static constexpr PhysAddr kNoFrame = ~PhysAddr{0};

            FiloPageFrameAllocator(const PhysTranslator& xlat, PhysAddr first_frame, size_t frame_count);

            std::optional<PhysAddr> allocate() override;
            void free(PhysAddr frame) override;

            size_t frames_in_use() const { return in_use_; }
            size_t frame_count() const { return frame_count_; }

        private:
            bool owns(PhysAddr frame) const {
                return frame >= first_frame_ && frame < end_;
            }

            const PhysTranslator& xlat_;
            const PhysAddr first_frame_;
            const PhysAddr end_;
            const size_t frame_count_;
            PhysAddr bump_;
            PhysAddr last_free_ = kNoFrame;
            size_t in_use_ = 0;
        };

        /**
         * Serializes access to another allocator with a mutex. This is the
         * only place the tab table may block.
         */
        class LockedPageFrameAllocator : public PageFrameAllocator {
        public:
            explicit LockedPageFrameAllocator(PageFrameAllocator& inner) : inner_(inner) {}

            std::optional<PhysAddr> allocate() override {
                std::lock_guard<std::mutex> lk(mu_);
                return inner_.allocate();
            }

            void free(PhysAddr frame) override {
                std::lock_guard<std::mutex> lk(mu_);
                inner_.free(frame);
            }

        private:
            PageFrameAllocator& inner_;
            std::mutex mu_;
        };

    } // namespace memmgr
} // namespace ktab
