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

namespace ktab {
    namespace memmgr {

        /** Physical address of a page frame. */
        using PhysAddr = uint64_t;

        constexpr size_t kPageSize = 4096;
        constexpr PhysAddr kPageMask = kPageSize - 1;

        inline constexpr bool is_page_aligned(PhysAddr addr) {
            return (addr & kPageMask) == 0;
        }

        /**
         * Turns a physical frame address into a directly dereferenceable
         * pointer. The kernel's memory model guarantees every frame handed
         * out by the page frame allocator is mapped.
         */
        class PhysTranslator {
        public:
            virtual ~PhysTranslator() = default;
            virtual void* translate(PhysAddr addr) const = 0;
        };

        /**
         * Linear (offset) translation: virt = base + (phys - phys_base).
         */
        class LinearTranslator : public PhysTranslator {
        public:
            LinearTranslator(void* virt_base, PhysAddr phys_base)
                : virt_base_(static_cast<uint8_t*>(virt_base)), phys_base_(phys_base) {}

            void* translate(PhysAddr addr) const override {
                return virt_base_ + (addr - phys_base_);
            }

            PhysAddr phys_base() const { return phys_base_; }

        private:
            uint8_t* virt_base_;
            PhysAddr phys_base_;
        };

    } // namespace memmgr
} // namespace ktab
