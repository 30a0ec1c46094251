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
#include <new>
#include <utility>

namespace ktab {
    namespace tab {

        /**
         * Heap cell owning one table payload. The slot stores a TabBox*;
         * deleting it through the base runs the payload's destructor.
         */
        class TabBox {
        public:
            virtual ~TabBox() = default;
        };

        template <typename T>
        class TypedTabBox final : public TabBox {
        public:
            explicit TypedTabBox(T&& v) : value(std::move(v)) {}
            T value;
        };

        /** Boxes `item`; nullptr if the heap is exhausted. */
        template <typename T>
        TypedTabBox<T>* make_box(T&& item) {
            return new (std::nothrow) TypedTabBox<T>(std::move(item));
        }

        template <typename T>
        T& unbox(TabBox* box) {
            return static_cast<TypedTabBox<T>*>(box)->value;
        }

    } // namespace tab
} // namespace ktab
