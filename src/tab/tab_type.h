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
#include <type_traits>

namespace ktab {
    namespace tab {

        /**
         * Type tag stored in the upper byte of a slot's ver_ty word.
         * Free marks an unoccupied slot and is never the tag of a payload.
         */
        enum class TabType : uint8_t {
            Free = 0,
            Ring = 1,
            Instance = 2,
            Thread = 3,
            RingInterface = 4,
            Module = 5,
            Token = 6,
            PortState = 7,
            Scheduler = 8,
        };

        const char* tab_type_name(TabType ty);

        /**
         * A type is storable in the table ("tabbed") when it declares
         *
         *     static constexpr TabType kTabType = TabType::...;
         *
         * with a tag other than Free.
         */
        namespace detail {
            // The Free comparison is only instantiated once the tag is known
            // to be a TabType
            template <typename T,
                      bool = std::is_same<std::decay_t<decltype(T::kTabType)>, TabType>::value>
            struct tab_tag_ok : std::false_type {};

            template <typename T>
            struct tab_tag_ok<T, true> : std::integral_constant<bool, T::kTabType != TabType::Free> {};
        }

        template <typename T, typename = void>
        struct is_tabbed : std::false_type {};

        template <typename T>
        struct is_tabbed<T, std::void_t<decltype(T::kTabType)>> : detail::tab_tag_ok<T> {};

        template <typename T>
        constexpr bool is_tabbed_v = is_tabbed<T>::value;

    } // namespace tab
} // namespace ktab
