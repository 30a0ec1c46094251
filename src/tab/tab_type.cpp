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

#include "tab_type.h"

namespace ktab {
    namespace tab {

        const char* tab_type_name(TabType ty) {
            switch (ty) {
                case TabType::Free:          return "Free";
                case TabType::Ring:          return "Ring";
                case TabType::Instance:      return "Instance";
                case TabType::Thread:        return "Thread";
                case TabType::RingInterface: return "RingInterface";
                case TabType::Module:        return "Module";
                case TabType::Token:         return "Token";
                case TabType::PortState:     return "PortState";
                case TabType::Scheduler:     return "Scheduler";
            }
            return "Unknown";
        }

    } // namespace tab
} // namespace ktab
