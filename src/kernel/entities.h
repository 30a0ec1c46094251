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
#include <optional>
#include <string>
#include <vector>

#include "../tab/tab.hpp"

namespace ktab {
    namespace kernel {

        using tab::GlobalTable;
        using tab::Tab;
        using tab::TabType;

        /*
         * Kernel objects stored in the tab table.
         *
         * Ownership points upward: a thread keeps its instance alive, an
         * instance keeps its module and ring alive, a ring keeps its parent
         * alive. Downward links (ring -> instances, instance -> threads) are
         * plain ids and are resolved through the table, so a dead child is
         * simply skipped and no reference cycle can form.
         */

        struct Module {
            static constexpr TabType kTabType = TabType::Module;

            uint64_t module_id;
            std::string name;
        };

        struct Ring {
            static constexpr TabType kTabType = TabType::Ring;

            std::optional<Tab<Ring>> parent;      // empty for the root ring
            std::vector<uint64_t> instances;
            std::vector<uint64_t> interfaces;
        };

        struct Instance {
            static constexpr TabType kTabType = TabType::Instance;

            Tab<Module> module;
            Tab<Ring> ring;
            std::vector<uint64_t> threads;
        };

        struct Thread {
            static constexpr TabType kTabType = TabType::Thread;

            Tab<Instance> instance;
            std::string name;
        };

        struct RingInterface {
            static constexpr TabType kTabType = TabType::RingInterface;

            Tab<Ring> ring;
            uint64_t type_id;
        };

        // Constructors. Each returns empty when the table is out of memory.

        std::optional<Tab<Ring>> create_root_ring(GlobalTable& table);
        std::optional<Tab<Ring>> create_ring(GlobalTable& table, const Tab<Ring>& parent);

        std::optional<Tab<Module>> create_module(GlobalTable& table, uint64_t module_id, std::string name);

        /** Instantiates `module` on `ring` and registers it with the ring. */
        std::optional<Tab<Instance>> create_instance(GlobalTable& table, const Tab<Module>& module,
                                                     const Tab<Ring>& ring);

        /** Creates a thread of `instance` and registers it with the instance. */
        std::optional<Tab<Thread>> spawn_thread(GlobalTable& table, const Tab<Instance>& instance,
                                                std::string name);

        /** Publishes an interface of type `type_id` on `ring`. */
        std::optional<Tab<RingInterface>> create_ring_interface(GlobalTable& table, const Tab<Ring>& ring,
                                                                uint64_t type_id);

        // Traversal

        std::optional<Tab<Ring>> parent_of(const Tab<Ring>& ring);
        Tab<Instance> instance_of(const Tab<Thread>& thread);
        Tab<Ring> ring_of(const Tab<Instance>& instance);
        Tab<Ring> ring_of(const Tab<Thread>& thread);

        /** Depth of `ring` below the root ring (the root is 0). */
        size_t ring_depth(const Tab<Ring>& ring);

        /**
         * The instances registered with `ring` that are still alive.
         * Ids of dead instances are pruned from the ring.
         */
        std::vector<Tab<Instance>> live_instances(GlobalTable& table, const Tab<Ring>& ring);

        /** The threads registered with `instance` that are still alive. */
        std::vector<Tab<Thread>> live_threads(GlobalTable& table, const Tab<Instance>& instance);

    } // namespace kernel
} // namespace ktab
