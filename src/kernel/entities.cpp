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

#include "entities.h"
#include "../util/log.h"

#include <algorithm>
#include <utility>

namespace ktab {
    namespace kernel {

        namespace {
            template <typename T>
            std::vector<Tab<T>> resolve_live(GlobalTable& table, const std::vector<uint64_t>& ids,
                                             std::vector<uint64_t>& dead) {
                std::vector<Tab<T>> live;
                live.reserve(ids.size());
                for (uint64_t id : ids) {
                    std::optional<Tab<T>> t = table.lookup<T>(id);
                    if (t) {
                        live.push_back(std::move(*t));
                    } else {
                        dead.push_back(id);
                    }
                }
                return live;
            }

            void erase_ids(std::vector<uint64_t>& ids, const std::vector<uint64_t>& dead) {
                ids.erase(std::remove_if(ids.begin(), ids.end(),
                                         [&](uint64_t id) {
                                             return std::find(dead.begin(), dead.end(), id) != dead.end();
                                         }),
                          ids.end());
            }
        }

        std::optional<Tab<Ring>> create_root_ring(GlobalTable& table) {
            std::optional<Tab<Ring>> ring = table.add(Ring{std::nullopt, {}, {}});
            if (ring) {
                debug() << "kernel: root ring " << ring->id().raw();
            }
            return ring;
        }

        std::optional<Tab<Ring>> create_ring(GlobalTable& table, const Tab<Ring>& parent) {
            return table.add(Ring{parent, {}, {}});
        }

        std::optional<Tab<Module>> create_module(GlobalTable& table, uint64_t module_id, std::string name) {
            return table.add(Module{module_id, std::move(name)});
        }

        std::optional<Tab<Instance>> create_instance(GlobalTable& table, const Tab<Module>& module,
                                                     const Tab<Ring>& ring) {
            std::optional<Tab<Instance>> instance = table.add(Instance{module, ring, {}});
            if (!instance) {
                warn() << "kernel: out of memory creating an instance";
                return std::nullopt;
            }
            const uint64_t id = instance->id().raw();
            ring.with_mut([id](Ring& r) { r.instances.push_back(id); });
            return instance;
        }

        std::optional<Tab<Thread>> spawn_thread(GlobalTable& table, const Tab<Instance>& instance,
                                                std::string name) {
            std::optional<Tab<Thread>> thread = table.add(Thread{instance, std::move(name)});
            if (!thread) {
                warn() << "kernel: out of memory spawning a thread";
                return std::nullopt;
            }
            const uint64_t id = thread->id().raw();
            instance.with_mut([id](Instance& i) { i.threads.push_back(id); });
            return thread;
        }

        std::optional<Tab<RingInterface>> create_ring_interface(GlobalTable& table, const Tab<Ring>& ring,
                                                                uint64_t type_id) {
            std::optional<Tab<RingInterface>> iface = table.add(RingInterface{ring, type_id});
            if (!iface) {
                return std::nullopt;
            }
            const uint64_t id = iface->id().raw();
            ring.with_mut([id](Ring& r) { r.interfaces.push_back(id); });
            return iface;
        }

        std::optional<Tab<Ring>> parent_of(const Tab<Ring>& ring) {
            return ring.with([](const Ring& r) { return r.parent; });
        }

        Tab<Instance> instance_of(const Tab<Thread>& thread) {
            return thread.with([](const Thread& t) { return t.instance; });
        }

        Tab<Ring> ring_of(const Tab<Instance>& instance) {
            return instance.with([](const Instance& i) { return i.ring; });
        }

        Tab<Ring> ring_of(const Tab<Thread>& thread) {
            return ring_of(instance_of(thread));
        }

        size_t ring_depth(const Tab<Ring>& ring) {
            size_t depth = 0;
            std::optional<Tab<Ring>> cur = parent_of(ring);
            while (cur) {
                ++depth;
                cur = parent_of(*cur);
            }
            return depth;
        }

        std::vector<Tab<Instance>> live_instances(GlobalTable& table, const Tab<Ring>& ring) {
            std::vector<uint64_t> ids = ring.with([](const Ring& r) { return r.instances; });
            std::vector<uint64_t> dead;
            std::vector<Tab<Instance>> live = resolve_live<Instance>(table, ids, dead);
            if (!dead.empty()) {
                ring.with_mut([&dead](Ring& r) { erase_ids(r.instances, dead); });
            }
            return live;
        }

        std::vector<Tab<Thread>> live_threads(GlobalTable& table, const Tab<Instance>& instance) {
            std::vector<uint64_t> ids = instance.with([](const Instance& i) { return i.threads; });
            std::vector<uint64_t> dead;
            std::vector<Tab<Thread>> live = resolve_live<Thread>(table, ids, dead);
            if (!dead.empty()) {
                instance.with_mut([&dead](Instance& i) { erase_ids(i.threads, dead); });
            }
            return live;
        }

    } // namespace kernel
} // namespace ktab
