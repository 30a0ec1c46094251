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

#include "host_phys_memory.h"
#include "../util/log.h"

#include <sys/mman.h>
#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace ktab {
    namespace memmgr {

        void* HostPhysMemory::map_region(size_t frame_count) {
            if (frame_count == 0) {
                throw std::invalid_argument("HostPhysMemory: frame_count must be non-zero");
            }
            void* p = ::mmap(nullptr, frame_count * kPageSize, PROT_READ | PROT_WRITE,
                             MAP_PRIVATE | MAP_ANONYMOUS | MAP_NORESERVE, -1, 0);
            if (p == MAP_FAILED) {
                throw std::runtime_error("HostPhysMemory: mmap of " + std::to_string(frame_count) +
                                         " frames failed: " + errnoWithDescription());
            }
            return p;
        }

        HostPhysMemory::HostPhysMemory(size_t frame_count, PhysAddr phys_base)
            : base_(map_region(frame_count)),
              frame_count_(frame_count),
              xlat_(base_, phys_base),
              filo_(xlat_, phys_base, frame_count),
              locked_(filo_) {
            debug() << "host phys memory: " << frame_count << " frames at phys "
                    << reinterpret_cast<void*>(phys_base) << " virt " << base_;
        }

        HostPhysMemory::~HostPhysMemory() {
            if (::munmap(base_, frame_count_ * kPageSize) != 0) {
                error() << "host phys memory: munmap failed: " << errnoWithDescription();
            }
        }

        size_t HostPhysMemory::compute_frame_count() {
            size_t mb = kDefaultMemoryMB;
            if (const char* env = std::getenv(kMemoryEnvVar)) {
                size_t env_mb = std::strtoul(env, nullptr, 10);
                if (env_mb > 0) {
                    mb = env_mb;
                } else {
                    warn() << kMemoryEnvVar << "='" << env << "' ignored, using " << mb << " MiB";
                }
            }
            return (mb * 1024 * 1024) / kPageSize;
        }

        HostPhysMemory& HostPhysMemory::instance() {
            static HostPhysMemory* instance = nullptr;
            static std::once_flag init_flag;
            std::call_once(init_flag, []() {
                instance = new HostPhysMemory(compute_frame_count());
            });
            return *instance;
        }

    } // namespace memmgr
} // namespace ktab
