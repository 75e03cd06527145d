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

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace textvault {

/**
 * MemoryCoordinator: collects droppable memory under pressure.
 *
 * Holders of caches register a reclaim callback. collect() runs them and
 * hands freed heap pages back to the OS where the allocator supports it.
 *
 * Usage:
 *   auto coord = std::make_shared<MemoryCoordinator>();
 *   auto id = coord->register_reclaimer("segment-cache",
 *       [&](bool) { return cache.clear_all(); }, false);
 *   ...
 *   coord->collect(true);   // after std::bad_alloc
 *   coord->unregister_reclaimer(id);
 *
 * Thread-safety:
 *   All public methods are thread-safe. Callbacks run without the
 *   coordinator lock held, so they may take their own locks.
 *   unregister_reclaimer() waits for a running call of that callback to
 *   return, after which the callback is never invoked again; a callback
 *   must not unregister itself.
 */
class MemoryCoordinator {
public:
    // Returns how many entries (or bytes, owner's choice) were released.
    typedef std::function<size_t(bool aggressive)> ReclaimFn;
    typedef uint64_t ReclaimerId;

    MemoryCoordinator() = default;

    MemoryCoordinator(const MemoryCoordinator&) = delete;
    MemoryCoordinator& operator=(const MemoryCoordinator&) = delete;

    /**
     * @param cheap run on every collect(); otherwise only on aggressive ones
     */
    ReclaimerId register_reclaimer(const std::string& name, ReclaimFn fn, bool cheap);
    void unregister_reclaimer(ReclaimerId id);

    /**
     * Run reclaimers (all of them when aggressive) and trim the heap.
     * @return sum of what the reclaimers reported
     */
    size_t collect(bool aggressive = false);

    size_t get_collection_count() const { return collections_.load(std::memory_order_relaxed); }
    size_t get_reclaimer_count() const;

private:
    struct Reclaimer {
        ReclaimerId id;
        std::string name;
        ReclaimFn fn;
        bool cheap;

        std::mutex run_mu;      // held while fn runs
        bool removed = false;   // guarded by run_mu
    };

    mutable std::mutex mu_;
    std::vector<std::shared_ptr<Reclaimer>> reclaimers_;
    ReclaimerId next_id_ = 1;
    std::atomic<size_t> collections_{0};
};

} // namespace textvault
