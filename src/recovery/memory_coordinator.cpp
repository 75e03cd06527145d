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

#include "memory_coordinator.h"
#include "../util/log.h"

#include <algorithm>

#if defined(__GLIBC__)
#include <malloc.h>
#endif

namespace textvault {

MemoryCoordinator::ReclaimerId MemoryCoordinator::register_reclaimer(const std::string& name,
                                                                     ReclaimFn fn, bool cheap) {
    std::lock_guard<std::mutex> lock(mu_);
    ReclaimerId id = next_id_++;
    auto r = std::make_shared<Reclaimer>();
    r->id = id;
    r->name = name;
    r->fn = std::move(fn);
    r->cheap = cheap;
    reclaimers_.push_back(std::move(r));
    debug() << "MemoryCoordinator: registered reclaimer '" << name << "' (id " << id << ")";
    return id;
}

void MemoryCoordinator::unregister_reclaimer(ReclaimerId id) {
    std::shared_ptr<Reclaimer> gone;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = std::find_if(reclaimers_.begin(), reclaimers_.end(),
                               [id](const std::shared_ptr<Reclaimer>& r) { return r->id == id; });
        if (it == reclaimers_.end()) {
            return;
        }
        gone = std::move(*it);
        reclaimers_.erase(it);
    }

    // a collect() may still hold a snapshot; wait out a running call
    std::lock_guard<std::mutex> run(gone->run_mu);
    gone->removed = true;
}

size_t MemoryCoordinator::get_reclaimer_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return reclaimers_.size();
}

size_t MemoryCoordinator::collect(bool aggressive) {
    std::vector<std::shared_ptr<Reclaimer>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mu_);
        snapshot = reclaimers_;
    }

    size_t released = 0;
    for (const auto& r : snapshot) {
        if (!aggressive && !r->cheap) {
            continue;
        }
        std::lock_guard<std::mutex> run(r->run_mu);
        if (r->removed) {
            continue;
        }
        try {
            released += r->fn(aggressive);
        } catch (const std::exception& e) {
            warning() << "MemoryCoordinator: reclaimer '" << r->name << "' failed: " << e.what();
        }
    }

#if defined(__GLIBC__)
    if (aggressive) {
        ::malloc_trim(0);
    }
#endif

    collections_.fetch_add(1, std::memory_order_relaxed);
    if (aggressive) {
        info() << "MemoryCoordinator: aggressive collection released " << released;
    } else {
        trace() << "MemoryCoordinator: collection released " << released;
    }
    return released;
}

} // namespace textvault
