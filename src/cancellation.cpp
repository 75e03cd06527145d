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

#include "cancellation.h"
#include "errors.h"
#include "util/log.h"

#include <cerrno>
#include <system_error>

namespace textvault {

namespace {

    std::atomic<int> pending_signal{0};
    static_assert(std::atomic<int>::is_always_lock_free, "signal flag must be lock-free");

    void on_interrupt(int signo) {
        pending_signal.store(signo, std::memory_order_relaxed);
    }

} // namespace

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw OperationCancelled();
    }
}

bool CancellationToken::wait_for(std::chrono::milliseconds d) const {
    if (!state_) {
        std::this_thread::sleep_for(d);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mu);
    return state_->cv.wait_for(lock, d, [this] {
        return state_->cancelled.load(std::memory_order_acquire);
    });
}

void CancellationSource::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        state_->cancelled.store(true, std::memory_order_release);
    }
    state_->cv.notify_all();
}

InterruptCanceller::InterruptCanceller(CancellationSource source, int signo)
    : source_(std::move(source)), signo_(signo) {
    pending_signal.store(0, std::memory_order_relaxed);
    thread_ = std::thread([this]() { watch(); });

    previous_ = std::signal(signo_, on_interrupt);
    if (previous_ == SIG_ERR) {
        int err = errno;
        running_.store(false);
        thread_.join();
        throw std::system_error(err, std::generic_category(),
                                "cannot install handler for signal " + std::to_string(signo_));
    }
}

InterruptCanceller::~InterruptCanceller() {
    std::signal(signo_, previous_);
    running_.store(false);
    thread_.join();
}

void InterruptCanceller::watch() {
    while (running_.load()) {
        if (pending_signal.load(std::memory_order_relaxed) == signo_) {
            pending_signal.store(0, std::memory_order_relaxed);
            info() << "Signal " << signo_ << " received, cancelling";
            source_.cancel();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

} // namespace textvault
