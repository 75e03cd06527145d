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
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <memory>
#include <mutex>
#include <thread>

namespace textvault {

namespace detail {
    struct CancelState {
        std::atomic<bool> cancelled{false};
        std::mutex mu;
        std::condition_variable cv;
    };
}

/**
 * Read side of a cancellation signal. Cheap to copy; a default-constructed
 * token can never be cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancelled() const {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

    // Throws OperationCancelled if cancellation was requested.
    void throw_if_cancelled() const;

    /**
     * Sleep for up to `d`, waking early on cancellation.
     * @return true if the wait was cut short by cancellation
     */
    bool wait_for(std::chrono::milliseconds d) const;

    static CancellationToken none() { return CancellationToken(); }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancelState> s) : state_(std::move(s)) {}

    std::shared_ptr<detail::CancelState> state_;
};

/**
 * Owner side: hands out tokens and fires them.
 */
class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<detail::CancelState>()) {}

    CancellationToken token() const { return CancellationToken(state_); }

    void cancel();

    bool is_cancelled() const {
        return state_->cancelled.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<detail::CancelState> state_;
};

/**
 * Cancels `source` when `signo` is delivered. The handler only stores to a
 * lock-free flag; a watcher thread polls it and calls cancel(). The
 * previous handler is restored on destruction. One instance at a time.
 */
class InterruptCanceller {
public:
    explicit InterruptCanceller(CancellationSource source, int signo = SIGINT);
    ~InterruptCanceller();

    InterruptCanceller(const InterruptCanceller&) = delete;
    InterruptCanceller& operator=(const InterruptCanceller&) = delete;

private:
    typedef void (*SignalHandler)(int);

    void watch();

    CancellationSource source_;
    int signo_;
    SignalHandler previous_ = SIG_DFL;
    std::atomic<bool> running_{true};
    std::thread thread_;
};

} // namespace textvault
