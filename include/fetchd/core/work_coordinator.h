// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2024-2025 YAMS Project Contributors
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <thread>
#include <vector>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

namespace fetchd {

/**
 * @brief Owns an io_context and the worker threads that run it.
 *
 * The download scheduler uses one coordinator with a single worker for its passes and
 * timers, and a second one sized to the transfer limit for executors.
 *
 * ## Shutdown Behavior
 *
 * - `stop()`: Resets the work guard and stops the io_context; queued handlers are dropped
 * - `join()`: Blocks until all workers return (safe for destruction)
 */
class WorkCoordinator {
public:
    WorkCoordinator();
    ~WorkCoordinator();

    WorkCoordinator(const WorkCoordinator&) = delete;
    WorkCoordinator& operator=(const WorkCoordinator&) = delete;
    WorkCoordinator(WorkCoordinator&&) = delete;
    WorkCoordinator& operator=(WorkCoordinator&&) = delete;

    /**
     * @brief Start the worker thread pool.
     *
     * @param numThreads Optional thread count override (default: hardware_concurrency)
     *
     * @throws std::runtime_error if already started or thread creation fails
     */
    void start(std::optional<std::size_t> numThreads = std::nullopt);

    // Idempotent; does not block.
    void stop();

    // Must follow stop(), or this will hang. Idempotent.
    void join();

    [[nodiscard]] std::shared_ptr<boost::asio::io_context> getIOContext() const noexcept;
    [[nodiscard]] boost::asio::io_context::executor_type getExecutor() const noexcept;
    [[nodiscard]] boost::asio::strand<boost::asio::io_context::executor_type> makeStrand() const;

    template <typename Fn> void post(Fn&& fn) const {
        boost::asio::post(getExecutor(), std::forward<Fn>(fn));
    }

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] std::size_t getWorkerCount() const noexcept;

    // Workers currently inside io_context::run()
    [[nodiscard]] std::size_t getActiveWorkerCount() const noexcept {
        return activeWorkers_.load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<boost::asio::io_context> ioContext_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        workGuard_;
    std::vector<std::thread> workers_;
    bool started_ = false;
    std::atomic<std::size_t> activeWorkers_{0};
};

} // namespace fetchd
