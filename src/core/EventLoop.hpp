// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace narrator
{

/// @brief Single-threaded task runner with cancellable delayed tasks.
///
/// Tasks run one at a time, in due-time order, on a dedicated worker thread.
/// Tasks posted with equal due time run in posting order. All public methods are
/// safe to call from any thread, including from within a running task.
class EventLoop
{
  public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;
    using TimerId = std::uint64_t;

    struct Impl;

    /// @brief Weak reference to a loop for threads that may outlive it.
    class Handle
    {
      public:
        Handle() = default;

        /// @brief Queues a task if the loop is still running.
        /// @return False if the loop is gone or stopped; the task is dropped.
        auto post(Task task) const -> bool;

      private:
        friend class EventLoop;
        explicit Handle(std::weak_ptr<Impl> impl): _impl(std::move(impl)) {}
        std::weak_ptr<Impl> _impl;
    };

    /// @brief Starts the worker thread.
    /// @param name Name used in log messages.
    explicit EventLoop(std::string name);
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// @brief Queues a task to run as soon as possible.
    void post(Task task);

    /// @brief Queues a task to run after @p delay.
    /// @return An id that can be passed to cancel().
    auto postDelayed(Clock::duration delay, Task task) -> TimerId;

    /// @brief Removes a not-yet-started delayed task.
    /// @return True if the task was pending and is now cancelled.
    auto cancel(TimerId id) -> bool;

    /// @brief Runs @p task on the loop and blocks until it has finished.
    ///
    /// When called from the loop thread itself the task runs inline.
    void invoke(Task task);

    /// @brief Stops the worker thread. Queued tasks are discarded.
    void stop();

    /// @brief Returns true if the caller is running on the loop thread.
    [[nodiscard]] auto isLoopThread() const -> bool;

    /// @brief Returns the number of queued tasks (immediate and delayed).
    [[nodiscard]] auto pendingTasks() const -> std::size_t;

    /// @brief Returns a weak handle for posting from other components' threads.
    [[nodiscard]] auto handle() const -> Handle;

  private:
    std::shared_ptr<Impl> _impl;
};

} // namespace narrator
