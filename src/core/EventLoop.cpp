// SPDX-License-Identifier: Apache-2.0
#include "EventLoop.hpp"

#include <core/Log.hpp>

#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace narrator
{

struct EventLoop::Impl
{
    using Key = std::pair<Clock::time_point, TimerId>;

    std::string name;
    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::map<Key, Task> queue;
    std::unordered_map<TimerId, Clock::time_point> dueTimes;
    TimerId nextId = 1;
    bool stopped = false;
    std::thread::id loopThreadId;
    std::jthread worker;

    auto enqueue(Clock::time_point due, Task task) -> TimerId
    {
        auto lock = std::lock_guard(mutex);
        if (stopped)
            return 0;
        auto const id = nextId++;
        queue.emplace(Key { due, id }, std::move(task));
        dueTimes.emplace(id, due);
        cv.notify_one();
        return id;
    }

    /// @brief Worker thread function that executes due tasks in order.
    /// @param stopToken The stop token for cooperative cancellation.
    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto task = Task {};
            {
                auto lock = std::unique_lock(mutex);
                if (queue.empty())
                {
                    cv.wait(lock, stopToken, [this] { return !queue.empty() || stopped; });
                    continue;
                }

                auto const due = queue.begin()->first.first;
                if (due > Clock::now())
                {
                    cv.wait_until(lock, stopToken, due, [this, due] {
                        return stopped || (!queue.empty() && queue.begin()->first.first < due);
                    });
                    continue;
                }

                auto node = queue.extract(queue.begin());
                dueTimes.erase(node.key().second);
                task = std::move(node.mapped());
            }

            if (task)
                task();
        }
    }
};

EventLoop::EventLoop(std::string name): _impl(std::make_shared<Impl>())
{
    _impl->name = std::move(name);
    // The worker co-owns the state so a loop stopped from its own thread can finish the running task.
    _impl->worker = std::jthread([impl = _impl](const std::stop_token& token) {
        {
            auto lock = std::lock_guard(impl->mutex);
            impl->loopThreadId = std::this_thread::get_id();
        }
        impl->run(token);
    });
    log::trace("Event loop '{}' started", _impl->name);
}

EventLoop::~EventLoop()
{
    stop();
}

void EventLoop::post(Task task)
{
    (void) _impl->enqueue(Clock::now(), std::move(task));
}

auto EventLoop::postDelayed(Clock::duration delay, Task task) -> TimerId
{
    return _impl->enqueue(Clock::now() + delay, std::move(task));
}

auto EventLoop::cancel(TimerId id) -> bool
{
    auto lock = std::lock_guard(_impl->mutex);
    auto const it = _impl->dueTimes.find(id);
    if (it == _impl->dueTimes.end())
        return false;
    _impl->queue.erase(Impl::Key { it->second, id });
    _impl->dueTimes.erase(it);
    return true;
}

void EventLoop::invoke(Task task)
{
    if (isLoopThread())
    {
        task();
        return;
    }

    // The promise is owned by the queued task so that a task discarded by stop()
    // releases the waiter through a broken promise.
    auto promise = std::make_shared<std::promise<void>>();
    auto finished = promise->get_future();
    auto const id = _impl->enqueue(Clock::now(), [&task, done = std::move(promise)] {
        task();
        done->set_value();
    });
    if (id == 0)
        return;
    finished.wait();
}

void EventLoop::stop()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->stopped)
            return;
        _impl->stopped = true;
        _impl->queue.clear();
        _impl->dueTimes.clear();
    }
    _impl->cv.notify_all();

    if (_impl->worker.joinable())
    {
        _impl->worker.request_stop();
        if (!isLoopThread())
            _impl->worker.join();
        else
            _impl->worker.detach();
    }
    log::trace("Event loop '{}' stopped", _impl->name);
}

auto EventLoop::isLoopThread() const -> bool
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->loopThreadId == std::this_thread::get_id();
}

auto EventLoop::handle() const -> Handle
{
    return Handle(_impl);
}

auto EventLoop::Handle::post(Task task) const -> bool
{
    auto const impl = _impl.lock();
    return impl && impl->enqueue(Clock::now(), std::move(task)) != 0;
}

auto EventLoop::pendingTasks() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->queue.size();
}

} // namespace narrator
