#pragma once

#include <algorithm>
#include <cstddef>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace wordsieve::parallel {
    template <typename Func, typename... Args>
    concept VoidCallable = std::is_invocable_r_v<void, Func, Args...>;

    // Runs each pushed task on its own thread until wait() joins them
    struct TaskQueue {
    private:
        std::vector<std::thread> threadPool;

    public:
        TaskQueue() noexcept = default;
        explicit TaskQueue(std::size_t initialCapacity) {
            threadPool.reserve(initialCapacity);
        }
        TaskQueue(const TaskQueue&) = delete;
        TaskQueue& operator=(const TaskQueue&) = delete;
        ~TaskQueue() { wait(); }

        template <typename Func, typename... Args>
            requires VoidCallable<Func, Args...>
        void push(Func&& func, Args&&... args) {
            threadPool.emplace_back(std::forward<Func>(func), std::forward<Args>(args)...);
        }

        // Blocks local thread until all tasks finish
        void wait() {
            while (!threadPool.empty()) {
                auto thread = std::move(threadPool.back());
                threadPool.pop_back();
                thread.join();
            }
        }

        // Returns number of unjoined tasks
        size_t size() const noexcept {
            return threadPool.size();
        }

        size_t capacity() const noexcept {
            return threadPool.capacity();
        }
    };

    /*
    Splits [0, numJobs) into at most numThreads contiguous chunks and pushes work(start, stop) for each.
    Earlier chunks take the remainder. Blocks until every chunk is done.
    If a push throws, the chunks already started are joined before the exception propagates.
    */
    template <typename Queue, typename Work>
    void forEachChunk(Queue& queue, size_t numJobs, size_t numThreads, Work&& work) {
        if (numJobs == 0) return;
        numThreads = std::clamp<size_t>(numThreads, 1, numJobs);
        const size_t baseWork = numJobs / numThreads;
        const size_t extraWork = numJobs % numThreads;

        try {
            size_t start = 0;
            for (size_t threadID = 0; threadID < numThreads; ++threadID) {
                const size_t stop = start + baseWork + static_cast<size_t>(threadID < extraWork);
                queue.push([&work, start, stop]() { work(start, stop); });
                start = stop;
            }
        } catch (...) {
            queue.wait();
            throw;
        }
        queue.wait();
    }
}
