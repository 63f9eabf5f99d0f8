#include "util/worker_pool.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace updock {

WorkerPool::WorkerPool(std::size_t workers, ThreadStarter start_thread)
    : workers_(std::max<std::size_t>(workers, 1)), start_thread_(std::move(start_thread)) {
    if (!start_thread_) {
        start_thread_ = [](std::function<void()> fn) { return std::thread(std::move(fn)); };
    }
}

void WorkerPool::Run(std::size_t count, const std::function<void(std::size_t)>& task) const {
    if (count == 0) return;

    std::atomic<std::size_t> next{0};
    auto drain = [&] {
        for (std::size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
            task(i);
        }
    };

    const std::size_t n = std::min(workers_, count);
    if (n == 1) {
        drain();
        return;
    }

    std::vector<std::thread> threads;
    threads.reserve(n);
    for (std::size_t t = 0; t < n; ++t) {
        try {
            threads.push_back(start_thread_(drain));
        } catch (const std::system_error& e) {
            LogWarn("started %zu of %zu workers: %s", threads.size(), n, e.what());
            break;
        }
    }
    if (threads.empty()) drain();
    for (auto& th : threads) th.join();
}

} // namespace updock
