#pragma once

#include <cstddef>
#include <functional>
#include <thread>

namespace updock {

// Fixed number of threads draining an index range.
class WorkerPool {
public:
    // Starts one worker thread; throws std::system_error when none can be created.
    using ThreadStarter = std::function<std::thread(std::function<void()>)>;

    explicit WorkerPool(std::size_t workers, ThreadStarter start_thread = {});

    std::size_t Workers() const { return workers_; }

    // Calls task(i) once for every i in [0, count) and returns when all calls
    // have finished. task must not throw. When fewer threads can be started
    // than requested, the ones that did start (or the caller) do the work.
    void Run(std::size_t count, const std::function<void(std::size_t)>& task) const;

private:
    std::size_t workers_;
    ThreadStarter start_thread_;
};

} // namespace updock
