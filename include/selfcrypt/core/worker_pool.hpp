#pragma once

#include "selfcrypt/core/cancellation.hpp"
#include "selfcrypt/core/result.hpp"
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <functional>

namespace selfcrypt::core {

// Fixed set of worker threads for chunk hashing, encryption and store calls
class WorkerPool {
public:
    // 0 picks std::thread::hardware_concurrency()
    explicit WorkerPool(size_t thread_count = 0);
    ~WorkerPool();
    
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    
    void post(std::function<void()> task);
    
    // Runs task(0) .. task(count - 1) on the pool and blocks until all have
    // finished. After the first failure or a cancellation the remaining
    // tasks are skipped. Returns the failure with the lowest index.
    // Must not be called from a pool thread.
    Result parallel_for(size_t count,
                        const std::function<Result(size_t)>& task,
                        const CancellationToken& token = CancellationToken::none());
    
    size_t thread_count() const { return thread_count_; }

private:
    size_t thread_count_;
    boost::asio::thread_pool pool_;
};

}
