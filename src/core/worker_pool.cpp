#include "selfcrypt/core/worker_pool.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace selfcrypt::core {

namespace {
    size_t resolve_thread_count(size_t requested) {
        if (requested > 0) {
            return requested;
        }
        return std::max<size_t>(2, std::thread::hardware_concurrency());
    }
}

WorkerPool::WorkerPool(size_t thread_count)
    : thread_count_(resolve_thread_count(thread_count))
    , pool_(thread_count_) {
}

WorkerPool::~WorkerPool() {
    pool_.join();
}

void WorkerPool::post(std::function<void()> task) {
    boost::asio::post(pool_, std::move(task));
}

Result WorkerPool::parallel_for(size_t count,
                                const std::function<Result(size_t)>& task,
                                const CancellationToken& token) {
    if (count == 0) {
        return Result();
    }
    
    struct Batch {
        std::mutex mutex;
        std::condition_variable done;
        size_t remaining;
        size_t failed_index;
        Result failure;
        std::atomic<bool> failed{false};
    };
    
    auto batch = std::make_shared<Batch>();
    batch->remaining = count;
    batch->failed_index = count;
    
    for (size_t i = 0; i < count; ++i) {
        boost::asio::post(pool_, [batch, &task, &token, i]() {
            Result result;
            if (token.is_cancelled()) {
                result = Result(ErrorCode::CANCELLED, "Operation cancelled");
            } else if (!batch->failed.load()) {
                result = task(i);
            }
            
            std::lock_guard<std::mutex> lock(batch->mutex);
            if (!result && i < batch->failed_index) {
                batch->failed_index = i;
                batch->failure = std::move(result);
                batch->failed = true;
            }
            if (--batch->remaining == 0) {
                batch->done.notify_all();
            }
        });
    }
    
    std::unique_lock<std::mutex> lock(batch->mutex);
    batch->done.wait(lock, [&batch]() { return batch->remaining == 0; });
    
    return batch->failed ? batch->failure : Result();
}

}
