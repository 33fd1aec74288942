#pragma once

#include <atomic>

namespace selfcrypt::core {

// Shared flag polled by long-running uploads and downloads. Owned by the
// caller and must outlive the operation it is passed to.
class CancellationToken {
public:
    CancellationToken() = default;
    
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;
    
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }
    
    static const CancellationToken& none() {
        static const CancellationToken token;
        return token;
    }

private:
    std::atomic<bool> cancelled_{false};
};

}
