#ifndef CANCELLATION_TOKEN_HPP
#define CANCELLATION_TOKEN_HPP

//internal
#include <atomic>

// Flag that allows to interrupt a running operation from another thread
// The operation checks it between buffers (or lines) so the part being written is discarded as a whole
class cancellation_token
{
    public:
        void cancel()
        {
            _is_cancelled.store(true, std::memory_order_relaxed);
        }

        bool is_cancelled() const
        {
            return _is_cancelled.load(std::memory_order_relaxed);
        }

    private:
        std::atomic<bool> _is_cancelled{false};
};

#endif
