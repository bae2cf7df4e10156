#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <chrono>
#include <mutex>

namespace mrec {
    enum class PushResult {
        Rejected,       // queue stopped
        Queued,
        QueuedEvicted   // queued after evicting the oldest entry
    };

    template <class T>
    class BoundedQueue {
    public:
        explicit BoundedQueue(size_t capacity) : cap_(capacity) {}

        PushResult push_drop_oldest(T v) {
            PushResult r = PushResult::Queued;
            {
                std::lock_guard lk(m_);
                if (stopped_ || cap_ == 0) return PushResult::Rejected;
                if (q_.size() >= cap_) {
                    q_.pop_front();
                    ++dropped_;
                    r = PushResult::QueuedEvicted;
                }
                q_.push_back(std::move(v));
            }
            cv_.notify_one();
            return r;
        }

        bool try_pop(T& out) {
            std::lock_guard lk(m_);
            if (q_.empty()) return false;
            out = std::move(q_.front());
            q_.pop_front();
            return true;
        }

        bool pop_for(T& out, std::chrono::milliseconds d) {
            std::unique_lock lk(m_);
            if (!cv_.wait_for(lk, d, [&]{ return stopped_ || !q_.empty(); })) return false;
            if (stopped_ || q_.empty()) return false;
            out = std::move(q_.front());
            q_.pop_front();
            return true;
        }

        void stop() {
            {
                std::lock_guard lk(m_);
                stopped_ = true;
            }
            cv_.notify_all();
        }

        size_t size() const {
            std::lock_guard lk(m_);
            return q_.size();
        }

        uint64_t dropped() const {
            std::lock_guard lk(m_);
            return dropped_;
        }
    private:
        size_t cap_;
        mutable std::mutex m_;
        std::condition_variable cv_;
        std::deque<T> q_;
        bool stopped_ = false;
        uint64_t dropped_ = 0;
    };
}
