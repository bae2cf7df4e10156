#include <pipeline/task_pool.hpp>

#include <algorithm>
#include <iostream>

namespace mrec {
    TaskPool::TaskPool(std::string name, int workers, size_t capacity)
        : name_(std::move(name)),
          workers_(std::max(1, workers)),
          queue_(std::max<size_t>(1, capacity)) {}

    bool TaskPool::start() {
        if (running_) return true;
        running_ = true;

        threads_.reserve(static_cast<size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            threads_.emplace_back([this] { worker_loop_(); });
        }
        return true;
    }

    PushResult TaskPool::submit(Task task) {
        if (!running_ || !task) return PushResult::Rejected;
        return queue_.push_drop_oldest(std::move(task));
    }

    void TaskPool::stop() {
        if (!running_) return;
        running_ = false;

        queue_.stop();
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
        threads_.clear();
    }

    void TaskPool::worker_loop_() {
        while (running_.load(std::memory_order_relaxed)) {
            Task task;
            if (!queue_.pop_for(task, std::chrono::milliseconds(200))) continue;
            if (!task) continue;

            try {
                task();
            } catch (const std::exception& e) {
                std::cerr << "[TaskPool:" << name_ << "](worker_loop_) task failed: " << e.what() << "\n";
            }
            ++completed_;
        }
    }
}
