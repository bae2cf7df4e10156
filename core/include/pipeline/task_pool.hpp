#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include <pipeline/bounded_queue.hpp>

namespace mrec {
    // Fixed set of workers draining a bounded queue of fire-and-forget tasks.
    // submit() never blocks; when the queue is full the oldest pending task is dropped.
    class TaskPool {
    public:
        using Task = std::function<void()>;

        TaskPool(std::string name, int workers, size_t capacity);
        ~TaskPool() { stop(); }

        TaskPool(const TaskPool&) = delete;
        TaskPool& operator=(const TaskPool&) = delete;

        bool start();
        PushResult submit(Task task);
        // finishes the tasks being run, discards pending ones
        void stop();

        bool running() const { return running_.load(); }
        uint64_t dropped() const { return queue_.dropped(); }
        uint64_t completed() const { return completed_.load(); }

    private:
        void worker_loop_();

        std::string name_;
        int workers_;
        BoundedQueue<Task> queue_;
        std::vector<std::thread> threads_;
        std::atomic<bool> running_{false};
        std::atomic<uint64_t> completed_{0};
    };
}
