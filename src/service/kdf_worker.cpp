#include "pqchat/service/kdf_worker.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace pqchat::service {

KdfWorker::KdfWorker(size_t threads) {
    if (threads == 0) {
        throw std::invalid_argument("KdfWorker needs at least one thread");
    }

    threads_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this] { run(); });
    }
    spdlog::debug("KDF worker started with {} threads", threads);
}

KdfWorker::~KdfWorker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

size_t KdfWorker::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void KdfWorker::enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::logic_error("KdfWorker is shutting down");
        }
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

void KdfWorker::run() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return;  // stopping and drained
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        // packaged_task stores any exception in its future
        job();
    }
}

}  // namespace pqchat::service
