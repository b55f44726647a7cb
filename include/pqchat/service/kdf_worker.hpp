#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace pqchat::service {

// Dedicated threads for compute-bound password derivation, kept apart from
// the threads serving connection fan-out.
//
// Tasks still queued at destruction are run before the threads join, so
// every returned future is eventually satisfied.
class KdfWorker {
public:
    explicit KdfWorker(size_t threads = 1);
    ~KdfWorker();

    KdfWorker(const KdfWorker&) = delete;
    KdfWorker& operator=(const KdfWorker&) = delete;

    // Exceptions thrown by the task surface through the future
    template <typename F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;

        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
        auto future = packaged->get_future();
        enqueue([packaged] { (*packaged)(); });
        return future;
    }

    [[nodiscard]] size_t thread_count() const { return threads_.size(); }
    [[nodiscard]] size_t pending() const;

private:
    void enqueue(std::function<void()> job);
    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> jobs_;
    bool stopping_{false};
    std::vector<std::thread> threads_;
};

}  // namespace pqchat::service
