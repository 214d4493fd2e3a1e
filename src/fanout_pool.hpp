#pragma once

// Internal header, not installed.
// std::jthread-based helper pool that runs one broadcast's per-channel
// sends in parallel. The calling thread takes part in every batch.

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <latch>
#include <mutex>
#include <span>
#include <thread>
#include <vector>

namespace listing_sync::detail {

class FanoutPool {
public:
    using Job = std::function<void()>;

    explicit FanoutPool(unsigned int num_helpers) {
        helpers_.reserve(num_helpers);
        for (unsigned int i = 0; i < num_helpers; ++i) {
            helpers_.emplace_back([this](std::stop_token st) { helper_loop(st); });
        }
    }

    ~FanoutPool() {
        {
            auto lock = std::scoped_lock{mutex_};
            for (auto& helper : helpers_) helper.request_stop();
        }
        cv_.notify_all();
        // Join before the mutex and condition variable go away.
        helpers_.clear();
    }

    FanoutPool(const FanoutPool&) = delete;
    auto operator=(const FanoutPool&) -> FanoutPool& = delete;

    /// Run every job and return once all of them have finished.
    /// Jobs must not throw.
    void run(std::span<const Job> jobs) {
        const auto helpers = std::min(helpers_.size(), jobs.empty() ? 0 : jobs.size() - 1);
        if (helpers == 0) {
            for (const auto& job : jobs) job();
            return;
        }

        auto batch = Batch{jobs, static_cast<std::ptrdiff_t>(helpers)};
        {
            auto lock = std::scoped_lock{mutex_};
            for (std::size_t i = 0; i < helpers; ++i) pending_.push_back(&batch);
        }
        cv_.notify_all();

        batch.work();
        batch.done.wait();
    }

    auto helpers() const -> std::size_t { return helpers_.size(); }

private:
    // Jobs are claimed one at a time through `next`, so a slow channel
    // only holds up the thread that drew it.
    struct Batch {
        std::span<const Job> jobs;
        std::atomic<std::size_t> next{0};
        std::latch done;

        Batch(std::span<const Job> j, std::ptrdiff_t helpers) : jobs{j}, done{helpers} {}

        void work() {
            for (auto i = next.fetch_add(1); i < jobs.size(); i = next.fetch_add(1)) {
                jobs[i]();
            }
        }
    };

    void helper_loop(std::stop_token st) {
        while (true) {
            Batch* batch = nullptr;
            {
                auto lock = std::unique_lock{mutex_};
                cv_.wait(lock, [&] { return !pending_.empty() || st.stop_requested(); });
                if (pending_.empty()) return;
                batch = pending_.front();
                pending_.pop_front();
            }
            batch->work();
            batch->done.count_down();
        }
    }

    std::vector<std::jthread> helpers_;
    std::deque<Batch*> pending_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace listing_sync::detail
