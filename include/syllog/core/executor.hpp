#pragma once
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace syllog::core {

    // Fixed-size pool of workers that share one index range at a time.
    //
    // bulk(f, n) publishes the range [0, n); idle workers claim the next
    // unclaimed index until the range is drained. There is no task queue:
    // a pool serves a single caller, one bulk call after another.
    class ThreadPool {
      public:
        using IndexFn = std::function<void(std::size_t)>;

        explicit ThreadPool(std::size_t threads = std::thread::hardware_concurrency());
        ~ThreadPool();

        ThreadPool(const ThreadPool &) = delete;
        ThreadPool &operator=(const ThreadPool &) = delete;

        // Runs f(0) .. f(n-1) on the workers and blocks until every index has
        // finished. The first exception thrown by f is rethrown here.
        void bulk(const IndexFn &f, std::size_t n);

        std::size_t size() const { return workers_.size(); }

      private:
        void work();
        bool has_index() const { return job_ != nullptr && next_ < count_; }

        std::mutex m_;
        std::condition_variable wake_;
        std::condition_variable drained_;

        // Current range, guarded by m_.
        const IndexFn *job_ = nullptr;
        std::size_t count_ = 0;
        std::size_t next_ = 0;
        std::size_t running_ = 0;
        std::exception_ptr error_;
        bool stop_ = false;

        std::vector<std::thread> workers_;
    };

} // namespace syllog::core
