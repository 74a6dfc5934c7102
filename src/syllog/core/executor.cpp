#include "syllog/core/executor.hpp"

namespace syllog::core {

    ThreadPool::ThreadPool(std::size_t threads) {
        if (threads == 0)
            threads = 1;
        workers_.reserve(threads);
        for (std::size_t i = 0; i < threads; ++i)
            workers_.emplace_back([this] { work(); });
    }

    ThreadPool::~ThreadPool() {
        {
            std::lock_guard<std::mutex> lk(m_);
            stop_ = true;
        }
        wake_.notify_all();
        for (auto &t : workers_)
            t.join();
    }

    void ThreadPool::bulk(const IndexFn &f, std::size_t n) {
        if (n == 0)
            return;

        std::unique_lock<std::mutex> lk(m_);
        job_ = &f;
        count_ = n;
        next_ = 0;
        error_ = nullptr;
        wake_.notify_all();

        drained_.wait(lk, [&] { return next_ >= count_ && running_ == 0; });
        job_ = nullptr;

        if (error_) {
            auto error = error_;
            error_ = nullptr;
            std::rethrow_exception(error);
        }
    }

    void ThreadPool::work() {
        std::unique_lock<std::mutex> lk(m_);
        for (;;) {
            wake_.wait(lk, [&] { return stop_ || has_index(); });
            if (!has_index())
                return;

            const IndexFn &f = *job_;
            const std::size_t i = next_++;
            ++running_;

            lk.unlock();
            std::exception_ptr error;
            try {
                f(i);
            } catch (...) {
                error = std::current_exception();
            }
            lk.lock();

            if (error && !error_)
                error_ = error;
            --running_;
            if (next_ >= count_ && running_ == 0)
                drained_.notify_all();
        }
    }

} // namespace syllog::core
