#include <em/task_executor.hpp>
#include <exception>

namespace em {

namespace {

void run_guarded(const std::function<void()>& task, warden::log::Logger& log) {
    try {
        task();
    } catch (const std::exception& e) {
        WARDEN_LOGERROR(log, "Background task failed: {}", e.what());
    }
}

} // namespace

ThreadPoolExecutor::ThreadPoolExecutor(std::size_t threads)
    : log_(warden::log::Logger::CreateLogger("EM")) {
    if (threads == 0) threads = 1;
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i)
        threads_.emplace_back([this] { worker_loop(); });
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    drain();
}

void ThreadPoolExecutor::submit(std::function<void()> task) {
    {
        std::scoped_lock lk(mu_);
        if (!draining_) {
            tasks_.push_back(std::move(task));
            cv_.notify_one();
            return;
        }
    }
    // pool is gone; the caller still needs its completion
    WARDEN_LOGDEBUG(log_, "Executor drained, running task inline");
    run_guarded(task, log_);
}

void ThreadPoolExecutor::drain() {
    {
        std::scoped_lock lk(mu_);
        draining_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_)
        if (t.joinable()) t.join();
    threads_.clear();
}

void ThreadPoolExecutor::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lk(mu_);
            cv_.wait(lk, [this] { return draining_ || !tasks_.empty(); });
            if (tasks_.empty()) return;   // draining and nothing left
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        run_guarded(task, log_);
    }
}

void InlineExecutor::submit(std::function<void()> task) {
    task();
}

} // namespace em
