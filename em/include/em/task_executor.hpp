#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include <log.hpp>

namespace em {

// Runs blocking platform calls off the control thread
class ITaskExecutor {
public:
    virtual ~ITaskExecutor() = default;
    virtual void submit(std::function<void()> task) = 0;
    // Runs everything already submitted, then refuses new work
    virtual void drain() = 0;
};

class ThreadPoolExecutor : public ITaskExecutor {
public:
    explicit ThreadPoolExecutor(std::size_t threads);
    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    void submit(std::function<void()> task) override;
    void drain() override;

private:
    void worker_loop();

    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    bool draining_{false};
    std::vector<std::thread> threads_;
    warden::log::Logger log_;
};

// Runs the task on the caller's thread; for tests and single-shot tools
class InlineExecutor : public ITaskExecutor {
public:
    void submit(std::function<void()> task) override;
    void drain() override {}
};

} // namespace em
