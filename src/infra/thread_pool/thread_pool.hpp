#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>
#include <stop_token>
#include <vector>
#include <stdexcept>
#include <atomic>

namespace cupload::infra {

// Пул потоков с ограниченной очередью: enqueue() блокирует вызывающего,
// пока в очереди max_queued задач (backpressure для последовательного читателя).
class ThreadPool {
public:
    explicit ThreadPool(std::size_t nthreads = std::jthread::hardware_concurrency(),
                        std::size_t max_queued = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args) -> void;

    template<typename F, typename... Args>
    auto enqueue_with_future(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>>;

    // Блокирующее ожидание завершения всех задач
    void wait();

    [[nodiscard]] auto size() const -> std::size_t { return workers_.size(); }

private:
    using Task = std::packaged_task<void()>;

    std::vector<std::jthread> workers_;
    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any cv_;
    std::condition_variable_any space_cv_;
    std::size_t max_queued_; // 0 = без ограничения
    bool stop_ = false;
    std::atomic<std::size_t> active_tasks_{0};
};

// =============== Реализация шаблонов ===============

template<typename F, typename... Args>
void ThreadPool::enqueue(F&& f, Args&&... args) {
    enqueue_with_future(std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::enqueue_with_future(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>>
{
    using ReturnType = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    auto future = task->get_future();
    {
        std::unique_lock lock(queue_mutex_);
        space_cv_.wait(lock, [this] {
            return stop_ || max_queued_ == 0 || tasks_.size() < max_queued_;
        });
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        active_tasks_.fetch_add(1, std::memory_order_relaxed);
        tasks_.emplace([task, this]() {
            (*task)();
            {
                std::lock_guard done_lock(queue_mutex_);
                active_tasks_.fetch_sub(1, std::memory_order_relaxed);
            }
            cv_.notify_all(); // уведомляем wait()
        });
    }
    cv_.notify_all();
    return future;
}

} // namespace cupload::infra

namespace cupload::infra {

inline ThreadPool::ThreadPool(std::size_t nthreads, std::size_t max_queued)
    : max_queued_(max_queued)
    , stop_(false)
{
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);

    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this](std::stop_token st) {
            while (true) {
                Task task;
                {
                    std::unique_lock lock(queue_mutex_);
                    cv_.wait(lock, [this, &st] {
                        return st.stop_requested() || !tasks_.empty() || stop_;
                    });

                    if (tasks_.empty()) {
                        // stop_ и очередь пуста
                        break;
                    }

                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                space_cv_.notify_one();

                task();
            }
        });
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    space_cv_.notify_all();
    // join до разрушения мьютекса и cv; оставшиеся в очереди задачи будут выполнены
    workers_.clear();
}

inline void ThreadPool::wait() {
    std::unique_lock lock(queue_mutex_);
    cv_.wait(lock, [this] {
        return tasks_.empty() && active_tasks_.load(std::memory_order_relaxed) == 0;
    });
}

} // namespace cupload::infra
