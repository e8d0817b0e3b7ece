#ifndef BRIDGESCOUT_THREADPOOL_HPP
#define BRIDGESCOUT_THREADPOOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace bridgescout {
namespace util {

/**
 * Fixed-size thread pool for bounded parallel task execution
 *
 * Usage:
 *   ThreadPool pool(4);  // 4 worker threads
 *   auto future = pool.enqueue([](){ return 42; });
 *   int result = future.get();
 *
 * Shutdown(true) drops tasks that have not started yet (their futures
 * report broken_promise) and waits for running tasks to finish. The
 * destructor performs Shutdown(false), i.e. it drains the queue first.
 */
class ThreadPool {
public:
  /**
   * Constructor - create pool with specified number of threads
   * If num_threads == 0, uses hardware concurrency
   */
  explicit ThreadPool(size_t num_threads = 0);

  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  /**
   * Enqueue a task for execution
   * Returns a future that will contain the result
   * Throws std::runtime_error after Shutdown()
   */
  template <class F, class... Args>
  auto enqueue(F &&f, Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  /**
   * Stop accepting tasks and join all workers. Idempotent.
   * @param discard_pending Drop queued tasks instead of running them
   */
  void Shutdown(bool discard_pending);

  size_t size() const { return workers_.size(); }

  // Number of queued tasks not yet picked up by a worker
  size_t pending() const;

private:
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;

  mutable std::mutex queue_mutex_;
  std::condition_variable condition_;
  bool stop_;
};

// Implementation of enqueue (must be in header for template)
template <class F, class... Args>
auto ThreadPool::enqueue(F &&f, Args &&...args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
  using return_type = typename std::invoke_result<F, Args...>::type;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...));

  std::future<return_type> res = task->get_future();
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);

    // Don't allow enqueueing after stopping the pool
    if (stop_)
      throw std::runtime_error("enqueue on stopped ThreadPool");

    tasks_.emplace([task]() { (*task)(); });
  }
  condition_.notify_one();
  return res;
}

} // namespace util
} // namespace bridgescout

#endif // BRIDGESCOUT_THREADPOOL_HPP
