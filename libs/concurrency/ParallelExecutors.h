#pragma once

#include "IParallelExecutor.h"
#include <queue>
#include <future>
#include <thread>
#include <vector>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <exception>
#include <memory>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies used to fan out bootstrap replicates and CSCV combinations.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread.
 *  - StdAsyncExecutor: one std::async(std::launch::async) call per task.
 *  - ThreadPoolExecutor<N>: fixed pool of worker threads fed from a queue.
 *
 * @section usage Choosing a policy
 * - SingleThreadExecutor is the default of every engine in this project and is
 *   what the unit tests use. Results never depend on the policy because each
 *   task writes its own output slot and draws from its own pre-seeded engine.
 * - StdAsyncExecutor is fine for a handful of long tasks.
 * - ThreadPoolExecutor<N> is the right choice for thousands of replicates; the
 *   thread count may also be chosen at run time (N == 0 with an explicit count).
 */
namespace concurrency
{
  /**
   * @brief Executes tasks synchronously on the calling thread.
   */
  class SingleThreadExecutor : public IParallelExecutor
  {
  public:
    std::future<void> submit(std::function<void()> task) override
    {
      std::promise<void> prom;
      auto fut = prom.get_future();
      try
	{
	  task();
	  prom.set_value();
	}
      catch (...)
	{
	  prom.set_exception(std::current_exception());
	}
      return fut;
    }
  };

  /**
   * @brief Executor policy using std::async for each task.
   *
   * Each submit may start a new thread; there is no cap on concurrency.
   */
  class StdAsyncExecutor : public IParallelExecutor
  {
  public:
    std::future<void> submit(std::function<void()> task) override
    {
      return std::async(std::launch::async, std::move(task));
    }
  };

  /**
   * @brief Fixed-size thread pool executor.
   *
   * Template parameter N fixes the number of workers at compile time. With
   * N == 0 the default constructor picks std::thread::hardware_concurrency()
   * (2 if unknown), and the explicit constructor takes the count at run time,
   * which is what the command-line driver uses for its --threads option.
   */
  template <std::size_t N = 0>
  class ThreadPoolExecutor : public IParallelExecutor
  {
  public:
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    ThreadPoolExecutor()
      : ThreadPoolExecutor(N)
    {}

    explicit ThreadPoolExecutor(std::size_t numThreads)
      : stop_(false)
    {
      const unsigned hw = std::thread::hardware_concurrency();
      const std::size_t threads = numThreads > 0 ? numThreads : (hw ? hw : 2);

      try
	{
	  for (std::size_t i = 0; i < threads; ++i)
	    workers_.emplace_back([this] { workerLoop(); });
	}
      catch (...)
	{
	  shutdown();
	  throw;
	}
    }

    ~ThreadPoolExecutor()
    {
      shutdown();
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
      auto fut = packaged->get_future();
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	if (stop_)
	  throw std::runtime_error("ThreadPoolExecutor: submit on a stopped pool");
	tasks_.emplace([packaged]() { (*packaged)(); });
      }
      condition_.notify_one();
      return fut;
    }

    std::size_t numThreads() const noexcept
    {
      return workers_.size();
    }

  private:
    void workerLoop()
    {
      for (;;)
	{
	  std::function<void()> task;
	  {
	    std::unique_lock<std::mutex> lock(tasksMutex_);
	    condition_.wait(lock, [this]{ return stop_ || !tasks_.empty(); });
	    if (stop_ && tasks_.empty())
	      return;
	    task = std::move(tasks_.front());
	    tasks_.pop();
	  }
	  task();
	}
    }

    void shutdown()
    {
      {
	std::lock_guard<std::mutex> lock(tasksMutex_);
	stop_ = true;
      }
      condition_.notify_all();
      for (auto& w : workers_)
	if (w.joinable())
	  w.join();
    }

  private:
    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        tasksMutex_;
    std::condition_variable           condition_;
    bool                              stop_;
  };
} // namespace concurrency
