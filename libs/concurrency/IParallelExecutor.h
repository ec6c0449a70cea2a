// concurrency/IParallelExecutor.h
#pragma once
#include <future>
#include <vector>
#include <functional>

namespace concurrency
{
  /**
   * @brief Interface every executor policy implements.
   *
   * The resampling engine and the CSCV estimator only ever need to submit
   * void() tasks and wait for the whole batch, so the interface is kept to
   * exactly that.
   */
  class IParallelExecutor
  {
  public:
    virtual ~IParallelExecutor() = default;

    // Schedule a void() task; the returned future rethrows anything the task threw.
    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Block until every future in the batch has completed. The first stored
    // exception is rethrown after all futures have been waited on.
    virtual void waitAll(std::vector<std::future<void>>& futures)
    {
      std::exception_ptr first;
      for (auto& f : futures)
	{
	  try
	    {
	      f.get();
	    }
	  catch (...)
	    {
	      if (!first)
		first = std::current_exception();
	    }
	}

      if (first)
	std::rethrow_exception(first);
    }
  };
} // namespace concurrency
