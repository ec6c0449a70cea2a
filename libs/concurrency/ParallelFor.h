#pragma once

#include <cstdint>    // for uint32_t
#include <thread>     // for std::thread::hardware_concurrency()
#include <vector>     // for std::vector
#include <future>     // for std::future
#include <algorithm>  // for std::min

namespace concurrency
{
  // Split [0, total) into contiguous chunks, submit one task per chunk, then
  // wait for all of them. A chunkSizeHint of 0 yields one chunk per hardware
  // thread. body(i) is called exactly once for every i; bodies must write to
  // disjoint state.
  template<typename Executor, typename Body>
  void parallel_for_chunked(uint32_t total, Executor& exec, Body body, uint32_t chunkSizeHint)
  {
    if (total == 0)
      return;

    uint32_t chunkSize = chunkSizeHint;
    if (chunkSize == 0)
      {
	const unsigned hw = std::thread::hardware_concurrency();
	const unsigned numTasks = hw ? hw : 2;
	chunkSize = (total + numTasks - 1) / numTasks; // ceil-divide
      }

    std::vector<std::future<void>> futures;
    futures.reserve((total + chunkSize - 1) / chunkSize);

    for (uint32_t start = 0; start < total; start += chunkSize)
      {
	const uint32_t end = std::min(total, start + chunkSize);
	futures.emplace_back(exec.submit([=]() {
	      for (uint32_t p = start; p < end; ++p)
		body(p);
	    }));
	if (end == total)
	  break;
      }

    exec.waitAll(futures);
  }

  template<typename Executor, typename Body>
  void parallel_for(uint32_t total, Executor& exec, Body body)
  {
    parallel_for_chunked(total, exec, body, 0);
  }
}
