#include "util/concurrency.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <thread>
#include <vector>

// decide global variable at runtime
const size_t THREAD_COUNT = []() {
  size_t count = (
    std::thread::hardware_concurrency() > 0
    ? std::thread::hardware_concurrency()
    : DEFAULT_THREAD_COUNT
  );
  std::cout << "[  info  ] using thread count " << count << std::endl;
  return count;
}();

void MULTI_TASK(std::function<void(size_t, size_t)> task, size_t num_tasks) {
  std::vector<std::future<void>> futures;

  if (num_tasks < THREAD_COUNT) {
    for (size_t thread_id = 0; thread_id < num_tasks; thread_id++) {
      futures.push_back(std::async(std::launch::async, task, thread_id, thread_id + 1));
    }
  } else {
    const size_t chunk = (num_tasks + THREAD_COUNT - 1) / THREAD_COUNT;
    for (size_t start = 0; start < num_tasks; start += chunk) {
      size_t end = std::min(start + chunk, num_tasks);
      futures.push_back(std::async(std::launch::async, task, start, end));
    }
  }

  // wait for every thread before surfacing a failure
  for (std::future<void>& future : futures) { future.wait(); }
  for (std::future<void>& future : futures) { future.get(); }
}
