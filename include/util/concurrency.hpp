#pragma once

#include <cstddef>
#include <functional>

// default thread count if hardware value is undefined
#define DEFAULT_THREAD_COUNT 8

// global constant for thread count, initialized in cxx
extern const size_t THREAD_COUNT;

/**
 * split [0, num_tasks) into contiguous ranges and call `task(start, end)` on each
 * from its own thread; returns once every range is done and rethrows the first
 * exception raised by a task
 */
void MULTI_TASK(std::function<void(size_t, size_t)> task, size_t num_tasks);
