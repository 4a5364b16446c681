// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/threads/thread_parallel_runner_internal.h"

#include <algorithm>

namespace pio {

// static
PioParallelRetCode ThreadParallelRunner::Runner(
    void* runner_opaque, void* opaque, PioParallelRunInit init,
    PioParallelRunFunction func, uint32_t start_range, uint32_t end_range) {
  ThreadParallelRunner* self =
      static_cast<ThreadParallelRunner*>(runner_opaque);
  if (start_range > end_range) return PIO_PARALLEL_RET_RUNNER_ERROR;
  if (start_range == end_range) return 0;

  int ret = init(opaque, std::max<size_t>(self->num_worker_threads_, 1));
  if (ret != 0) return ret;

  // Use a sequential run when num_worker_threads_ is zero since we have no
  // worker threads.
  if (self->num_worker_threads_ == 0) {
    const size_t thread = 0;
    for (uint32_t task = start_range; task < end_range; ++task) {
      func(opaque, task, thread);
    }
    return 0;
  }

  if (self->depth_.fetch_add(1, std::memory_order_acq_rel) != 0) {
    self->depth_.fetch_add(-1, std::memory_order_acq_rel);
    return PIO_PARALLEL_RET_RUNNER_ERROR;  // Must not re-enter.
  }

  const WorkerCommand worker_command =
      (static_cast<WorkerCommand>(start_range) << 32) + end_range;

  self->data_func_ = func;
  self->opaque_ = opaque;
  self->num_reserved_.store(0, std::memory_order_relaxed);

  self->StartWorkers(worker_command);

  {
    std::unique_lock<std::mutex> lock(self->mutex_);
    self->workers_done_cv_.wait(
        lock, [self]() { return self->workers_pending_ == 0; });
  }

  self->depth_.fetch_add(-1, std::memory_order_acq_rel);
  return 0;
}

// static
void ThreadParallelRunner::RunRange(ThreadParallelRunner* self,
                                    const WorkerCommand command,
                                    const int thread) {
  const uint32_t begin = command >> 32;
  const uint32_t end = command & 0xFFFFFFFF;
  const uint32_t num_tasks = end - begin;

  // Trials are few and expensive, so each worker reserves a single task at a
  // time instead of a chunk.
  for (;;) {
    const uint32_t my_index =
        self->num_reserved_.fetch_add(1, std::memory_order_relaxed);
    if (my_index >= num_tasks) break;
    self->data_func_(self->opaque_, begin + my_index, thread);
  }
}

// static
void ThreadParallelRunner::ThreadFunc(ThreadParallelRunner* self,
                                      const int thread) {
  uint64_t seen_generation = 0;
  // Until kWorkerExit command received:
  for (;;) {
    WorkerCommand command;
    {
      std::unique_lock<std::mutex> lock(self->mutex_);
      self->worker_start_cv_.wait(lock, [self, seen_generation]() {
        return self->generation_ != seen_generation;
      });
      seen_generation = self->generation_;
      command = self->worker_start_command_;
    }

    if (command == kWorkerExit) return;
    RunRange(self, command, thread);

    std::unique_lock<std::mutex> lock(self->mutex_);
    if (--self->workers_pending_ == 0) {
      self->workers_done_cv_.notify_one();
    }
  }
}

ThreadParallelRunner::ThreadParallelRunner(const int num_worker_threads)
    : num_worker_threads_(std::max(num_worker_threads, 0)),
      num_threads_(std::max(num_worker_threads, 1)) {
  threads_.reserve(num_worker_threads_);

  // Suppress "unused-private-field" warning.
  (void)padding1;
  (void)padding2;

  for (uint32_t i = 0; i < num_worker_threads_; ++i) {
    threads_.emplace_back(ThreadFunc, this, static_cast<int>(i));
  }
}

void ThreadParallelRunner::StartWorkers(const WorkerCommand worker_command) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    worker_start_command_ = worker_command;
    workers_pending_ = num_worker_threads_;
    ++generation_;
  }
  // Workers will need this lock, so release it before they wake up.
  worker_start_cv_.notify_all();
}

ThreadParallelRunner::~ThreadParallelRunner() {
  if (num_worker_threads_ != 0) {
    StartWorkers(kWorkerExit);
  }

  for (std::thread& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

}  // namespace pio
