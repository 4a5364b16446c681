// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.
//

// C++ implementation using std::thread of a ::PioParallelRunner.

// The main class in this module, ThreadParallelRunner, implements a static
// method ThreadParallelRunner::Runner than can be passed as a
// PioParallelRunner when using a ThreadParallelRunner instance as the opaque
// runner_opaque pointer.
//
// Worker threads are started in the constructor and joined in the
// destructor. Each Runner() call hands the range to the workers, which
// reserve tasks one at a time with an atomic counter, so tasks of unequal
// cost still balance across threads.

#ifndef LIB_THREADS_THREAD_PARALLEL_RUNNER_INTERNAL_H_
#define LIB_THREADS_THREAD_PARALLEL_RUNNER_INTERNAL_H_

#include <pio/parallel_runner.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace pio {

// Main helper class implementing the ::PioParallelRunner interface.
class ThreadParallelRunner {
 public:
  // ::PioParallelRunner interface.
  static PioParallelRetCode Runner(void* runner_opaque, void* opaque,
                                   PioParallelRunInit init,
                                   PioParallelRunFunction func,
                                   uint32_t start_range, uint32_t end_range);

  // Starts the given number of worker threads and blocks until they are ready.
  // "num_worker_threads" defaults to one per hyperthread. If zero, all tasks
  // run on the main thread.
  explicit ThreadParallelRunner(
      int num_worker_threads = std::thread::hardware_concurrency());

  // Waits for all threads to exit.
  ~ThreadParallelRunner();

  // Returns maximum number of main/worker threads that may call Func. Useful
  // for allocating per-thread storage.
  size_t NumThreads() const { return num_threads_; }

  // Returns number of worker threads created (some may be sleeping and never
  // wake up in time to participate in Run). Useful for characterizing
  // performance.
  size_t NumWorkerThreads() const { return num_worker_threads_; }

 private:
  // Workers wait on worker_start_cv_ until the generation changes, then read
  // the command. A command either encodes the begin/end of a range or is
  // kWorkerExit. The main thread waits on workers_done_cv_ until every worker
  // finished the current command.
  using WorkerCommand = uint64_t;

  // Not a valid range encoding since begin >= end.
  static constexpr WorkerCommand kWorkerExit = ~0ULL;

  // Publishes a new command to all workers.
  void StartWorkers(WorkerCommand worker_command);

  // Attempts to reserve and perform some work from the global range of tasks,
  // which is encoded within "command". Returns after all tasks are reserved.
  static void RunRange(ThreadParallelRunner* self, WorkerCommand command,
                       int thread);

  static void ThreadFunc(ThreadParallelRunner* self, int thread);

  // Unmodified after ctor, but cannot be const because we call thread::join().
  std::vector<std::thread> threads_;

  const uint32_t num_worker_threads_;  // == threads_.size()
  const uint32_t num_threads_;

  std::atomic<int> depth_{0};  // detects if Run is re-entered (not supported).

  std::mutex mutex_;  // guards both cv and their variables.
  std::condition_variable worker_start_cv_;
  std::condition_variable workers_done_cv_;
  uint64_t generation_ = 0;
  WorkerCommand worker_start_command_ = kWorkerExit;
  uint32_t workers_pending_ = 0;

  // Written by main thread, read by workers (after mutex lock/unlock).
  PioParallelRunFunction data_func_ = nullptr;
  void* opaque_ = nullptr;

  // Updated by workers; padding avoids false sharing.
  uint8_t padding1[64];
  std::atomic<uint32_t> num_reserved_{0};
  uint8_t padding2[64];
};

}  // namespace pio

#endif  // LIB_THREADS_THREAD_PARALLEL_RUNNER_INTERNAL_H_
