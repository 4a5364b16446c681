// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef TOOLS_TRIAL_THREAD_POOL_H_
#define TOOLS_TRIAL_THREAD_POOL_H_

#include <pio/parallel_runner.h>
#include <stddef.h>

#include <thread>

#include "lib/pio/base/data_parallel.h"
#include "lib/threads/thread_parallel_runner_internal.h"

namespace pio {
namespace tools {

// Pool that runs the encode-decode-score trials of a search batch. The tools
// create one per run from the --threads flag and pass it to Optimize().
class TrialThreadPool : public ThreadPool {
 public:
  // Maps the --threads value to a worker count: -1 (or any negative value)
  // means one worker per hyperthread, 0 runs every trial on the calling
  // thread.
  static int WorkerCount(int requested) {
    if (requested >= 0) return requested;
    const int hardware = static_cast<int>(std::thread::hardware_concurrency());
    return hardware > 0 ? hardware : 1;
  }

  // Blocks until the workers are ready.
  explicit TrialThreadPool(int requested_threads)
      : ThreadPool(&ThreadParallelRunner::Runner,
                   static_cast<void*>(&runner_)),
        runner_(WorkerCount(requested_threads)) {}

  TrialThreadPool(const TrialThreadPool&) = delete;
  TrialThreadPool& operator=(const TrialThreadPool&) = delete;

  // Threads a batch runs on, the calling thread counting as one when there
  // are no workers.
  size_t NumThreads() const { return runner_.NumThreads(); }

 private:
  ThreadParallelRunner runner_;
};

}  // namespace tools
}  // namespace pio

#endif  // TOOLS_TRIAL_THREAD_POOL_H_
