// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_PIO_BASE_DATA_PARALLEL_H_
#define LIB_PIO_BASE_DATA_PARALLEL_H_

// Portable, low-overhead C++11 ThreadPool alternative to OpenMP for
// data-parallel computations.

#include <pio/parallel_runner.h>

#include <cstddef>
#include <cstdint>

#include "lib/pio/base/compiler_specific.h"
#include "lib/pio/base/status.h"

namespace pio {

class ThreadPool {
 public:
  ThreadPool(PioParallelRunner runner, void* runner_opaque)
      : runner_(runner ? runner : &ThreadPool::SequentialRunnerStatic),
        runner_opaque_(runner ? runner_opaque : static_cast<void*>(this)) {}

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  PioParallelRunner runner() const { return runner_; }
  void* runner_opaque() const { return runner_opaque_; }

  // Runs init_func(num_threads) followed by data_func(task, thread) on worker
  // thread(s) for every task in [begin, end). init_func() must return a Status
  // indicating whether the initialization succeeded.
  // "thread" is an integer smaller than num_threads.
  // Not thread-safe - no two calls to Run may overlap.
  // Subsequent calls will reuse the same threads.
  //
  // Precondition: begin <= end.
  template <class InitFunc, class DataFunc>
  Status Run(uint32_t begin, uint32_t end, const InitFunc& init_func,
             const DataFunc& data_func, const char* caller = "") {
    PIO_ENSURE(begin <= end);
    if (begin == end) return true;
    RunCallState<InitFunc, DataFunc> call_state(init_func, data_func);
    // The runner_ uses the C convention and returns 0 in case of error, so we
    // convert it to a Status.
    if (!runner_) {
      return PIO_FAILURE("%s: no runner", caller);
    }
    int ret = (*runner_)(runner_opaque_, static_cast<void*>(&call_state),
                         &call_state.CallInitFunc, &call_state.CallDataFunc,
                         begin, end);
    if (ret != 0) {
      return PIO_FAILURE("%s: runner failed with code %d", caller, ret);
    }
    return true;
  }

  // Use this as init_func when no initialization is needed.
  static Status NoInit(size_t num_threads) { return true; }

 private:
  // class holding the state of a Run() call to pass to the runner_ as an
  // opaque pointer.
  template <class InitFunc, class DataFunc>
  class RunCallState final {
   public:
    RunCallState(const InitFunc& init_func, const DataFunc& data_func)
        : init_func_(init_func), data_func_(data_func) {}

    // Given the init_func and data_func as opaque pointers, calls them.
    static PioParallelRetCode CallInitFunc(void* opaque, size_t num_threads) {
      auto* self = static_cast<RunCallState<InitFunc, DataFunc>*>(opaque);
      // Returns -1 when the internal init function returns false Status to
      // indicate an error.
      if (!self->init_func_(num_threads)) {
        return -1;
      }
      return 0;
    }

    static void CallDataFunc(void* opaque, uint32_t value, size_t thread_id) {
      auto* self = static_cast<RunCallState<InitFunc, DataFunc>*>(opaque);
      self->data_func_(value, thread_id);
    }

   private:
    const InitFunc& init_func_;
    const DataFunc& data_func_;
  };

  // Default implementation using std::thread is in
  // lib/threads/thread_parallel_runner_internal.h; when no runner is given
  // the tasks run sequentially on the calling thread.
  static PioParallelRetCode SequentialRunnerStatic(
      void* runner_opaque, void* opaque, PioParallelRunInit init,
      PioParallelRunFunction func, uint32_t start_range, uint32_t end_range);

  // The caller supplied runner function and its opaque void*.
  const PioParallelRunner runner_;
  void* const runner_opaque_;
};

template <class InitFunc, class DataFunc>
Status RunOnPool(ThreadPool* pool, const uint32_t begin, const uint32_t end,
                 const InitFunc& init_func, const DataFunc& data_func,
                 const char* caller) {
  if (pool == nullptr) {
    ThreadPool default_pool(nullptr, nullptr);
    return default_pool.Run(begin, end, init_func, data_func, caller);
  } else {
    return pool->Run(begin, end, init_func, data_func, caller);
  }
}

}  // namespace pio

#endif  // LIB_PIO_BASE_DATA_PARALLEL_H_
