/* Copyright (c) the JPEG XL Project Authors. All rights reserved.
 *
 * Use of this source code is governed by a BSD-style
 * license that can be found in the LICENSE file.
 */

/** @file parallel_runner.h
 *  @brief Interface for running a range of independent tasks on a runner
 *  chosen by the caller.
 *
 * The optimizer runs its trials through a PioParallelRunner. A runner calls
 * "init" once with the number of threads it will use and then calls "func"
 * exactly once for every value in the range [start_range, end_range), possibly
 * in parallel and in any order. The runner returns only when every call
 * finished.
 */

#ifndef PIO_PARALLEL_RUNNER_H_
#define PIO_PARALLEL_RUNNER_H_

#include <stddef.h>
#include <stdint.h>

#if defined(__cplusplus) || defined(c_plusplus)
extern "C" {
#endif

/** Return code used in the PioParallel* functions as return value. A value
 * of 0 means success and any other value means error. The special value
 * PIO_PARALLEL_RET_RUNNER_ERROR can be used by the runner to indicate any
 * other error.
 */
typedef int PioParallelRetCode;

/**
 * General error returned by the runner when it fails to run the tasks.
 */
#define PIO_PARALLEL_RET_RUNNER_ERROR (-1)

/**
 * Parallel run initialization callback. See @ref PioParallelRunner for
 * details.
 *
 * @param opaque the @p opaque object passed to the runner.
 * @param num_threads the maximum number of threads that will call the
 *     @c func callback concurrently.
 * @return 0 if the initialization process was successful.
 * @return an error code if there was an error, which should be returned by
 *     the runner.
 */
typedef PioParallelRetCode (*PioParallelRunInit)(void* opaque,
                                                 size_t num_threads);

/**
 * Parallel run data processing callback. See @ref PioParallelRunner for
 * details.
 *
 * @param opaque the @p opaque object passed to the runner.
 * @param value the task value to process, in the range given to the runner.
 * @param thread_id the thread index, in [0, num_threads).
 */
typedef void (*PioParallelRunFunction)(void* opaque, uint32_t value,
                                       size_t thread_id);

/**
 * PioParallelRunner function type. Runs "init" once and then "func" for
 * every value in [start_range, end_range). Must not return before every
 * "func" call returned.
 *
 * @return 0 if the @p init call succeeded (returned 0) and no other error
 *     occurred in the runner code.
 * @return PIO_PARALLEL_RET_RUNNER_ERROR if an error occurred in the runner
 *     code, for example, setting up the threads.
 * @return the return value of @p init() if non-zero.
 */
typedef PioParallelRetCode (*PioParallelRunner)(
    void* runner_opaque, void* opaque, PioParallelRunInit init,
    PioParallelRunFunction func, uint32_t start_range, uint32_t end_range);

#if defined(__cplusplus) || defined(c_plusplus)
}
#endif

#endif /* PIO_PARALLEL_RUNNER_H_ */
