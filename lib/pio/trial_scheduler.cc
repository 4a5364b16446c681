// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/pio/trial_scheduler.h"

#include <cstdint>
#include <utility>

namespace pio {

// static
TrialOutcome TrialScheduler::RunTrial(const TrialRequest& request) {
  TrialOutcome outcome;
  const CodecAdapter& adapter = *request.adapter;
  outcome.trial.format = adapter.format;
  outcome.trial.parameter = request.parameter;

  if (!adapter.native_range.Contains(request.parameter)) {
    outcome.status = PIO_STATUS(StatusCode::kEncodeError,
                                "%s: parameter %d outside [%d, %d]",
                                FormatName(adapter.format), request.parameter,
                                adapter.native_range.min,
                                adapter.native_range.max);
    return outcome;
  }
  Status encoded =
      adapter.encode(*request.image, request.parameter, &outcome.trial.encoded);
  if (!encoded) {
    outcome.status = PIO_STATUS(StatusCode::kEncodeError,
                                "%s: encoding at %d failed (%s)",
                                FormatName(adapter.format), request.parameter,
                                StatusCodeName(encoded.code()));
    return outcome;
  }

  StatusOr<PackedImage> decoded = adapter.decode(outcome.trial.encoded);
  if (!decoded.ok()) {
    outcome.status = PIO_STATUS(StatusCode::kDecodeError,
                                "%s: decoding the output at %d failed (%s)",
                                FormatName(adapter.format), request.parameter,
                                StatusCodeName(decoded.status().code()));
    return outcome;
  }
  PackedImage candidate = std::move(decoded).value_();
  if (candidate.xsize() != request.evaluator->xsize() ||
      candidate.ysize() != request.evaluator->ysize()) {
    outcome.status = PIO_STATUS(
        StatusCode::kDimensionMismatch, "%s: decoded %zux%zu, expected %zux%zu",
        FormatName(adapter.format), candidate.xsize(), candidate.ysize(),
        request.evaluator->xsize(), request.evaluator->ysize());
    return outcome;
  }

  StatusOr<double> score = request.evaluator->Compare(candidate);
  if (!score.ok()) {
    outcome.status = score.status();
    return outcome;
  }
  outcome.trial.score = std::move(score).value_();
  return outcome;
}

Status TrialScheduler::RunBatch(const std::vector<TrialRequest>& requests,
                                std::vector<TrialOutcome>* outcomes) {
  outcomes->clear();
  outcomes->resize(requests.size());
  const auto run_trial = [&](const uint32_t i, size_t /*thread*/) {
    (*outcomes)[i] = RunTrial(requests[i]);
  };
  PIO_RETURN_IF_ERROR(RunOnPool(pool_, 0, static_cast<uint32_t>(requests.size()),
                                ThreadPool::NoInit, run_trial, "RunBatch"));
  return true;
}

}  // namespace pio
