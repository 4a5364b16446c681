// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/pio/search.h"

#include <chrono>
#include <utility>

#ifndef PIO_DEBUG_SEARCH
#define PIO_DEBUG_SEARCH 0
#endif  // PIO_DEBUG_SEARCH

namespace pio {

namespace {

// Bisection state of one format. Owned by the controller loop; never touched
// by the worker threads.
class FormatSearch {
 public:
  FormatSearch(const FormatCandidate* candidate, size_t trial_budget)
      : candidate_(candidate),
        trial_budget_(trial_budget),
        lo_(candidate->target.min_param),
        hi_(candidate->target.max_param) {}

  bool Active() const {
    return !dropped_ && lo_ <= hi_ && num_trials_ < trial_budget_;
  }

  TrialRequest NextRequest() const {
    int mid = lo_ + (hi_ - lo_) / 2;
    return TrialRequest{&candidate_->adapter, candidate_->image,
                        candidate_->evaluator, mid};
  }

  void Update(TrialOutcome&& outcome) {
    const int mid = outcome.trial.parameter;
    num_trials_++;
    if (!outcome.status) {
      if (outcome.status.code() == StatusCode::kEncodeError) {
        // The encoder rejected this parameter; try less compression.
        lo_ = mid + 1;
        return;
      }
      PIO_WARNING("%s: dropping format after %s at parameter %d",
                  FormatName(candidate_->adapter.format),
                  StatusCodeName(outcome.status.code()), mid);
      dropped_ = true;
      return;
    }
    const double target = candidate_->target.target_score;
    const double score = outcome.trial.score;
    PIO_DEBUG(PIO_DEBUG_SEARCH, "%s [%d, %d] @%d: score %.5f, %zu bytes",
              FormatName(candidate_->adapter.format), lo_, hi_, mid, score,
              outcome.trial.encoded.size());
    if (score > target) {
      lo_ = mid + 1;
    } else {
      hi_ = mid - 1;
    }

    SearchResult result;
    result.format = outcome.trial.format;
    result.parameter = mid;
    result.encoded = std::move(outcome.trial.encoded);
    result.score = score;
    result.target_score = target;
    result.satisfies_target = score <= target;
    if (!has_best_ || IsBetterResult(result, best_)) {
      best_ = std::move(result);
      has_best_ = true;
    }
  }

  bool HasResult() const { return !dropped_ && has_best_; }

  SearchResult TakeResult() {
    best_.num_trials = num_trials_;
    return std::move(best_);
  }

  const QualityTarget& target() const { return candidate_->target; }

 private:
  const FormatCandidate* candidate_;
  const size_t trial_budget_;
  int lo_;
  int hi_;
  size_t num_trials_ = 0;
  bool dropped_ = false;
  bool has_best_ = false;
  SearchResult best_;
};

}  // namespace

bool IsBetterResult(const SearchResult& a, const SearchResult& b) {
  if (a.satisfies_target != b.satisfies_target) return a.satisfies_target;
  if (a.satisfies_target) {
    if (a.encoded.size() != b.encoded.size()) {
      return a.encoded.size() < b.encoded.size();
    }
    return a.score < b.score;
  }
  const double a_excess = a.score - a.target_score;
  const double b_excess = b.score - b.target_score;
  if (a_excess != b_excess) return a_excess < b_excess;
  return a.encoded.size() < b.encoded.size();
}

StatusOr<SearchResult> SearchBestEncoding(
    const std::vector<FormatCandidate>& candidates,
    const SearchOptions& options, TrialScheduler* scheduler,
    std::vector<SearchResult>* per_format) {
  if (candidates.empty()) {
    return PIO_FAILURE("no candidate formats");
  }
  for (const FormatCandidate& candidate : candidates) {
    if (candidate.target.min_param > candidate.target.max_param) {
      return PIO_FAILURE("empty parameter band [%d, %d] for %s",
                         candidate.target.min_param,
                         candidate.target.max_param,
                         FormatName(candidate.adapter.format));
    }
    PIO_ENSURE(candidate.image != nullptr && candidate.evaluator != nullptr);
  }
  PIO_ENSURE(options.trial_budget > 0);

  std::vector<FormatSearch> searches;
  searches.reserve(candidates.size());
  for (const FormatCandidate& candidate : candidates) {
    searches.emplace_back(&candidate, options.trial_budget);
  }

  using Clock = std::chrono::steady_clock;
  const Clock::time_point start = Clock::now();
  std::vector<TrialRequest> requests;
  std::vector<size_t> owners;
  std::vector<TrialOutcome> outcomes;
  for (size_t round = 0;; round++) {
    if (round > 0 && options.deadline_seconds > 0.0) {
      std::chrono::duration<double> elapsed = Clock::now() - start;
      if (elapsed.count() >= options.deadline_seconds) {
        PIO_WARNING("search deadline of %.3fs reached after %zu rounds",
                    options.deadline_seconds, round);
        break;
      }
    }
    requests.clear();
    owners.clear();
    for (size_t i = 0; i < searches.size(); i++) {
      if (!searches[i].Active()) continue;
      requests.push_back(searches[i].NextRequest());
      owners.push_back(i);
    }
    if (requests.empty()) break;

    PIO_RETURN_IF_ERROR(scheduler->RunBatch(requests, &outcomes));
    for (size_t j = 0; j < outcomes.size(); j++) {
      FormatSearch& search = searches[owners[j]];
      if (options.on_trial) options.on_trial(outcomes[j], search.target());
      search.Update(std::move(outcomes[j]));
    }
  }

  if (per_format != nullptr) per_format->clear();
  bool has_winner = false;
  SearchResult winner;
  for (FormatSearch& search : searches) {
    if (!search.HasResult()) continue;
    SearchResult result = search.TakeResult();
    if (per_format != nullptr) per_format->push_back(result);
    if (!has_winner || IsBetterResult(result, winner)) {
      winner = std::move(result);
      has_winner = true;
    }
  }
  if (!has_winner) {
    return PIO_STATUS(StatusCode::kNoViableEncoding,
                      "none of the %zu candidate formats produced a usable "
                      "encoding",
                      candidates.size());
  }
  return winner;
}

}  // namespace pio
