// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

// Measures the score and size of one image at every native parameter of a
// format, as CSV on stdout. The quality tables in lib/pio/quality_table.cc are
// built from the output of this tool over a reference corpus.

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <utility>
#include <vector>

#include "lib/extras/codec.h"
#include "lib/pio/alpha.h"
#include "lib/pio/evaluator.h"
#include "lib/pio/optimize_params.h"
#include "lib/pio/packed_image.h"
#include "lib/pio/trial_scheduler.h"
#include "tools/args.h"
#include "tools/cmdline.h"
#include "tools/file_io.h"
#include "tools/trial_thread_pool.h"

namespace pio {
namespace tools {
namespace {

struct QualityTableArgs {
  void AddCommandLineOptions(CommandLineParser* cmdline) {
    cmdline->AddPositionalOption("IMAGE", /* required = */ true,
                                 "The reference image: JPEG, PNG or WebP.",
                                 &file_in);

    cmdline->AddOptionValue('f', "format", "F",
                            "Format to measure: jpeg, png or webp. Default is "
                            "jpeg.",
                            &formats, &ParseFormats);

    cmdline->AddOptionValue('\0', "threads", "N",
                            "Number of worker threads (-1 == use machine "
                            "default, 0 == do not use multithreading).",
                            &num_threads, &ParseSigned);
  }

  bool ValidateArgs() {
    if (file_in == nullptr) {
      fprintf(stderr, "Missing IMAGE filename.\n");
      return false;
    }
    if (formats.size() != 1) {
      fprintf(stderr, "Invalid --format: exactly one format is measured.\n");
      return false;
    }
    if (num_threads < -1) {
      fprintf(
          stderr,
          "Invalid flag value for --threads: must be -1, 0 or positive.\n");
      return false;
    }
    return true;
  }

  const char* file_in = nullptr;
  std::vector<Format> formats = {Format::kJPEG};
  int32_t num_threads = -1;
};

Status PrintQualityTable(const PackedImage& decoded, const CodecAdapter& adapter,
                         ThreadPool* pool) {
  // Same source as the optimizer would see for this format.
  PackedImage image;
  if (decoded.HasAlpha() &&
      (decoded.IsOpaque() || !FormatSupportsAlpha(adapter.format))) {
    PIO_ASSIGN_OR_RETURN(image,
                         CompositeOverBackground(decoded, BackgroundColor()));
  } else {
    image = decoded.Copy();
  }
  PIO_ASSIGN_OR_RETURN(Evaluator evaluator, Evaluator::Create(image));

  std::vector<TrialRequest> requests;
  for (int p = adapter.native_range.min; p <= adapter.native_range.max; ++p) {
    requests.push_back(TrialRequest{&adapter, &image, &evaluator, p});
  }
  std::vector<TrialOutcome> outcomes;
  TrialScheduler scheduler(pool);
  PIO_RETURN_IF_ERROR(scheduler.RunBatch(requests, &outcomes));

  printf("quality,score,size\n");
  for (size_t i = 0; i < outcomes.size(); ++i) {
    if (!outcomes[i].status) {
      fprintf(stderr, "%s at %d failed\n", FormatName(adapter.format),
              requests[i].parameter);
      continue;
    }
    const Trial& trial = outcomes[i].trial;
    printf("%d,%.6f,%zu\n", trial.parameter, trial.score,
           trial.encoded.size());
  }
  return true;
}

}  // namespace
}  // namespace tools
}  // namespace pio

int main(int argc, const char* argv[]) {
  pio::tools::QualityTableArgs args;
  pio::tools::CommandLineParser cmdline;
  args.AddCommandLineOptions(&cmdline);

  if (!cmdline.Parse(argc, argv)) {
    // Parse already printed the actual error cause.
    fprintf(stderr, "Use '%s -h' for more information\n", argv[0]);
    return EXIT_FAILURE;
  }
  if (cmdline.HelpFlagPassed()) {
    cmdline.PrintHelp();
    return EXIT_SUCCESS;
  }
  if (!args.ValidateArgs()) {
    fprintf(stderr, "Use '%s -h' for more information\n", argv[0]);
    return EXIT_FAILURE;
  }

  std::vector<uint8_t> bytes;
  if (!pio::tools::ReadFile(args.file_in, &bytes)) {
    fprintf(stderr, "couldn't load %s\n", args.file_in);
    return EXIT_FAILURE;
  }
  pio::StatusOr<pio::PackedImage> decoded =
      pio::extras::DecodeToSrgb(bytes, nullptr);
  if (!decoded.ok()) {
    fprintf(stderr, "Failed to decode %s\n", args.file_in);
    return EXIT_FAILURE;
  }

  pio::OptimizeParams params;
  params.formats = args.formats;
  const pio::CodecAdapter adapter =
      pio::extras::MakeCodecAdapter(args.formats[0], params);
  pio::tools::TrialThreadPool pool(args.num_threads);
  if (!pio::tools::PrintQualityTable(std::move(decoded).value_(), adapter,
                                     &pool)) {
    fprintf(stderr, "Failed to measure %s\n", args.file_in);
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
