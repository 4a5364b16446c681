// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

// Re-encodes an image at the smallest size that still looks like the
// original.

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "lib/extras/codec.h"
#include "lib/pio/base/status.h"
#include "lib/pio/optimize.h"
#include "lib/pio/optimize_params.h"
#include "lib/pio/packed_image.h"
#include "tools/args.h"
#include "tools/cmdline.h"
#include "tools/file_io.h"
#include "tools/progress.h"
#include "tools/trial_thread_pool.h"

namespace pio {
namespace tools {

struct OptimizeArgs {
  void AddCommandLineOptions(CommandLineParser* cmdline) {
    cmdline->AddPositionalOption("INPUT", /* required = */ true,
                                 "The input image: JPEG, PNG or WebP. "
                                 "'-' reads stdin.",
                                 &file_in);

    cmdline->AddPositionalOption("OUTPUT", /* required = */ true,
                                 "The output image. '-' writes to stdout.",
                                 &file_out);

    cmdline->AddOptionValue('q', "quality", "Q",
                            "Visual quality, 0 (worst) to 100 (best). "
                            "Default is 85.",
                            &params.quality, &ParseDouble);

    cmdline->AddOptionValue('\0', "spread", "S",
                            "Half width of the searched parameter band, in "
                            "quality units. Default is 10.",
                            &params.spread, &ParseDouble);

    cmdline->AddOptionValue('\0', "target", "SCORE",
                            "Dissimilarity target, overrides the one derived "
                            "from --quality.",
                            &params.target_score, &ParseDouble);

    cmdline->AddOptionValue('\0', "min", "P",
                            "Lowest native encoder parameter to try. With "
                            "--min or --max the band ignores --quality and "
                            "--spread.",
                            &params.min_param, &ParseSigned);

    cmdline->AddOptionValue('\0', "max", "P",
                            "Highest native encoder parameter to try.",
                            &params.max_param, &ParseSigned);

    opt_format_id = cmdline->AddOptionValue(
        'f', "format", "F[,F...]",
        "Candidate output formats among jpeg, png and webp, in order of "
        "preference. Default is the format of OUTPUT's extension, else the "
        "input format.",
        &params.formats, &ParseFormats);

    cmdline->AddOptionValue('\0', "threads", "N",
                            "Number of worker threads (-1 == use machine "
                            "default, 0 == do not use multithreading).",
                            &num_threads, &ParseSigned);

    cmdline->AddOptionValue('\0', "budget", "N",
                            "Maximum number of trial encodings per format. "
                            "Default is 8.",
                            &params.trial_budget, &ParseUnsigned);

    cmdline->AddOptionValue('\0', "timeout", "SECONDS",
                            "Stops searching after this time, 0 for no limit.",
                            &params.deadline_seconds, &ParseDouble);

    cmdline->AddOptionValue('\0', "chroma-subsampling", "420|422|444",
                            "JPEG chroma subsampling. Default is 420.",
                            &params.jpeg.chroma_subsampling,
                            &ParseChromaSubsampling);

    cmdline->AddOptionValue('\0', "background", "RRGGBB",
                            "Color that transparent pixels are blended over "
                            "for formats without alpha. Default is ffffff.",
                            &params.background, &ParseBackground);

    cmdline->AddOptionFlag('\0', "no-dither",
                           "Disables error diffusion for PNG palettes.",
                           &params.png.dither, &SetBooleanFalse);

    cmdline->AddOptionFlag('\0', "keep-larger",
                           "Writes the result even if it is larger than an "
                           "input of the same format.",
                           &keep_larger, &SetBooleanTrue);

    cmdline->AddOptionValue('\0', "webp-method", "0..6",
                            "libwebp effort. Default is 6.",
                            &params.webp.method, &ParseSigned, 1);

    cmdline->AddOptionFlag('\0', "no-sharp-yuv",
                           "Uses plain RGB to YUV conversion for WebP.",
                           &params.webp.use_sharp_yuv, &SetBooleanFalse, 1);

    cmdline->AddOptionFlag('v', "verbose",
                           "Prints every trial. Repeat for more output.",
                           &verbose, &IncrementUnsigned);

    cmdline->AddOptionFlag('\0', "quiet", "Silence output (except for errors).",
                           &quiet, &SetBooleanTrue);
  }

  // Validate the passed arguments, checking whether all passed options are
  // compatible. Returns whether the validation was successful.
  bool ValidateArgs(const CommandLineParser& cmdline) {
    if (file_in == nullptr) {
      fprintf(stderr, "Missing INPUT filename.\n");
      return false;
    }
    if (file_out == nullptr) {
      fprintf(stderr, "Missing OUTPUT filename.\n");
      return false;
    }
    if (params.quality < 0 || params.quality > 100) {
      fprintf(stderr, "Invalid --quality: must be in [0, 100].\n");
      return false;
    }
    if (params.spread < 0) {
      fprintf(stderr, "Invalid --spread: must not be negative.\n");
      return false;
    }
    if (params.trial_budget == 0) {
      fprintf(stderr, "Invalid --budget: must be positive.\n");
      return false;
    }
    if (params.deadline_seconds < 0) {
      fprintf(stderr, "Invalid --timeout: must not be negative.\n");
      return false;
    }
    if (num_threads < -1) {
      fprintf(
          stderr,
          "Invalid flag value for --threads: must be -1, 0 or positive.\n");
      return false;
    }
    if (params.webp.method < 0 || params.webp.method > 6) {
      fprintf(stderr, "Invalid --webp-method: must be in [0, 6].\n");
      return false;
    }
    return true;
  }

  const char* file_in = nullptr;
  const char* file_out = nullptr;
  OptimizeParams params;
  int32_t num_threads = -1;
  bool keep_larger = false;
  size_t verbose = 0;
  bool quiet = false;
  // References (ids) of specific options to check if they were matched.
  CommandLineParser::OptionId opt_format_id = 0;
};

// Output formats when --format is absent: the extension of the output, else
// the input format.
std::vector<Format> DefaultFormats(const char* file_out, Format input_format) {
  Format format;
  if (extras::FormatFromPath(file_out, &format)) return {format};
  return {input_format};
}

}  // namespace tools
}  // namespace pio

int main(int argc, const char* argv[]) {
  pio::tools::OptimizeArgs args;
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

  if (!args.ValidateArgs(cmdline)) {
    // ValidateArgs already printed the actual error cause.
    fprintf(stderr, "Use '%s -h' for more information\n", argv[0]);
    return EXIT_FAILURE;
  }

  std::vector<uint8_t> input;
  if (!pio::tools::ReadFile(args.file_in, &input)) {
    fprintf(stderr, "couldn't load %s\n", args.file_in);
    return EXIT_FAILURE;
  }

  pio::Format input_format = pio::Format::kJPEG;
  pio::StatusOr<pio::PackedImage> decoded =
      pio::extras::DecodeToSrgb(input, &input_format);
  if (!decoded.ok()) {
    fprintf(stderr, "Failed to decode %s\n", args.file_in);
    return EXIT_FAILURE;
  }
  const pio::PackedImage image = std::move(decoded).value_();
  if (!args.quiet) {
    fprintf(stderr, "Read %s: %zux%zu %s, %zu bytes.\n", args.file_in,
            image.xsize(), image.ysize(), pio::FormatName(input_format),
            input.size());
  }

  if (!cmdline.GetOption(args.opt_format_id)->matched()) {
    args.params.formats =
        pio::tools::DefaultFormats(args.file_out, input_format);
  }

  pio::tools::TrialThreadPool pool(args.num_threads);

  const size_t input_size = input.size();
  const bool verbose = args.verbose > 0 && !args.quiet;
  const pio::TrialCallback on_trial =
      [verbose, input_size](const pio::TrialOutcome& outcome,
                            const pio::QualityTarget& target) {
        if (!verbose) return;
        fputs(pio::tools::TrialLine(outcome, target, input_size).c_str(),
              stderr);
      };

  const std::vector<pio::CodecAdapter> adapters =
      pio::extras::MakeCodecAdapters(args.params);
  pio::StatusOr<pio::SearchResult> optimized =
      pio::Optimize(image, adapters, args.params, &pool, on_trial);
  if (!optimized.ok()) {
    if (optimized.status().code() == pio::StatusCode::kNoViableEncoding) {
      fprintf(stderr, "No format produced a usable encoding of %s\n",
              args.file_in);
    } else {
      fprintf(stderr, "Failed to optimize %s\n", args.file_in);
    }
    return EXIT_FAILURE;
  }
  const pio::SearchResult result = std::move(optimized).value_();

  if (!args.quiet) {
    fprintf(stderr,
            "Best: %s quality %d, score %.6f (target %.6f%s), %zu bytes, "
            "%.1f %% of original, %zu trials.\n",
            pio::FormatName(result.format), result.parameter, result.score,
            result.target_score, result.satisfies_target ? "" : ", missed",
            result.encoded.size(),
            pio::tools::Percent(result.encoded.size(), input_size),
            result.num_trials);
  }

  const bool copy_input = !args.keep_larger &&
                          result.format == input_format &&
                          result.encoded.size() >= input_size;
  if (copy_input && !args.quiet) {
    fprintf(stderr, "Output is not smaller than the input, copying it.\n");
  }
  if (!pio::tools::WriteFile(args.file_out,
                             copy_input ? input : result.encoded)) {
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
