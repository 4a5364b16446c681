// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/quantize.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_map>
#include <utility>

namespace pio {
namespace extras {

namespace {

// Beyond this many distinct colors the histogram ignores low bits, which
// increases color coherence at the cost of precision.
constexpr size_t kMaxHistogramColors = 1 << 18;

struct HistItem {
  PaletteColor color;
  uint32_t count;
};

struct HistAccumulator {
  uint64_t sum[4] = {0, 0, 0, 0};
  uint32_t count = 0;
};

// Fully transparent pixels all map to one key regardless of their color.
uint32_t ColorKey(const uint8_t* p, size_t nc, int ignorebits) {
  const uint32_t a = nc == 4 ? p[3] : 255;
  if (a == 0) return 0;
  const uint32_t mask = (0xFFu << ignorebits) & 0xFFu;
  return ((p[0] & mask) << 24) | ((p[1] & mask) << 16) | ((p[2] & mask) << 8) |
         (a & mask);
}

PaletteColor LoadColor(const uint8_t* p, size_t nc) {
  PaletteColor color = {p[0], p[1], p[2],
                        static_cast<uint8_t>(nc == 4 ? p[3] : 255)};
  if (color[3] == 0) color = {0, 0, 0, 0};
  return color;
}

// Returns the distinct colors of the image with their pixel counts, or an
// empty vector if there are more than "max_colors" of them.
std::vector<HistItem> ComputeHistogram(const PackedImage& image,
                                       int ignorebits, size_t max_colors) {
  const size_t nc = image.num_channels();
  std::unordered_map<uint32_t, HistAccumulator> acc;
  for (size_t y = 0; y < image.ysize(); ++y) {
    const uint8_t* row = image.ConstRow(y);
    for (size_t x = 0; x < image.xsize(); ++x) {
      const uint8_t* p = row + x * nc;
      const PaletteColor color = LoadColor(p, nc);
      HistAccumulator& item = acc[ColorKey(p, nc, ignorebits)];
      for (size_t c = 0; c < 4; ++c) item.sum[c] += color[c];
      item.count++;
      if (acc.size() > max_colors) return {};
    }
  }
  std::vector<HistItem> hist;
  hist.reserve(acc.size());
  for (const auto& it : acc) {
    HistItem item;
    for (size_t c = 0; c < 4; ++c) {
      item.color[c] = static_cast<uint8_t>(
          (it.second.sum[c] + it.second.count / 2) / it.second.count);
    }
    item.count = it.second.count;
    hist.push_back(item);
  }
  // The iteration order of the map is unspecified; sorting makes the output
  // independent of the standard library.
  std::sort(hist.begin(), hist.end(), [](const HistItem& a, const HistItem& b) {
    return a.color < b.color;
  });
  return hist;
}

// A range [begin, end) of histogram entries.
struct Box {
  size_t begin;
  size_t end;
  // Channel with the largest weighted variance, and that variance.
  size_t channel;
  double variance;
};

Box MakeBox(const std::vector<HistItem>& hist, size_t begin, size_t end) {
  Box box{begin, end, 0, 0.0};
  if (end - begin < 2) return box;
  double weight = 0;
  double mean[4] = {0, 0, 0, 0};
  for (size_t i = begin; i < end; ++i) {
    weight += hist[i].count;
    for (size_t c = 0; c < 4; ++c) mean[c] += hist[i].count * hist[i].color[c];
  }
  for (size_t c = 0; c < 4; ++c) mean[c] /= weight;
  for (size_t c = 0; c < 4; ++c) {
    double variance = 0;
    for (size_t i = begin; i < end; ++i) {
      const double d = hist[i].color[c] - mean[c];
      variance += hist[i].count * d * d;
    }
    if (variance > box.variance) {
      box.variance = variance;
      box.channel = c;
    }
  }
  return box;
}

PaletteColor BoxColor(const std::vector<HistItem>& hist, const Box& box) {
  uint64_t weight = 0;
  uint64_t sum[4] = {0, 0, 0, 0};
  for (size_t i = box.begin; i < box.end; ++i) {
    weight += hist[i].count;
    for (size_t c = 0; c < 4; ++c) sum[c] += hist[i].count * hist[i].color[c];
  }
  PaletteColor color;
  for (size_t c = 0; c < 4; ++c) {
    color[c] = static_cast<uint8_t>((sum[c] + weight / 2) / weight);
  }
  return color;
}

// Repeatedly splits the box with the largest variance at the weighted median
// of its widest channel.
std::vector<PaletteColor> MedianCut(std::vector<HistItem>* hist,
                                    size_t max_colors) {
  std::vector<Box> boxes = {MakeBox(*hist, 0, hist->size())};
  while (boxes.size() < max_colors) {
    size_t best = boxes.size();
    for (size_t i = 0; i < boxes.size(); ++i) {
      if (boxes[i].end - boxes[i].begin < 2 || boxes[i].variance <= 0) {
        continue;
      }
      if (best == boxes.size() || boxes[i].variance > boxes[best].variance) {
        best = i;
      }
    }
    if (best == boxes.size()) break;
    const Box box = boxes[best];
    const size_t channel = box.channel;
    std::sort(hist->begin() + box.begin, hist->begin() + box.end,
              [channel](const HistItem& a, const HistItem& b) {
                return a.color[channel] < b.color[channel];
              });
    uint64_t total = 0;
    for (size_t i = box.begin; i < box.end; ++i) total += (*hist)[i].count;
    uint64_t acc = 0;
    size_t split = box.begin + 1;
    for (size_t i = box.begin; i + 1 < box.end; ++i) {
      acc += (*hist)[i].count;
      split = i + 1;
      if (2 * acc >= total) break;
    }
    boxes[best] = MakeBox(*hist, box.begin, split);
    boxes.push_back(MakeBox(*hist, split, box.end));
  }
  std::vector<PaletteColor> palette;
  palette.reserve(boxes.size());
  for (const Box& box : boxes) palette.push_back(BoxColor(*hist, box));
  return palette;
}

// Finds the nearest palette entry, comparing alpha-premultiplied colors.
class PaletteMapper {
 public:
  explicit PaletteMapper(const std::vector<PaletteColor>& palette)
      : palette_(palette) {}

  uint8_t Nearest(const PaletteColor& color) {
    const uint32_t key = (static_cast<uint32_t>(color[0]) << 24) |
                         (static_cast<uint32_t>(color[1]) << 16) |
                         (static_cast<uint32_t>(color[2]) << 8) | color[3];
    auto it = cache_.find(key);
    if (it != cache_.end()) return it->second;
    uint8_t best = 0;
    int64_t best_dist = -1;
    for (size_t i = 0; i < palette_.size(); ++i) {
      const int64_t dist = Distance(color, palette_[i]);
      if (best_dist < 0 || dist < best_dist) {
        best_dist = dist;
        best = static_cast<uint8_t>(i);
      }
    }
    cache_.emplace(key, best);
    return best;
  }

 private:
  static int64_t Distance(const PaletteColor& a, const PaletteColor& b) {
    int64_t dist = 0;
    for (size_t c = 0; c < 3; ++c) {
      const int64_t d = static_cast<int64_t>(a[c]) * a[3] -
                        static_cast<int64_t>(b[c]) * b[3];
      dist += d * d;
    }
    const int64_t da = (static_cast<int64_t>(a[3]) - b[3]) * 255;
    return dist + da * da;
  }

  const std::vector<PaletteColor>& palette_;
  std::unordered_map<uint32_t, uint8_t> cache_;
};

void MapPixels(const PackedImage& image, const std::vector<PaletteColor>& palette,
               bool dither, std::vector<uint8_t>* indices) {
  const size_t xsize = image.xsize();
  const size_t nc = image.num_channels();
  PaletteMapper mapper(palette);
  indices->resize(xsize * image.ysize());
  if (!dither) {
    for (size_t y = 0; y < image.ysize(); ++y) {
      const uint8_t* row = image.ConstRow(y);
      for (size_t x = 0; x < xsize; ++x) {
        (*indices)[y * xsize + x] = mapper.Nearest(LoadColor(row + x * nc, nc));
      }
    }
    return;
  }
  // Floyd-Steinberg: errors of the current and the next row, with one
  // pixel of padding on each side.
  std::vector<float> err_cur((xsize + 2) * 4, 0.f);
  std::vector<float> err_next((xsize + 2) * 4, 0.f);
  for (size_t y = 0; y < image.ysize(); ++y) {
    const uint8_t* row = image.ConstRow(y);
    std::fill(err_next.begin(), err_next.end(), 0.f);
    for (size_t x = 0; x < xsize; ++x) {
      const PaletteColor src = LoadColor(row + x * nc, nc);
      float* e = &err_cur[(x + 1) * 4];
      PaletteColor value;
      float wanted[4];
      for (size_t c = 0; c < 4; ++c) {
        wanted[c] = std::min(255.f, std::max(0.f, src[c] + e[c]));
        value[c] = static_cast<uint8_t>(std::lround(wanted[c]));
      }
      // Keep fully transparent and fully opaque pixels exact in alpha.
      if (src[3] == 0 || src[3] == 255) value[3] = src[3];
      const uint8_t index = mapper.Nearest(value);
      (*indices)[y * xsize + x] = index;
      const PaletteColor& chosen = palette[index];
      for (size_t c = 0; c < 4; ++c) {
        const float diff = wanted[c] - chosen[c];
        err_cur[(x + 2) * 4 + c] += diff * (7.f / 16);
        err_next[x * 4 + c] += diff * (3.f / 16);
        err_next[(x + 1) * 4 + c] += diff * (5.f / 16);
        err_next[(x + 2) * 4 + c] += diff * (1.f / 16);
      }
    }
    std::swap(err_cur, err_next);
  }
}

// Drops unused entries and orders the palette as documented in PaletteImage.
void SortPalette(PaletteImage* out) {
  const size_t n = out->palette.size();
  std::vector<size_t> popularity(n, 0);
  for (uint8_t index : out->indices) popularity[index]++;
  std::vector<size_t> order;
  for (size_t i = 0; i < n; ++i) {
    if (popularity[i] != 0) order.push_back(i);
  }
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    const bool ta = out->palette[a][3] < 255;
    const bool tb = out->palette[b][3] < 255;
    if (ta != tb) return ta;
    return popularity[a] > popularity[b];
  });
  std::vector<uint8_t> remap(n, 0);
  std::vector<PaletteColor> palette(order.size());
  out->num_transparent = 0;
  for (size_t i = 0; i < order.size(); ++i) {
    remap[order[i]] = static_cast<uint8_t>(i);
    palette[i] = out->palette[order[i]];
    if (palette[i][3] < 255) out->num_transparent++;
  }
  for (uint8_t& index : out->indices) index = remap[index];
  out->palette = std::move(palette);
}

}  // namespace

StatusOr<PaletteImage> Quantize(const PackedImage& image, size_t max_colors,
                                bool dither) {
  if (max_colors < 2 || max_colors > 256) {
    return PIO_FAILURE("invalid palette size %zu", max_colors);
  }
  if (image.xsize() == 0 || image.ysize() == 0) {
    return PIO_FAILURE("empty image");
  }
  PaletteImage out;
  out.xsize = image.xsize();
  out.ysize = image.ysize();

  std::vector<HistItem> hist = ComputeHistogram(image, 0, max_colors);
  if (!hist.empty()) {
    // Few enough colors to keep them all.
    for (const HistItem& item : hist) out.palette.push_back(item.color);
    MapPixels(image, out.palette, /*dither=*/false, &out.indices);
  } else {
    int ignorebits = 0;
    while ((hist = ComputeHistogram(image, ignorebits, kMaxHistogramColors))
               .empty()) {
      ignorebits++;
    }
    out.palette = MedianCut(&hist, max_colors);
    MapPixels(image, out.palette, dither, &out.indices);
  }
  SortPalette(&out);
  return out;
}

StatusOr<PackedImage> ExpandPalette(const PaletteImage& image) {
  const size_t nc = image.num_transparent > 0 ? 4 : 3;
  PIO_ENSURE(image.indices.size() == image.xsize * image.ysize);
  PIO_ASSIGN_OR_RETURN(PackedImage out,
                       PackedImage::Create(image.xsize, image.ysize, nc));
  uint8_t* p = out.pixels();
  for (uint8_t index : image.indices) {
    PIO_ENSURE(index < image.palette.size());
    const PaletteColor& color = image.palette[index];
    for (size_t c = 0; c < nc; ++c) p[c] = color[c];
    p += nc;
  }
  return out;
}

}  // namespace extras
}  // namespace pio
