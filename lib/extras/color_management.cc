// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/color_management.h"

#include <lcms2.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <utility>

namespace pio {
namespace extras {
namespace {

// cms functions (even *THR) are not thread-safe, except cmsDoTransform.
// To ensure all functions are covered without frequent lock-taking nor risk of
// recursive lock, we lock in the top-level APIs.
std::mutex& LcmsMutex() {
  static std::mutex m;
  return m;
}

struct ProfileDeleter {
  void operator()(void* p) { cmsCloseProfile(p); }
};
using Profile = std::unique_ptr<void, ProfileDeleter>;

struct TransformDeleter {
  void operator()(void* p) { cmsDeleteTransform(p); }
};
using Transform = std::unique_ptr<void, TransformDeleter>;

void ErrorHandler(cmsContext context, cmsUInt32Number code, const char* text) {
  PIO_WARNING("LCMS error %u: %s", code, text);
}

// Returns a context for the current thread, creating it if necessary.
StatusOr<cmsContext> GetContext() {
  static thread_local void* context_;
  if (context_ == nullptr) {
    context_ = cmsCreateContext(nullptr, nullptr);
    if (context_ == nullptr) return PIO_FAILURE("Failed to create context");
    cmsSetLogErrorHandlerTHR(static_cast<cmsContext>(context_), &ErrorHandler);
  }
  return static_cast<cmsContext>(context_);
}

Status DecodeProfile(const cmsContext context, const std::vector<uint8_t>& icc,
                     Profile* profile) {
  profile->reset(cmsOpenProfileFromMemTHR(
      context, icc.data(), static_cast<cmsUInt32Number>(icc.size())));
  if (profile->get() == nullptr) {
    return PIO_FAILURE("Failed to decode profile");
  }
  return true;
}

std::string GetDescription(const Profile& profile) {
  const cmsUInt32Number size = cmsGetProfileInfoASCII(
      profile.get(), cmsInfoDescription, "en", "US", nullptr, 0);
  if (size == 0) return std::string();
  std::vector<char> buf(size);
  cmsGetProfileInfoASCII(profile.get(), cmsInfoDescription, "en", "US",
                         buf.data(), size);
  // The returned size includes the terminating zero.
  return std::string(buf.data());
}

Status CreateSrgbTransform(const cmsContext context, const Profile& src,
                           cmsUInt32Number type_src, Transform* transform) {
  Profile srgb(cmsCreate_sRGBProfileTHR(context));
  if (srgb.get() == nullptr) return PIO_FAILURE("Failed to create sRGB");
  transform->reset(cmsCreateTransformTHR(context, src.get(), type_src,
                                         srgb.get(), TYPE_RGB_8,
                                         INTENT_PERCEPTUAL, 0));
  if (transform->get() == nullptr) {
    return PIO_FAILURE("Failed to create transform");
  }
  return true;
}

}  // namespace

bool IsSrgbDescription(const std::string& description) {
  static const char* const kSrgbNames[] = {
      "c2", "sRGBz", "z", "nRGB", "uRGB", "sRGB", "nGry", "uGry", "sGry"};
  for (const char* name : kSrgbNames) {
    if (description == name) return true;
  }
  std::string lower = description;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return lower.find("srgb") != std::string::npos;
}

StatusOr<std::string> ProfileDescription(const std::vector<uint8_t>& icc) {
  std::lock_guard<std::mutex> guard(LcmsMutex());
  PIO_ASSIGN_OR_RETURN(cmsContext context, GetContext());
  Profile profile;
  PIO_RETURN_IF_ERROR(DecodeProfile(context, icc, &profile));
  return GetDescription(profile);
}

StatusOr<PackedImage> ConvertToSrgb(const std::vector<uint8_t>& icc,
                                    const PackedImage& image) {
  if (icc.empty()) return image.Copy();
  std::lock_guard<std::mutex> guard(LcmsMutex());
  PIO_ASSIGN_OR_RETURN(cmsContext context, GetContext());
  Profile profile;
  if (!DecodeProfile(context, icc, &profile)) {
    PIO_WARNING("Ignoring unreadable ICC profile of %zu bytes", icc.size());
    return image.Copy();
  }
  const std::string description = GetDescription(profile);
  if (IsSrgbDescription(description)) return image.Copy();

  cmsUInt32Number type_src;
  size_t src_channels;
  switch (cmsGetColorSpace(profile.get())) {
    case cmsSigRgbData:
      type_src = TYPE_RGB_8;
      src_channels = 3;
      break;
    case cmsSigGrayData:
      type_src = TYPE_GRAY_8;
      src_channels = 1;
      break;
    default:
      PIO_WARNING("Ignoring ICC profile \"%s\" of unsupported color space",
                  description.c_str());
      return image.Copy();
  }
  Transform transform;
  PIO_RETURN_IF_ERROR(
      CreateSrgbTransform(context, profile, type_src, &transform));

  PackedImage out = image.Copy();
  const size_t xsize = image.xsize();
  const size_t nc = image.num_channels();
  std::vector<uint8_t> src_row(xsize * src_channels);
  std::vector<uint8_t> dst_row(xsize * 3);
  for (size_t y = 0; y < image.ysize(); ++y) {
    const uint8_t* in = image.ConstRow(y);
    for (size_t x = 0; x < xsize; ++x) {
      for (size_t c = 0; c < src_channels; ++c) {
        src_row[x * src_channels + c] = in[x * nc + c];
      }
    }
    cmsDoTransform(transform.get(), src_row.data(), dst_row.data(),
                   static_cast<cmsUInt32Number>(xsize));
    uint8_t* row = out.Row(y);
    for (size_t x = 0; x < xsize; ++x) {
      for (size_t c = 0; c < 3; ++c) row[x * nc + c] = dst_row[x * 3 + c];
    }
  }
  return out;
}

StatusOr<PackedImage> ConvertCmykToSrgb(const std::vector<uint8_t>& icc,
                                        const uint8_t* cmyk, size_t xsize,
                                        size_t ysize, bool inverted) {
  if (icc.empty()) {
    return PIO_FAILURE("CMYK image without a color profile");
  }
  std::lock_guard<std::mutex> guard(LcmsMutex());
  PIO_ASSIGN_OR_RETURN(cmsContext context, GetContext());
  Profile profile;
  PIO_RETURN_IF_ERROR(DecodeProfile(context, icc, &profile));
  if (cmsGetColorSpace(profile.get()) != cmsSigCmykData) {
    return PIO_FAILURE("CMYK image with a non-CMYK color profile");
  }
  Transform transform;
  PIO_RETURN_IF_ERROR(CreateSrgbTransform(
      context, profile, inverted ? TYPE_CMYK_8_REV : TYPE_CMYK_8, &transform));
  PIO_ASSIGN_OR_RETURN(PackedImage out, PackedImage::Create(xsize, ysize, 3));
  for (size_t y = 0; y < ysize; ++y) {
    cmsDoTransform(transform.get(), cmyk + y * xsize * 4, out.Row(y),
                   static_cast<cmsUInt32Number>(xsize));
  }
  return out;
}

}  // namespace extras
}  // namespace pio
