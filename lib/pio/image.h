// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_PIO_IMAGE_H_
#define LIB_PIO_IMAGE_H_

// Planar float images used by the perceptual evaluator.

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "lib/pio/base/compiler_specific.h"
#include "lib/pio/base/status.h"

namespace pio {

// Single channel image with rows stored contiguously. Move-only; use Copy()
// when a duplicate is really needed.
template <typename T>
class Plane {
 public:
  using T_ = T;

  Plane() = default;
  Plane(Plane&&) noexcept = default;
  Plane& operator=(Plane&&) noexcept = default;
  Plane(const Plane&) = delete;
  Plane& operator=(const Plane&) = delete;

  static StatusOr<Plane> Create(const size_t xsize, const size_t ysize) {
    if (ysize != 0 && xsize > SIZE_MAX / sizeof(T) / ysize) {
      return PIO_FAILURE("Plane %zux%zu too large", xsize, ysize);
    }
    Plane plane;
    plane.xsize_ = xsize;
    plane.ysize_ = ysize;
    plane.orig_xsize_ = xsize;
    plane.orig_ysize_ = ysize;
    plane.data_.resize(xsize * ysize);
    return plane;
  }

  StatusOr<Plane> Copy() const {
    PIO_ASSIGN_OR_RETURN(Plane copy, Create(xsize_, ysize_));
    for (size_t y = 0; y < ysize_; ++y) {
      const T* PIO_RESTRICT from = ConstRow(y);
      T* PIO_RESTRICT to = copy.Row(y);
      for (size_t x = 0; x < xsize_; ++x) to[x] = from[x];
    }
    return copy;
  }

  PIO_INLINE T* Row(const size_t y) {
    PIO_DASSERT(y < ysize_);
    return data_.data() + y * orig_xsize_;
  }
  PIO_INLINE const T* Row(const size_t y) const { return ConstRow(y); }
  PIO_INLINE const T* ConstRow(const size_t y) const {
    PIO_DASSERT(y < ysize_);
    return data_.data() + y * orig_xsize_;
  }

  // Logical resize; the allocation and the row pitch are kept so a plane can
  // be reused across the scales of a pyramid.
  Status ShrinkTo(const size_t xsize, const size_t ysize) {
    if (xsize > orig_xsize_ || ysize > orig_ysize_) {
      return PIO_FAILURE("Can not shrink %zux%zu to %zux%zu", orig_xsize_,
                         orig_ysize_, xsize, ysize);
    }
    xsize_ = xsize;
    ysize_ = ysize;
    return true;
  }

  size_t xsize() const { return xsize_; }
  size_t ysize() const { return ysize_; }

 private:
  size_t xsize_ = 0;
  size_t ysize_ = 0;
  size_t orig_xsize_ = 0;
  size_t orig_ysize_ = 0;
  std::vector<T> data_;
};

using ImageF = Plane<float>;

// Three planes of identical size.
template <typename T>
class Image3 {
 public:
  using PlaneT = ::pio::Plane<T>;
  static constexpr size_t kNumPlanes = 3;

  Image3() = default;
  Image3(Image3&&) noexcept = default;
  Image3& operator=(Image3&&) noexcept = default;
  Image3(const Image3&) = delete;
  Image3& operator=(const Image3&) = delete;

  static StatusOr<Image3> Create(const size_t xsize, const size_t ysize) {
    PIO_ASSIGN_OR_RETURN(PlaneT plane0, PlaneT::Create(xsize, ysize));
    PIO_ASSIGN_OR_RETURN(PlaneT plane1, PlaneT::Create(xsize, ysize));
    PIO_ASSIGN_OR_RETURN(PlaneT plane2, PlaneT::Create(xsize, ysize));
    return Image3(std::move(plane0), std::move(plane1), std::move(plane2));
  }

  StatusOr<Image3> Copy() const {
    PIO_ASSIGN_OR_RETURN(PlaneT plane0, planes_[0].Copy());
    PIO_ASSIGN_OR_RETURN(PlaneT plane1, planes_[1].Copy());
    PIO_ASSIGN_OR_RETURN(PlaneT plane2, planes_[2].Copy());
    return Image3(std::move(plane0), std::move(plane1), std::move(plane2));
  }

  PIO_INLINE T* PlaneRow(const size_t c, const size_t y) {
    return planes_[c].Row(y);
  }
  PIO_INLINE const T* PlaneRow(const size_t c, const size_t y) const {
    return planes_[c].ConstRow(y);
  }
  PIO_INLINE const T* ConstPlaneRow(const size_t c, const size_t y) const {
    return planes_[c].ConstRow(y);
  }

  PlaneT& Plane(size_t idx) { return planes_[idx]; }
  const PlaneT& Plane(size_t idx) const { return planes_[idx]; }

  Status ShrinkTo(const size_t xsize, const size_t ysize) {
    for (PlaneT& plane : planes_) {
      PIO_RETURN_IF_ERROR(plane.ShrinkTo(xsize, ysize));
    }
    return true;
  }

  size_t xsize() const { return planes_[0].xsize(); }
  size_t ysize() const { return planes_[0].ysize(); }

 private:
  Image3(PlaneT&& plane0, PlaneT&& plane1, PlaneT&& plane2) {
    planes_[0] = std::move(plane0);
    planes_[1] = std::move(plane1);
    planes_[2] = std::move(plane2);
  }

  PlaneT planes_[kNumPlanes];
};

using Image3F = Image3<float>;

// Minimum and maximum sample of a plane. The plane must not be empty.
template <typename T>
void ImageMinMax(const Plane<T>& image, T* const PIO_RESTRICT min,
                 T* const PIO_RESTRICT max) {
  *min = image.ConstRow(0)[0];
  *max = *min;
  for (size_t y = 0; y < image.ysize(); ++y) {
    const T* PIO_RESTRICT row = image.ConstRow(y);
    for (size_t x = 0; x < image.xsize(); ++x) {
      if (row[x] < *min) *min = row[x];
      if (row[x] > *max) *max = row[x];
    }
  }
}

}  // namespace pio

#endif  // LIB_PIO_IMAGE_H_
