// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_PIO_BASE_STATUS_H_
#define LIB_PIO_BASE_STATUS_H_

// Error handling: Status return type + helper macros.

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <new>
#include <type_traits>
#include <utility>

#include "lib/pio/base/compiler_specific.h"

namespace pio {

// Uncomment to abort when PIO_FAILURE or PIO_STATUS with a fatal error is
// reached:
// #define PIO_CRASH_ON_ERROR

#ifndef PIO_ENABLE_ASSERT
#define PIO_ENABLE_ASSERT 1
#endif

#ifndef PIO_ENABLE_CHECK
#define PIO_ENABLE_CHECK 1
#endif

// Pass -DPIO_DEBUG_ON_ERROR at compile time to print debug messages when a
// function returns PIO_FAILURE or calls PIO_NOTIFY_ERROR. Note that this is
// irrelevant if you also pass -DPIO_CRASH_ON_ERROR.
#if defined(PIO_DEBUG_ON_ERROR) || defined(PIO_CRASH_ON_ERROR)
#undef PIO_DEBUG_ON_ERROR
#define PIO_DEBUG_ON_ERROR 1
#else  // PIO_DEBUG_ON_ERROR || PIO_CRASH_ON_ERROR
#ifdef NDEBUG
#define PIO_DEBUG_ON_ERROR 0
#else  // NDEBUG
#define PIO_DEBUG_ON_ERROR 1
#endif  // NDEBUG
#endif  // PIO_DEBUG_ON_ERROR || PIO_CRASH_ON_ERROR

// Pass -DPIO_DEBUG_ON_ALL_ERROR at compile time to print debug messages on
// all error (fatal and non-fatal) status. This implies PIO_DEBUG_ON_ERROR.
#if defined(PIO_DEBUG_ON_ALL_ERROR)
#undef PIO_DEBUG_ON_ALL_ERROR
#define PIO_DEBUG_ON_ALL_ERROR 1
// PIO_DEBUG_ON_ALL_ERROR implies PIO_DEBUG_ON_ERROR too.
#undef PIO_DEBUG_ON_ERROR
#define PIO_DEBUG_ON_ERROR 1
#else  // PIO_DEBUG_ON_ALL_ERROR
#define PIO_DEBUG_ON_ALL_ERROR 0
#endif  // PIO_DEBUG_ON_ALL_ERROR

// The Verbose level for the library
#ifndef PIO_DEBUG_V_LEVEL
#define PIO_DEBUG_V_LEVEL 0
#endif  // PIO_DEBUG_V_LEVEL

// Print a debug message on standard error. You should use the PIO_DEBUG macro
// instead of calling Debug directly. This function returns false, so it can be
// used as a return value in PIO_FAILURE.
PIO_FORMAT(1, 2)
bool Debug(const char* format, ...);

// Print a debug message on standard error if "enabled" is true. "enabled" is
// normally a macro that evaluates to 0 or 1 at compile time, so the Debug
// function is never called and optimized out in release builds. Note that the
// arguments are compiled but not evaluated when enabled is false. The format
// string must be a explicit string in the call, for example:
//   PIO_DEBUG(PIO_DEBUG_MYMODULE, "my module message: %d", some_var);
// Add a header at the top of your module's .cc or .h file (depending on whether
// you have PIO_DEBUG calls from the .h as well) like this:
//   #ifndef PIO_DEBUG_MYMODULE
//   #define PIO_DEBUG_MYMODULE 0
//   #endif PIO_DEBUG_MYMODULE
#define PIO_DEBUG(enabled, format, ...)                         \
  do {                                                          \
    if (enabled) {                                              \
      ::pio::Debug(("%s:%d: " format "\n"), __FILE__, __LINE__, \
                   ##__VA_ARGS__);                              \
    }                                                           \
  } while (0)

// PIO_DEBUG version that prints the debug message if the global verbose level
// defined at compile time by PIO_DEBUG_V_LEVEL is greater or equal than the
// passed level.
#define PIO_DEBUG_V(level, format, ...) \
  PIO_DEBUG(level <= PIO_DEBUG_V_LEVEL, format, ##__VA_ARGS__)

// Warnings (via PIO_WARNING) are enabled by default in debug builds (opt and
// debug).
#ifdef PIO_DEBUG_WARNING
#undef PIO_DEBUG_WARNING
#define PIO_DEBUG_WARNING 1
#else  // PIO_DEBUG_WARNING
#ifdef NDEBUG
#define PIO_DEBUG_WARNING 0
#else  // PIO_DEBUG_WARNING
#define PIO_DEBUG_WARNING 1
#endif  // NDEBUG
#endif  // PIO_DEBUG_WARNING
#define PIO_WARNING(format, ...) \
  PIO_DEBUG(PIO_DEBUG_WARNING, format, ##__VA_ARGS__)

// Exits the program after printing a stack trace when possible.
PIO_NORETURN bool Abort();

// Exits the program after printing file/line plus a formatted string.
#define PIO_ABORT(format, ...)                                              \
  ((PIO_DEBUG_ON_ERROR) && ::pio::Debug(("%s:%d: PIO_ABORT: " format "\n"), \
                                        __FILE__, __LINE__, ##__VA_ARGS__), \
   ::pio::Abort())

// Does not guarantee running the code, use only for debug mode checks.
#if PIO_ENABLE_ASSERT
#define PIO_ASSERT(condition)                                      \
  do {                                                             \
    if (!(condition)) {                                            \
      PIO_DEBUG(PIO_DEBUG_ON_ERROR, "PIO_ASSERT: %s", #condition); \
      ::pio::Abort();                                              \
    }                                                              \
  } while (0)
#else
#define PIO_ASSERT(condition) \
  do {                        \
  } while (0)
#endif

// Same as above, but only runs in debug builds (builds where NDEBUG is not
// defined). This is useful for slower asserts that we want to run more rarely
// than usual. These will run on asan, msan and other debug builds, but not in
// opt or release.
#if !defined(NDEBUG) || defined(ADDRESS_SANITIZER) || \
    defined(MEMORY_SANITIZER) || defined(THREAD_SANITIZER)
#define PIO_DASSERT(condition)                                      \
  do {                                                              \
    if (!(condition)) {                                             \
      PIO_DEBUG(PIO_DEBUG_ON_ERROR, "PIO_DASSERT: %s", #condition); \
      ::pio::Abort();                                               \
    }                                                               \
  } while (0)
#else
#define PIO_DASSERT(condition) \
  do {                         \
  } while (0)
#endif

// Always runs the condition, so can be used for non-debug calls.
#if PIO_ENABLE_CHECK
#define PIO_CHECK(condition)                                      \
  do {                                                            \
    if (!(condition)) {                                           \
      PIO_DEBUG(PIO_DEBUG_ON_ERROR, "PIO_CHECK: %s", #condition); \
      ::pio::Abort();                                             \
    }                                                             \
  } while (0)
#else
#define PIO_CHECK(condition) \
  do {                       \
    (void)(condition);       \
  } while (0)
#endif

// A error code returned by the library functions. The value zero means OK
// and every other value is an error. The codes name the conditions the
// optimizer distinguishes when it decides whether a failed trial is
// recoverable.
enum class StatusCode : int32_t {
  // The only non-error status code.
  kOk = 0,

  // Errors (positive values).
  kGenericError = 1,

  // The codec rejected a parameter or an image; the trial is dropped but the
  // search continues.
  kEncodeError = 2,

  // A codec could not decode its own output.
  kDecodeError = 3,

  // Two images of different dimensions were compared.
  kDimensionMismatch = 4,

  // No candidate format produced a usable trial.
  kNoViableEncoding = 5,
};

const char* StatusCodeName(StatusCode code);

// Drop-in replacement for bool that raises compiler warnings if not used
// after being returned from a function. Example:
// Status LoadFile(...) { return true; } is more compact than
// bool PIO_MUST_USE_RESULT LoadFile(...) { return true; }
// In case of error, the status can carry an extra error code in its value which
// is split between fatal and non-fatal error codes.
class PIO_MUST_USE_RESULT Status {
 public:
  // We want implicit constructor from bool to allow returning "true" or "false"
  // on a function when using Status. "true" means StatusCode::kOk while "false"
  // means StatusCode::kGenericError.
  Status(bool ok)  // NOLINT(google-explicit-constructor)
      : code_(ok ? StatusCode::kOk : StatusCode::kGenericError) {}

  // We also want implicit cast to bool to check for return values of functions.
  operator bool() const {  // NOLINT(google-explicit-constructor)
    return code_ == StatusCode::kOk;
  }

  constexpr Status(StatusCode code)  // NOLINT(google-explicit-constructor)
      : code_(code) {}

  // Returns the StatusCode.
  constexpr StatusCode code() const { return code_; }

  // Returns whether the status code is a fatal error.
  constexpr bool IsFatalError() const {
    return static_cast<int32_t>(code_) > 0;
  }

 private:
  StatusCode code_;
};

static constexpr Status OkStatus() { return Status(StatusCode::kOk); }

// Helper function to create a Status and print the debug message or abort
// when needed.
inline PIO_FORMAT(2, 3) Status
    StatusMessage(const Status status, const char* format, ...) {
  // This block will be removed from non-debug builds, but it is the only place
  // where Debug is called.
  if (PIO_DEBUG_ON_ERROR && (PIO_DEBUG_ON_ALL_ERROR || status.IsFatalError())) {
    va_list args;
    va_start(args, format);
    vfprintf(stderr, format, args);
    va_end(args);
  }
#ifdef PIO_CRASH_ON_ERROR
  // PIO_CRASH_ON_ERROR means to Abort() only on fatal errors.
  if (status.IsFatalError()) {
    ::pio::Abort();
  }
#endif  // PIO_CRASH_ON_ERROR
  return status;
}

// Annotation for the location where an error condition is first noticed.
// Error codes are too unspecific to pinpoint the exact location, so we
// add a build flag that crashes and dumps stack at the actual error source.
#define PIO_FAILURE(format, ...)                                              \
  ::pio::StatusMessage(::pio::Status(::pio::StatusCode::kGenericError),       \
                       ("%s:%d: " format "\n"), __FILE__, __LINE__,           \
                       ##__VA_ARGS__)

// Same as PIO_FAILURE, but with an explicit StatusCode.
#define PIO_STATUS(status, format, ...)                                     \
  ::pio::StatusMessage(::pio::Status(status), ("%s:%d: " format "\n"),      \
                       __FILE__, __LINE__, ##__VA_ARGS__)

// Notify of an error but discard the resulting Status value. This is only
// useful for debug builds or when building with PIO_CRASH_ON_ERROR.
#define PIO_NOTIFY_ERROR(format, ...)                                      \
  (void)::pio::StatusMessage(::pio::Status(::pio::StatusCode::kGenericError), \
                             "%s:%d: " format "\n", __FILE__, __LINE__,    \
                             ##__VA_ARGS__)

// Always runs the condition, so can be used for non-debug calls. The error
// code of the failed status is propagated unchanged.
#define PIO_RETURN_IF_ERROR(status)                                       \
  do {                                                                    \
    ::pio::Status pio_return_if_error_status = (status);                  \
    if (!pio_return_if_error_status) {                                    \
      (void)::pio::StatusMessage(                                         \
          pio_return_if_error_status,                                     \
          "%s:%d: PIO_RETURN_IF_ERROR code=%d: %s\n", __FILE__, __LINE__, \
          static_cast<int>(pio_return_if_error_status.code()), #status);  \
      return pio_return_if_error_status;                                  \
    }                                                                     \
  } while (0)

// As PIO_RETURN_IF_ERROR, but creates a generic failure if the condition
// does not hold. Used for conditions that must hold on valid inputs.
#define PIO_ENSURE(condition)                                             \
  do {                                                                    \
    if (!(condition)) {                                                   \
      return PIO_FAILURE("PIO_ENSURE: %s", #condition);                   \
    }                                                                     \
  } while (0)

template <typename T>
class PIO_MUST_USE_RESULT StatusOr {
  static_assert(!std::is_convertible<StatusCode, T>::value &&
                    !std::is_convertible<T, StatusCode>::value,
                "You cannot make a StatusOr with a type convertible from or to "
                "StatusCode");
  static_assert(std::is_move_constructible<T>::value &&
                    std::is_move_assignable<T>::value,
                "T must be move constructible and move assignable");

 public:
  // NOLINTNEXTLINE(google-explicit-constructor)
  StatusOr(Status status) : code_(status.code()) {
    if (status) {
      PIO_DEBUG(PIO_DEBUG_ON_ERROR, "Can not construct StatusOr with OK");
      ::pio::Abort();
    }
  }
  // NOLINTNEXTLINE(google-explicit-constructor)
  StatusOr(T&& value) : code_(StatusCode::kOk) {
    new (&storage_.data_) T(std::move(value));
  }

  StatusOr(StatusOr&& other) noexcept {
    if (other.ok()) {
      new (&storage_.data_) T(std::move(other.storage_.data_));
    }
    code_ = other.code_;
  }

  StatusOr& operator=(StatusOr&& other) noexcept {
    if (this == &other) return *this;
    if (ok() && other.ok()) {
      storage_.data_ = std::move(other.storage_.data_);
    } else if (other.ok()) {
      new (&storage_.data_) T(std::move(other.storage_.data_));
    } else if (ok()) {
      storage_.data_.~T();
    }
    code_ = other.code_;
    return *this;
  }

  StatusOr(const StatusOr&) = delete;
  StatusOr operator=(const StatusOr&) = delete;

  bool ok() const { return code_ == StatusCode::kOk; }
  Status status() const { return code_; }

  // Only call this if you are absolutely sure that `ok()` is true.
  // Never call this manually: rely on PIO_ASSIGN_OR.
  T value_() && {
    if (!ok()) {
      PIO_DEBUG(PIO_DEBUG_ON_ERROR, "Can not get value from failed StatusOr");
      ::pio::Abort();
    }
    return std::move(storage_.data_);
  }

  ~StatusOr() {
    if (code_ == StatusCode::kOk) {
      storage_.data_.~T();
    }
  }

 private:
  union Storage {
    char placeholder_;
    T data_;
    Storage() {}
    ~Storage() {}
  } storage_;

  StatusCode code_;
};

#define PIO_ASSIGN_OR_RETURN(lhs, statusor) \
  PIO_ASSIGN_OR_RETURN_IMPL(                \
      PIO_STATUS_MACROS_CONCAT_NAME(_status_or_value, __LINE__), lhs, statusor)

#define PIO_ASSIGN_OR_RETURN_IMPL(name, lhs, statusor) \
  auto name = statusor;                                \
  PIO_RETURN_IF_ERROR(name.status());                  \
  lhs = std::move(name).value_();

#define PIO_STATUS_MACROS_CONCAT_NAME(x, y) \
  PIO_STATUS_MACROS_CONCAT_NAME_IMPL(x, y)
#define PIO_STATUS_MACROS_CONCAT_NAME_IMPL(x, y) x##y

}  // namespace pio

#endif  // LIB_PIO_BASE_STATUS_H_
