/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by every module: expected<V, E>, strong
 *        identifiers, ScopeGuard and the per-module error codes.
 *
 * Errors are values. Every fallible operation returns expected<V, E> with a
 * small enum class as E, so callers must look at the outcome instead of
 * relying on stack unwinding.
 */

#ifndef MWD_VOCABULARY_HPP_
#define MWD_VOCABULARY_HPP_

#include "mwd/platform.hpp"

#include <cstdint>
#include <functional>
#include <new>
#include <string>
#include <type_traits>
#include <utility>

namespace mwd {

// ============================================================================
// Error Codes
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

enum class RegistryError : uint8_t {
  kUnknownStage = 0,    ///< Service stage absent from the stage list.
  kInvalidPattern,      ///< Accept/reject pattern does not compile.
  kInvalidLimit,        ///< Failure limit is not positive.
  kDuplicateService,    ///< Two definitions share one name.
  kEmptyStageList,
  kNotFound,
};

enum class StoreError : uint8_t {
  kNotFound = 0,
  kIoError,
  kInvalidRecord,
};

enum class QueueError : uint8_t {
  kClosed = 0,
  kTimeout,
};

enum class DispatchError : uint8_t {
  kUnknownSubmission = 0,
  kUnknownFile,
  kAlreadyComplete,
  kInvalidSubmission,
  kNotOutstanding,
};

enum class TimerError : uint8_t {
  kInvalidPeriod = 0,
  kAlreadyRunning,
  kNotFound,
};

enum class TaskGroupError : uint8_t {
  kTaskFailed = 0,
  kTaskThrew,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error result.
 *
 * Constructed only through success() / error(). Accessing value() on an
 * error (or get_error() on a value) is a programming error caught by
 * MWD_ASSERT in debug builds.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) {
    expected r;
    ::new (&r.storage_) V(v);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& v) {
    expected r;
    ::new (&r.storage_) V(std::move(v));
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) {
    expected r;
    r.error_ = std::move(e);
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) : error_(other.error_),
                                    has_value_(other.has_value_) {
    if (has_value_) ::new (&storage_) V(*other.ptr());
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value)
      : error_(std::move(other.error_)), has_value_(other.has_value_) {
    if (has_value_) ::new (&storage_) V(std::move(*other.ptr()));
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      error_ = other.error_;
      has_value_ = other.has_value_;
      if (has_value_) ::new (&storage_) V(*other.ptr());
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_assignable<E>::value) {
    if (this != &other) {
      Destroy();
      error_ = std::move(other.error_);
      has_value_ = other.has_value_;
      if (has_value_) ::new (&storage_) V(std::move(*other.ptr()));
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    MWD_ASSERT(has_value_);
    return *ptr();
  }
  const V& value() const& {
    MWD_ASSERT(has_value_);
    return *ptr();
  }
  V&& value() && {
    MWD_ASSERT(has_value_);
    return std::move(*ptr());
  }

  const E& get_error() const noexcept {
    MWD_ASSERT(!has_value_);
    return error_;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? *ptr() : fallback;
  }

 private:
  expected() = default;

  V* ptr() noexcept { return std::launder(reinterpret_cast<V*>(&storage_)); }
  const V* ptr() const noexcept {
    return std::launder(reinterpret_cast<const V*>(&storage_));
  }

  void Destroy() noexcept {
    if (has_value_) {
      ptr()->~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  E error_{};
  bool has_value_ = false;
};

/** void specialization: success carries nothing. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected r;
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) {
    expected r;
    r.error_ = std::move(e);
    r.has_value_ = false;
    return r;
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const noexcept {
    MWD_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected() = default;

  E error_{};
  bool has_value_ = false;
};

/// Chain a fallible step: runs fn(value) on success, forwards the error.
template <typename V, typename E, typename F>
auto and_then(const expected<V, E>& r, F&& fn) -> decltype(fn(r.value())) {
  using R = decltype(fn(r.value()));
  if (!r.has_value()) return R::error(r.get_error());
  return fn(r.value());
}

/// Observe an error; does nothing on success.
template <typename V, typename E, typename F>
void or_else(const expected<V, E>& r, F&& fn) {
  if (!r.has_value()) fn(r.get_error());
}

// ============================================================================
// NewType - strong typedef
// ============================================================================

/**
 * @brief Wraps T under a distinct Tag so that, e.g., a submission id can
 *        never be passed where a file hash is expected.
 */
template <typename T, typename Tag>
class NewType {
 public:
  NewType() = default;
  explicit NewType(T v) : value_(std::move(v)) {}

  const T& value() const noexcept { return value_; }

  bool operator==(const NewType& o) const { return value_ == o.value_; }
  bool operator!=(const NewType& o) const { return value_ != o.value_; }
  bool operator<(const NewType& o) const { return value_ < o.value_; }

 private:
  T value_{};
};

struct TimerTaskIdTag {};
using TimerTaskId = NewType<uint32_t, TimerTaskIdTag>;

// ============================================================================
// Overloaded visitor pattern (C++17)
// ============================================================================

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// ============================================================================
// ScopeGuard
// ============================================================================

/** Runs a cleanup callable on scope exit unless release() was called. */
class ScopeGuard final {
 public:
  explicit ScopeGuard(std::function<void()> fn) : fn_(std::move(fn)) {}

  ScopeGuard(ScopeGuard&& other) noexcept : fn_(std::move(other.fn_)) {
    other.fn_ = nullptr;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() {
    if (fn_) fn_();
  }

  void release() noexcept { fn_ = nullptr; }

 private:
  std::function<void()> fn_;
};

#define MWD_SCOPE_EXIT(code)                                     \
  ::mwd::ScopeGuard MWD_CONCAT(mwd_scope_exit_, __LINE__)(       \
      [&]() { code; })

// ============================================================================
// Error names (logging)
// ============================================================================

inline const char* ToString(RegistryError e) noexcept {
  switch (e) {
    case RegistryError::kUnknownStage: return "unknown stage";
    case RegistryError::kInvalidPattern: return "invalid pattern";
    case RegistryError::kInvalidLimit: return "invalid failure limit";
    case RegistryError::kDuplicateService: return "duplicate service";
    case RegistryError::kEmptyStageList: return "empty stage list";
    case RegistryError::kNotFound: return "not found";
  }
  return "unknown";
}

inline const char* ToString(StoreError e) noexcept {
  switch (e) {
    case StoreError::kNotFound: return "not found";
    case StoreError::kIoError: return "io error";
    case StoreError::kInvalidRecord: return "invalid record";
  }
  return "unknown";
}

inline const char* ToString(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound: return "file not found";
    case ConfigError::kParseError: return "parse error";
    case ConfigError::kFormatNotSupported: return "format not supported";
    case ConfigError::kBufferFull: return "buffer full";
    case ConfigError::kInvalidValue: return "invalid value";
  }
  return "unknown";
}

inline const char* ToString(DispatchError e) noexcept {
  switch (e) {
    case DispatchError::kUnknownSubmission: return "unknown submission";
    case DispatchError::kUnknownFile: return "unknown file";
    case DispatchError::kAlreadyComplete: return "already complete";
    case DispatchError::kInvalidSubmission: return "invalid submission";
    case DispatchError::kNotOutstanding: return "not outstanding";
  }
  return "unknown";
}

inline const char* ToString(TimerError e) noexcept {
  switch (e) {
    case TimerError::kInvalidPeriod: return "invalid period";
    case TimerError::kAlreadyRunning: return "already running";
    case TimerError::kNotFound: return "not found";
  }
  return "unknown";
}

}  // namespace mwd

#endif  // MWD_VOCABULARY_HPP_
