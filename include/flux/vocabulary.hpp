/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by all flux headers.
 *
 * Provides:
 *   - expected<V, E>     : value-or-error return type (no exceptions)
 *   - optional<T>        : nullable value without heap allocation
 *   - FixedString<N>     : bounded, null-terminated string
 *   - FixedFunction<Sig> : small-buffer type-erased callable
 *   - ScopeGuard         : run a cleanup on scope exit (FLUX_SCOPE_EXIT)
 *   - NewType<T, Tag>    : strong typedef for identifiers
 *   - Error enums for every subsystem
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef FLUX_VOCABULARY_HPP_
#define FLUX_VOCABULARY_HPP_

#include "flux/platform.hpp"

#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

namespace flux {

// ============================================================================
// Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound,
  kParseError,
  kFormatNotSupported,
  kBufferFull
};

enum class DispatchError : uint8_t {
  kNotDispatching,      ///< WaitFor() called outside an open broadcast.
  kUnknownCallback,     ///< Id does not map to a registered callback.
  kCircularDependency,  ///< Id is already executing in this broadcast.
  kCallbackFailed,      ///< A registered callback failed or threw.
  kQueueFull            ///< Bounded dispatch queue has no room left.
};

/** @brief Human-readable name of a DispatchError (never nullptr). */
inline const char* DispatchErrorName(DispatchError e) noexcept {
  switch (e) {
    case DispatchError::kNotDispatching:
      return "NotDispatching";
    case DispatchError::kUnknownCallback:
      return "UnknownCallback";
    case DispatchError::kCircularDependency:
      return "CircularDependency";
    case DispatchError::kCallbackFailed:
      return "CallbackFailed";
    case DispatchError::kQueueFull:
      return "QueueFull";
  }
  return "Unknown";
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct through the static factories:
 * @code
 *   return expected<int, ConfigError>::success(42);
 *   return expected<int, ConfigError>::error(ConfigError::kParseError);
 * @endcode
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) {
    expected r;
    ::new (&r.storage_.value) V(v);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& v) {
    expected r;
    ::new (&r.storage_.value) V(std::move(v));
    r.has_value_ = true;
    return r;
  }

  static expected error(const E& e) {
    expected r;
    ::new (&r.storage_.err) E(e);
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(other.storage_.value);
    } else {
      ::new (&storage_.err) E(other.storage_.err);
    }
  }

  expected(expected&& other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      ::new (&storage_.err) E(std::move(other.storage_.err));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(other.storage_.value);
      } else {
        ::new (&storage_.err) E(other.storage_.err);
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(std::move(other.storage_.value));
      } else {
        ::new (&storage_.err) E(std::move(other.storage_.err));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    FLUX_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    FLUX_ASSERT(has_value_);
    return storage_.value;
  }

  const E& get_error() const {
    FLUX_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

 private:
  expected() noexcept : storage_(), has_value_(false) {}

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
    } else {
      storage_.err.~E();
    }
  }

  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/**
 * @brief Specialization for operations that return no value on success.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(); }

  static expected error(const E& e) {
    expected r;
    r.err_ = e;
    r.has_value_ = false;
    return r;
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const {
    FLUX_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_(), has_value_(true) {}

  E err_;
  bool has_value_;
};

/**
 * @brief Chain an operation that runs only when @p r holds a value.
 *
 * @p fn receives the value and must return an expected with the same E.
 */
template <typename V, typename E, typename F>
auto and_then(const expected<V, E>& r, F&& fn) -> decltype(fn(r.value())) {
  using Ret = decltype(fn(r.value()));
  if (!r.has_value()) return Ret::error(r.get_error());
  return fn(r.value());
}

/** @brief Invoke @p fn with the error when @p r holds one. */
template <typename V, typename E, typename F>
void or_else(const expected<V, E>& r, F&& fn) {
  if (!r.has_value()) fn(r.get_error());
}

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& v) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (&storage_) T(v);
  }

  optional(T&& v) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (&storage_) T(std::move(v));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) ::new (&storage_) T(*other.Ptr());
  }

  optional(optional&& other) noexcept : has_value_(other.has_value_) {
    if (has_value_) ::new (&storage_) T(std::move(*other.Ptr()));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_) T(*other.Ptr());
        has_value_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_) T(std::move(*other.Ptr()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() {
    FLUX_ASSERT(has_value_);
    return *Ptr();
  }
  const T& value() const {
    FLUX_ASSERT(has_value_);
    return *Ptr();
  }

  T value_or(const T& fallback) const {
    return has_value_ ? *Ptr() : fallback;
  }

  void reset() noexcept {
    if (has_value_) {
      Ptr()->~T();
      has_value_ = false;
    }
  }

 private:
  T* Ptr() noexcept { return std::launder(reinterpret_cast<T*>(&storage_)); }
  const T* Ptr() const noexcept {
    return std::launder(reinterpret_cast<const T*>(&storage_));
  }

  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool has_value_;
};

// ============================================================================
// FixedString<N>
// ============================================================================

/** @brief Tag selecting the truncating FixedString constructor. */
struct TruncateToCapacity_t {};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Null-terminated string with compile-time capacity.
 *
 * Literal construction is checked at compile time; runtime strings go
 * through the TruncateToCapacity overloads.
 */
template <uint32_t Capacity>
class FixedString final {
  static_assert(Capacity > 0U, "FixedString capacity must be non-zero");

 public:
  FixedString() noexcept : size_(0U) { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&str)[N]) noexcept  // NOLINT(runtime/explicit)
      : size_(N - 1U) {
    static_assert(N - 1U <= Capacity, "literal exceeds FixedString capacity");
    std::memcpy(buf_, str, N);
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0U) {
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t len) noexcept
      : size_(0U) {
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    if (str == nullptr) {
      clear();
      return;
    }
    assign(TruncateToCapacity, str,
           static_cast<uint32_t>(std::strlen(str)));
  }

  void assign(TruncateToCapacity_t, const char* str, uint32_t len) noexcept {
    if (str == nullptr) {
      clear();
      return;
    }
    size_ = (len < Capacity) ? len : Capacity;
    std::memcpy(buf_, str, size_);
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }
  bool empty() const noexcept { return size_ == 0U; }

  void clear() noexcept {
    size_ = 0U;
    buf_[0] = '\0';
  }

  bool operator==(const char* rhs) const noexcept {
    return (rhs != nullptr) && (std::strcmp(buf_, rhs) == 0);
  }
  bool operator!=(const char* rhs) const noexcept { return !(*this == rhs); }

  template <uint32_t M>
  bool operator==(const FixedString<M>& rhs) const noexcept {
    return (size_ == rhs.size()) &&
           (std::memcmp(buf_, rhs.c_str(), size_) == 0);
  }
  template <uint32_t M>
  bool operator!=(const FixedString<M>& rhs) const noexcept {
    return !(*this == rhs);
  }

 private:
  char buf_[Capacity + 1U];
  uint32_t size_;
};

// ============================================================================
// FixedFunction<Sig, BufferSize>
// ============================================================================

template <typename Signature, size_t BufferSize = 4 * sizeof(void*)>
class FixedFunction;

/**
 * @brief Move-only type-erased callable stored in an inline buffer.
 *
 * Callables larger than BufferSize are rejected at compile time; no heap
 * allocation ever happens.
 */
template <typename Ret, typename... Args, size_t BufferSize>
class FixedFunction<Ret(Args...), BufferSize> final {
 public:
  FixedFunction() noexcept = default;
  FixedFunction(std::nullptr_t) noexcept {}  // NOLINT(runtime/explicit)

  template <typename F,
            typename = typename std::enable_if<!std::is_same<
                typename std::decay<F>::type, FixedFunction>::value>::type>
  FixedFunction(F&& f) noexcept {  // NOLINT(runtime/explicit)
    using Fn = typename std::decay<F>::type;
    static_assert(sizeof(Fn) <= BufferSize,
                  "callable exceeds FixedFunction buffer size");
    static_assert(alignof(Fn) <= alignof(std::max_align_t),
                  "callable over-aligned for FixedFunction");
    ::new (&storage_) Fn(std::forward<F>(f));
    invoker_ = [](void* s, Args... args) -> Ret {
      return (*static_cast<Fn*>(s))(std::forward<Args>(args)...);
    };
    manager_ = [](void* dst, void* src, Op op) {
      if (op == Op::kMove) {
        ::new (dst) Fn(std::move(*static_cast<Fn*>(src)));
        static_cast<Fn*>(src)->~Fn();
      } else {
        static_cast<Fn*>(src)->~Fn();
      }
    };
  }

  FixedFunction(FixedFunction&& other) noexcept { MoveFrom(other); }

  FixedFunction& operator=(FixedFunction&& other) noexcept {
    if (this != &other) {
      Reset();
      MoveFrom(other);
    }
    return *this;
  }

  FixedFunction(const FixedFunction&) = delete;
  FixedFunction& operator=(const FixedFunction&) = delete;

  ~FixedFunction() { Reset(); }

  Ret operator()(Args... args) const {
    FLUX_ASSERT(invoker_ != nullptr);
    return invoker_(const_cast<void*>(static_cast<const void*>(&storage_)),
                    std::forward<Args>(args)...);
  }

  explicit operator bool() const noexcept { return invoker_ != nullptr; }

 private:
  enum class Op : uint8_t { kMove, kDestroy };

  void MoveFrom(FixedFunction& other) noexcept {
    if (other.invoker_ != nullptr) {
      other.manager_(&storage_, &other.storage_, Op::kMove);
      invoker_ = other.invoker_;
      manager_ = other.manager_;
      other.invoker_ = nullptr;
      other.manager_ = nullptr;
    }
  }

  void Reset() noexcept {
    if (invoker_ != nullptr) {
      manager_(nullptr, &storage_, Op::kDestroy);
      invoker_ = nullptr;
      manager_ = nullptr;
    }
  }

  typename std::aligned_storage<BufferSize, alignof(std::max_align_t)>::type
      storage_;
  Ret (*invoker_)(void*, Args...) = nullptr;
  void (*manager_)(void*, void*, Op) = nullptr;
};

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs the stored cleanup when destroyed unless release() was called.
 *
 * Movable so that a cleanup can outlive the scope that armed it (the moved
 * from guard is disarmed).
 */
class ScopeGuard final {
 public:
  explicit ScopeGuard(FixedFunction<void()> cleanup) noexcept
      : cleanup_(std::move(cleanup)), active_(true) {}

  ScopeGuard(ScopeGuard&& other) noexcept
      : cleanup_(std::move(other.cleanup_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() {
    if (active_ && cleanup_) cleanup_();
  }

  void release() noexcept { active_ = false; }

 private:
  FixedFunction<void()> cleanup_;
  bool active_;
};

#define FLUX_SCOPE_EXIT(...)                                   \
  ::flux::ScopeGuard FLUX_CONCAT(flux_scope_exit_, __LINE__)( \
      ::flux::FixedFunction<void()>([&]() { __VA_ARGS__; }))

// ============================================================================
// NewType<T, Tag>
// ============================================================================

/**
 * @brief Strong typedef: two NewTypes over the same T do not mix.
 */
template <typename T, typename Tag>
class NewType final {
 public:
  constexpr NewType() noexcept : value_() {}
  constexpr explicit NewType(T v) noexcept : value_(v) {}

  constexpr T value() const noexcept { return value_; }

  constexpr bool operator==(const NewType& rhs) const noexcept {
    return value_ == rhs.value_;
  }
  constexpr bool operator!=(const NewType& rhs) const noexcept {
    return value_ != rhs.value_;
  }
  constexpr bool operator<(const NewType& rhs) const noexcept {
    return value_ < rhs.value_;
  }

 private:
  T value_;
};

struct BroadcastSeqTag {};

/** @brief Per-dispatcher sequence number of a broadcast (1-based). */
using BroadcastSeq = NewType<uint64_t, BroadcastSeqTag>;

}  // namespace flux

#endif  // FLUX_VOCABULARY_HPP_
