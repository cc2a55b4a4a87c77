/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by all mirror modules.
 *
 * - expected<V, E>  : value-or-error return type (no exceptions)
 * - FixedString<N>  : bounded, stack-allocated string
 * - FixedVector<T,N>: bounded, stack-allocated vector
 * - Error enums for every module
 *
 * Header-only, C++17.
 */

#ifndef MIRROR_VOCABULARY_HPP_
#define MIRROR_VOCABULARY_HPP_

#include "mirror/platform.hpp"

#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

namespace mirror {

// ============================================================================
// Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

enum class TransportError : uint8_t {
  kAdvertiseFailed,
  kBrowseFailed,
  kInviteFailed,
  kSendFailed,
  kNotConnected,
  kUnknownPeer,
};

enum class WireError : uint8_t {
  kTruncated,
  kBadLength,
  kBadMetadata,
  kEmptyImage,
  kNotJson,
  kUnknownType,
  kMissingField,
};

enum class EncodeError : uint8_t {
  kInvalidFrame,
  kUnsupportedFormat,
  kCodecFailed,
};

enum class SessionError : uint8_t {
  kAlreadyConnecting,
  kNotStarted,
  kTransportFailed,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Constructed only through the success() / error() factories.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) {
    expected r;
    ::new (static_cast<void*>(&r.value_)) V(v);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& v) {
    expected r;
    ::new (static_cast<void*>(&r.value_)) V(std::move(v));
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.error_ = e;
    return r;
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(other.value_);
    } else {
      error_ = other.error_;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
    } else {
      error_ = other.error_;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(other.value_);
      } else {
        error_ = other.error_;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
      } else {
        error_ = other.error_;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    MIRROR_ASSERT(has_value_);
    return value_;
  }
  const V& value() const& noexcept {
    MIRROR_ASSERT(has_value_);
    return value_;
  }
  V&& value() && noexcept {
    MIRROR_ASSERT(has_value_);
    return std::move(value_);
  }

  E get_error() const noexcept {
    MIRROR_ASSERT(!has_value_);
    return error_;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? value_ : fallback;
  }

 private:
  expected() noexcept : error_(), has_value_(false) {}

  void Destroy() noexcept {
    if (has_value_) {
      value_.~V();
      has_value_ = false;
    }
  }

  union {
    V value_;
    E error_;
  };
  bool has_value_;
};

/** @brief Specialization for operations that return no value. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    MIRROR_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected(bool ok, E e) noexcept : error_(e), has_value_(ok) {}

  E error_;
  bool has_value_;
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

/// Tag selecting the truncating FixedString constructors.
struct TruncateToCapacity_t {
  explicit constexpr TruncateToCapacity_t() = default;
};
inline constexpr TruncateToCapacity_t TruncateToCapacity{};

template <uint32_t Capacity>
class FixedString {
 public:
  FixedString() noexcept : size_(0) { buf_[0] = '\0'; }

  /// Construct from a literal that is known to fit.
  template <uint32_t N>
  FixedString(const char (&str)[N]) noexcept : size_(0) {  // NOLINT
    static_assert(N - 1 <= Capacity, "string literal exceeds capacity");
    assign(TruncateToCapacity, str, N - 1);
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0) {
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const char* str, size_t len) noexcept
      : size_(0) {
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    assign(TruncateToCapacity, str, (str != nullptr) ? std::strlen(str) : 0U);
  }

  void assign(TruncateToCapacity_t, const char* str, size_t len) noexcept {
    if (str == nullptr) {
      clear();
      return;
    }
    size_ = static_cast<uint32_t>((len > Capacity) ? Capacity : len);
    std::memcpy(buf_, str, size_);
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    size_ = 0;
    buf_[0] = '\0';
  }

  bool operator==(const char* other) const noexcept {
    return (other != nullptr) && std::strcmp(buf_, other) == 0;
  }
  bool operator!=(const char* other) const noexcept { return !(*this == other); }

  template <uint32_t M>
  bool operator==(const FixedString<M>& other) const noexcept {
    return size_ == other.size() &&
           std::memcmp(buf_, other.c_str(), size_) == 0;
  }
  template <uint32_t M>
  bool operator!=(const FixedString<M>& other) const noexcept {
    return !(*this == other);
  }

 private:
  char buf_[Capacity + 1];
  uint32_t size_;
};

// ============================================================================
// FixedVector<T, Capacity>
// ============================================================================

template <typename T, uint32_t Capacity>
class FixedVector {
 public:
  using iterator = T*;
  using const_iterator = const T*;

  FixedVector() noexcept : size_(0) {}

  FixedVector(const FixedVector& other) : size_(0) {
    for (const auto& item : other) {
      (void)push_back(item);
    }
  }

  FixedVector(FixedVector&& other) noexcept : size_(0) {
    for (auto& item : other) {
      (void)push_back(std::move(item));
    }
    other.clear();
  }

  FixedVector& operator=(const FixedVector& other) {
    if (this != &other) {
      clear();
      for (const auto& item : other) {
        (void)push_back(item);
      }
    }
    return *this;
  }

  FixedVector& operator=(FixedVector&& other) noexcept {
    if (this != &other) {
      clear();
      for (auto& item : other) {
        (void)push_back(std::move(item));
      }
      other.clear();
    }
    return *this;
  }

  ~FixedVector() { clear(); }

  bool push_back(const T& item) { return emplace_back(item); }
  bool push_back(T&& item) { return emplace_back(std::move(item)); }

  template <typename... Args>
  bool emplace_back(Args&&... args) {
    if (size_ >= Capacity) return false;
    ::new (static_cast<void*>(Slot(size_))) T(std::forward<Args>(args)...);
    ++size_;
    return true;
  }

  bool pop_back() noexcept {
    if (size_ == 0) return false;
    --size_;
    Slot(size_)->~T();
    return true;
  }

  /// Remove the element at index by moving the last element into its place.
  bool erase_unordered(uint32_t index) noexcept {
    if (index >= size_) return false;
    if (index != size_ - 1) {
      *Slot(index) = std::move(*Slot(size_ - 1));
    }
    return pop_back();
  }

  void clear() noexcept {
    while (size_ > 0) {
      (void)pop_back();
    }
  }

  T& operator[](uint32_t i) noexcept {
    MIRROR_ASSERT(i < size_);
    return *Slot(i);
  }
  const T& operator[](uint32_t i) const noexcept {
    MIRROR_ASSERT(i < size_);
    return *Slot(i);
  }

  iterator begin() noexcept { return Slot(0); }
  iterator end() noexcept { return Slot(0) + size_; }
  const_iterator begin() const noexcept { return Slot(0); }
  const_iterator end() const noexcept { return Slot(0) + size_; }

  uint32_t size() const noexcept { return size_; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }
  bool empty() const noexcept { return size_ == 0; }
  bool full() const noexcept { return size_ >= Capacity; }

 private:
  T* Slot(uint32_t i) noexcept {
    return std::launder(reinterpret_cast<T*>(storage_) + i);
  }
  const T* Slot(uint32_t i) const noexcept {
    return std::launder(reinterpret_cast<const T*>(storage_) + i);
  }

  alignas(T) unsigned char storage_[sizeof(T) * Capacity];
  uint32_t size_;
};

}  // namespace mirror

#endif  // MIRROR_VOCABULARY_HPP_
