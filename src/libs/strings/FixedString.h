#pragma once
// Fixed capacity strings for task names and log formatting.
//
// FixedString<16> name; - a mutable string with the specified capacity
// makeConstString("foo") - an immutable view of a string literal
//
// None of the methods or classes in this file perform any dynamic
// memory allocation.
#include <stdint.h>
#include <string.h>
#include "src/libs/traits/Traits.h"
namespace preempt {

// Compare two character sequences.
// Returns <0 if Left < Right, 0 if Left == Right, >0 if Left > Right
template <class LeftIter, class RightIter>
int compareSequences(
    LeftIter left,
    LeftIter leftEnd,
    RightIter right,
    RightIter rightEnd) {
  while (left != leftEnd && right != rightEnd) {
    auto l = static_cast<unsigned char>(*left);
    auto r = static_cast<unsigned char>(*right);
    if (l != r) {
      return l < r ? -1 : 1;
    }
    ++left;
    ++right;
  }

  int l = left == leftEnd ? 0 : static_cast<unsigned char>(*left);
  int r = right == rightEnd ? 0 : static_cast<unsigned char>(*right);
  return l - r;
}

// Common comparison operators for the string types below.  Derived
// provides begin(), end() and size().
template <class Derived>
class StringBase {
 public:
  const char* begin() const {
    return static_cast<const Derived*>(this)->begin();
  }

  const char* end() const {
    return static_cast<const Derived*>(this)->end();
  }

  size_t size() const {
    return static_cast<const Derived*>(this)->size();
  }

  bool empty() const {
    return size() == 0;
  }

  template <typename Other>
  bool operator==(const StringBase<Other>& other) const {
    return compareSequences(begin(), end(), other.begin(), other.end()) == 0;
  }

  bool operator==(const char* other) const {
    return compareSequences(begin(), end(), other, other + ::strlen(other)) ==
        0;
  }

  template <typename Other>
  bool operator!=(const StringBase<Other>& other) const {
    return !(*this == other);
  }

  bool operator!=(const char* other) const {
    return !(*this == other);
  }

  bool startsWith(const char* other) const {
    auto otherSize = ::strlen(other);
    if (size() < otherSize) {
      return false;
    }
    return compareSequences(
               begin(), begin() + otherSize, other, other + otherSize) == 0;
  }
};

// An immutable view over static string data
class ConstString : public StringBase<ConstString> {
  const char* data_;
  size_t size_;

 public:
  constexpr ConstString() : data_(""), size_(0) {}
  constexpr ConstString(const char* data, size_t size)
      : data_(data), size_(size) {}

  const char* begin() const {
    return data_;
  }
  const char* end() const {
    return data_ + size_;
  }
  size_t size() const {
    return size_;
  }
};

// A runtime constructed string with a fixed storage capacity.
// Overflowing the capacity is a soft failure; the string is filled
// until it is truncated, and append returns false.
template <size_t Size>
class FixedString : public StringBase<FixedString<Size>> {
  char data_[Size + 1u];
  size_t size_;

 public:
  FixedString() : data_{}, size_(0) {}

  explicit FixedString(const char* cstr) : data_{}, size_(0) {
    append(cstr);
  }

  const char* begin() const {
    return data_;
  }
  const char* end() const {
    return data_ + size_;
  }
  size_t size() const {
    return size_;
  }
  constexpr size_t capacity() const {
    return Size;
  }
  const char* data() const {
    return data_;
  }
  const char* c_str() const {
    return data_;
  }

  void clear() {
    size_ = 0;
    data_[0] = 0;
  }

  // Append len bytes of data from src.
  // Returns true if all of the data was copied, false
  // if it was too large.  If the data cannot fit, then
  // as much of the data as can fit will be appended.
  bool append(const char* src, size_t len) {
    const auto avail = Size - size_;
    const auto toCopy = avail < len ? avail : len;
    if (toCopy > 0) {
      ::memcpy(data_ + size_, src, toCopy);
      size_ += toCopy;
      data_[size_] = 0;
    }
    return toCopy == len;
  }

  bool append(const char* cstr) {
    return append(cstr, cstr ? ::strlen(cstr) : 0);
  }

  template <typename Other>
  bool append(const StringBase<Other>& other) {
    return append(other.begin(), other.size());
  }

  // Appends the value as exactly 2*sizeof(value) upper case hex digits
  template <typename Int>
  bool appendHex(Int value) {
    for (int shift = int(sizeof(Int) * 8) - 4; shift >= 0; shift -= 4) {
      char digit = toHexDigit(uint8_t((uint64_t(value) >> shift) & 0xf));
      if (!append(&digit, 1)) {
        return false;
      }
    }
    return true;
  }

  bool appendDecimal(uint64_t value) {
    char buf[20];
    size_t len = 0;
    do {
      buf[len++] = char('0' + value % 10);
      value /= 10;
    } while (value != 0);
    while (len > 0) {
      if (!append(&buf[--len], 1)) {
        return false;
      }
    }
    return true;
  }

  bool appendDecimal(int64_t value) {
    if (value < 0) {
      if (!append("-", 1)) {
        return false;
      }
      return appendDecimal(uint64_t(0) - uint64_t(value));
    }
    return appendDecimal(uint64_t(value));
  }

  static char toHexDigit(uint8_t b) {
    if (b > 9) {
      return 'A' + (b - 10);
    }
    return '0' + b;
  }
};
}

// makeConstString("foo") returns a ConstString viewing "foo" without the
// terminating NUL.
#define makeConstString(literal) \
  ::preempt::ConstString((literal), sizeof(literal) - 1)

#ifdef __PREEMPT_HOST_BOARD
// Glue so that lest can print our strings in failed expectations
#include <string>
namespace lest {
inline std::string to_string(::preempt::ConstString const& str) {
  return std::string(str.begin(), str.size());
}
template <size_t Size>
inline std::string to_string(::preempt::FixedString<Size> const& str) {
  return std::string(str.begin(), str.size());
}
}
#endif
