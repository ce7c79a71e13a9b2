#pragma once
#include <stddef.h>
#include <stdint.h>

// Minimal type traits; the scheduler sources do not use <utility>.
namespace preempt {

template <class T>
struct remove_reference {
  typedef T type;
};
template <class T>
struct remove_reference<T&> {
  typedef T type;
};
template <class T>
struct remove_reference<T&&> {
  typedef T type;
};

template <class T>
typename remove_reference<T>::type&& move(T&& t) {
  return static_cast<typename remove_reference<T>::type&&>(t);
}

template <class T>
T&& forward(typename remove_reference<T>::type& t) {
  return static_cast<T&&>(t);
}

template <class T>
T&& forward(typename remove_reference<T>::type&& t) {
  return static_cast<T&&>(t);
}

// Round value down/up to a power-of-two alignment
constexpr uintptr_t alignDown(uintptr_t value, uintptr_t align) {
  return value & ~(align - 1);
}

constexpr uintptr_t alignUp(uintptr_t value, uintptr_t align) {
  return (value + align - 1) & ~(align - 1);
}

constexpr bool isPowerOfTwo(size_t value) {
  return value != 0 && (value & (value - 1)) == 0;
}
}
