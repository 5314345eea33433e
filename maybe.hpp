#ifndef MAYBE_HPP
#define MAYBE_HPP

#include <cassert>
#include <new>
#include <utility>

// optional value, as produced by parser::optional
template<class T>
class maybe {
  union {
    T value;
  };

  bool set;

  void reset() {
    if(set) {
      value.~T();
      set = false;
    }
  }

public:
  using value_type = T;

  maybe(): set(false) {}
  maybe(T source): value(std::move(source)), set(true) {}

  maybe(const maybe& other): set(other.set) {
    if(set) new (&value) T(other.value);
  }

  maybe(maybe&& other): set(other.set) {
    if(set) new (&value) T(std::move(other.value));
  }

  maybe& operator=(maybe other) {
    reset();
    if(other.set) {
      new (&value) T(std::move(other.value));
      set = true;
    }
    return *this;
  }

  ~maybe() { reset(); }

  explicit operator bool() const { return set; }

  const T& get() const {
    assert(set);
    return value;
  }

  T& get() {
    assert(set);
    return value;
  }

  T value_or(T fallback) const {
    if(set) return value;
    return fallback;
  }
};

#endif
