#ifndef EITHER_HPP
#define EITHER_HPP

#include "overload.hpp"

#include <type_traits>
#include <cassert>
#include <new>
#include <utility>

// either a Left (failure) or a Right (success)
template<class Left, class Right>
class either {
  typename std::aligned_union<0, Left, Right>::type storage;
  const bool ok;

  template<class T>
  T& cast() {
    return *reinterpret_cast<T*>(&storage);
  }

  template<class T>
  const T& cast() const {
    return *reinterpret_cast<const T*>(&storage);
  }

public:
  using value_type = Right;

  either(Right right): ok(true) {
    new (&storage) Right(std::move(right));
  }

  either(Left left): ok(false) {
    new (&storage) Left(std::move(left));
  }

  either(const either& other): ok(other.ok) {
    if(ok) {
      new (&storage) Right(other.right());
    } else {
      new (&storage) Left(other.left());
    }
  }

  either(either&& other): ok(other.ok) {
    if(ok) {
      new (&storage) Right(std::move(other.right()));
    } else {
      new (&storage) Left(std::move(other.left()));
    }
  }

  // results are returned, never reassigned
  either& operator=(const either&) = delete;
  either& operator=(either&&) = delete;

  ~either() {
    if(ok) {
      cast<Right>().~Right();
    } else {
      cast<Left>().~Left();
    }
  }

  explicit operator bool() const { return ok; }

  template<class Self, class Cont>
  static auto visit(Self&& self, Cont& cont) {
    if(self.ok) {
      return cont(std::forward<Self>(self).right());
    }

    return cont(std::forward<Self>(self).left());
  }

  template<class ... Cases>
  friend auto match(const either& self, Cases... cases) {
    auto cont = make_overload(std::move(cases)...);
    return visit(self, cont);
  }

  template<class ... Cases>
  friend auto match(either&& self, Cases... cases) {
    auto cont = make_overload(std::move(cases)...);
    return visit(self, cont);
  }

  const Right* get() const {
    if(!ok) return nullptr;
    return &cast<Right>();
  }

  Right* get() {
    if(!ok) return nullptr;
    return &cast<Right>();
  }

  const Right& right() const {
    assert(ok);
    return cast<Right>();
  }

  Right& right() {
    assert(ok);
    return cast<Right>();
  }

  const Left& left() const {
    assert(!ok);
    return cast<Left>();
  }

  Left& left() {
    assert(!ok);
    return cast<Left>();
  }

};


#endif
