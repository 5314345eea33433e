#ifndef VARIANT_HPP
#define VARIANT_HPP

#include "overload.hpp"

#include <cstddef>
#include <memory>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace detail {

  // alternative membership
  template<class U, class ... T> struct contains: std::false_type { };

  template<class U, class H, class ... T>
  struct contains<U, H, T...>:
    std::integral_constant<bool, std::is_same<U, H>::value || contains<U, T...>::value> { };

  // alternative index
  template<class U, class ... T> struct index_of;

  template<class U, class ... T>
  struct index_of<U, U, T...>: std::integral_constant<std::size_t, 0> { };

  template<class U, class H, class ... T>
  struct index_of<U, H, T...>:
    std::integral_constant<std::size_t, 1 + index_of<U, T...>::value> { };

  // first alternative
  template<class H, class ... T>
  struct head {
    using type = H;
  };

}


// owning tagged union: each alternative lives in its own heap cell, copies are
// deep
template<class ... T>
class variant {
  using storage_type = typename std::aligned_union<0, std::unique_ptr<T>...>::type;
  storage_type storage;

  std::size_t index;

  template<class U>
  const std::unique_ptr<U>& ptr() const {
    return reinterpret_cast<const std::unique_ptr<U>&>(storage);
  }

  template<class U>
  std::unique_ptr<U>& ptr() {
    return reinterpret_cast<std::unique_ptr<U>&>(storage);
  }

  template<class U>
  void destruct() {
    using pointer = std::unique_ptr<U>;
    ptr<U>().~pointer();
  }

  template<class U>
  void copy_construct(const variant& other) {
    const auto& source = other.ptr<U>();
    new (&storage) std::unique_ptr<U>(source ? new U(*source) : nullptr);
  }

  template<class U>
  void move_construct(variant&& other) {
    new (&storage) std::unique_ptr<U>(std::move(other.ptr<U>()));
  }

  template<class U>
  bool equal(const variant& other) const {
    const auto& lhs = ptr<U>();
    const auto& rhs = other.ptr<U>();
    if(!lhs || !rhs) return !lhs && !rhs;
    return *lhs == *rhs;
  }

  template<class Ret, class U, class Visitor>
  static Ret apply(Visitor& visitor, const variant& self) {
    return visitor(*self.ptr<U>());
  }

  void destroy() {
    using thunk_type = void (variant::*)();
    static const thunk_type thunk[] = {&variant::destruct<T>...};
    (this->*thunk[index])();
  }

  template<class U>
  static constexpr std::size_t expected() {
    static_assert(detail::contains<U, T...>::value, "not an alternative");
    return detail::index_of<U, T...>::value;
  }

public:

  template<class U, class V = typename std::decay<U>::type,
           class = typename std::enable_if<detail::contains<V, T...>::value>::type>
  variant(U&& value): index(detail::index_of<V, T...>::value) {
    new (&storage) std::unique_ptr<V>(new V(std::forward<U>(value)));
  }

  variant(const variant& other): index(other.index) {
    using thunk_type = void (variant::*)(const variant&);
    static const thunk_type thunk[] = {&variant::copy_construct<T>...};
    (this->*thunk[index])(other);
  }

  variant(variant&& other) noexcept: index(other.index) {
    using thunk_type = void (variant::*)(variant&&);
    static const thunk_type thunk[] = {&variant::move_construct<T>...};
    (this->*thunk[index])(std::move(other));
  }

  ~variant() { destroy(); }

  variant& operator=(const variant& other) {
    if(this == &other) return *this;
    variant copy(other);
    return *this = std::move(copy);
  }

  variant& operator=(variant&& other) noexcept {
    if(this == &other) return *this;
    destroy();
    index = other.index;

    using thunk_type = void (variant::*)(variant&&);
    static const thunk_type thunk[] = {&variant::move_construct<T>...};
    (this->*thunk[index])(std::move(other));
    return *this;
  }

  std::size_t type() const { return index; }

  template<class U>
  bool is() const { return index == expected<U>(); }

  // get value, throw if type is wrong
  template<class U>
  const U& get() const {
    if(index != expected<U>()) throw std::bad_cast();
    return *ptr<U>();
  }

  template<class U>
  U& get() {
    if(index != expected<U>()) throw std::bad_cast();
    return *ptr<U>();
  }

  // get value, nullptr if type is wrong
  template<class U>
  const U* get_if() const {
    if(index != expected<U>()) return nullptr;
    return ptr<U>().get();
  }

  template<class U>
  U* get_if() {
    if(index != expected<U>()) return nullptr;
    return ptr<U>().get();
  }

  // apply visitor
  template<class Visitor>
  auto visit(Visitor&& visitor) const {
    // all cases must agree with the first one
    using first_type = typename detail::head<T...>::type;
    using result_type = typename std::result_of<Visitor&(const first_type&)>::type;
    using thunk_type = result_type (*)(Visitor&, const variant&);

    static const thunk_type thunk[] = {&variant::apply<result_type, T, Visitor>...};
    return thunk[index](visitor, *this);
  }

  template<class ... Cases>
  auto match(Cases... cases) const {
    auto visitor = make_overload(std::move(cases)...);
    return visit(visitor);
  }

  bool operator==(const variant& other) const {
    if(index != other.index) return false;

    using thunk_type = bool (variant::*)(const variant&) const;
    static const thunk_type thunk[] = {&variant::equal<T>...};
    return (this->*thunk[index])(other);
  }

  bool operator!=(const variant& other) const {
    return !operator==(other);
  }

};

#endif
