#ifndef OVERLOAD_HPP
#define OVERLOAD_HPP

#include <utility>

// lambda overload set
template<class...> struct overload;

template<class F>
struct overload<F>: F {
  using F::operator();

  overload(F f): F(std::move(f)) { }
};

template<class F, class ... Fs>
struct overload<F, Fs...>: F, overload<Fs...> {
  using F::operator();
  using overload<Fs...>::operator();

  overload(F f, Fs... fs): F(std::move(f)), overload<Fs...>(std::move(fs)...) { }
};


template<class ... Fs>
static overload<Fs...> make_overload(Fs... fs) {
  return {std::move(fs)...};
}

#endif
