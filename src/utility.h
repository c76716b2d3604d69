/**
 * @file src/utility.h
 * @brief Declarations for utility functions.
 */
#pragma once

// standard includes
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#define KITTY_WHILE_LOOP(x, y, z) \
  { \
    x; \
    while (y) z \
  }

template<typename T>
struct argument_type;

template<typename T, typename U>
struct argument_type<T(U)> {
  typedef U type;
};

#define KITTY_USING_MOVE_T(move_t, t, init_val, z) \
  class move_t { \
  public: \
    using element_type = typename argument_type<void(t)>::type; \
\
    move_t(): \
        el {init_val} { \
    } \
    template<class... Args> \
    move_t(Args &&...args): \
        el {std::forward<Args>(args)...} { \
    } \
    move_t(const move_t &) = delete; \
\
    move_t(move_t &&other) noexcept: \
        el {std::move(other.el)} { \
      other.el = element_type {init_val}; \
    } \
\
    move_t &operator=(const move_t &) = delete; \
\
    move_t &operator=(move_t &&other) { \
      std::swap(el, other.el); \
      return *this; \
    } \
    element_type *operator->() { \
      return &el; \
    } \
    const element_type *operator->() const { \
      return &el; \
    } \
\
    inline element_type release() { \
      element_type val = std::move(el); \
      el = element_type {init_val}; \
      return val; \
    } \
\
    ~move_t() z \
\
      element_type el; \
  }

#define TUPLE_2D(a, b, expr) \
  decltype(expr) a##_##b = expr; \
  auto &a = std::get<0>(a##_##b); \
  auto &b = std::get<1>(a##_##b)

namespace util {

  template<class... Ts>
  struct overloaded: Ts... {
    using Ts::operator()...;
  };
  template<class... Ts>
  overloaded(Ts...) -> overloaded<Ts...>;

  template<class T>
  class Hex {
  public:
    typedef T elem_type;

  private:
    const char _bits[16] {
      '0',
      '1',
      '2',
      '3',
      '4',
      '5',
      '6',
      '7',
      '8',
      '9',
      'A',
      'B',
      'C',
      'D',
      'E',
      'F'
    };

    char _hex[sizeof(elem_type) * 2];

  public:
    Hex(const elem_type &elem, bool rev) {
      if (!rev) {
        const uint8_t *data = reinterpret_cast<const uint8_t *>(&elem) + sizeof(elem_type) - 1;
        for (auto it = begin(); it < cend();) {
          *it++ = _bits[*data / 16];
          *it++ = _bits[*data-- % 16];
        }
      } else {
        const uint8_t *data = reinterpret_cast<const uint8_t *>(&elem);
        for (auto it = begin(); it < cend();) {
          *it++ = _bits[*data / 16];
          *it++ = _bits[*data++ % 16];
        }
      }
    }

    char *begin() {
      return _hex;
    }

    char *end() {
      return _hex + sizeof(elem_type) * 2;
    }

    const char *begin() const {
      return _hex;
    }

    const char *end() const {
      return _hex + sizeof(elem_type) * 2;
    }

    const char *cbegin() const {
      return _hex;
    }

    const char *cend() const {
      return _hex + sizeof(elem_type) * 2;
    }

    std::string to_string() const {
      return {begin(), end()};
    }

    std::string_view to_string_view() const {
      return {begin(), sizeof(elem_type) * 2};
    }
  };

  template<typename T>
  std::string log_hex(const T &value) {
    return "0x" + Hex<T>(value, false).to_string();
  }

  template<class X, class Y>
  class Either: public std::variant<std::monostate, X, Y> {
  public:
    using std::variant<std::monostate, X, Y>::variant;

    constexpr bool has_left() const {
      return std::holds_alternative<X>(*this);
    }

    constexpr bool has_right() const {
      return std::holds_alternative<Y>(*this);
    }

    X &left() {
      return std::get<X>(*this);
    }

    Y &right() {
      return std::get<Y>(*this);
    }

    const X &left() const {
      return std::get<X>(*this);
    }

    const Y &right() const {
      return std::get<Y>(*this);
    }
  };
}  // namespace util
