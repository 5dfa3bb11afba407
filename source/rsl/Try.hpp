#pragma once

#include <type_traits>
#include <utility>

#include <rsl/Expected.hpp>

// clang-format off
//
// ```cpp
//    std::expected<int, Err> GetInt();
//    std::expected<int, Err> Foo() {
//       return TRY(GetInt()) + 5;
//    }
// ```
//
// In particular:
// - Move-only types work
// - Copy-only types work
// - Result<void> types work
// - The error type is forwarded as-is, so a function returning
//   std::expected<T, E> may only TRY expressions whose error converts to E.
//
#if (defined(__clang__) || defined(__GNUC__)) && defined(__cpp_lib_remove_cvref) && __cpp_lib_remove_cvref >= 201711L
#define HAS_RUST_TRY
template <typename T> auto MyMove(T&& t) {
  if constexpr (!std::is_void_v<typename std::remove_cvref_t<T>::value_type>) {
    return std::move(*t);
  }
}
#define TRY(...)                                                               \
  ({                                                                           \
    auto&& y = (__VA_ARGS__);                                                  \
    static_assert(!std::is_lvalue_reference_v<decltype(MyMove(y))>);           \
    if (!y) [[unlikely]] {                                                     \
      return RSL_UNEXPECTED(y.error());                                        \
    }                                                                          \
    MyMove(y);                                                                 \
  })
#else
#error "TRY requires GNU statement expressions"
#endif
// clang-format on
