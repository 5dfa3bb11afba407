#pragma once

#include <core/common.h>
#include <magic_enum.hpp>

namespace libgx {

enum class ErrorKind {
  //! Structural violation in a container header or entry header
  InvalidHeader,
  //! A format code that does not resolve to a known pixel format
  InvalidFormat,
  //! A known code the codec has no implementation for
  UnsupportedFormat,
  //! Caller-supplied value out of range
  ArgumentError,
};

struct Error {
  ErrorKind kind = ErrorKind::InvalidHeader;
  std::string message;

  bool operator==(const Error&) const = default;
};

template <typename T> using GxResult = std::expected<T, Error>;

inline std::string_view ErrorKindName(ErrorKind kind) {
  return magic_enum::enum_name(kind);
}

inline std::unexpected<Error> MakeError(ErrorKind kind, std::string message) {
  return std::unexpected(Error{kind, std::move(message)});
}

//! Tags a string error from the stream layer with |kind| so it can be
//! propagated with TRY from a function returning GxResult.
template <typename T>
GxResult<T> WithKind(std::expected<T, std::string>&& r, ErrorKind kind) {
  if (!r) {
    return MakeError(kind, std::move(r.error()));
  }
  if constexpr (std::is_void_v<T>) {
    return {};
  } else {
    return std::move(*r);
  }
}

} // namespace libgx

// Same shape as EXPECT, but yields a libgx::Error of the given kind
#define GX_EXPECT(kind, expr, ...)                                             \
  if (!(expr)) [[unlikely]] {                                                  \
    return ::libgx::MakeError(                                                 \
        kind, fmt::format("[{}:{}] {} [Internal: {}]", __FILE_NAME__,          \
                          __LINE__, (0 __VA_OPT__(, ) __VA_ARGS__), #expr));   \
  }
