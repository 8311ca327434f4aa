#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tw {
  enum class ErrorDomain : std::uint16_t {
    IO = 0x02,
    Validation = 0x04,
    Config = 0x05,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable across
  // releases.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    // Helper to construct reserved error codes.
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kNotFound = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kNotADirectory = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kPermissionDenied = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kDirectoryReadFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kLogOpenFailed = Make(ErrorDomain::IO, 0x05);
    } // namespace io

    namespace validation {
      inline constexpr int kEmptyPath = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kNoChildren = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kNullNode = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kValueKindMismatch = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kSeekOutOfRange = Make(ErrorDomain::Validation, 0x05);
      inline constexpr int kInvalidPrefixPart = Make(ErrorDomain::Validation, 0x06);
      inline constexpr int kInvalidPattern = Make(ErrorDomain::Validation, 0x07);
    } // namespace validation

    namespace state {
      inline constexpr int kChildrenConsumed = Make(ErrorDomain::State, 0x01);
    } // namespace state

    namespace config {
      inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x01);
    } // namespace config

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };
} // namespace tw
