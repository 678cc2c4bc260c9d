#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dv {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0;
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
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kLockTimeout = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kParentMissing = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kNodeMissing = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kMarkerCorrupt = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kOpenFailed = Make(ErrorDomain::IO, 0x05);
      inline constexpr int kReadFailed = Make(ErrorDomain::IO, 0x06);
      inline constexpr int kWriteFailed = Make(ErrorDomain::IO, 0x07);
      inline constexpr int kMoveFailed = Make(ErrorDomain::IO, 0x08);
      inline constexpr int kDeleteFailed = Make(ErrorDomain::IO, 0x09);
      inline constexpr int kCreateFailed = Make(ErrorDomain::IO, 0x0A);
      inline constexpr int kListFailed = Make(ErrorDomain::IO, 0x0B);
    } // namespace io

    namespace validation {
      inline constexpr int kHierarchyViolation = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kUnsupportedCrossKindMove = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kInvalidSegmentName = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kRootImmutable = Make(ErrorDomain::Validation, 0x04);
    } // namespace validation

    namespace state {
      inline constexpr int kTargetExists = Make(ErrorDomain::State, 0x01);
    } // namespace state

    namespace crypto {
      inline constexpr int kFilenameAuthenticationFailed = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kMalformedCiphertext = Make(ErrorDomain::Crypto, 0x02);
      inline constexpr int kRandomUnavailable = Make(ErrorDomain::Crypto, 0x03);
    } // namespace crypto

    namespace dependency {
      inline constexpr int kPrimitiveUnavailable = Make(ErrorDomain::Dependency, 0x01);
    } // namespace dependency

    namespace config {
      inline constexpr int kInvalidOption = Make(ErrorDomain::Config, 0x01);
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

  // Failure classes callers of the folder layer are expected to branch on.
  enum class FailureKind : std::uint8_t {
    kLockTimeout,
    kParentMissing,
    kHierarchyViolation,
    kUnsupportedCrossKindMove,
    kPrimitiveUnavailable,
    kOther
  };

  inline FailureKind KindOf(const Error& err) noexcept {
    switch (err.code) {
    case errors::io::kLockTimeout:
      return FailureKind::kLockTimeout;
    case errors::io::kParentMissing:
      return FailureKind::kParentMissing;
    case errors::validation::kHierarchyViolation:
      return FailureKind::kHierarchyViolation;
    case errors::validation::kUnsupportedCrossKindMove:
      return FailureKind::kUnsupportedCrossKindMove;
    case errors::dependency::kPrimitiveUnavailable:
      return FailureKind::kPrimitiveUnavailable;
    default:
      return FailureKind::kOther;
    }
  }

  struct AuthenticationFailureError : public std::runtime_error {
    explicit AuthenticationFailureError(const std::string& msg) : std::runtime_error(msg) {}
  };
} // namespace dv
