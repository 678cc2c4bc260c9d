#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace dv::security {

class Zeroizer {
public:
  static void Wipe(std::span<uint8_t> data) noexcept;

  template <typename T>
  static void WipeVector(std::vector<T>& vec) noexcept {
    if (vec.empty()) {
      return;
    }
    const std::size_t bytes = vec.size() * sizeof(T);
    auto byte_span = std::span<uint8_t>(reinterpret_cast<uint8_t*>(vec.data()), bytes);
    Wipe(byte_span);
  }

  template <typename T>
  class ScopeWiper {
  public:
    explicit ScopeWiper(std::span<T> span) noexcept : span_(span) {}

    ScopeWiper(const ScopeWiper&) = delete;
    ScopeWiper& operator=(const ScopeWiper&) = delete;

    ~ScopeWiper() noexcept {
      if (span_.empty()) {
        return;
      }
      auto byte_span = std::span<uint8_t>(reinterpret_cast<uint8_t*>(span_.data()), span_.size_bytes());
      Zeroizer::Wipe(byte_span);
    }

  private:
    std::span<T> span_;
  };
};

} // namespace dv::security
