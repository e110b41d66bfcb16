#pragma once

namespace netstatus::util {

// Locale-independent ASCII lowercase
constexpr unsigned char ascii_lower(unsigned char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<unsigned char>(c + ('a' - 'A')) : c;
}

} // namespace netstatus::util
