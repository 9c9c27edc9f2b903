// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <openssl/err.h>
#include <openssl/rand.h>

namespace dnsfwd
{
namespace crypto
{

/// \brief Random source backed by OpenSSL RAND_bytes().
///
/// Used for DNS packet identifiers, where an unpredictable id makes it harder
/// to match a spoofed reply to an outstanding upstream query.
class SecureRng
{
public:
  /// \brief Fill a buffer with random bytes.
  /// \throws std::runtime_error if RAND_bytes fails
  static void fill(std::uint8_t *dst, std::size_t len)
  {
    if (len == 0)
    {
      return;
    }
    if (RAND_bytes(dst, static_cast<int>(len)) != 1)
    {
      throw std::runtime_error("SecureRng: RAND_bytes failed: " + lastError());
    }
  }

  /// \brief Uniformly distributed 16-bit value.
  static std::uint16_t randomUint16()
  {
    std::array<std::uint8_t, 2> bytes{};
    fill(bytes.data(), bytes.size());
    return static_cast<std::uint16_t>((bytes[0] << 8) | bytes[1]);
  }

private:
  static std::string lastError()
  {
    unsigned long code = ERR_peek_last_error(); // NOLINT(google-runtime-int)
    if (code == 0UL)
    {
      return "no OpenSSL error available";
    }
    char buf[256] = {0};
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(buf);
  }
};

} // namespace crypto
} // namespace dnsfwd
