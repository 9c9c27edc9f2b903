// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "dns_types.hpp"
#include <arpa/inet.h>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace dnsfwd
{
namespace network
{
namespace dns
{
/// \brief Network byte order helpers shared by every DNS codec.
namespace wire
{

inline void writeUint8(std::vector<std::uint8_t> &buffer, std::uint8_t value)
{
  buffer.push_back(value);
}

inline void writeUint16(std::vector<std::uint8_t> &buffer, std::uint16_t value)
{
  std::uint16_t netValue = htons(value);
  const std::uint8_t *bytes = reinterpret_cast<const std::uint8_t *>(&netValue);
  buffer.insert(buffer.end(), bytes, bytes + 2);
}

inline void writeUint32(std::vector<std::uint8_t> &buffer, std::uint32_t value)
{
  std::uint32_t netValue = htonl(value);
  const std::uint8_t *bytes = reinterpret_cast<const std::uint8_t *>(&netValue);
  buffer.insert(buffer.end(), bytes, bytes + 4);
}

/// \brief Caller must have checked bounds.
inline std::uint16_t readUint16(const std::uint8_t *data, std::size_t offset)
{
  std::uint16_t netValue;
  std::memcpy(&netValue, data + offset, 2);
  return ntohs(netValue);
}

/// \brief Caller must have checked bounds.
inline std::uint32_t readUint32(const std::uint8_t *data, std::size_t offset)
{
  std::uint32_t netValue;
  std::memcpy(&netValue, data + offset, 4);
  return ntohl(netValue);
}

/// \throws DnsParseException if fewer than \p needed bytes remain at \p offset
inline void checkBounds(std::size_t offset, std::size_t needed, std::size_t total)
{
  if (offset > total || needed > total - offset)
  {
    throw DnsParseException("Insufficient data at offset " + std::to_string(offset) + ", needed " +
                            std::to_string(needed) + ", total " + std::to_string(total));
  }
}

/// \brief Strict UTF-8 check: no overlong forms, surrogates or code points
/// above U+10FFFF.
inline bool isValidUtf8(const std::uint8_t *data, std::size_t size)
{
  std::size_t i = 0;
  while (i < size)
  {
    std::uint8_t lead = data[i];
    if (lead < 0x80)
    {
      ++i;
      continue;
    }

    std::size_t extra;
    std::uint32_t codePoint;
    if ((lead & 0xE0) == 0xC0)
    {
      extra = 1;
      codePoint = lead & 0x1F;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
      extra = 2;
      codePoint = lead & 0x0F;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
      extra = 3;
      codePoint = lead & 0x07;
    }
    else
    {
      return false;
    }

    if (size - i <= extra)
    {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k)
    {
      std::uint8_t next = data[i + k];
      if ((next & 0xC0) != 0x80)
      {
        return false;
      }
      codePoint = (codePoint << 6) | (next & 0x3F);
    }

    static const std::uint32_t minimum[] = {0, 0x80, 0x800, 0x10000};
    if (codePoint < minimum[extra] || codePoint > 0x10FFFF ||
        (codePoint >= 0xD800 && codePoint <= 0xDFFF))
    {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

} // namespace wire
} // namespace dns
} // namespace network
} // namespace dnsfwd
