// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "dns_types.hpp"
#include "dns_wire.hpp"
#include "dnsfwd/crypto/secure_rng.hpp"
#include <cstdint>
#include <vector>

namespace dnsfwd
{
namespace network
{
namespace dns
{

/// \brief The fixed 12-byte DNS header (RFC 1035 section 4.1.1)
///
///   ID(16) | QR(1) OPCODE(4) AA(1) TC(1) RD(1) | RA(1) Z(3) RCODE(4) |
///   QDCOUNT(16) | ANCOUNT(16) | NSCOUNT(16) | ARCOUNT(16)
struct DnsHeader
{
  std::uint16_t id;      ///< Query identifier, echoed in the reply
  bool qr;               ///< Query/Response flag
  DnsOpcode opcode;      ///< Operation code
  bool aa;               ///< Authoritative answer
  bool tc;               ///< Truncation flag
  bool rd;               ///< Recursion desired
  bool ra;               ///< Recursion available
  std::uint8_t z;        ///< Reserved, 3 bits
  DnsResponseCode rcode; ///< Response code
  std::uint16_t qdcount; ///< Question count
  std::uint16_t ancount; ///< Answer count
  std::uint16_t nscount; ///< Authority count
  std::uint16_t arcount; ///< Additional count

  DnsHeader()
    : id(0), qr(false), opcode(DnsOpcode::Query), aa(false), tc(false), rd(false), ra(false),
      z(0), rcode(DnsResponseCode::NOERROR), qdcount(0), ancount(0), nscount(0), arcount(0)
  {
  }

  /// \brief Header for a fresh outbound query: random id, standard query,
  /// recursion not requested, only the question count set.
  static DnsHeader newQuery(std::uint16_t questionCount)
  {
    DnsHeader header;
    header.id = generateId();
    header.qdcount = questionCount;
    return header;
  }

  static std::uint16_t generateId() { return crypto::SecureRng::randomUint16(); }

  /// \brief Decode the header from the first 12 bytes of a message.
  /// Opcode and response code values outside the named set are kept as-is.
  /// \throws DnsParseException if fewer than 12 bytes are available
  static DnsHeader decode(const std::uint8_t *data, std::size_t size)
  {
    if (size < constants::DNS_HEADER_SIZE)
    {
      throw DnsParseException("Message too short for DNS header: " + std::to_string(size) +
                              " bytes, minimum " + std::to_string(constants::DNS_HEADER_SIZE) +
                              " required");
    }

    DnsHeader header;
    header.id = wire::readUint16(data, 0);

    std::uint16_t flags = wire::readUint16(data, 2);
    header.qr = (flags & 0x8000) != 0;
    header.opcode = static_cast<DnsOpcode>((flags >> 11) & 0x0F);
    header.aa = (flags & 0x0400) != 0;
    header.tc = (flags & 0x0200) != 0;
    header.rd = (flags & 0x0100) != 0;
    header.ra = (flags & 0x0080) != 0;
    header.z = static_cast<std::uint8_t>((flags >> 4) & 0x07);
    header.rcode = static_cast<DnsResponseCode>(flags & 0x0F);

    header.qdcount = wire::readUint16(data, 4);
    header.ancount = wire::readUint16(data, 6);
    header.nscount = wire::readUint16(data, 8);
    header.arcount = wire::readUint16(data, 10);
    return header;
  }

  static DnsHeader decode(const std::vector<std::uint8_t> &data)
  {
    return decode(data.data(), data.size());
  }

  /// \brief Append the 12 header bytes to \p buffer.
  /// \throws DnsEncodeException if opcode, rcode or z overflow their fields
  void encode(std::vector<std::uint8_t> &buffer) const
  {
    auto rawOpcode = static_cast<std::uint8_t>(opcode);
    auto rawRcode = static_cast<std::uint8_t>(rcode);
    if (rawOpcode > 0x0F)
    {
      throw DnsEncodeException("Opcode " + std::to_string(rawOpcode) + " does not fit in 4 bits");
    }
    if (rawRcode > 0x0F)
    {
      throw DnsEncodeException("Response code " + std::to_string(rawRcode) +
                               " does not fit in 4 bits");
    }
    if (z > 0x07)
    {
      throw DnsEncodeException("Reserved field " + std::to_string(z) + " does not fit in 3 bits");
    }

    std::uint16_t flags = 0;
    flags |= qr ? 0x8000 : 0;
    flags |= static_cast<std::uint16_t>(rawOpcode << 11);
    flags |= aa ? 0x0400 : 0;
    flags |= tc ? 0x0200 : 0;
    flags |= rd ? 0x0100 : 0;
    flags |= ra ? 0x0080 : 0;
    flags |= static_cast<std::uint16_t>(z << 4);
    flags |= rawRcode;

    wire::writeUint16(buffer, id);
    wire::writeUint16(buffer, flags);
    wire::writeUint16(buffer, qdcount);
    wire::writeUint16(buffer, ancount);
    wire::writeUint16(buffer, nscount);
    wire::writeUint16(buffer, arcount);
  }

  std::vector<std::uint8_t> encode() const
  {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(constants::DNS_HEADER_SIZE);
    encode(buffer);
    return buffer;
  }

  bool operator==(const DnsHeader &other) const
  {
    return id == other.id && qr == other.qr && opcode == other.opcode && aa == other.aa &&
           tc == other.tc && rd == other.rd && ra == other.ra && z == other.z &&
           rcode == other.rcode && qdcount == other.qdcount && ancount == other.ancount &&
           nscount == other.nscount && arcount == other.arcount;
  }

  bool operator!=(const DnsHeader &other) const { return !(*this == other); }
};

} // namespace dns
} // namespace network
} // namespace dnsfwd
