// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "dns_name.hpp"
#include "dns_types.hpp"
#include "dns_wire.hpp"
#include <arpa/inet.h>
#include <array>
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

/// \brief DNS question section entry
struct DnsQuestion
{
  DnsName name;   ///< Domain name, possibly ending in a compression pointer
  DnsType qtype;  ///< Query type
  DnsClass qclass; ///< Query class

  DnsQuestion(DnsName n = DnsName(), DnsType type = DnsType::A, DnsClass cls = DnsClass::IN)
    : name(std::move(n)), qtype(type), qclass(cls)
  {
  }

  /// \brief Decode QNAME, QTYPE and QCLASS at \p offset.
  /// \return Offset of the first byte after the question
  /// \throws DnsParseException on malformed input
  static std::size_t decode(const std::uint8_t *data, std::size_t offset, std::size_t size,
                            DnsQuestion &question)
  {
    offset = DnsName::decode(data, offset, size, question.name);

    wire::checkBounds(offset, constants::DNS_QUESTION_FIXED_SIZE, size);
    question.qtype = static_cast<DnsType>(wire::readUint16(data, offset));
    question.qclass = static_cast<DnsClass>(wire::readUint16(data, offset + 2));
    return offset + constants::DNS_QUESTION_FIXED_SIZE;
  }

  void encode(std::vector<std::uint8_t> &buffer) const
  {
    name.encode(buffer);
    wire::writeUint16(buffer, static_cast<std::uint16_t>(qtype));
    wire::writeUint16(buffer, static_cast<std::uint16_t>(qclass));
  }

  /// \brief On-wire size: name plus QTYPE and QCLASS.
  std::uint16_t length() const
  {
    return static_cast<std::uint16_t>(name.length() + constants::DNS_QUESTION_FIXED_SIZE);
  }

  bool operator==(const DnsQuestion &other) const
  {
    return name == other.name && qtype == other.qtype && qclass == other.qclass;
  }
};

/// \brief Type-specific RDATA. Only A records (a 4-byte IPv4 address) have a
/// codec; every other type is rejected as unsupported.
class DnsRecordData
{
public:
  DnsRecordData() : _type(DnsType::A), _address{} {}

  static DnsRecordData ipv4(const std::array<std::uint8_t, 4> &octets)
  {
    DnsRecordData data;
    data._address = octets;
    return data;
  }

  /// \throws DnsEncodeException if \p dotted is not an IPv4 address
  static DnsRecordData ipv4(const std::string &dotted)
  {
    in_addr addr{};
    if (::inet_pton(AF_INET, dotted.c_str(), &addr) != 1)
    {
      throw DnsEncodeException("Invalid IPv4 address: " + dotted);
    }
    std::array<std::uint8_t, 4> octets;
    std::memcpy(octets.data(), &addr.s_addr, octets.size());
    return ipv4(octets);
  }

  /// \brief Decode \p rdlength bytes of RDATA for a record of \p type.
  /// \throws DnsParseException if the bytes are missing or the length is wrong
  /// \throws DnsUnsupportedException for any type other than A
  static DnsRecordData decode(DnsType type, const std::uint8_t *data, std::size_t offset,
                              std::uint16_t rdlength, std::size_t size)
  {
    wire::checkBounds(offset, rdlength, size);
    if (type != DnsType::A)
    {
      throw DnsUnsupportedException("RDATA decoding for record type " + dns::toString(type) +
                                    " is not implemented");
    }
    if (rdlength != 4)
    {
      throw DnsParseException("A record RDLENGTH must be 4, got " + std::to_string(rdlength));
    }
    std::array<std::uint8_t, 4> octets;
    std::memcpy(octets.data(), data + offset, octets.size());
    return ipv4(octets);
  }

  /// \brief Append RDLENGTH followed by the RDATA bytes.
  void encode(std::vector<std::uint8_t> &buffer) const
  {
    wire::writeUint16(buffer, length());
    buffer.insert(buffer.end(), _address.begin(), _address.end());
  }

  DnsType type() const { return _type; }

  std::uint16_t length() const { return static_cast<std::uint16_t>(_address.size()); }

  const std::array<std::uint8_t, 4> &address() const { return _address; }

  std::string toString() const
  {
    char text[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, _address.data(), text, sizeof(text));
    return std::string(text);
  }

  bool operator==(const DnsRecordData &other) const
  {
    return _type == other._type && _address == other._address;
  }

private:
  DnsType _type;
  std::array<std::uint8_t, 4> _address;
};

/// \brief DNS resource record (answer, authority or additional section)
struct DnsResourceRecord
{
  DnsName name;       ///< Owner name
  DnsType type;       ///< Record type, always matches data.type()
  DnsClass cls;       ///< Record class
  std::uint32_t ttl;  ///< Seconds a receiver may cache the record
  DnsRecordData data; ///< Type-specific payload

  DnsResourceRecord() : type(DnsType::A), cls(DnsClass::IN), ttl(0) {}

  DnsResourceRecord(DnsName n, DnsClass c, std::uint32_t ttlValue, DnsRecordData rdata)
    : name(std::move(n)), type(rdata.type()), cls(c), ttl(ttlValue), data(std::move(rdata))
  {
  }

  /// \brief Convenience constructor for an A record.
  static DnsResourceRecord address(DnsName owner, const std::string &ip, std::uint32_t ttlValue,
                                   DnsClass c = DnsClass::IN)
  {
    return DnsResourceRecord(std::move(owner), c, ttlValue, DnsRecordData::ipv4(ip));
  }

  /// \brief Decode NAME, TYPE, CLASS, TTL, RDLENGTH and RDATA.
  /// \return Offset of the first byte after the record
  /// \throws DnsParseException on malformed input
  /// \throws DnsUnsupportedException for RDATA types without a codec
  static std::size_t decode(const std::uint8_t *data, std::size_t offset, std::size_t size,
                            DnsResourceRecord &rr)
  {
    offset = DnsName::decode(data, offset, size, rr.name);

    wire::checkBounds(offset, constants::DNS_RECORD_FIXED_SIZE, size);
    rr.type = static_cast<DnsType>(wire::readUint16(data, offset));
    rr.cls = static_cast<DnsClass>(wire::readUint16(data, offset + 2));
    rr.ttl = wire::readUint32(data, offset + 4);
    std::uint16_t rdlength = wire::readUint16(data, offset + 8);
    offset += constants::DNS_RECORD_FIXED_SIZE;

    rr.data = DnsRecordData::decode(rr.type, data, offset, rdlength, size);
    return offset + rdlength;
  }

  void encode(std::vector<std::uint8_t> &buffer) const
  {
    name.encode(buffer);
    wire::writeUint16(buffer, static_cast<std::uint16_t>(type));
    wire::writeUint16(buffer, static_cast<std::uint16_t>(cls));
    wire::writeUint32(buffer, ttl);
    data.encode(buffer);
  }

  std::uint16_t rdlength() const { return data.length(); }

  /// \brief On-wire size: name, fixed fields and RDATA.
  std::uint16_t length() const
  {
    return static_cast<std::uint16_t>(name.length() + constants::DNS_RECORD_FIXED_SIZE +
                                      rdlength());
  }

  bool operator==(const DnsResourceRecord &other) const
  {
    return name == other.name && type == other.type && cls == other.cls && ttl == other.ttl &&
           data == other.data;
  }
};

} // namespace dns
} // namespace network
} // namespace dnsfwd
