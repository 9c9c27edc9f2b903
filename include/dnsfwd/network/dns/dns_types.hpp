// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace dnsfwd
{
namespace network
{
namespace dns
{

/// \brief DNS message opcodes (RFC 1035)
///
/// Decoding keeps whatever 4-bit value arrived on the wire; values outside
/// the named set are reported by isKnown() and re-encoded unchanged.
enum class DnsOpcode : std::uint8_t
{
  Query = 0,  ///< Standard query
  IQuery = 1, ///< Inverse query
  Status = 2  ///< Server status request
};

/// \brief DNS response codes (RFC 1035)
enum class DnsResponseCode : std::uint8_t
{
  NOERROR = 0,  ///< No error
  FORMERR = 1,  ///< Format error
  SERVFAIL = 2, ///< Server failure
  NXDOMAIN = 3, ///< Name does not exist
  NOTIMP = 4,   ///< Not implemented
  REFUSED = 5   ///< Query refused
};

/// \brief DNS record types (RFC 1035 section 3.2.2)
enum class DnsType : std::uint16_t
{
  A = 1,       ///< Host address
  NS = 2,      ///< Authoritative name server
  MD = 3,      ///< Mail destination (obsolete)
  MF = 4,      ///< Mail forwarder (obsolete)
  CNAME = 5,   ///< Canonical name for an alias
  SOA = 6,     ///< Start of a zone of authority
  MB = 7,      ///< Mailbox domain name
  MG = 8,      ///< Mail group member
  MR = 9,      ///< Mail rename domain name
  NULLRR = 10, ///< Null RR
  WKS = 11,    ///< Well known service description
  PTR = 12,    ///< Domain name pointer
  HINFO = 13,  ///< Host information
  MINFO = 14,  ///< Mailbox or mail list information
  MX = 15,     ///< Mail exchange
  TXT = 16     ///< Text strings
};

/// \brief DNS record class (RFC 1035)
enum class DnsClass : std::uint16_t
{
  IN = 1, ///< Internet class
  CS = 2, ///< CSNET class (obsolete)
  CH = 3, ///< CHAOS class
  HS = 4  ///< Hesiod class
};

inline bool isKnown(DnsOpcode opcode) { return static_cast<std::uint8_t>(opcode) <= 2; }

inline bool isKnown(DnsResponseCode rcode) { return static_cast<std::uint8_t>(rcode) <= 5; }

inline bool isKnown(DnsType type)
{
  auto raw = static_cast<std::uint16_t>(type);
  return raw >= 1 && raw <= 16;
}

inline bool isKnown(DnsClass cls)
{
  auto raw = static_cast<std::uint16_t>(cls);
  return raw >= 1 && raw <= 4;
}

inline std::string toString(DnsOpcode opcode)
{
  switch (opcode)
  {
    case DnsOpcode::Query:
      return "QUERY";
    case DnsOpcode::IQuery:
      return "IQUERY";
    case DnsOpcode::Status:
      return "STATUS";
    default:
      return "UNKNOWN(" + std::to_string(static_cast<unsigned>(opcode)) + ")";
  }
}

inline std::string toString(DnsResponseCode rcode)
{
  switch (rcode)
  {
    case DnsResponseCode::NOERROR:
      return "NOERROR";
    case DnsResponseCode::FORMERR:
      return "FORMERR";
    case DnsResponseCode::SERVFAIL:
      return "SERVFAIL";
    case DnsResponseCode::NXDOMAIN:
      return "NXDOMAIN";
    case DnsResponseCode::NOTIMP:
      return "NOTIMP";
    case DnsResponseCode::REFUSED:
      return "REFUSED";
    default:
      return "UNKNOWN(" + std::to_string(static_cast<unsigned>(rcode)) + ")";
  }
}

inline std::string toString(DnsType type)
{
  static const char *const names[] = {"A",  "NS", "MD",   "MF",  "CNAME", "SOA",
                                      "MB", "MG", "MR",   "NULL", "WKS",  "PTR",
                                      "HINFO", "MINFO", "MX", "TXT"};
  if (isKnown(type))
  {
    return names[static_cast<std::uint16_t>(type) - 1];
  }
  return "UNKNOWN(" + std::to_string(static_cast<unsigned>(type)) + ")";
}

inline std::string toString(DnsClass cls)
{
  switch (cls)
  {
    case DnsClass::IN:
      return "IN";
    case DnsClass::CS:
      return "CS";
    case DnsClass::CH:
      return "CH";
    case DnsClass::HS:
      return "HS";
    default:
      return "UNKNOWN(" + std::to_string(static_cast<unsigned>(cls)) + ")";
  }
}

/// \brief Malformed wire data: truncated fields, oversized labels, bad
/// compression pointers.
class DnsParseException : public std::runtime_error
{
public:
  explicit DnsParseException(const std::string &message)
      : std::runtime_error("DNS Parse Error: " + message)
  {
  }
};

/// \brief Well-formed input that this codec has no implementation for, such as
/// RDATA of a type other than A or encoding a compression pointer.
class DnsUnsupportedException : public std::runtime_error
{
public:
  explicit DnsUnsupportedException(const std::string &message)
      : std::runtime_error("DNS Unsupported: " + message)
  {
  }
};

/// \brief An in-memory value that cannot be represented on the wire.
class DnsEncodeException : public std::runtime_error
{
public:
  explicit DnsEncodeException(const std::string &message)
      : std::runtime_error("DNS Encode Error: " + message)
  {
  }
};

/// \brief DNS protocol constants
namespace constants
{
  constexpr std::uint16_t DNS_PORT = 53;
  constexpr std::size_t DNS_HEADER_SIZE = 12;
  constexpr std::size_t DNS_MAX_UDP_SIZE = 512;
  constexpr std::size_t DNS_MAX_LABEL_SIZE = 63;
  constexpr std::size_t DNS_MAX_NAME_SIZE = 255;
  constexpr std::size_t DNS_POINTER_SIZE = 2;
  constexpr std::size_t DNS_QUESTION_FIXED_SIZE = 4;
  constexpr std::size_t DNS_RECORD_FIXED_SIZE = 10;
  constexpr std::uint8_t DNS_COMPRESSION_MASK = 0xC0;
  constexpr std::uint16_t DNS_COMPRESSION_POINTER_MASK = 0x3FFF;
} // namespace constants

} // namespace dns
} // namespace network
} // namespace dnsfwd
