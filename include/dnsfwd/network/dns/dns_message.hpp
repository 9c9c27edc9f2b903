// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "dns_header.hpp"
#include "dns_name.hpp"
#include "dns_records.hpp"
#include "dns_types.hpp"
#include <cstdint>
#include <limits>
#include <unordered_set>
#include <vector>

namespace dnsfwd
{
namespace network
{
namespace dns
{

/// \brief A complete DNS message: header plus the four record sections.
///
/// Section counts in the header drive parsing. When serializing, the counts
/// are taken from the section sizes instead, so a message can never be
/// written with counts that disagree with its contents.
class DnsMessage
{
public:
  DnsHeader header;
  std::vector<DnsQuestion> questions;
  std::vector<DnsResourceRecord> answers;
  std::vector<DnsResourceRecord> authority;
  std::vector<DnsResourceRecord> additional;

  /// \brief Parse a DNS message from binary data
  /// \throws DnsParseException if the buffer is malformed or ends before every
  ///         counted entry has been read
  /// \throws DnsUnsupportedException if a record carries RDATA without a codec
  static DnsMessage parse(const std::uint8_t *data, std::size_t size);

  static DnsMessage parse(const std::vector<std::uint8_t> &data)
  {
    return parse(data.data(), data.size());
  }

  /// \brief Outbound query with a fresh header and empty record sections.
  static DnsMessage newQuery(std::vector<DnsQuestion> questions);

  /// \brief Reply to \p query carrying the given questions and answers.
  ///
  /// The id and opcode are copied from the query. The response code is
  /// NOERROR for a standard query and NOTIMP for anything else. AA, TC, RD and
  /// RA are cleared.
  static DnsMessage newReply(const DnsMessage &query, std::vector<DnsQuestion> questions,
                             std::vector<DnsResourceRecord> answers);

  /// \brief Header-only reply for a query whose body could not be used.
  static DnsMessage newErrorReply(const DnsHeader &queryHeader, DnsResponseCode rcode);

  /// \brief Write header, questions, answers, authority and additional
  /// records in that order.
  /// \throws DnsUnsupportedException if any name still holds a pointer
  /// \throws DnsEncodeException for values that do not fit the wire format
  void serialize(std::vector<std::uint8_t> &buffer) const;

  std::vector<std::uint8_t> serialize() const
  {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(constants::DNS_MAX_UDP_SIZE);
    serialize(buffer);
    return buffer;
  }

  /// \brief Materialize the name that starts at message offset \p offset.
  ///
  /// Walks the sections in wire order, summing each entry's on-wire length,
  /// until the entry whose name covers \p offset is found. Pointers met along
  /// the way are followed recursively.
  /// \throws DnsParseException if the offset lies in the header, past the last
  ///         name, off a label boundary, or the pointers form a loop
  DnsName resolveLabels(std::uint16_t offset) const
  {
    std::unordered_set<std::uint16_t> visitedPointers;
    return resolveLabels(offset, visitedPointers);
  }

  /// \brief Copy of \p name with its trailing pointer (if any) replaced by the
  /// labels it refers to. \p name must come from this message.
  DnsName decompress(const DnsName &name) const;

  /// \brief Copy of \p question with a decompressed name.
  DnsQuestion decompress(const DnsQuestion &question) const
  {
    return DnsQuestion(decompress(question.name), question.qtype, question.qclass);
  }

  /// \brief Copy of \p record with a decompressed owner name.
  DnsResourceRecord decompress(const DnsResourceRecord &record) const
  {
    DnsResourceRecord copy = record;
    copy.name = decompress(record.name);
    return copy;
  }

private:
  DnsName resolveLabels(std::uint16_t offset,
                        std::unordered_set<std::uint16_t> &visitedPointers) const;

  DnsName locateLabels(std::uint16_t offset) const;

  static std::uint16_t sectionCount(std::size_t size, const char *section);
};

// ==================== Implementation ====================

inline DnsMessage DnsMessage::parse(const std::uint8_t *data, std::size_t size)
{
  DnsMessage message;
  message.header = DnsHeader::decode(data, size);
  std::size_t offset = constants::DNS_HEADER_SIZE;

  message.questions.reserve(message.header.qdcount);
  for (std::uint16_t i = 0; i < message.header.qdcount; ++i)
  {
    DnsQuestion question;
    offset = DnsQuestion::decode(data, offset, size, question);
    message.questions.push_back(std::move(question));
  }

  auto parseSection = [&](std::uint16_t count, std::vector<DnsResourceRecord> &section)
  {
    section.reserve(count);
    for (std::uint16_t i = 0; i < count; ++i)
    {
      DnsResourceRecord rr;
      offset = DnsResourceRecord::decode(data, offset, size, rr);
      section.push_back(std::move(rr));
    }
  };

  parseSection(message.header.ancount, message.answers);
  parseSection(message.header.nscount, message.authority);
  parseSection(message.header.arcount, message.additional);

  return message;
}

inline DnsMessage DnsMessage::newQuery(std::vector<DnsQuestion> questions)
{
  DnsMessage message;
  message.header = DnsHeader::newQuery(sectionCount(questions.size(), "question"));
  message.questions = std::move(questions);
  return message;
}

inline DnsMessage DnsMessage::newReply(const DnsMessage &query,
                                       std::vector<DnsQuestion> questions,
                                       std::vector<DnsResourceRecord> answers)
{
  DnsMessage reply;
  reply.header.id = query.header.id;
  reply.header.qr = true;
  reply.header.opcode = query.header.opcode;
  reply.header.aa = false;
  reply.header.tc = false;
  reply.header.rd = false;
  reply.header.ra = false;
  reply.header.z = 0;
  reply.header.rcode = query.header.opcode == DnsOpcode::Query ? DnsResponseCode::NOERROR
                                                               : DnsResponseCode::NOTIMP;
  reply.header.qdcount = sectionCount(questions.size(), "question");
  reply.header.ancount = sectionCount(answers.size(), "answer");
  reply.questions = std::move(questions);
  reply.answers = std::move(answers);
  return reply;
}

inline DnsMessage DnsMessage::newErrorReply(const DnsHeader &queryHeader, DnsResponseCode rcode)
{
  DnsMessage reply;
  reply.header.id = queryHeader.id;
  reply.header.qr = true;
  reply.header.opcode = queryHeader.opcode;
  reply.header.rcode = rcode;
  return reply;
}

inline void DnsMessage::serialize(std::vector<std::uint8_t> &buffer) const
{
  DnsHeader wireHeader = header;
  wireHeader.qdcount = sectionCount(questions.size(), "question");
  wireHeader.ancount = sectionCount(answers.size(), "answer");
  wireHeader.nscount = sectionCount(authority.size(), "authority");
  wireHeader.arcount = sectionCount(additional.size(), "additional");
  wireHeader.encode(buffer);

  for (const auto &question : questions)
  {
    question.encode(buffer);
  }
  for (const auto &rr : answers)
  {
    rr.encode(buffer);
  }
  for (const auto &rr : authority)
  {
    rr.encode(buffer);
  }
  for (const auto &rr : additional)
  {
    rr.encode(buffer);
  }
}

inline DnsName DnsMessage::decompress(const DnsName &name) const
{
  if (!name.isCompressed())
  {
    return name;
  }

  std::vector<DnsLabel> labels(name.labels().begin(), name.labels().end() - 1);
  DnsName target = resolveLabels(name.pointerOffset());
  labels.insert(labels.end(), target.labels().begin(), target.labels().end());

  DnsName result(std::move(labels));
  if (result.length() > constants::DNS_MAX_NAME_SIZE)
  {
    throw DnsParseException("Decompressed name too long: " + std::to_string(result.length()) +
                            " (max " + std::to_string(constants::DNS_MAX_NAME_SIZE) + ")");
  }
  return result;
}

inline DnsName DnsMessage::resolveLabels(std::uint16_t offset,
                                         std::unordered_set<std::uint16_t> &visitedPointers) const
{
  if (offset < constants::DNS_HEADER_SIZE)
  {
    throw DnsParseException("Label offset " + std::to_string(offset) + " is inside the header");
  }
  if (!visitedPointers.insert(offset).second)
  {
    throw DnsParseException("Compression pointer loop detected at offset: " +
                            std::to_string(offset));
  }

  DnsName suffix = locateLabels(offset);
  if (!suffix.isCompressed())
  {
    return suffix;
  }

  std::vector<DnsLabel> labels(suffix.labels().begin(), suffix.labels().end() - 1);
  DnsName rest = resolveLabels(suffix.pointerOffset(), visitedPointers);
  labels.insert(labels.end(), rest.labels().begin(), rest.labels().end());
  return DnsName(std::move(labels));
}

inline DnsName DnsMessage::locateLabels(std::uint16_t offset) const
{
  std::size_t entryStart = constants::DNS_HEADER_SIZE;

  for (const auto &question : questions)
  {
    std::size_t entryEnd = entryStart + question.length();
    if (offset < entryEnd)
    {
      return question.name.suffixAt(offset - entryStart);
    }
    entryStart = entryEnd;
  }

  for (const auto *section : {&answers, &authority, &additional})
  {
    for (const auto &rr : *section)
    {
      std::size_t entryEnd = entryStart + rr.length();
      if (offset < entryEnd)
      {
        return rr.name.suffixAt(offset - entryStart);
      }
      entryStart = entryEnd;
    }
  }

  throw DnsParseException("Label offset " + std::to_string(offset) +
                          " is past the last decoded name");
}

inline std::uint16_t DnsMessage::sectionCount(std::size_t size, const char *section)
{
  if (size > std::numeric_limits<std::uint16_t>::max())
  {
    throw DnsEncodeException(std::string("Too many ") + section + " entries: " +
                             std::to_string(size));
  }
  return static_cast<std::uint16_t>(size);
}

} // namespace dns
} // namespace network
} // namespace dnsfwd
