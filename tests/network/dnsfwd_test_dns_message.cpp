// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

/// \file dnsfwd_test_dns_message.cpp
/// \brief Message parsing, reply derivation, serialization and decompression

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "dnsfwd/network/dns/dns_message.hpp"
#include "test_helpers.hpp"

using namespace dnsfwd::network::dns;
using dnsfwd::test::Bytes;
using dnsfwd::test::WireBuilder;

namespace
{
/// One question for codecrafters.io and one answer whose owner is a pointer
/// back to the question name at offset 12.
Bytes questionAndPointerAnswer()
{
  return WireBuilder()
    .header(0x04D2, 0x8180, 1, 1)
    .name({"codecrafters", "io"})
    .questionTail()
    .pointer(12)
    .aRecordTail(60, {76, 76, 21, 21})
    .build();
}
} // namespace

TEST_CASE("DNS message parsing", "[dns][message]")
{
  SECTION("Counts drive how many entries are read")
  {
    DnsMessage m = DnsMessage::parse(questionAndPointerAnswer());

    CHECK(m.header.id == 1234);
    REQUIRE(m.questions.size() == 1);
    REQUIRE(m.answers.size() == 1);
    CHECK(m.authority.empty());
    CHECK(m.additional.empty());
    CHECK(m.questions[0].name.toString() == "codecrafters.io");
    CHECK(m.answers[0].name.isCompressed());
    CHECK(m.answers[0].data.toString() == "76.76.21.21");
  }

  SECTION("Authority and additional sections are read in order")
  {
    Bytes wire = WireBuilder()
                   .header(9, 0x8000, 0, 1, 1, 1)
                   .name({"a"})
                   .aRecordTail(1, {1, 1, 1, 1})
                   .name({"b"})
                   .aRecordTail(2, {2, 2, 2, 2})
                   .name({"c"})
                   .aRecordTail(3, {3, 3, 3, 3})
                   .build();
    DnsMessage m = DnsMessage::parse(wire);

    REQUIRE(m.answers.size() == 1);
    REQUIRE(m.authority.size() == 1);
    REQUIRE(m.additional.size() == 1);
    CHECK(m.answers[0].ttl == 1);
    CHECK(m.authority[0].name.toString() == "b");
    CHECK(m.additional[0].data.toString() == "3.3.3.3");
  }

  SECTION("Buffer exhausted before the counts are satisfied")
  {
    Bytes wire = WireBuilder().header(1, 0, 2, 0).name({"only", "one"}).questionTail().build();
    CHECK_THROWS_AS(DnsMessage::parse(wire), DnsParseException);
  }

  SECTION("Header too short")
  {
    CHECK_THROWS_AS(DnsMessage::parse(Bytes(11, 0)), DnsParseException);
  }

  SECTION("Unsupported record data in the answers")
  {
    Bytes wire = WireBuilder()
                   .header(1, 0x8000, 0, 1)
                   .name({"x"})
                   .recordTail(static_cast<std::uint16_t>(DnsType::NS), 1, 60, {0})
                   .build();
    CHECK_THROWS_AS(DnsMessage::parse(wire), DnsUnsupportedException);
  }

  SECTION("Trailing bytes after the counted entries are ignored")
  {
    Bytes wire = WireBuilder().header(1, 0, 0, 0).raw({0xDE, 0xAD}).build();
    CHECK_NOTHROW(DnsMessage::parse(wire));
  }
}

TEST_CASE("DNS message construction", "[dns][message]")
{
  SECTION("New query")
  {
    DnsMessage q = DnsMessage::newQuery({DnsQuestion(DnsName::fromString("codecrafters.io"))});
    CHECK_FALSE(q.header.qr);
    CHECK_FALSE(q.header.rd);
    CHECK(q.header.opcode == DnsOpcode::Query);
    CHECK(q.header.qdcount == 1);
    CHECK(q.header.ancount == 0);
    CHECK(q.answers.empty());
  }

  SECTION("Reply to a standard query")
  {
    Bytes wire = WireBuilder()
                   .header(1234, 0x0100, 1, 0)
                   .name({"codecrafters", "io"})
                   .questionTail()
                   .build();
    DnsMessage query = DnsMessage::parse(wire);

    DnsName owner = DnsName::fromString("codecrafters.io");
    DnsMessage reply = DnsMessage::newReply(
      query, query.questions,
      {DnsResourceRecord::address(owner, "1.2.3.4", 60), DnsResourceRecord::address(owner, "5.6.7.8", 60)});

    CHECK(reply.header.id == 1234);
    CHECK(reply.header.qr);
    CHECK(reply.header.opcode == DnsOpcode::Query);
    CHECK(reply.header.rcode == DnsResponseCode::NOERROR);
    CHECK(reply.header.qdcount == 1);
    CHECK(reply.header.ancount == 2);
    CHECK(reply.header.nscount == 0);
    CHECK(reply.header.arcount == 0);
    CHECK_FALSE(reply.header.rd);
    CHECK_FALSE(reply.header.ra);
    CHECK_FALSE(reply.header.aa);
    CHECK_FALSE(reply.header.tc);
  }

  SECTION("Reply to any other opcode is NOTIMP")
  {
    DnsMessage query;
    query.header.id = 77;
    query.header.opcode = DnsOpcode::Status;
    DnsMessage reply = DnsMessage::newReply(query, {}, {});
    CHECK(reply.header.opcode == DnsOpcode::Status);
    CHECK(reply.header.rcode == DnsResponseCode::NOTIMP);
  }

  SECTION("Error reply is header only")
  {
    DnsHeader queryHeader;
    queryHeader.id = 99;
    queryHeader.qdcount = 4;
    DnsMessage reply = DnsMessage::newErrorReply(queryHeader, DnsResponseCode::FORMERR);
    Bytes wire = reply.serialize();

    REQUIRE(wire.size() == 12);
    DnsHeader decoded = DnsHeader::decode(wire);
    CHECK(decoded.id == 99);
    CHECK(decoded.qr);
    CHECK(decoded.rcode == DnsResponseCode::FORMERR);
    CHECK(decoded.qdcount == 0);
  }
}

TEST_CASE("DNS message serialization", "[dns][message]")
{
  SECTION("Counts come from the sections, not the header fields")
  {
    DnsMessage m;
    m.header.id = 5;
    m.header.qdcount = 40;
    m.questions.push_back(DnsQuestion(DnsName::fromString("a.io")));
    m.additional.push_back(DnsResourceRecord::address(DnsName::fromString("a.io"), "9.9.9.9", 1));

    DnsMessage round = DnsMessage::parse(m.serialize());
    CHECK(round.header.qdcount == 1);
    CHECK(round.header.ancount == 0);
    CHECK(round.header.arcount == 1);
    CHECK(round.additional[0].data.toString() == "9.9.9.9");
  }

  SECTION("Serializing twice gives identical bytes")
  {
    DnsMessage q = DnsMessage::newQuery({DnsQuestion(DnsName::fromString("codecrafters.io"))});
    CHECK(q.serialize() == q.serialize());
  }

  SECTION("Uncompressed message round-trips byte for byte")
  {
    Bytes wire = WireBuilder()
                   .header(0x1111, 0x8580, 1, 1)
                   .name({"www", "example", "com"})
                   .questionTail()
                   .name({"www", "example", "com"})
                   .aRecordTail(300, {192, 0, 2, 1})
                   .build();
    CHECK(DnsMessage::parse(wire).serialize() == wire);
  }

  SECTION("A parsed message with pointers cannot be re-encoded as is")
  {
    DnsMessage m = DnsMessage::parse(questionAndPointerAnswer());
    CHECK_THROWS_AS(m.serialize(), DnsUnsupportedException);
  }
}

TEST_CASE("DNS label resolution", "[dns][message][compression]")
{
  SECTION("Answer pointer to the question name")
  {
    DnsMessage m = DnsMessage::parse(questionAndPointerAnswer());
    DnsName resolved = m.decompress(m.answers[0].name);

    REQUIRE(resolved.labels().size() == 2);
    CHECK(resolved.labels()[0].text() == "codecrafters");
    CHECK(resolved.labels()[1].text() == "io");
    CHECK_FALSE(resolved.isCompressed());
  }

  SECTION("Pointer to the middle of a name")
  {
    Bytes wire = WireBuilder()
                   .header(1, 0, 2, 0)
                   .name({"www", "codecrafters", "io"})
                   .questionTail()
                   .labelsOnly({"api"})
                   .pointer(16)
                   .questionTail()
                   .build();
    DnsMessage m = DnsMessage::parse(wire);
    CHECK(m.decompress(m.questions[1]).name.toString() == "api.codecrafters.io");
    CHECK(m.resolveLabels(12).toString() == "www.codecrafters.io");
  }

  SECTION("Chained pointers are followed")
  {
    // q1: codecrafters.io @12, q2: www + ptr(12) @33, answer: ptr(33)
    Bytes wire = WireBuilder()
                   .header(1, 0x8000, 2, 1)
                   .name({"codecrafters", "io"})
                   .questionTail()
                   .labelsOnly({"www"})
                   .pointer(12)
                   .questionTail()
                   .pointer(33)
                   .aRecordTail(5, {1, 2, 3, 4})
                   .build();
    DnsMessage m = DnsMessage::parse(wire);
    CHECK(m.decompress(m.answers[0]).name.toString() == "www.codecrafters.io");
  }

  SECTION("Pointer into an earlier answer")
  {
    // q @12 (example.com, 13 bytes), answer 1 @29 mail.example.com, answer 2 -> 29
    Bytes wire = WireBuilder()
                   .header(1, 0x8000, 1, 2)
                   .name({"example", "com"})
                   .questionTail()
                   .name({"mail", "example", "com"})
                   .aRecordTail(5, {1, 2, 3, 4})
                   .pointer(29)
                   .aRecordTail(5, {5, 6, 7, 8})
                   .build();
    DnsMessage m = DnsMessage::parse(wire);
    CHECK(m.decompress(m.answers[1].name).toString() == "mail.example.com");
  }

  SECTION("Offsets that are not on a label boundary are rejected")
  {
    DnsMessage m = DnsMessage::parse(questionAndPointerAnswer());
    CHECK_THROWS_AS(m.resolveLabels(14), DnsParseException);
    // QTYPE of the question
    CHECK_THROWS_AS(m.resolveLabels(29), DnsParseException);
  }

  SECTION("Offsets inside the header or past every name are rejected")
  {
    DnsMessage m = DnsMessage::parse(questionAndPointerAnswer());
    CHECK_THROWS_AS(m.resolveLabels(0), DnsParseException);
    CHECK_THROWS_AS(m.resolveLabels(11), DnsParseException);
    CHECK_THROWS_AS(m.resolveLabels(500), DnsParseException);
  }

  SECTION("Pointer to a terminator resolves to the root")
  {
    DnsMessage m = DnsMessage::parse(questionAndPointerAnswer());
    CHECK(m.resolveLabels(28).isRoot());
  }

  SECTION("Pointer loops are rejected")
  {
    // Built in memory: decoding never yields a loop on its own
    DnsMessage m;
    m.questions.push_back(DnsQuestion(DnsName({DnsLabel::pointer(18)})));
    m.questions.push_back(DnsQuestion(DnsName({DnsLabel::pointer(12)})));
    CHECK_THROWS_AS(m.decompress(m.questions[0].name), DnsParseException);
  }

  SECTION("Uncompressed names come back unchanged")
  {
    DnsMessage m = DnsMessage::parse(questionAndPointerAnswer());
    CHECK(m.decompress(m.questions[0]) == m.questions[0]);
  }

  SECTION("Decompressed reply can be serialized")
  {
    DnsMessage m = DnsMessage::parse(questionAndPointerAnswer());
    DnsMessage reply = DnsMessage::newReply(m, m.questions, {m.decompress(m.answers[0])});
    Bytes wire = reply.serialize();

    DnsMessage back = DnsMessage::parse(wire);
    CHECK(back.answers[0].name.toString() == "codecrafters.io");
    CHECK(back.answers[0].data.toString() == "76.76.21.21");
  }
}
