// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

/// \file dnsfwd_test_dns_forwarder.cpp
/// \brief Per-question forwarding against a scripted upstream

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "dnsfwd/network/dns/dns_forwarder.hpp"
#include "test_helpers.hpp"

using namespace dnsfwd::network::dns;
using dnsfwd::test::answerWithPointers;
using dnsfwd::test::Bytes;
using dnsfwd::test::ScriptedUpstream;
using dnsfwd::test::WireBuilder;

namespace
{
/// Inbound query with two questions, the second compressed against the first.
Bytes twoQuestionQuery(std::uint16_t flags = dnsfwd::test::QUERY_RD)
{
  return WireBuilder()
    .header(0x2222, flags, 2, 0)
    .name({"codecrafters", "io"})
    .questionTail()
    .labelsOnly({"abc"})
    .pointer(12)
    .questionTail()
    .build();
}
} // namespace

TEST_CASE("Forwarder sends one upstream query per question", "[dns][forwarder]")
{
  auto upstream = std::make_shared<ScriptedUpstream>();
  upstream->push([](const DnsMessage &q) { return answerWithPointers(q, {{1, 1, 1, 1}}); });
  upstream->push([](const DnsMessage &q)
                 { return answerWithPointers(q, {{2, 2, 2, 2}, {3, 3, 3, 3}}); });

  DnsForwarder forwarder(upstream);
  DnsMessage query = DnsMessage::parse(twoQuestionQuery());
  std::vector<DnsResourceRecord> answers = forwarder.forward(query);

  REQUIRE(upstream->sent.size() == 2);

  SECTION("Each upstream query carries one decompressed question")
  {
    DnsMessage first = DnsMessage::parse(upstream->sent[0]);
    DnsMessage second = DnsMessage::parse(upstream->sent[1]);

    REQUIRE(first.questions.size() == 1);
    REQUIRE(second.questions.size() == 1);
    CHECK(first.questions[0].name.toString() == "codecrafters.io");
    CHECK(second.questions[0].name.toString() == "abc.codecrafters.io");
    CHECK_FALSE(second.questions[0].name.isCompressed());
    CHECK_FALSE(first.header.qr);
    CHECK(first.header.opcode == DnsOpcode::Query);
  }

  SECTION("The client's recursion-desired bit is passed on")
  {
    CHECK(DnsMessage::parse(upstream->sent[0]).header.rd);
  }

  SECTION("Answers are decompressed against their own reply, in order")
  {
    REQUIRE(answers.size() == 3);
    CHECK(answers[0].name.toString() == "codecrafters.io");
    CHECK(answers[0].data.toString() == "1.1.1.1");
    CHECK(answers[1].name.toString() == "abc.codecrafters.io");
    CHECK(answers[1].data.toString() == "2.2.2.2");
    CHECK(answers[2].name.toString() == "abc.codecrafters.io");
    CHECK(answers[2].data.toString() == "3.3.3.3");
    for (const auto &rr : answers)
    {
      CHECK_FALSE(rr.name.isCompressed());
      CHECK(rr.ttl == 300);
    }
  }
}

TEST_CASE("Forwarder without recursion desired", "[dns][forwarder]")
{
  auto upstream = std::make_shared<ScriptedUpstream>();
  upstream->push([](const DnsMessage &q) { return answerWithPointers(q, {}); });
  upstream->push([](const DnsMessage &q) { return answerWithPointers(q, {}); });

  DnsForwarder forwarder(upstream);
  auto answers = forwarder.forward(DnsMessage::parse(twoQuestionQuery(0)));

  CHECK(answers.empty());
  CHECK_FALSE(DnsMessage::parse(upstream->sent[0]).header.rd);
}

TEST_CASE("Forwarder rejects bad upstream replies", "[dns][forwarder]")
{
  auto upstream = std::make_shared<ScriptedUpstream>();
  DnsForwarder forwarder(upstream);
  DnsMessage query = DnsMessage::parse(twoQuestionQuery());

  SECTION("Reply id does not match")
  {
    upstream->push(
      [](const DnsMessage &q)
      {
        Bytes reply = answerWithPointers(q, {{1, 1, 1, 1}});
        reply[1] ^= 0x01;
        return reply;
      });
    CHECK_THROWS_AS(forwarder.forward(query), DnsTransportException);
  }

  SECTION("Reply is not marked as a response")
  {
    upstream->push(
      [](const DnsMessage &q)
      {
        Bytes reply = answerWithPointers(q, {{1, 1, 1, 1}});
        reply[2] &= 0x7F;
        return reply;
      });
    CHECK_THROWS_AS(forwarder.forward(query), DnsTransportException);
  }

  SECTION("Malformed reply")
  {
    upstream->push([](const DnsMessage &) { return Bytes{0x00, 0x01, 0x80}; });
    CHECK_THROWS_AS(forwarder.forward(query), DnsParseException);
  }

  SECTION("Reply with record data that has no codec")
  {
    upstream->push(
      [](const DnsMessage &q)
      {
        Bytes qname;
        q.questions[0].name.encode(qname);
        return WireBuilder()
          .header(q.header.id, 0x8180, 1, 1)
          .raw(qname)
          .questionTail()
          .pointer(12)
          .recordTail(static_cast<std::uint16_t>(DnsType::CNAME), 1, 60, {0xC0, 0x0C})
          .build();
      });
    CHECK_THROWS_AS(forwarder.forward(query), DnsUnsupportedException);
  }

  SECTION("Transport failure stops the whole request")
  {
    upstream->push([](const DnsMessage &q) { return answerWithPointers(q, {{1, 1, 1, 1}}); });
    // second exchange finds an empty script
    CHECK_THROWS_AS(forwarder.forward(query), DnsTransportException);
    CHECK(upstream->sent.size() == 2);
  }
}

TEST_CASE("Forwarder requires an upstream", "[dns][forwarder]")
{
  CHECK_THROWS_AS(DnsForwarder(nullptr), std::invalid_argument);
}
