// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Shared test helpers for the dnsfwd test suite

#pragma once

#include "dnsfwd/core/logger.hpp"
#include "dnsfwd/network/dns/dns_message.hpp"
#include "dnsfwd/network/dns/dns_transport.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <initializer_list>
#include <string>
#include <vector>

namespace dnsfwd::test
{

using Bytes = std::vector<std::uint8_t>;

/// \brief Hand-assembled wire messages, so codec tests do not depend on the
/// encoder they are checking.
class WireBuilder
{
public:
  WireBuilder &header(std::uint16_t id, std::uint16_t flags, std::uint16_t qd, std::uint16_t an,
                      std::uint16_t ns = 0, std::uint16_t ar = 0)
  {
    u16(id);
    u16(flags);
    u16(qd);
    u16(an);
    u16(ns);
    u16(ar);
    return *this;
  }

  /// \brief Length-prefixed labels followed by the zero terminator.
  WireBuilder &name(std::initializer_list<std::string> labels)
  {
    labelsOnly(labels);
    _bytes.push_back(0);
    return *this;
  }

  /// \brief Length-prefixed labels without a terminator (for a following pointer).
  WireBuilder &labelsOnly(std::initializer_list<std::string> labels)
  {
    for (const auto &label : labels)
    {
      _bytes.push_back(static_cast<std::uint8_t>(label.size()));
      _bytes.insert(_bytes.end(), label.begin(), label.end());
    }
    return *this;
  }

  WireBuilder &pointer(std::uint16_t offset)
  {
    return u16(static_cast<std::uint16_t>(0xC000 | offset));
  }

  WireBuilder &questionTail(std::uint16_t type = 1, std::uint16_t cls = 1)
  {
    u16(type);
    return u16(cls);
  }

  WireBuilder &recordTail(std::uint16_t type, std::uint16_t cls, std::uint32_t ttl,
                          const Bytes &rdata)
  {
    u16(type);
    u16(cls);
    u32(ttl);
    u16(static_cast<std::uint16_t>(rdata.size()));
    _bytes.insert(_bytes.end(), rdata.begin(), rdata.end());
    return *this;
  }

  WireBuilder &aRecordTail(std::uint32_t ttl, const Bytes &ipv4) { return recordTail(1, 1, ttl, ipv4); }

  WireBuilder &raw(const Bytes &bytes)
  {
    _bytes.insert(_bytes.end(), bytes.begin(), bytes.end());
    return *this;
  }

  WireBuilder &u16(std::uint16_t value)
  {
    _bytes.push_back(static_cast<std::uint8_t>(value >> 8));
    _bytes.push_back(static_cast<std::uint8_t>(value & 0xFF));
    return *this;
  }

  WireBuilder &u32(std::uint32_t value)
  {
    u16(static_cast<std::uint16_t>(value >> 16));
    return u16(static_cast<std::uint16_t>(value & 0xFFFF));
  }

  std::size_t size() const { return _bytes.size(); }

  Bytes build() const { return _bytes; }

private:
  Bytes _bytes;
};

/// \brief Standard query flags with RD set.
constexpr std::uint16_t QUERY_RD = 0x0100;

/// \brief Upstream that answers from a script instead of a socket.
///
/// Each exchange pops the next responder; a responder gets the parsed
/// outbound query and returns the raw reply bytes (or throws).
class ScriptedUpstream : public network::dns::DnsUpstream
{
public:
  using Responder = std::function<Bytes(const network::dns::DnsMessage &query)>;

  void push(Responder responder) { _script.push_back(std::move(responder)); }

  Bytes exchange(const Bytes &query) override
  {
    sent.push_back(query);
    if (_script.empty())
    {
      throw network::dns::DnsTransportException("script exhausted");
    }
    Responder next = std::move(_script.front());
    _script.pop_front();
    return next(network::dns::DnsMessage::parse(query));
  }

  std::string describe() const override { return "scripted"; }

  std::vector<Bytes> sent;

private:
  std::deque<Responder> _script;
};

/// \brief Reply to \p query answering its single question with one A record
/// per address. The answer names are pointers to the question name at 12.
inline Bytes answerWithPointers(const network::dns::DnsMessage &query,
                                const std::vector<Bytes> &addresses, std::uint32_t ttl = 300)
{
  const auto &question = query.questions.at(0);
  WireBuilder builder;
  builder.header(query.header.id, 0x8180, 1, static_cast<std::uint16_t>(addresses.size()));

  Bytes qname;
  question.name.encode(qname);
  builder.raw(qname).questionTail(static_cast<std::uint16_t>(question.qtype),
                                  static_cast<std::uint16_t>(question.qclass));
  for (const auto &address : addresses)
  {
    builder.pointer(12).aRecordTail(ttl, address);
  }
  return builder.build();
}

/// \brief Collects log output through the logger's external handler for the
/// lifetime of the object.
class LogCapture
{
public:
  struct Entry
  {
    core::Logger::Level level;
    std::string formatted;
    std::string raw;
  };

  explicit LogCapture(core::Logger::Level level = core::Logger::Level::Trace)
  {
    core::Logger::setLevel(level);
    core::Logger::setExternalHandler(
      [this](core::Logger::Level lvl, const std::string &formatted, const std::string &raw)
      { entries.push_back({lvl, formatted, raw}); });
  }

  ~LogCapture() { core::Logger::clearExternalHandler(); }

  LogCapture(const LogCapture &) = delete;
  LogCapture &operator=(const LogCapture &) = delete;

  bool contains(const std::string &text) const
  {
    for (const auto &entry : entries)
    {
      if (entry.raw.find(text) != std::string::npos)
      {
        return true;
      }
    }
    return false;
  }

  std::vector<Entry> entries;
};

} // namespace dnsfwd::test
