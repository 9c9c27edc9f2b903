// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "dns_message.hpp"
#include "dns_transport.hpp"
#include "dnsfwd/core/logger.hpp"
#include <iterator>
#include <memory>
#include <stdexcept>
#include <vector>

namespace dnsfwd
{
namespace network
{
namespace dns
{

/// \brief Resolves each question of an inbound query through an upstream
/// resolver, one single-question round trip per question.
class DnsForwarder
{
public:
  explicit DnsForwarder(std::shared_ptr<DnsUpstream> upstream) : _upstream(std::move(upstream))
  {
    if (!_upstream)
    {
      throw std::invalid_argument("DnsForwarder requires an upstream");
    }
  }

  /// \brief Forward every question of \p query and collect the answers.
  ///
  /// Answers come back decompressed against the upstream reply they arrived
  /// in, in question order. The first failure aborts the whole request.
  /// \throws DnsTransportException on I/O failure or a mismatched reply
  /// \throws DnsParseException if a question or an upstream reply is malformed
  /// \throws DnsUnsupportedException if the upstream answers with non-A data
  std::vector<DnsResourceRecord> forward(const DnsMessage &query) const
  {
    std::vector<DnsResourceRecord> answers;
    for (const auto &question : query.questions)
    {
      std::vector<DnsResourceRecord> batch = forwardOne(query.decompress(question), query.header.rd);
      answers.insert(answers.end(), std::make_move_iterator(batch.begin()),
                     std::make_move_iterator(batch.end()));
    }
    return answers;
  }

  /// \brief Send one already-decompressed question upstream.
  std::vector<DnsResourceRecord> forwardOne(const DnsQuestion &question,
                                            bool recursionDesired) const
  {
    DnsMessage upstreamQuery = DnsMessage::newQuery({question});
    upstreamQuery.header.rd = recursionDesired;

    DNSFWD_LOG_DEBUG("Forwarding " << question.name.toString() << " " << toString(question.qtype)
                                   << " to " << _upstream->describe() << " (id "
                                   << upstreamQuery.header.id << ")");

    std::vector<std::uint8_t> replyBytes = _upstream->exchange(upstreamQuery.serialize());
    DnsMessage reply = DnsMessage::parse(replyBytes);

    if (!reply.header.qr)
    {
      throw DnsTransportException("upstream " + _upstream->describe() +
                                  " sent a query instead of a response");
    }
    if (reply.header.id != upstreamQuery.header.id)
    {
      throw DnsTransportException("upstream reply id " + std::to_string(reply.header.id) +
                                  " does not match query id " +
                                  std::to_string(upstreamQuery.header.id));
    }

    std::vector<DnsResourceRecord> answers;
    answers.reserve(reply.answers.size());
    for (const auto &rr : reply.answers)
    {
      answers.push_back(reply.decompress(rr));
    }

    DNSFWD_LOG_DEBUG("Upstream returned " << answers.size() << " answer(s) for "
                                          << question.name.toString() << " ("
                                          << toString(reply.header.rcode) << ")");
    return answers;
  }

  const std::shared_ptr<DnsUpstream> &upstream() const { return _upstream; }

private:
  std::shared_ptr<DnsUpstream> _upstream;
};

} // namespace dns
} // namespace network
} // namespace dnsfwd
