// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "dns_types.hpp"
#include "dnsfwd/core/logger.hpp"
#include "dnsfwd/network/udp_socket.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dnsfwd
{
namespace network
{
namespace dns
{

/// \brief DNS transport exceptions
class DnsTransportException : public std::runtime_error
{
public:
  explicit DnsTransportException(const std::string &message)
      : std::runtime_error("DNS Transport Error: " + message)
  {
  }
};

/// \brief Something that answers one serialized DNS query with one
/// serialized reply.
class DnsUpstream
{
public:
  virtual ~DnsUpstream() = default;

  /// \brief Send \p query and block for the reply datagram.
  /// \throws DnsTransportException on any I/O failure or an interrupted wait
  virtual std::vector<std::uint8_t> exchange(const std::vector<std::uint8_t> &query) = 0;

  /// \brief Human readable destination, for logs.
  virtual std::string describe() const = 0;
};

/// \brief Upstream resolver reached over plain UDP.
///
/// One socket per exchange. The receive blocks until a datagram from the
/// server arrives; datagrams from other senders are dropped. There is no
/// timeout and no retry, but a signal ends the wait with an error.
class UdpUpstream : public DnsUpstream
{
public:
  explicit UdpUpstream(UdpEndpoint server) : _server(std::move(server)) {}

  std::vector<std::uint8_t> exchange(const std::vector<std::uint8_t> &query) override
  {
    try
    {
      UdpSocket socket;
      socket.sendTo(query, _server);

      UdpEndpoint expected = UdpEndpoint::fromSockaddr(_server.toSockaddr());
      std::vector<std::uint8_t> reply;
      while (true)
      {
        std::optional<UdpEndpoint> from = socket.receiveFrom(reply, constants::DNS_MAX_UDP_SIZE);
        if (!from)
        {
          throw DnsTransportException("exchange with " + _server.toString() + " interrupted");
        }
        if (*from == expected)
        {
          return reply;
        }
        DNSFWD_LOG_WARN("Ignoring " << reply.size() << " byte datagram from " << from->toString()
                                    << " while waiting for " << _server.toString());
      }
    }
    catch (const SocketException &e)
    {
      throw DnsTransportException("exchange with " + _server.toString() + " failed: " + e.what());
    }
  }

  std::string describe() const override { return "udp://" + _server.toString(); }

  const UdpEndpoint &server() const { return _server; }

private:
  UdpEndpoint _server;
};

} // namespace dns
} // namespace network
} // namespace dnsfwd
