// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "dns_forwarder.hpp"
#include "dns_message.hpp"
#include "dns_transport.hpp"
#include "dnsfwd/core/logger.hpp"
#include "dnsfwd/network/udp_socket.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dnsfwd
{
namespace network
{
namespace dns
{

/// \brief Settings for DnsRequestHandler
struct DnsHandlerConfig
{
  std::string staticAddress = "8.8.8.8"; ///< A record data used when no upstream is set
  std::uint32_t staticTtl = 60;          ///< TTL for locally built answers
  std::size_t maxUdpSize = constants::DNS_MAX_UDP_SIZE;
};

/// \brief Turns one inbound datagram into at most one reply datagram.
///
/// With an upstream every question is forwarded; without one each question
/// is answered locally with an A record for the configured static address.
/// Failures are mapped to response codes and never escape:
///
///   malformed query           FORMERR
///   unsupported content       NOTIMP
///   opcode other than Query   NOTIMP, nothing forwarded
///   upstream failure          SERVFAIL
///
/// Datagrams too short for a header and datagrams that are themselves
/// responses get no reply at all.
class DnsRequestHandler
{
public:
  /// \throws DnsEncodeException if config.staticAddress is not an IPv4 address
  explicit DnsRequestHandler(std::shared_ptr<DnsUpstream> upstream = nullptr,
                             DnsHandlerConfig config = DnsHandlerConfig())
    : _config(std::move(config)), _staticData(DnsRecordData::ipv4(_config.staticAddress))
  {
    if (upstream)
    {
      _forwarder = std::make_unique<DnsForwarder>(std::move(upstream));
    }
  }

  bool isForwarding() const { return _forwarder != nullptr; }

  const DnsHandlerConfig &config() const { return _config; }

  std::optional<std::vector<std::uint8_t>> handle(const std::uint8_t *data, std::size_t size) const
  {
    if (size < constants::DNS_HEADER_SIZE)
    {
      DNSFWD_LOG_DEBUG("Dropping " << size << " byte datagram, too short for a DNS header");
      return std::nullopt;
    }

    DnsHeader header = DnsHeader::decode(data, size);
    if (header.qr)
    {
      DNSFWD_LOG_DEBUG("Dropping response datagram (id " << header.id << ")");
      return std::nullopt;
    }

    DnsMessage query;
    try
    {
      query = DnsMessage::parse(data, size);
    }
    catch (const DnsParseException &e)
    {
      DNSFWD_LOG_WARN("Malformed query id " << header.id << ": " << e.what());
      return encodeError(header, DnsResponseCode::FORMERR);
    }
    catch (const DnsUnsupportedException &e)
    {
      DNSFWD_LOG_WARN("Unsupported query id " << header.id << ": " << e.what());
      return encodeError(header, DnsResponseCode::NOTIMP);
    }

    std::vector<DnsQuestion> questions;
    questions.reserve(query.questions.size());
    try
    {
      for (const auto &question : query.questions)
      {
        questions.push_back(query.decompress(question));
      }
    }
    catch (const DnsParseException &e)
    {
      DNSFWD_LOG_WARN("Bad compression in query id " << header.id << ": " << e.what());
      return encodeError(header, DnsResponseCode::FORMERR);
    }

    if (header.opcode != DnsOpcode::Query)
    {
      DNSFWD_LOG_INFO("Opcode " << toString(header.opcode) << " not implemented (id " << header.id
                                << ")");
      return encodeReply(DnsMessage::newReply(query, std::move(questions), {}));
    }

    std::vector<DnsResourceRecord> answers;
    try
    {
      answers = _forwarder ? _forwarder->forward(query) : answerLocally(questions);
    }
    catch (const std::exception &e)
    {
      DNSFWD_LOG_ERROR("Resolution failed for query id " << header.id << ": " << e.what());
      return encodeError(header, DnsResponseCode::SERVFAIL);
    }

    DNSFWD_LOG_INFO("Query id " << header.id << ": " << questions.size() << " question(s), "
                                << answers.size() << " answer(s)");
    return encodeReply(DnsMessage::newReply(query, std::move(questions), std::move(answers)));
  }

  std::optional<std::vector<std::uint8_t>> handle(const std::vector<std::uint8_t> &datagram) const
  {
    return handle(datagram.data(), datagram.size());
  }

private:
  std::vector<DnsResourceRecord> answerLocally(const std::vector<DnsQuestion> &questions) const
  {
    std::vector<DnsResourceRecord> answers;
    answers.reserve(questions.size());
    for (const auto &question : questions)
    {
      answers.emplace_back(question.name, DnsClass::IN, _config.staticTtl, _staticData);
    }
    return answers;
  }

  std::vector<std::uint8_t> encodeReply(DnsMessage reply) const
  {
    std::vector<std::uint8_t> bytes;
    try
    {
      bytes = reply.serialize();
      if (bytes.size() > _config.maxUdpSize)
      {
        DNSFWD_LOG_WARN("Reply id " << reply.header.id << " is " << bytes.size()
                                    << " bytes, truncating");
        reply.header.tc = true;
        reply.answers.clear();
        reply.authority.clear();
        reply.additional.clear();
        bytes = reply.serialize();
        if (bytes.size() > _config.maxUdpSize)
        {
          reply.questions.clear();
          bytes = reply.serialize();
        }
      }
    }
    catch (const std::exception &e)
    {
      DNSFWD_LOG_ERROR("Cannot encode reply id " << reply.header.id << ": " << e.what());
      return encodeError(reply.header, DnsResponseCode::SERVFAIL);
    }
    return bytes;
  }

  static std::vector<std::uint8_t> encodeError(const DnsHeader &queryHeader, DnsResponseCode rcode)
  {
    return DnsMessage::newErrorReply(queryHeader, rcode).serialize();
  }

  DnsHandlerConfig _config;
  DnsRecordData _staticData;
  std::unique_ptr<DnsForwarder> _forwarder;
};

/// \brief Single-threaded UDP front end: receive a datagram, hand it to the
/// handler, send the reply back to the sender.
class DnsServer
{
public:
  /// \param receiveTimeout How long a receive may block before the stop flag
  ///        is checked again. Zero blocks until a datagram or a signal arrives.
  DnsServer(UdpEndpoint bindAddress, std::shared_ptr<DnsRequestHandler> handler,
            std::chrono::milliseconds receiveTimeout = std::chrono::milliseconds(0))
    : _bindAddress(std::move(bindAddress)), _handler(std::move(handler)),
      _receiveTimeout(receiveTimeout)
  {
    if (!_handler)
    {
      throw std::invalid_argument("DnsServer requires a request handler");
    }
  }

  /// \brief Bind the listening socket.
  /// \throws DnsTransportException if the socket cannot be bound
  void start()
  {
    try
    {
      auto socket = std::make_unique<UdpSocket>();
      socket->bind(_bindAddress);
      if (_receiveTimeout.count() > 0)
      {
        socket->setReceiveTimeout(_receiveTimeout);
      }
      _socket = std::move(socket);
    }
    catch (const SocketException &e)
    {
      throw DnsTransportException("cannot listen on " + _bindAddress.toString() + ": " + e.what());
    }
    DNSFWD_LOG_INFO("DNS server listening on " << localEndpoint().toString());
  }

  bool isStarted() const { return _socket != nullptr; }

  /// \brief Handle at most one datagram.
  /// \return true if a datagram was received
  /// \throws DnsTransportException if the server was not started or the
  ///         receive itself fails
  bool serveOnce()
  {
    if (!_socket)
    {
      throw DnsTransportException("server not started");
    }

    std::vector<std::uint8_t> datagram;
    std::optional<UdpEndpoint> client;
    try
    {
      client = _socket->receiveFrom(datagram, constants::DNS_MAX_UDP_SIZE);
    }
    catch (const SocketException &e)
    {
      throw DnsTransportException(e.what());
    }
    if (!client)
    {
      return false;
    }

    DNSFWD_LOG_TRACE("Received " << datagram.size() << " bytes from " << client->toString());

    std::optional<std::vector<std::uint8_t>> reply = _handler->handle(datagram);
    if (!reply)
    {
      return true;
    }

    try
    {
      _socket->sendTo(*reply, *client);
    }
    catch (const SocketException &e)
    {
      DNSFWD_LOG_ERROR("Failed to send reply to " << client->toString() << ": " << e.what());
    }
    return true;
  }

  /// \brief Serve datagrams until \p stopRequested becomes true. A receive
  /// error only ends the current iteration.
  void run(const std::atomic<bool> &stopRequested)
  {
    if (!_socket)
    {
      start();
    }
    while (!stopRequested.load())
    {
      try
      {
        serveOnce();
      }
      catch (const DnsTransportException &e)
      {
        DNSFWD_LOG_ERROR(e.what());
      }
    }
    DNSFWD_LOG_INFO("DNS server on " << _bindAddress.toString() << " stopped");
  }

  /// \brief The bound address, or the configured one before start().
  UdpEndpoint localEndpoint() const { return _socket ? _socket->localEndpoint() : _bindAddress; }

  void stop() { _socket.reset(); }

private:
  UdpEndpoint _bindAddress;
  std::shared_ptr<DnsRequestHandler> _handler;
  std::chrono::milliseconds _receiveTimeout;
  std::unique_ptr<UdpSocket> _socket;
};

} // namespace dns
} // namespace network
} // namespace dnsfwd
