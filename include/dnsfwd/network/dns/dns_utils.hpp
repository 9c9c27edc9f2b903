// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "dnsfwd/network/udp_socket.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace dnsfwd
{
namespace network
{
namespace dns
{

/// \brief Trim whitespace and lowercase hostnames. Dotted quads are left as-is.
inline std::string normalizeServerString(const std::string &server)
{
  std::size_t start = server.find_first_not_of(" \t\n\r");
  if (start == std::string::npos)
    return "";
  std::size_t end = server.find_last_not_of(" \t\n\r");
  std::string normalized = server.substr(start, end - start + 1);

  bool hasLetters = std::any_of(normalized.begin(), normalized.end(),
                                [](unsigned char c) { return std::isalpha(c) != 0; });
  if (hasLetters)
  {
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  }
  return normalized;
}

/// \brief Split "host:port" into an endpoint. A missing port means
/// \p defaultPort.
///
///   parseEndpoint("8.8.8.8:53", 53)    -> 8.8.8.8, 53
///   parseEndpoint("resolver.lan", 53)  -> resolver.lan, 53
///
/// \throws std::invalid_argument for an empty host or a port outside 1-65535
inline UdpEndpoint parseEndpoint(const std::string &text, std::uint16_t defaultPort)
{
  std::string normalized = normalizeServerString(text);
  std::string host = normalized;
  std::uint16_t port = defaultPort;

  std::size_t colon = normalized.rfind(':');
  if (colon != std::string::npos)
  {
    host = normalized.substr(0, colon);
    std::string portText = normalized.substr(colon + 1);
    if (portText.empty() ||
        !std::all_of(portText.begin(), portText.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; }) ||
        portText.size() > 5)
    {
      throw std::invalid_argument("Invalid port in endpoint: " + text);
    }
    unsigned long value = std::stoul(portText);
    if (value == 0 || value > 65535)
    {
      throw std::invalid_argument("Port out of range in endpoint: " + text);
    }
    port = static_cast<std::uint16_t>(value);
  }

  if (host.empty())
  {
    throw std::invalid_argument("Missing host in endpoint: " + text);
  }
  return UdpEndpoint(host, port);
}

} // namespace dns
} // namespace network
} // namespace dnsfwd
