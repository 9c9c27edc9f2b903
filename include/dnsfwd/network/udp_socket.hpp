// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <vector>

namespace dnsfwd
{
namespace network
{

/// \brief Socket-level failure (create, bind, send, receive).
class SocketException : public std::runtime_error
{
public:
  explicit SocketException(const std::string &message) : std::runtime_error(message) {}
};

inline std::string lastErr()
{
  char buf[256] = {0};
  int e = errno;
#if defined(__GLIBC__) && defined(_GNU_SOURCE)
  return std::string(::strerror_r(e, buf, sizeof(buf)));
#else
  ::strerror_r(e, buf, sizeof(buf));
  return std::string(buf);
#endif
}

/// \brief IPv4 address and port.
struct UdpEndpoint
{
  std::string address;
  std::uint16_t port{0};

  UdpEndpoint() = default;
  UdpEndpoint(std::string addr, std::uint16_t p) : address(std::move(addr)), port(p) {}

  std::string toString() const { return address + ":" + std::to_string(port); }

  /// \brief Resolve to a socket address. Dotted quads are used directly,
  /// anything else goes through getaddrinfo().
  /// \throws SocketException if the address cannot be resolved
  sockaddr_in toSockaddr() const
  {
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    if (::inet_pton(AF_INET, address.c_str(), &sa.sin_addr) == 1)
    {
      return sa;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo *res = nullptr;
    int rc = ::getaddrinfo(address.c_str(), nullptr, &hints, &res);
    if (rc != 0 || !res)
    {
      throw SocketException("getaddrinfo(" + address + "): " + gai_strerror(rc));
    }
    sa.sin_addr = reinterpret_cast<sockaddr_in *>(res->ai_addr)->sin_addr;
    ::freeaddrinfo(res);
    return sa;
  }

  static UdpEndpoint fromSockaddr(const sockaddr_in &sa)
  {
    char text[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &sa.sin_addr, text, sizeof(text));
    return UdpEndpoint(text, ntohs(sa.sin_port));
  }

  bool operator==(const UdpEndpoint &other) const
  {
    return address == other.address && port == other.port;
  }
};

/// \brief Blocking IPv4 UDP socket owning its file descriptor.
class UdpSocket
{
public:
  /// \throws SocketException if the socket cannot be created
  UdpSocket()
  {
    _fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (_fd < 0)
    {
      throw SocketException("socket: " + lastErr());
    }
  }

  ~UdpSocket() { close(); }

  UdpSocket(const UdpSocket &) = delete;
  UdpSocket &operator=(const UdpSocket &) = delete;

  UdpSocket(UdpSocket &&other) noexcept : _fd(other._fd) { other._fd = -1; }

  UdpSocket &operator=(UdpSocket &&other) noexcept
  {
    if (this != &other)
    {
      close();
      _fd = other._fd;
      other._fd = -1;
    }
    return *this;
  }

  void bind(const UdpEndpoint &local)
  {
    sockaddr_in sa = local.toSockaddr();
    int reuse = 1;
    ::setsockopt(_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    if (::bind(_fd, reinterpret_cast<sockaddr *>(&sa), sizeof(sa)) < 0)
    {
      throw SocketException("bind " + local.toString() + ": " + lastErr());
    }
  }

  /// \brief Bound address; useful after binding to port 0.
  UdpEndpoint localEndpoint() const
  {
    sockaddr_in sa{};
    socklen_t len = sizeof(sa);
    if (::getsockname(_fd, reinterpret_cast<sockaddr *>(&sa), &len) < 0)
    {
      throw SocketException("getsockname: " + lastErr());
    }
    return UdpEndpoint::fromSockaddr(sa);
  }

  /// \brief Zero disables the timeout.
  void setReceiveTimeout(std::chrono::milliseconds timeout)
  {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (::setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0)
    {
      throw SocketException("setsockopt(SO_RCVTIMEO): " + lastErr());
    }
  }

  void sendTo(const std::vector<std::uint8_t> &payload, const UdpEndpoint &to)
  {
    sockaddr_in sa = to.toSockaddr();
    ssize_t n = ::sendto(_fd, payload.data(), payload.size(), 0,
                         reinterpret_cast<sockaddr *>(&sa), sizeof(sa));
    if (n < 0)
    {
      throw SocketException("sendto " + to.toString() + ": " + lastErr());
    }
    if (static_cast<std::size_t>(n) != payload.size())
    {
      throw SocketException("sendto " + to.toString() + ": short write");
    }
  }

  /// \brief Block for one datagram. \p buffer is resized to the datagram size.
  /// \return The sender, or std::nullopt if interrupted or timed out
  /// \throws SocketException on any other receive error
  std::optional<UdpEndpoint> receiveFrom(std::vector<std::uint8_t> &buffer,
                                         std::size_t maxSize)
  {
    buffer.resize(maxSize);
    sockaddr_in sa{};
    socklen_t len = sizeof(sa);
    ssize_t n = ::recvfrom(_fd, buffer.data(), buffer.size(), 0,
                           reinterpret_cast<sockaddr *>(&sa), &len);
    if (n < 0)
    {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
      {
        buffer.clear();
        return std::nullopt;
      }
      throw SocketException("recvfrom: " + lastErr());
    }
    buffer.resize(static_cast<std::size_t>(n));
    return UdpEndpoint::fromSockaddr(sa);
  }

  int fd() const { return _fd; }

  void close()
  {
    if (_fd >= 0)
    {
      ::close(_fd);
      _fd = -1;
    }
  }

private:
  int _fd{-1};
};

} // namespace network
} // namespace dnsfwd
