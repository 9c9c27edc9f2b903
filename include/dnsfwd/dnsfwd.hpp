// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "dnsfwd/core/config_loader.hpp"
#include "dnsfwd/core/logger.hpp"
#include "dnsfwd/network/dns/dns_server.hpp"
#include "dnsfwd/network/dns/dns_transport.hpp"
#include "dnsfwd/network/dns/dns_utils.hpp"
#include <atomic>
#include <cctype>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace dnsfwd
{

/// \brief The forwarding DNS server process: merged configuration, logger
/// setup and the serve loop.
class ForwarderService
{
public:
  /// \brief Everything is optional so CLI values can be layered over the
  /// TOML file and defaults filled in last.
  struct Config
  {
    struct ServerConfig
    {
      std::optional<std::string> bindAddress;
      std::optional<int> port;
    } server;
    struct ResolverConfig
    {
      std::optional<std::string> address; ///< host:port, unset means answer locally
      std::optional<std::string> staticAddress;
      std::optional<std::uint32_t> staticTtl;
    } resolver;
    struct LogConfig
    {
      std::optional<std::string> level;
      std::optional<std::string> file;
      std::optional<std::string> timeFormat;
      std::optional<std::string> format;
    } log;

    std::optional<std::string> configFile;
  };

  static constexpr const char *DEFAULT_BIND_ADDRESS = "127.0.0.1";
  static constexpr int DEFAULT_PORT = 2053;
  static constexpr const char *DEFAULT_STATIC_ADDRESS = "8.8.8.8";
  static constexpr std::uint32_t DEFAULT_STATIC_TTL = 60;
  static constexpr const char *DEFAULT_LOG_LEVEL = "info";
  static constexpr const char *DEFAULT_LOG_TIME_FORMAT = "%Y-%m-%d %H:%M:%S";

  explicit ForwarderService(Config config) : _config(std::move(config)) {}

  ForwarderService(const ForwarderService &) = delete;
  ForwarderService &operator=(const ForwarderService &) = delete;

  /// \brief Map a level name to a Logger level; unknown names mean Info.
  static core::Logger::Level toLevel(const std::string &s)
  {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
    {
      v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (v == "trace")
    {
      return core::Logger::Level::Trace;
    }
    if (v == "debug")
    {
      return core::Logger::Level::Debug;
    }
    if (v == "warn" || v == "warning")
    {
      return core::Logger::Level::Warning;
    }
    if (v == "error")
    {
      return core::Logger::Level::Error;
    }
    if (v == "fatal")
    {
      return core::Logger::Level::Fatal;
    }
    return core::Logger::Level::Info;
  }

  /// \brief Initialize the logger, then build the handler and the server from
  /// the merged configuration.
  /// \throws std::invalid_argument for a bad port or resolver endpoint
  /// \throws network::dns::DnsEncodeException for a bad static address
  void applyConfig()
  {
    core::Logger::init(toLevel(_config.log.level.value_or(DEFAULT_LOG_LEVEL)),
                       _config.log.file.value_or(""),
                       _config.log.timeFormat.value_or(DEFAULT_LOG_TIME_FORMAT));
    if (_config.log.format)
    {
      core::Logger::setLogFormat(*_config.log.format);
    }

    DNSFWD_LOG_INFO("applyConfig: server.bindAddress = "
                    << _config.server.bindAddress.value_or("<unset>"));
    DNSFWD_LOG_INFO("applyConfig: server.port = "
                    << (_config.server.port ? std::to_string(*_config.server.port) : "<unset>"));
    DNSFWD_LOG_INFO("applyConfig: resolver.address = "
                    << _config.resolver.address.value_or("<unset>"));
    DNSFWD_LOG_INFO("applyConfig: log.level = " << _config.log.level.value_or("<unset>"));
    DNSFWD_LOG_INFO("applyConfig: log.file = " << _config.log.file.value_or("<unset>"));

    int port = _config.server.port.value_or(DEFAULT_PORT);
    if (port < 0 || port > 65535)
    {
      throw std::invalid_argument("Invalid server port: " + std::to_string(port));
    }
    network::UdpEndpoint bindAddress(_config.server.bindAddress.value_or(DEFAULT_BIND_ADDRESS),
                                     static_cast<std::uint16_t>(port));

    std::shared_ptr<network::dns::DnsUpstream> upstream;
    if (_config.resolver.address)
    {
      upstream = std::make_shared<network::dns::UdpUpstream>(network::dns::parseEndpoint(
        *_config.resolver.address, network::dns::constants::DNS_PORT));
      DNSFWD_LOG_INFO("Forwarding queries to " << upstream->describe());
    }
    else
    {
      DNSFWD_LOG_INFO("No resolver configured, answering locally with "
                      << _config.resolver.staticAddress.value_or(DEFAULT_STATIC_ADDRESS));
    }

    network::dns::DnsHandlerConfig handlerConfig;
    handlerConfig.staticAddress = _config.resolver.staticAddress.value_or(DEFAULT_STATIC_ADDRESS);
    handlerConfig.staticTtl = _config.resolver.staticTtl.value_or(DEFAULT_STATIC_TTL);

    _handler = std::make_shared<network::dns::DnsRequestHandler>(upstream, handlerConfig);
    _server = std::make_unique<network::dns::DnsServer>(bindAddress, _handler);
  }

  /// \brief Bind and serve until stop() is called.
  /// \throws network::dns::DnsTransportException if the bind fails
  void run()
  {
    if (!_server)
    {
      applyConfig();
    }
    _server->start();
    _server->run(_stopRequested);
  }

  /// \brief Ask run() to return. Safe to call from a signal handler.
  void stop() { _stopRequested.store(true); }

  bool isStopRequested() const { return _stopRequested.load(); }

  const Config &config() const { return _config; }

  const std::shared_ptr<network::dns::DnsRequestHandler> &handler() const { return _handler; }

private:
  Config _config;
  std::atomic<bool> _stopRequested{false};
  std::shared_ptr<network::dns::DnsRequestHandler> _handler;
  std::unique_ptr<network::dns::DnsServer> _server;
};

} // namespace dnsfwd
