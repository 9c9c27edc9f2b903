// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#include <dnsfwd/dnsfwd.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>

#define DNSFWD_DEFAULT_CONFIG_FILE_PATH "/etc/dnsfwd/dnsfwd.toml"

namespace
{
dnsfwd::ForwarderService *g_service = nullptr;

/// \brief Print help message
void printHelp()
{
  std::cout << "dnsfwd Options:\n"
            << "  -h, --help                       Show this help message\n"
            << "  -c, --config <file>              Configuration file path\n"
            << "  -b, --bind <addr>                Listen address (default: 127.0.0.1)\n"
            << "  -p, --port <port>                Listen port (default: 2053)\n"
            << "  -r, --resolver <host:port>       Upstream resolver; answer locally if unset\n"
            << "  -l, --log-level <level>          Log level (trace, debug, info, "
               "warning, error, fatal)\n"
            << "  -f, --log-file <file>            Log file path\n";
}

/// \brief Parse command-line arguments into the service config
void parseCliArgs(int argc, char **argv, dnsfwd::ForwarderService::Config &config,
                  std::unique_ptr<dnsfwd::core::ConfigLoader> &configLoader)
{
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if ((arg == "-p" || arg == "--port") && i + 1 < argc)
    {
      try
      {
        config.server.port = std::stoi(argv[++i]);
      }
      catch (const std::exception &e)
      {
        throw std::runtime_error("Invalid port number: " + std::string(argv[i]));
      }
    }
    else if ((arg == "-c" || arg == "--config") && i + 1 < argc)
    {
      config.configFile = argv[++i];
      configLoader = std::make_unique<dnsfwd::core::ConfigLoader>(config.configFile.value());
    }
    else if ((arg == "-b" || arg == "--bind") && i + 1 < argc)
    {
      config.server.bindAddress = argv[++i];
    }
    else if ((arg == "-r" || arg == "--resolver") && i + 1 < argc)
    {
      config.resolver.address = argv[++i];
    }
    else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc)
    {
      config.log.level = argv[++i];
    }
    else if ((arg == "-f" || arg == "--log-file") && i + 1 < argc)
    {
      config.log.file = argv[++i];
    }
    else if (arg == "-h" || arg == "--help")
    {
      printHelp();
      std::exit(0);
    }
    else if (arg.length() > 0 && arg[0] == '-')
    {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }
}

/// \brief Fill every value the command line left unset from the TOML file.
/// An explicit --config that cannot be loaded is an error; a missing default
/// file is not.
void parseTomlConfig(dnsfwd::ForwarderService::Config &config,
                     std::unique_ptr<dnsfwd::core::ConfigLoader> &configLoader)
{
  if (configLoader)
  {
    configLoader->load();
  }
  else
  {
    configLoader = std::make_unique<dnsfwd::core::ConfigLoader>(DNSFWD_DEFAULT_CONFIG_FILE_PATH);
    if (!configLoader->reload())
    {
      return;
    }
  }

  if (!config.server.bindAddress.has_value())
  {
    if (auto bindOpt = configLoader->getString("dnsfwd.server.bindAddress"))
    {
      config.server.bindAddress = *bindOpt;
    }
  }
  if (!config.server.port.has_value())
  {
    if (auto portOpt = configLoader->getInt("dnsfwd.server.port"))
    {
      config.server.port = static_cast<int>(*portOpt);
    }
  }
  if (!config.resolver.address.has_value())
  {
    if (auto resolverOpt = configLoader->getString("dnsfwd.resolver.address"))
    {
      config.resolver.address = *resolverOpt;
    }
  }
  if (!config.resolver.staticAddress.has_value())
  {
    if (auto staticOpt = configLoader->getString("dnsfwd.resolver.staticAddress"))
    {
      config.resolver.staticAddress = *staticOpt;
    }
  }
  if (!config.resolver.staticTtl.has_value())
  {
    if (auto ttlOpt = configLoader->getInt("dnsfwd.resolver.staticTtl"))
    {
      if (*ttlOpt < 0 || *ttlOpt > 0x7FFFFFFF)
      {
        throw std::runtime_error("Invalid dnsfwd.resolver.staticTtl: " + std::to_string(*ttlOpt));
      }
      config.resolver.staticTtl = static_cast<std::uint32_t>(*ttlOpt);
    }
  }
  if (!config.log.level.has_value())
  {
    if (auto logLevelOpt = configLoader->getString("dnsfwd.log.level"))
    {
      config.log.level = *logLevelOpt;
    }
  }
  if (!config.log.file.has_value())
  {
    if (auto logFileOpt = configLoader->getString("dnsfwd.log.file"))
    {
      config.log.file = *logFileOpt;
    }
  }
  if (!config.log.timeFormat.has_value())
  {
    if (auto timeFormatOpt = configLoader->getString("dnsfwd.log.timeFormat"))
    {
      config.log.timeFormat = *timeFormatOpt;
    }
  }
  if (!config.log.format.has_value())
  {
    if (auto formatOpt = configLoader->getString("dnsfwd.log.format"))
    {
      config.log.format = *formatOpt;
    }
  }
}

void onTerminate(int)
{
  if (g_service)
  {
    g_service->stop();
  }
}

/// \brief No SA_RESTART, so a blocked receive returns EINTR and the serve
/// loop sees the stop flag.
void installSignalHandlers()
{
  struct sigaction sa
  {
  };
  sa.sa_handler = onTerminate;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}
} // namespace

int main(int argc, char **argv)
{
  try
  {
    std::unique_ptr<dnsfwd::core::ConfigLoader> configLoader;
    dnsfwd::ForwarderService::Config config;
    parseCliArgs(argc, argv, config, configLoader);
    parseTomlConfig(config, configLoader);

    dnsfwd::ForwarderService service(config);
    service.applyConfig();
    if (configLoader && configLoader->isLoaded())
    {
      DNSFWD_LOG_INFO("Using config file: " + configLoader->filename());
    }

    g_service = &service;
    installSignalHandlers();
    service.run();
    g_service = nullptr;
  }
  catch (const std::exception &ex)
  {
    std::cerr << "dnsfwd: " << ex.what() << std::endl;
    return EXIT_FAILURE;
  }

  dnsfwd::core::Logger::flush();
  return 0;
}
