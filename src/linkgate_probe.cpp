// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <linkgate/linkgate.hpp>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace
{

/// \brief Command-line settings; every set field overrides the config file.
struct ProbeOptions
{
  std::optional<std::string> configFile;
  std::optional<std::string> logLevel;
  std::optional<std::string> logFile;
  std::optional<std::string> policy;
  std::optional<std::int64_t> peerCount;
  std::optional<std::string> apiUrl;
  std::optional<std::string> gatewayUrl;
  std::optional<std::string> nodeMode;
  bool resolveOnly = false;
  std::vector<std::string> targets;
};

/// \brief Print help message
void printHelp()
{
  std::cout
      << "Usage: linkgate-probe [options] <url|fqdn>...\n"
      << "Prints the safety gate result and the DNSLink redirect decision for "
         "each URL.\n\n"
      << "  -h, --help                 Show this help message\n"
      << "  -c, --config <file>        Configuration file path (TOML)\n"
      << "  -l, --log-level <level>    Log level (trace, debug, info, warning, "
         "error, fatal)\n"
      << "  -f, --log-file <file>      Log file path (default: stdout)\n"
      << "  -p, --policy <policy>      DNSLink policy (disabled, manual, eager)\n"
      << "      --peer-count <n>       Override the node peer count\n"
      << "      --api-url <url>        Node API base URL\n"
      << "      --gateway-url <url>    Gateway base URL\n"
      << "      --node-mode <mode>     embedded or external\n"
      << "  -r, --resolve              Treat arguments as FQDNs and only resolve "
         "them\n";
}

/// \brief Parse command-line arguments into the probe options
ProbeOptions parseCliArgs(int argc, char** argv)
{
  ProbeOptions options;
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    bool hasValue = i + 1 < argc;
    if ((arg == "-c" || arg == "--config") && hasValue)
    {
      options.configFile = argv[++i];
    }
    else if ((arg == "-l" || arg == "--log-level") && hasValue)
    {
      options.logLevel = argv[++i];
    }
    else if ((arg == "-f" || arg == "--log-file") && hasValue)
    {
      options.logFile = argv[++i];
    }
    else if ((arg == "-p" || arg == "--policy") && hasValue)
    {
      options.policy = argv[++i];
    }
    else if (arg == "--peer-count" && hasValue)
    {
      try
      {
        options.peerCount = std::stoll(argv[++i]);
      }
      catch (const std::exception& e)
      {
        throw std::runtime_error("Invalid peer count '" + std::string(argv[i]) + "': " +
                                 e.what());
      }
    }
    else if (arg == "--api-url" && hasValue)
    {
      options.apiUrl = argv[++i];
    }
    else if (arg == "--gateway-url" && hasValue)
    {
      options.gatewayUrl = argv[++i];
    }
    else if (arg == "--node-mode" && hasValue)
    {
      options.nodeMode = argv[++i];
    }
    else if (arg == "-r" || arg == "--resolve")
    {
      options.resolveOnly = true;
    }
    else if (arg == "-h" || arg == "--help")
    {
      printHelp();
      std::exit(0);
    }
    else if (!arg.empty() && arg[0] == '-')
    {
      throw std::runtime_error("Unknown option: " + arg);
    }
    else
    {
      options.targets.push_back(arg);
    }
  }
  return options;
}

void applyOverrides(const ProbeOptions& options, linkgate::dnslink::ResolverConfig& config,
                    linkgate::dnslink::HostState& state)
{
  using namespace linkgate::dnslink;
  if (options.logLevel)
    config.log.level = linkgate::core::Logger::levelFromString(*options.logLevel);
  if (options.logFile)
    config.log.file = *options.logFile;
  if (options.policy)
    state.dnslinkPolicy = parseDnslinkPolicy(*options.policy);
  if (options.peerCount)
    state.peerCount = *options.peerCount;
  if (options.apiUrl)
    state.apiBaseUrl = *options.apiUrl;
  if (options.gatewayUrl)
    state.gatewayBaseUrl = *options.gatewayUrl;
  if (options.nodeMode)
    state.nodeMode = parseNodeMode(*options.nodeMode);
}

void probeUrl(linkgate::dnslink::DnslinkResolver& resolver, const std::string& url)
{
  if (!resolver.isLookupSafeForUrl(url))
  {
    std::cout << url << "\tunsafe\tno redirect\n";
    return;
  }
  auto decision = resolver.planRedirect(url);
  std::cout << url << "\tsafe\t"
            << (decision.shouldRedirect() ? *decision.redirectUrl : std::string("no redirect"))
            << "\n";
}

void probeFqdn(linkgate::dnslink::DnslinkResolver& resolver, const std::string& fqdn)
{
  auto value = resolver.resolveAndCache(fqdn);
  std::cout << fqdn << "\t" << (value ? value->toString() : std::string("<unresolved>"))
            << "\n";
}

} // namespace

int main(int argc, char** argv)
{
  try
  {
    ProbeOptions options = parseCliArgs(argc, argv);
    if (options.targets.empty())
    {
      printHelp();
      return EXIT_FAILURE;
    }

    linkgate::dnslink::ResolverConfig config;
    linkgate::dnslink::HostState state;
    if (options.configFile)
    {
      linkgate::core::ConfigLoader loader(*options.configFile);
      loader.load();
      config = linkgate::dnslink::ResolverConfig::fromLoader(loader);
      state = linkgate::dnslink::HostState::fromLoader(loader);
    }
    applyOverrides(options, config, state);

    linkgate::core::Logger::init(config.log.level, config.log.file);
    LINKGATE_LOG_INFO("linkgate-probe " << linkgate::kVersion << ": policy "
                                        << linkgate::dnslink::toString(state.dnslinkPolicy)
                                        << ", API " << state.apiBaseUrl);

    linkgate::dnslink::DnslinkResolver resolver([state]() { return state; }, config);
    resolver.setDiagnosticSink(
        [](const linkgate::dnslink::LookupDiagnostic& diagnostic)
        {
          std::cerr << "lookup failed for " << diagnostic.fqdn << ": "
                    << diagnostic.error.message << std::endl;
        });

    for (const auto& target : options.targets)
    {
      if (options.resolveOnly)
      {
        probeFqdn(resolver, target);
      }
      else
      {
        probeUrl(resolver, target);
      }
    }
    linkgate::core::Logger::flush();
  }
  catch (const std::exception& ex)
  {
    std::cerr << "linkgate-probe: " << ex.what() << std::endl;
    return EXIT_FAILURE;
  }
  return 0;
}
