/// @file main.cpp
/// @brief intg_inspect: resolve integrations and print what the loader sees.
///
/// Usage:
///   intg_inspect --config <file.yaml> [--discovery] <domain>...
///
/// Exits non-zero if any requested domain fails to resolve.

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "intg/foundation/config_manager.hpp"
#include "intg/loader/host_context.hpp"
#include "intg/version.hpp"

namespace {

struct InspectArgs {
    std::filesystem::path configPath;
    bool discovery = false;
    std::vector<std::string> domains;
};

InspectArgs parseArgs(int argc, char* argv[]) {
    InspectArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--config" && i + 1 < argc) {
            args.configPath = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        } else if (arg == "--discovery") {
            args.discovery = true;
        } else {
            args.domains.emplace_back(arg);
        }
    }

    // Environment variable override, as for the host itself.
    if (args.configPath.empty()) {
        if (const char* envPath = std::getenv("INTG_CONFIG_PATH"); envPath != nullptr) {
            args.configPath = envPath;
        }
    }
    return args;
}

std::string joined(const std::set<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ", ";
        }
        out += item;
    }
    return out.empty() ? "-" : out;
}

void printDiscovery(intg::loader::DiscoveryAggregator& discovery) {
    std::size_t zeroconfMatchers = 0;
    for (const auto& [type, matchers] : discovery.GetZeroconf()) {
        zeroconfMatchers += matchers.size();
    }
    std::cout << "discovery:\n"
              << "  zeroconf   " << zeroconfMatchers << "\n"
              << "  bluetooth  " << discovery.GetBluetooth().size() << "\n"
              << "  dhcp       " << discovery.GetDhcp().size() << "\n"
              << "  usb        " << discovery.GetUsb().size() << "\n"
              << "  homekit    " << discovery.GetHomekit().size() << "\n"
              << "  ssdp       " << discovery.GetSsdp().size() << "\n"
              << "  mqtt       " << discovery.GetMqtt().size() << "\n"
              << "  config flows " << discovery.GetConfigFlows().size() << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    auto args = parseArgs(argc, argv);
    if (args.configPath.empty() || (args.domains.empty() && !args.discovery)) {
        std::cerr << "intg_inspect " << intg::Version::string << "\n"
                  << "usage: intg_inspect --config <file.yaml> [--discovery] <domain>...\n";
        return EXIT_FAILURE;
    }

    intg::foundation::ConfigManager config;
    auto loadResult = config.load(args.configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto host = intg::loader::HostContext::Create(config);
    if (!host) {
        std::cerr << "Failed to set up loader: " << host.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto& ctx = *host.value();

    bool failed = false;
    auto results = ctx.Plugins().GetMany(args.domains);
    for (const auto& domain : args.domains) {
        const auto& result = results.at(domain);
        if (!result) {
            failed = true;
            std::cout << domain << ": " << result.error().message();
            if (const auto* info = result.error().context<intg::foundation::DomainErrorInfo>();
                info != nullptr && !info->cause.empty()) {
                std::cout << " (" << info->cause << ")";
            }
            std::cout << "\n";
            continue;
        }

        const auto& plugin = *result.value();
        std::cout << domain << ": " << plugin.Name() << " ["
                  << intg::loader::pluginRootName(plugin.Root()) << ", "
                  << intg::loader::integrationTypeName(plugin.Type()) << "] "
                  << plugin.Version().value_or("no version") << "\n"
                  << "  path: " << plugin.Directory().string() << "\n";

        if (ctx.Dependencies().Resolve(plugin)) {
            auto closure = plugin.AllDependencies();
            std::cout << "  dependencies: " << joined(closure.value()) << "\n";
        } else {
            failed = true;
            auto reason = ctx.Dependencies().ComputeDependencies(plugin);
            std::cout << "  dependencies: unresolved";
            if (!reason) {
                std::cout << " (" << reason.error().message() << ")";
            }
            std::cout << "\n";
        }
    }

    if (args.discovery) {
        printDiscovery(ctx.Discovery());
    }

    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
