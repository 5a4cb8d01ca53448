#include <borealis/core/logger.hpp>
#include <CLI/CLI.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <iostream>

#include "core/config_flow.hpp"
#include "core/description_fetcher.hpp"
#include "core/http_requester.hpp"
#include "core/netcast_client.hpp"
#include "core/netcast_scanner.hpp"
#include "core/settings_manager.hpp"
#include "views/console_flow_view.hpp"

static brls::LogLevel logLevelFromName(const std::string& name) {
    if (name == "debug") return brls::LogLevel::LOG_DEBUG;
    if (name == "warning") return brls::LogLevel::LOG_WARNING;
    if (name == "error") return brls::LogLevel::LOG_ERROR;
    return brls::LogLevel::LOG_INFO;
}

static int saveEntry(SettingsManager& settings, const FlowResult& result) {
    if (!settings.addEntry(result.title, result.data)) {
        std::cerr << "Device is already configured\n";
        return 1;
    }
    if (settings.writeFile() != 0) {
        std::cerr << fmt::format("Failed to write {}\n", settings.getConfigPath());
        return 1;
    }
    return 0;
}

static int runDiscover(NetcastScanner& scanner, bool json, bool full) {
    auto devices = scanner.discover();

    if (json) {
        nlohmann::json out = nlohmann::json::array();
        if (full) {
            out = devices;
        } else {
            out = scanner.deviceSummaries();
        }
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    if (devices.empty()) {
        std::cout << "No LG NetCast TVs found\n";
        return 0;
    }
    for (const auto& summary : scanner.deviceSummaries()) {
        std::cout << fmt::format("{}\t{}\t{}\n", summary.id, summary.host, summary.name);
    }
    return 0;
}

static int runSetup(SettingsManager& settings, ConfigFlow& flow, const std::string& host) {
    ConsoleFlowView view(&flow);

    std::optional<FlowInput> input;
    if (!host.empty()) {
        input = FlowInput{{netcast::CONF_HOST, host}};
    }

    FlowResult result = view.run(input);
    if (result.type != FlowResultType::CreateEntry) {
        return 1;
    }
    return saveEntry(settings, result);
}

static int runImport(SettingsManager& settings, ConfigFlow& flow, const netcast::DeviceConfig& config) {
    FlowResult result = flow.importEntry(config);
    if (result.type != FlowResultType::CreateEntry) {
        std::cerr << ConsoleFlowView::abortMessage(result.reason) << "\n";
        return 1;
    }
    if (saveEntry(settings, result) != 0) {
        return 1;
    }
    std::cout << fmt::format("Imported {} at {}\n", result.title, result.data.host);
    return 0;
}

static int runList(const SettingsManager& settings, bool json) {
    auto entries = settings.entries();

    if (json) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& entry : entries) {
            out.push_back(entry.data);
        }
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    for (const auto& entry : entries) {
        std::cout << fmt::format("{}\t{}\t{}\n", entry.data.id.value_or("-"), entry.data.host, entry.title);
    }
    return 0;
}

static int runRemove(SettingsManager& settings, const std::string& id) {
    if (!settings.removeEntry(id)) {
        std::cerr << fmt::format("No configured device {}\n", id);
        return 1;
    }
    return settings.writeFile() == 0 ? 0 : 1;
}

int main(int argc, char* argv[]) {
    CLI::App app{"Discover and pair LG NetCast TVs"};

    std::string configPath = SettingsManager::defaultConfigPath();
    bool verbose = false;
    app.add_option("-c,--config", configPath, "Configuration file");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.require_subcommand(1);

    bool discoverJson = false;
    bool discoverFull = false;
    auto* discoverCommand = app.add_subcommand("discover", "Search the network for TVs");
    discoverCommand->add_flag("--json", discoverJson, "Print JSON");
    discoverCommand->add_flag("--full", discoverFull, "Include SSDP headers and description fields");

    std::string setupHost;
    auto* setupCommand = app.add_subcommand("setup", "Pair a TV interactively");
    setupCommand->add_option("--host", setupHost, "TV host, skips discovery");

    std::string importHost;
    std::string importToken;
    std::string importName;
    std::string importId;
    auto* importCommand = app.add_subcommand("import", "Add a TV with a known access token");
    importCommand->add_option("--host", importHost, "TV host")->required();
    importCommand->add_option("--token", importToken, "Access token");
    importCommand->add_option("--name", importName, "Display name");
    importCommand->add_option("--id", importId, "Unique id");

    bool listJson = false;
    auto* listCommand = app.add_subcommand("list", "List configured TVs");
    listCommand->add_flag("--json", listJson, "Print JSON");

    std::string removeId;
    auto* removeCommand = app.add_subcommand("remove", "Remove a configured TV");
    removeCommand->add_option("id", removeId, "Unique id or host")->required();

    CLI11_PARSE(app, argc, argv);

    brls::Logger::setLogLevel(verbose ? brls::LogLevel::LOG_DEBUG : brls::LogLevel::LOG_INFO);

    SettingsManager settings(configPath);
    std::string error;
    if (!settings.parseFile(error)) {
        std::cerr << fmt::format("Invalid configuration {}: {}\n", configPath, error);
        return 1;
    }
    if (!verbose) {
        brls::Logger::setLogLevel(logLevelFromName(settings.getLogLevel()));
    }

    curl_global_init(CURL_GLOBAL_ALL);
    brls::Logger::debug("CURL initialized");

    int status = 0;
    {
        CurlRequester requester(settings.getHttpTimeout(), netcast::UDAP_USER_AGENT);
        DescriptionFetcher fetcher(&requester);
        NetcastScanner scanner(settings.getScannerOptions(), &fetcher);

        ConfigFlow flow(&scanner, &settings, [&requester](const netcast::DeviceConfig& config) -> std::unique_ptr<SessionClient> {
            return std::make_unique<NetcastClient>(&requester, config.host, config.accessToken);
        });

        if (*discoverCommand) {
            status = runDiscover(scanner, discoverJson, discoverFull);
        } else if (*setupCommand) {
            status = runSetup(settings, flow, setupHost);
        } else if (*importCommand) {
            netcast::DeviceConfig config;
            config.host = importHost;
            if (!importToken.empty()) config.accessToken = importToken;
            if (!importName.empty()) config.name = importName;
            if (!importId.empty()) config.id = importId;
            status = runImport(settings, flow, config);
        } else if (*listCommand) {
            status = runList(settings, listJson);
        } else if (*removeCommand) {
            status = runRemove(settings, removeId);
        }
    }

    curl_global_cleanup();
    brls::Logger::debug("Exiting with status {}", status);
    return status;
}
