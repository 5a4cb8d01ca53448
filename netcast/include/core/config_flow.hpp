#ifndef NETCAST_CONFIG_FLOW_HPP
#define NETCAST_CONFIG_FLOW_HPP

#include "core/netcast_client.hpp"
#include "models/netcast_types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

class NetcastScanner;

enum class FlowStep {
    User,       // Host entry, empty host goes to device pick
    PickDevice, // Choose one of the discovered TVs
    Authorize   // Pairing key entry
};

enum class FlowResultType {
    Form,
    CreateEntry,
    Abort
};

struct FlowState {
    FlowStep step = FlowStep::User;
    netcast::DeviceConfig config;
    std::map<std::string, netcast::DeviceRecord> discovered;
};

using FlowInput = std::map<std::string, std::string>;

struct FlowResult {
    FlowResultType type = FlowResultType::Form;

    // Form
    std::string stepId;
    std::map<std::string, std::string> errors;
    std::map<std::string, std::string> choices;

    // Abort
    std::string reason;

    // CreateEntry
    std::string title;
    netcast::DeviceConfig data;

    FlowState state;
};

// Records already configured on the host side.
class ConfigEntries {
public:
    virtual ~ConfigEntries() = default;

    virtual std::vector<netcast::ConfigEntry> entries() const = 0;
};

class ConfigFlow {
public:
    ConfigFlow(NetcastScanner* scanner, const ConfigEntries* entries, SessionClientFactory clientFactory);

    // Runs the user step of a fresh flow.
    FlowResult start(const std::optional<FlowInput>& input = std::nullopt);

    // Feeds input to the step recorded in state.
    FlowResult configure(const FlowState& state, const std::optional<FlowInput>& input);

    // Creates an entry from a complete record without user interaction.
    FlowResult importEntry(const netcast::DeviceConfig& config);

    static const char* stepName(FlowStep step);

private:
    NetcastScanner* m_scanner = nullptr;
    const ConfigEntries* m_entries = nullptr;
    SessionClientFactory m_clientFactory;

    FlowResult stepUser(FlowState state, const std::optional<FlowInput>& input);
    FlowResult stepPickDevice(FlowState state, const std::optional<FlowInput>& input);
    FlowResult stepAuthorize(FlowState state, const std::optional<FlowInput>& input);
    FlowResult createEntry(FlowState state);

    FlowResult showForm(FlowState state, FlowStep step,
                        std::map<std::string, std::string> errors = {},
                        std::map<std::string, std::string> choices = {}) const;
    FlowResult abort(FlowState state, const std::string& reason) const;

    bool isIdConfigured(const std::string& id) const;
    bool isHostConfigured(const std::string& host) const;
};

#endif
