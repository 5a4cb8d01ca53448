#include "core/config_flow.hpp"
#include "core/netcast_scanner.hpp"

#include <borealis/core/logger.hpp>

using namespace netcast;

static std::optional<std::string> inputValue(const std::optional<FlowInput>& input, const char* key) {
    if (!input) return std::nullopt;
    auto it = input->find(key);
    if (it == input->end()) return std::nullopt;
    return it->second;
}

ConfigFlow::ConfigFlow(NetcastScanner* scanner, const ConfigEntries* entries, SessionClientFactory clientFactory)
    : m_scanner(scanner), m_entries(entries), m_clientFactory(std::move(clientFactory)) {
}

const char* ConfigFlow::stepName(FlowStep step) {
    switch (step) {
        case FlowStep::User:
            return "user";
        case FlowStep::PickDevice:
            return "pick_device";
        case FlowStep::Authorize:
            return "authorize";
    }
    return "user";
}

FlowResult ConfigFlow::start(const std::optional<FlowInput>& input) {
    return stepUser(FlowState{}, input);
}

FlowResult ConfigFlow::configure(const FlowState& state, const std::optional<FlowInput>& input) {
    switch (state.step) {
        case FlowStep::User:
            return stepUser(state, input);
        case FlowStep::PickDevice:
            return stepPickDevice(state, input);
        case FlowStep::Authorize:
            return stepAuthorize(state, input);
    }
    return stepUser(state, input);
}

FlowResult ConfigFlow::stepUser(FlowState state, const std::optional<FlowInput>& input) {
    state.step = FlowStep::User;

    if (!input) {
        return showForm(std::move(state), FlowStep::User);
    }

    auto host = inputValue(input, CONF_HOST);
    if (!host || host->empty()) {
        return stepPickDevice(std::move(state), std::nullopt);
    }

    if (!isHostValid(*host)) {
        brls::Logger::debug("ConfigFlow: rejected host {}", *host);
        return showForm(std::move(state), FlowStep::User, {{CONF_HOST, "invalid_host"}});
    }

    state.config.host = *host;
    return stepAuthorize(std::move(state), std::nullopt);
}

FlowResult ConfigFlow::stepPickDevice(FlowState state, const std::optional<FlowInput>& input) {
    state.step = FlowStep::PickDevice;

    if (input) {
        auto uniqueId = inputValue(input, CONF_DEVICE);
        auto it = uniqueId ? state.discovered.find(*uniqueId) : state.discovered.end();
        if (it == state.discovered.end()) {
            std::map<std::string, std::string> choices;
            for (const auto& [id, record] : state.discovered) {
                choices[id] = record.displayName();
            }
            return showForm(std::move(state), FlowStep::PickDevice, {{CONF_DEVICE, "invalid_device"}}, choices);
        }

        if (isIdConfigured(*uniqueId)) {
            return abort(std::move(state), "already_configured");
        }

        DeviceRecord record = it->second;
        state.config.host = record.host();
        state.config.id = *uniqueId;
        state.config.name = record.displayName();
        brls::Logger::debug("ConfigFlow: picked {} at {}", *uniqueId, state.config.host);
        return stepAuthorize(std::move(state), std::nullopt);
    }

    std::vector<DeviceRecord> devices;
    if (m_scanner) {
        devices = m_scanner->discover();
    }

    state.discovered.clear();
    std::map<std::string, std::string> choices;
    for (const auto& record : devices) {
        if (record.st() != SSDP_ST) continue;
        if (isIdConfigured(record.uniqueId)) continue;

        state.discovered[record.uniqueId] = record;
        choices[record.uniqueId] = record.displayName();
    }

    if (choices.empty()) {
        return abort(std::move(state), "no_devices_found");
    }

    return showForm(std::move(state), FlowStep::PickDevice, {}, choices);
}

FlowResult ConfigFlow::stepAuthorize(FlowState state, const std::optional<FlowInput>& input) {
    state.step = FlowStep::Authorize;

    if (auto token = inputValue(input, CONF_ACCESS_TOKEN)) {
        if (token->size() > ACCESS_TOKEN_MAX_LENGTH) {
            return showForm(std::move(state), FlowStep::Authorize, {{CONF_ACCESS_TOKEN, "invalid_access_token"}});
        }
        state.config.accessToken = *token;
    }

    if (!m_clientFactory) {
        return showForm(std::move(state), FlowStep::Authorize, {{"base", "cannot_connect"}});
    }

    auto client = m_clientFactory(state.config);
    if (!client) {
        return showForm(std::move(state), FlowStep::Authorize, {{"base", "cannot_connect"}});
    }

    std::string sessionId;
    std::string error;
    SessionResult result = client->getSessionId(sessionId, error);

    std::map<std::string, std::string> errors;
    switch (result) {
        case SessionResult::Success:
            return createEntry(std::move(state));
        case SessionResult::AccessTokenError:
            if (input) {
                errors[CONF_ACCESS_TOKEN] = "invalid_access_token";
            }
            break;
        case SessionResult::SessionIdError:
            brls::Logger::warning("ConfigFlow: cannot connect to {}: {}", state.config.host, error);
            errors["base"] = "cannot_connect";
            break;
    }

    return showForm(std::move(state), FlowStep::Authorize, errors);
}

FlowResult ConfigFlow::createEntry(FlowState state) {
    if (!state.config.id) {
        if (isHostConfigured(state.config.host)) {
            return abort(std::move(state), "already_configured");
        }
        state.config.name = DEFAULT_NAME;
    }

    FlowResult result;
    result.type = FlowResultType::CreateEntry;
    result.title = state.config.name.value_or(DEFAULT_NAME);
    result.data = state.config;
    result.state = std::move(state);

    brls::Logger::info("ConfigFlow: created entry {} for {}", result.title, result.data.host);
    return result;
}

FlowResult ConfigFlow::importEntry(const DeviceConfig& config) {
    FlowState state;
    state.config = config;

    if (config.id && isIdConfigured(*config.id)) {
        return abort(std::move(state), "already_configured");
    }

    if (!isHostValid(config.host)) {
        return abort(std::move(state), "invalid_host");
    }

    if (!state.config.name) {
        state.config.name = DEFAULT_NAME;
    }

    if (!state.config.id && isHostConfigured(state.config.host)) {
        return abort(std::move(state), "already_configured");
    }

    FlowResult result;
    result.type = FlowResultType::CreateEntry;
    result.title = *state.config.name;
    result.data = state.config;
    result.state = std::move(state);
    return result;
}

FlowResult ConfigFlow::showForm(FlowState state, FlowStep step,
                                std::map<std::string, std::string> errors,
                                std::map<std::string, std::string> choices) const {
    state.step = step;

    FlowResult result;
    result.type = FlowResultType::Form;
    result.stepId = stepName(step);
    result.errors = std::move(errors);
    result.choices = std::move(choices);
    result.state = std::move(state);
    return result;
}

FlowResult ConfigFlow::abort(FlowState state, const std::string& reason) const {
    brls::Logger::info("ConfigFlow: aborted: {}", reason);

    FlowResult result;
    result.type = FlowResultType::Abort;
    result.reason = reason;
    result.state = std::move(state);
    return result;
}

bool ConfigFlow::isIdConfigured(const std::string& id) const {
    if (!m_entries || id.empty()) return false;
    for (const auto& entry : m_entries->entries()) {
        if (entry.data.id && *entry.data.id == id) {
            return true;
        }
    }
    return false;
}

bool ConfigFlow::isHostConfigured(const std::string& host) const {
    if (!m_entries) return false;
    for (const auto& entry : m_entries->entries()) {
        if (entry.data.host == host) {
            return true;
        }
    }
    return false;
}
