#include "views/console_flow_view.hpp"

#include <borealis/core/logger.hpp>
#include <fmt/format.h>

#include <cstdlib>
#include <vector>

using namespace netcast;

ConsoleFlowView::ConsoleFlowView(ConfigFlow* flow, std::istream& in, std::ostream& out)
    : m_flow(flow), m_in(in), m_out(out) {
}

std::string ConsoleFlowView::errorMessage(const std::string& code) {
    if (code == "invalid_host") return "Invalid host name or IP address";
    if (code == "invalid_access_token") return "Invalid access token";
    if (code == "cannot_connect") return "Failed to connect to the TV";
    if (code == "invalid_device") return "Unknown device";
    return code;
}

std::string ConsoleFlowView::abortMessage(const std::string& reason) {
    if (reason == "no_devices_found") return "No LG NetCast TVs found on the network";
    if (reason == "already_configured") return "Device is already configured";
    if (reason == "invalid_host") return "Invalid host name or IP address";
    if (reason == "cancelled") return "Setup cancelled";
    return reason;
}

bool ConsoleFlowView::prompt(const std::string& label, std::string& outValue) {
    m_out << label << ": " << std::flush;
    if (!std::getline(m_in, outValue)) {
        return false;
    }
    if (!outValue.empty() && outValue.back() == '\r') {
        outValue.pop_back();
    }
    return true;
}

void ConsoleFlowView::printErrors(const FlowResult& result) {
    for (const auto& [field, code] : result.errors) {
        if (field == "base") {
            m_out << "Error: " << errorMessage(code) << "\n";
        } else {
            m_out << fmt::format("Error ({}): {}\n", field, errorMessage(code));
        }
    }
}

std::optional<FlowInput> ConsoleFlowView::askUser(const FlowResult& result) {
    printErrors(result);
    m_out << "Enter the TV host, or leave empty to search the network.\n";

    std::string host;
    if (!prompt("Host", host)) {
        return std::nullopt;
    }
    return FlowInput{{CONF_HOST, host}};
}

std::optional<FlowInput> ConsoleFlowView::askPickDevice(const FlowResult& result) {
    printErrors(result);
    m_out << "Select a TV:\n";

    std::vector<std::string> ids;
    for (const auto& [id, name] : result.choices) {
        ids.push_back(id);
        auto record = result.state.discovered.find(id);
        std::string host = record != result.state.discovered.end() ? record->second.host() : "";
        m_out << fmt::format("  [{}] {} ({}) {}\n", ids.size(), name, id, host);
    }

    std::string choice;
    if (!prompt("Device", choice)) {
        return std::nullopt;
    }

    // Accept the list number as well as the id itself.
    char* end = nullptr;
    unsigned long index = std::strtoul(choice.c_str(), &end, 10);
    if (!choice.empty() && end && *end == '\0' && index >= 1 && index <= ids.size()
        && result.choices.find(choice) == result.choices.end()) {
        choice = ids[index - 1];
    }
    return FlowInput{{CONF_DEVICE, choice}};
}

std::optional<FlowInput> ConsoleFlowView::askAuthorize(const FlowResult& result) {
    printErrors(result);
    m_out << fmt::format("Enter the pairing key shown on the TV at {}.\n", result.state.config.host);

    std::string token;
    if (!prompt("Access token", token)) {
        return std::nullopt;
    }
    return FlowInput{{CONF_ACCESS_TOKEN, token}};
}

FlowResult ConsoleFlowView::run(const std::optional<FlowInput>& initialInput) {
    FlowResult result = m_flow->start(initialInput);

    while (result.type == FlowResultType::Form) {
        brls::Logger::debug("ConsoleFlowView: showing {}", result.stepId);

        std::optional<FlowInput> input;
        switch (result.state.step) {
            case FlowStep::User:
                input = askUser(result);
                break;
            case FlowStep::PickDevice:
                input = askPickDevice(result);
                break;
            case FlowStep::Authorize:
                input = askAuthorize(result);
                break;
        }

        if (!input) {
            result.type = FlowResultType::Abort;
            result.reason = "cancelled";
            break;
        }

        result = m_flow->configure(result.state, input);
    }

    if (result.type == FlowResultType::Abort) {
        m_out << abortMessage(result.reason) << "\n";
    } else {
        m_out << fmt::format("Configured {} at {}\n", result.title, result.data.host);
    }
    return result;
}
