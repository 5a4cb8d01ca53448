#ifndef NETCAST_CONSOLE_FLOW_VIEW_HPP
#define NETCAST_CONSOLE_FLOW_VIEW_HPP

#include "core/config_flow.hpp"

#include <iostream>
#include <string>

// Drives a ConfigFlow on a text terminal: each form is printed with its
// errors and the answers are read line by line.
class ConsoleFlowView {
public:
    ConsoleFlowView(ConfigFlow* flow, std::istream& in = std::cin, std::ostream& out = std::cout);

    // Runs until the flow creates an entry or aborts. End of input aborts
    // with reason "cancelled".
    FlowResult run(const std::optional<FlowInput>& initialInput = std::nullopt);

    static std::string errorMessage(const std::string& code);
    static std::string abortMessage(const std::string& reason);

private:
    ConfigFlow* m_flow = nullptr;
    std::istream& m_in;
    std::ostream& m_out;

    bool prompt(const std::string& label, std::string& outValue);
    void printErrors(const FlowResult& result);

    std::optional<FlowInput> askUser(const FlowResult& result);
    std::optional<FlowInput> askPickDevice(const FlowResult& result);
    std::optional<FlowInput> askAuthorize(const FlowResult& result);
};

#endif
