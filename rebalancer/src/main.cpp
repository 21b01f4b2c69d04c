#include <iostream>
#include <string>
#include <vector>
#include "types.hpp"
#include "allocation_policy.hpp"
#include "portfolio_input.hpp"
#include "rebalancer.hpp"
#include "safety_check.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

int fail(const std::string& stage, const std::string& message) {
    std::cerr << stage << ": " << message << std::endl;

    // Output Error JSON
    json error_output = {
        {"status", "error"},
        {"message", message}
    };
    std::cout << error_output.dump(4) << std::endl;
    return 1;
}

} // namespace

int main() {
    // 1. Read Input (Stdin)
    json input;
    try {
        std::cin >> input;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing JSON input: " << e.what() << std::endl;
        return 1;
    }

    // 2. Parse Holdings, Allocations and Settings
    PortfolioInput request;
    try {
        request = parse_portfolio_input(input);
    } catch (const std::exception& e) {
        std::cerr << "Error extracting data from JSON: " << e.what() << std::endl;
        return 1;
    }

    AllocationPolicy policy(request.allocations, request.settings.allocation_epsilon);

    // 3. Validate Inputs
    auto holdings_result = SafetyCheck::validate(request.holdings);
    if (!holdings_result.valid) {
        return fail("Invalid holdings", holdings_result.reason);
    }
    auto policy_result = SafetyCheck::validate(policy);
    if (!policy_result.valid) {
        return fail("Invalid allocations", policy_result.reason);
    }

    // 4. Run Rebalancer
    double total_value = Rebalancer::total_value(request.holdings);
    std::vector<RebalanceAction> actions = Rebalancer::rebalance(request.holdings, policy, request.settings);

    // 5. Run Safety Check
    auto safety_result = SafetyCheck::validate(actions);
    if (!safety_result.valid) {
        return fail("Safety Check Failed", safety_result.reason);
    }

    // 6. Output Actions (Stdout)
    json output = {
        {"status", "ok"},
        {"total_value", total_value},
        {"balanced", actions.empty()},
        {"allocation_warning", policy.allocation_warning() ? json(*policy.allocation_warning()) : json(nullptr)},
        {"actions", actions}
    };
    std::cout << output.dump(4) << std::endl;

    return 0;
}
