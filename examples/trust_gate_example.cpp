/**
 * @file trust_gate_example.cpp
 * @brief Gating remote tool servers through the trust registry
 *
 * This example shows how to:
 * 1. Load the registry from disk and refresh it from the authority
 * 2. Evaluate trust decisions for several servers and tools
 * 3. Send a signed tools/call through the gateway
 *
 * Usage: trust_gate_example [tool-server-url]
 */

#include "trustchain/config.hpp"
#include "trustchain/http_client.hpp"
#include "trustchain/policy_evaluator.hpp"
#include "trustchain/session.hpp"
#include "trustchain/tool_call_gateway.hpp"
#include "trustchain/trust_registry.hpp"
#include <iostream>

using namespace trustchain;
using json = nlohmann::json;

static void printDecision(const ServerConfig& server, std::string_view tool,
                          const TrustDecision& decision) {
    std::cout << "   " << server.id << " / " << tool << ": "
              << (decision.allowed ? "ALLOW " : "DENY  ") << decision.code
              << " (" << decision.reason << ")\n";
}

int main(int argc, char** argv) {
    std::cout << "TrustChain Trust Gate Example\n";

    try {
        auto config = TrustChainConfig::fromEnvironment();
        auto http = defaultHttpClient();

        // Step 1: Registry
        std::cout << "1. Loading trust registry...\n";
        std::shared_ptr<RegistryStorage> storage;
        if (!config.registry_path.empty()) {
            storage = std::make_shared<FileRegistryStorage>(config.registry_path);
        }
        TrustRegistry registry(storage);
        std::cout << "   " << registry.load() << " persisted records\n";

        if (config.registry_url) {
            auto synced = registry.syncFromAuthority(*http, *config.registry_url,
                                                     config.registry_timeout);
            if (synced.isSuccess()) {
                std::cout << "   Synced " << synced.value() << " records from "
                          << *config.registry_url << "\n";
            } else {
                std::cout << "   Sync failed, using cached records: "
                          << synced.error().what() << "\n";
            }
        }
        std::cout << "\n";

        // Step 2: Decisions
        std::cout << "2. Evaluating trust...\n";
        PolicyEvaluator policy(registry, PolicyOptions::fromConfig(config));
        ServerConfig panel{"panel", argc > 1 ? argv[1] : "http://localhost:3001/mcp"};
        ServerConfig unknown{"crm", "https://crm.example.com/mcp"};

        printDecision(panel, "list_tasks", policy.evaluateTrust(panel, std::string_view("list_tasks")));
        printDecision(panel, "delete_task", policy.evaluateTrust(panel, std::string_view("delete_task")));
        printDecision(unknown, "list_contacts",
                      policy.evaluateTrust(unknown, std::string_view("list_contacts")));
        std::cout << "\n";

        // Step 3: A gated, signed call
        std::cout << "3. Calling list_tasks on " << panel.url << "...\n";
        auto session = Session::create(config, http);
        ToolCallGateway gateway(*session, policy,
                                std::make_shared<HttpToolTransport>(http, config.registry_timeout));
        try {
            auto result = gateway.call(panel, "list_tasks", {{"limit", 5}});
            std::cout << "   Result: " << result.dump() << "\n";
        } catch (const DenialError& e) {
            std::cout << "   Denied: " << e.denyCode() << " (" << e.reason() << ")\n";
        } catch (const IoError& e) {
            std::cout << "   No tool server reachable: " << e.what() << "\n";
        }

        registry.save();

    } catch (const TrustChainError& e) {
        std::cerr << "TrustChain error [" << errorCodeToString(e.errorCode()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
