/**
 * @file sign_and_verify.cpp
 * @brief End-to-end example of a signed agent session
 *
 * This example shows how to:
 * 1. Create a session from the environment (or defaults)
 * 2. Sign tool calls and bind a final answer to them
 * 3. Verify envelopes the way a tool server would
 * 4. Export the audit trail and check it offline
 */

#include "trustchain/audit_trail.hpp"
#include "trustchain/config.hpp"
#include "trustchain/session.hpp"
#include "trustchain/verification_engine.hpp"
#include <iostream>

using namespace trustchain;
using json = nlohmann::json;

int main() {
    std::cout << "TrustChain Sign / Verify Example\n";

    try {
        // Step 1: Configure the session
        std::cout << "1. Creating session...\n";
        auto config = TrustChainConfig::fromEnvironment();
        config.agent_id = "example-planner";
        config.tier = Tier::Enterprise;

        auto session = Session::create(config);
        auto info = session->sessionInfo();
        auto key = session->keyInfo();
        std::cout << "   Session: " << info.session_id << "\n";
        std::cout << "   Key id:  " << key.key_id << " ("
                  << algorithmToString(key.algorithm)
                  << (key.external ? ", external" : ", local") << ")\n\n";

        // Step 2: Sign the tool calls the agent decided to make
        std::cout << "2. Signing tool calls...\n";
        session->setCurrentQuery("Which tasks are overdue?");
        session->setDecisionContext(json{{"plan", "list open tasks, then fetch details"}});

        json listArgs = {{"status", "open"}, {"limit", 20}};
        auto listCall = session->sign("list_tasks", listArgs);
        json getArgs = {{"id", "T-17"}};
        auto getCall = session->sign("get_task", getArgs);

        std::cout << "   #" << listCall.sequence << " list_tasks  " << listCall.signature.substr(0, 40)
                  << "...\n";
        std::cout << "   #" << getCall.sequence << " get_task    parent="
                  << (getCall.parent_signature ? "yes" : "no") << "\n\n";

        // Step 3: What the tool server sees
        std::cout << "3. Verifying on the receiving side...\n";
        json request = attachEnvelope(
            {{"jsonrpc", "2.0"}, {"method", "tools/call"}, {"params", {{"name", "get_task"}, {"arguments", getArgs}}}},
            getCall);
        auto received = request.at("trustchain").get<Envelope>();

        VerificationEngine standalone;
        std::cout << "   Untouched arguments: "
                  << (standalone.verify(received, "get_task", getArgs) ? "VALID" : "INVALID") << "\n";
        std::cout << "   Tampered arguments:  "
                  << (standalone.verify(received, "get_task", json{{"id", "T-18"}}) ? "VALID" : "INVALID")
                  << "\n\n";

        // Step 4: Bind the final answer to the calls above
        std::cout << "4. Signing the final response...\n";
        std::string answer = "Task T-17 is three days overdue.";
        std::vector<std::string> signatures = {listCall.signature, getCall.signature};
        auto proof = session->signFinalResponse(answer, signatures);
        std::cout << "   Proof valid: "
                  << (session->verifyFinalResponse(proof, answer, signatures) ? "yes" : "no") << "\n\n";

        // Step 5: Audit export
        std::cout << "5. Exporting the audit trail...\n";
        auto report = session->exportComplianceReport();
        if (report) {
            auto check = verifyAuditProof(*report);
            std::cout << "   Report " << (*report)["report_id"].get<std::string>() << ": "
                      << check.total << " entries, "
                      << (check.ok ? "chain intact" : "FAILED: " + check.reason) << "\n";
        }

        auto ended = session->endSession();
        std::cout << "\nSession ended after " << ended.total_calls << " calls\n";

    } catch (const TrustChainError& e) {
        std::cerr << "TrustChain error [" << errorCodeToString(e.errorCode()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
