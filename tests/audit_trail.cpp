#include <doctest/doctest.h>
#include "trustchain/audit_trail.hpp"

using namespace trustchain;
using json = nlohmann::json;

namespace {

AuditEntry entry(uint64_t sequence, const std::string& signature,
                 std::optional<std::string> parent = std::nullopt,
                 const std::string& session = "sess_a") {
    AuditEntry e;
    e.tool_name = "tool_" + std::to_string(sequence);
    e.args_hash = "hash";
    e.signature = signature;
    e.timestamp = "2025-03-01T12:00:00.000Z";
    e.sequence = sequence;
    e.key_id = "kid";
    e.session_id = session;
    e.parent_signature = std::move(parent);
    return e;
}

AuditTrail chained(size_t count) {
    AuditTrail trail;
    std::optional<std::string> parent;
    for (uint64_t i = 1; i <= count; ++i) {
        std::string sig = "ed25519:sig" + std::to_string(i);
        trail.append(entry(i, sig, parent));
        parent = sig;
    }
    return trail;
}

}  // namespace

TEST_CASE("AuditTrail community view is limited") {
    AuditTrail trail(10);
    for (uint64_t i = 1; i <= 12; ++i) {
        trail.append(entry(i, "ed25519:s" + std::to_string(i)));
    }
    CHECK(trail.size() == 12);

    auto community = trail.entries(Tier::Community);
    REQUIRE(community.size() == 10);
    CHECK(community.front().sequence == 3);
    CHECK(community.back().sequence == 12);

    CHECK(trail.entries(Tier::Pro).size() == 12);
    CHECK(trail.entries(Tier::Enterprise).size() == 12);
}

TEST_CASE("AuditTrail chain integrity") {
    auto trail = chained(4);
    CHECK(trail.chainIntegrity());
    CHECK(trail.chainLength() == 3);
    REQUIRE(trail.lastSignature() != nullptr);
    CHECK(*trail.lastSignature() == "ed25519:sig4");

    AuditTrail broken;
    broken.append(entry(1, "ed25519:one"));
    broken.append(entry(2, "ed25519:two", std::string("ed25519:one")));
    broken.append(entry(3, "ed25519:three", std::string("ed25519:forged")));
    CHECK_FALSE(broken.chainIntegrity());
}

TEST_CASE("AuditTrail without links is intact") {
    AuditTrail trail;
    CHECK(trail.chainIntegrity());
    CHECK(trail.lastSignature() == nullptr);
    trail.append(entry(1, "ed25519:one"));
    trail.append(entry(2, "ed25519:two"));
    CHECK(trail.chainIntegrity());
    CHECK(trail.chainLength() == 0);
}

TEST_CASE("AuditTrail first entry cannot have a parent") {
    AuditTrail trail;
    trail.append(entry(1, "ed25519:one", std::string("ed25519:ghost")));
    CHECK_FALSE(trail.chainIntegrity());
}

TEST_CASE("AuditTrail toJson") {
    auto trail = chained(2);
    auto j = trail.toJson();
    CHECK(j["total"] == 2);
    CHECK(j["chain_integrity"] == true);
    REQUIRE(j["entries"].size() == 2);
    CHECK(j["entries"][1]["parent_signature"] == "ed25519:sig1");
}

TEST_CASE("Compliance report is enterprise only") {
    auto trail = chained(3);
    ComplianceContext context;
    context.agent_id = "agent";
    context.session_id = "sess_a";
    context.public_key = "pk";
    context.compliance_markers = {"SOC2", "HIPAA", "AI-Act"};

    context.tier = Tier::Pro;
    CHECK_FALSE(trail.exportComplianceReport(context).has_value());

    context.tier = Tier::Enterprise;
    auto report = trail.exportComplianceReport(context);
    REQUIRE(report.has_value());
    CHECK((*report)["report_id"].get<std::string>().rfind("rpt_", 0) == 0);
    CHECK((*report)["report_id"].get<std::string>().size() == 4 + 16);
    CHECK((*report)["agent_id"] == "agent");
    CHECK((*report)["tier"] == "enterprise");
    CHECK((*report)["algorithm"] == "ed25519");
    CHECK((*report)["total_operations"] == 3);
    CHECK((*report)["chain_integrity"] == true);
    CHECK((*report)["compliance_markers"].size() == 3);
    CHECK((*report)["audit_entries"].size() == 3);
    CHECK(parseRfc3339((*report)["generated_at"].get<std::string>()).has_value());
}

TEST_CASE("AuditProof accepts an intact trail") {
    auto trail = chained(5);
    auto result = verifyAuditProof(trail.all());
    CHECK(result.ok);
    CHECK(result.total == 5);
    CHECK(verifyAuditProof(trail.toJson()).ok);
}

TEST_CASE("AuditProof rejects an empty trail") {
    auto result = verifyAuditProof(std::vector<AuditEntry>{});
    CHECK_FALSE(result.ok);
    CHECK(result.reason == "empty audit trail");
}

TEST_CASE("AuditProof detects replay") {
    std::vector<AuditEntry> entries = {entry(1, "ed25519:a"), entry(2, "ed25519:b"),
                                       entry(2, "ed25519:c")};
    auto result = verifyAuditProof(entries);
    CHECK_FALSE(result.ok);
    CHECK(result.reason.find("replay") != std::string::npos);
}

TEST_CASE("AuditProof checks sequences per session") {
    std::vector<AuditEntry> entries = {entry(1, "ed25519:a", std::nullopt, "sess_a"),
                                       entry(1, "ed25519:b", std::nullopt, "sess_b"),
                                       entry(2, "ed25519:c", std::nullopt, "sess_a")};
    CHECK(verifyAuditProof(entries).ok);
}

TEST_CASE("AuditProof detects a chain break") {
    std::vector<AuditEntry> entries = {entry(1, "ed25519:a"),
                                       entry(2, "ed25519:b", std::string("ed25519:a")),
                                       entry(3, "ed25519:c", std::string("ed25519:x"))};
    auto result = verifyAuditProof(entries);
    CHECK_FALSE(result.ok);
    CHECK(result.reason.find("chain break at sequence 3") != std::string::npos);
}

TEST_CASE("AuditProof requires crypto fields") {
    auto missingSignature = entry(1, "");
    CHECK(verifyAuditProof(std::vector<AuditEntry>{missingSignature}).reason ==
          "missing signature at index 0");

    json doc = json::array({json(entry(1, "ed25519:a"))});
    doc[0].erase("algorithm");
    auto result = verifyAuditProof(doc);
    CHECK_FALSE(result.ok);
    CHECK(result.reason == "missing algorithm at index 0");

    json noVersion = json::array({json(entry(1, "ed25519:a"))});
    noVersion[0].erase("signature_schema_version");
    CHECK(verifyAuditProof(noVersion).reason ==
          "missing signature_schema_version at index 0");
}

TEST_CASE("AuditProof accepts compliance report layout") {
    json report = {{"report_id", "rpt_x"},
                   {"audit_entries", json::array({json(entry(1, "ed25519:a"))})}};
    CHECK(verifyAuditProof(report).ok);
    CHECK_FALSE(verifyAuditProof(json{{"rows", json::array()}}).ok);
    CHECK_FALSE(verifyAuditProof(json("not a trail")).ok);
}
