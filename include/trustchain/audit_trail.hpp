/**
 * @file audit_trail.hpp
 * @brief Append-only ledger of signed tool calls
 */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "envelope.hpp"

namespace trustchain {

/**
 * @brief Identity fields written into a compliance report
 */
struct ComplianceContext {
  std::string agent_id;
  std::string session_id;
  Tier tier = Tier::Community;
  SignatureAlgorithm algorithm = SignatureAlgorithm::Ed25519;
  std::string public_key;
  std::vector<std::string> compliance_markers;
};

class AuditTrail {
 public:
  explicit AuditTrail(
      size_t visibleLimit = config_defaults::AUDIT_VISIBLE_LIMIT);

  void append(AuditEntry entry);

  /**
   * @brief Entries visible at `tier`: everything for pro and enterprise,
   * the most recent `visibleLimit` for community
   */
  std::vector<AuditEntry> entries(Tier tier) const;

  const std::vector<AuditEntry>& all() const noexcept { return entries_; }

  size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }

  /**
   * @brief True if every present parent_signature equals the signature of
   * the entry before it
   */
  bool chainIntegrity() const;

  /// Number of entries carrying a parent_signature
  size_t chainLength() const;

  const std::string* lastSignature() const noexcept;

  void clear() noexcept { entries_.clear(); }

  /**
   * @brief Compliance report; enterprise tier only
   * @return std::nullopt below enterprise
   */
  std::optional<nlohmann::json> exportComplianceReport(
      const ComplianceContext& context) const;

  /// {"entries": [...], "chain_integrity": bool, "total": n}
  nlohmann::json toJson() const;

 private:
  size_t visible_limit_;
  std::vector<AuditEntry> entries_;
};

struct AuditProofResult {
  bool ok = false;
  std::string reason;
  size_t total = 0;
};

/**
 * @brief Offline check of an exported trail
 *
 * Required crypto fields (signature, algorithm, schema version), strictly
 * increasing sequence per session, and parent links within each session.
 */
AuditProofResult verifyAuditProof(const std::vector<AuditEntry>& entries);

/**
 * @brief Same check on a JSON export: a bare array, or an object with
 * "entries" or "audit_entries"
 */
AuditProofResult verifyAuditProof(const nlohmann::json& document);

}  // namespace trustchain
