#include "trustchain/audit_trail.hpp"

#include <cstddef>
#include <map>

#include "trustchain/crypto.hpp"
#include "trustchain/logging.hpp"
#include "trustchain/time_util.hpp"

namespace trustchain {

using json = nlohmann::json;

AuditTrail::AuditTrail(size_t visibleLimit) : visible_limit_(visibleLimit) {}

void AuditTrail::append(AuditEntry entry) {
  entries_.push_back(std::move(entry));
}

std::vector<AuditEntry> AuditTrail::entries(Tier tier) const {
  if (tier != Tier::Community || entries_.size() <= visible_limit_) {
    return entries_;
  }
  auto first = entries_.end() - static_cast<std::ptrdiff_t>(visible_limit_);
  return std::vector<AuditEntry>(first, entries_.end());
}

bool AuditTrail::chainIntegrity() const {
  for (size_t i = 1; i < entries_.size(); ++i) {
    const auto& parent = entries_[i].parent_signature;
    if (parent && *parent != entries_[i - 1].signature) {
      return false;
    }
  }
  // the first entry of a session has nothing to link to
  return entries_.empty() || !entries_.front().parent_signature;
}

size_t AuditTrail::chainLength() const {
  size_t linked = 0;
  for (const auto& entry : entries_) {
    if (entry.parent_signature) ++linked;
  }
  return linked;
}

const std::string* AuditTrail::lastSignature() const noexcept {
  return entries_.empty() ? nullptr : &entries_.back().signature;
}

std::optional<json> AuditTrail::exportComplianceReport(
    const ComplianceContext& context) const {
  if (context.tier != Tier::Enterprise) {
    TC_LOG_WARN("Compliance reports require the enterprise tier");
    return std::nullopt;
  }

  return json{{"report_id", "rpt_" + randomHex(8)},
              {"generated_at", formatRfc3339(Clock::now())},
              {"agent_id", context.agent_id},
              {"session_id", context.session_id},
              {"tier", tierToString(context.tier)},
              {"algorithm", algorithmToString(context.algorithm)},
              {"public_key", context.public_key},
              {"total_operations", entries_.size()},
              {"chain_integrity", chainIntegrity()},
              {"compliance_markers", context.compliance_markers},
              {"audit_entries", entries_}};
}

json AuditTrail::toJson() const {
  return json{{"entries", entries_},
              {"chain_integrity", chainIntegrity()},
              {"total", entries_.size()}};
}

AuditProofResult verifyAuditProof(const std::vector<AuditEntry>& entries) {
  AuditProofResult result;
  result.total = entries.size();
  if (entries.empty()) {
    result.reason = "empty audit trail";
    return result;
  }

  for (size_t i = 0; i < entries.size(); ++i) {
    const auto& entry = entries[i];
    if (entry.signature.empty()) {
      result.reason = "missing signature at index " + std::to_string(i);
      return result;
    }
    if (entry.signature_schema_version <= 0) {
      result.reason =
          "missing signature_schema_version at index " + std::to_string(i);
      return result;
    }
  }

  std::map<std::string, uint64_t> lastSequence;
  for (const auto& entry : entries) {
    const std::string session =
        entry.session_id.empty() ? "unknown" : entry.session_id;
    auto& previous = lastSequence[session];
    if (entry.sequence <= previous) {
      result.reason = "replay or non-monotonic sequence in session " +
                      session + ": " + std::to_string(entry.sequence) +
                      " <= " + std::to_string(previous);
      return result;
    }
    previous = entry.sequence;
  }

  std::map<std::string, const AuditEntry*> lastEntry;
  for (const auto& entry : entries) {
    const std::string session =
        entry.session_id.empty() ? "unknown" : entry.session_id;
    auto it = lastEntry.find(session);
    if (entry.parent_signature) {
      if (it == lastEntry.end() ||
          it->second->signature != *entry.parent_signature) {
        result.reason = "chain break at sequence " +
                        std::to_string(entry.sequence) + " in session " +
                        session;
        return result;
      }
    }
    lastEntry[session] = &entry;
  }

  result.ok = true;
  return result;
}

AuditProofResult verifyAuditProof(const json& document) {
  const json* list = nullptr;
  if (document.is_array()) {
    list = &document;
  } else if (document.is_object()) {
    for (const char* key : {"entries", "audit_entries"}) {
      auto it = document.find(key);
      if (it != document.end() && it->is_array()) {
        list = &*it;
        break;
      }
    }
  }
  if (list == nullptr) {
    return {false, "expected an array of entries or an 'entries' field", 0};
  }

  std::vector<AuditEntry> entries;
  entries.reserve(list->size());
  for (size_t i = 0; i < list->size(); ++i) {
    const auto& item = (*list)[i];
    if (!item.is_object()) {
      return {false, "entry " + std::to_string(i) + " is not an object",
              list->size()};
    }
    // "algorithm" decodes to a default when absent, so check it here
    auto alg = item.find("algorithm");
    if (alg == item.end() || !alg->is_string() ||
        !algorithmFromString(alg->get<std::string>())) {
      return {false, "missing algorithm at index " + std::to_string(i),
              list->size()};
    }
    try {
      entries.push_back(item.get<AuditEntry>());
    } catch (const json::exception& e) {
      return {false, "entry " + std::to_string(i) + ": " + e.what(),
              list->size()};
    }
  }
  return verifyAuditProof(entries);
}

}  // namespace trustchain
