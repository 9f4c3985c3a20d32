/**
 * @file verification_engine.hpp
 * @brief Recompute the signed payload and check an envelope's signature
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "envelope.hpp"
#include "key_manager.hpp"

namespace trustchain {

/**
 * @brief Stateless verifier; never throws
 *
 * Ed25519 envelopes verify against their embedded public key. HMAC envelopes
 * need the KeyManager that produced them.
 */
class VerificationEngine {
 public:
  explicit VerificationEngine(const KeyManager* keys = nullptr) noexcept
      : keys_(keys) {}

  /**
   * @return True only if the signature matches the payload rebuilt from
   * (toolName, args) and the envelope's own sequence, timestamp, key id,
   * schema version, tenant and execution context
   */
  bool verify(const Envelope& envelope, std::string_view toolName,
              const nlohmann::json& args) const noexcept;

  /**
   * @return True if both hashes match `responseText` and `toolSignatures`
   * and the embedded envelope verifies
   */
  bool verifyFinalResponse(
      const FinalResponseProof& proof, std::string_view responseText,
      const std::vector<std::string>& toolSignatures) const noexcept;

 private:
  const KeyManager* keys_;
};

}  // namespace trustchain
