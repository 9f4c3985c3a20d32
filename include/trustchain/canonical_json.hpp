/**
 * @file canonical_json.hpp
 * @brief Deterministic JSON serialization used as the signing input
 */

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "error.hpp"

namespace trustchain {

namespace canonical_constants {
/// Nesting limit; a value tree cannot be cyclic, so this bounds the walk
constexpr size_t MAX_DEPTH = 256;
}  // namespace canonical_constants

/**
 * @brief Serialize a JSON value canonically
 *
 * Object keys are sorted bytewise at every level, including objects inside
 * arrays. Output is compact (no whitespace), UTF-8, with numbers written as
 * stored. Two values that differ only in key insertion order produce
 * identical output.
 *
 * @throws CanonicalizationError on excess nesting, non-finite numbers,
 * invalid UTF-8, binary or discarded values
 */
std::string canonicalize(const nlohmann::json& value,
                         size_t maxDepth = canonical_constants::MAX_DEPTH);

/**
 * @brief Overload for insertion-ordered documents
 */
std::string canonicalize(const nlohmann::ordered_json& value,
                         size_t maxDepth = canonical_constants::MAX_DEPTH);

/**
 * @brief Canonical form as bytes, ready for signing or hashing
 */
std::vector<uint8_t> canonicalBytes(const nlohmann::json& value);

}  // namespace trustchain
