#include "trustchain/canonical_json.hpp"

#include <algorithm>
#include <cmath>
#include <string_view>
#include <utility>

namespace trustchain {

namespace {

void writeString(const std::string& s, std::string& out) {
  try {
    out += nlohmann::json(s).dump();
  } catch (const nlohmann::json::type_error& e) {
    throw CanonicalizationError(e.what());
  }
}

template <typename Json>
void writeCanonical(const Json& value, std::string& out, size_t depth,
                    size_t maxDepth) {
  if (depth > maxDepth) {
    throw CanonicalizationError("nesting exceeds " + std::to_string(maxDepth) +
                                " levels");
  }

  switch (value.type()) {
    case nlohmann::json::value_t::object: {
      std::vector<std::pair<std::string_view, const Json*>> members;
      members.reserve(value.size());
      for (auto it = value.begin(); it != value.end(); ++it) {
        members.emplace_back(it.key(), &it.value());
      }
      std::sort(members.begin(), members.end(),
                [](const auto& a, const auto& b) { return a.first < b.first; });

      out.push_back('{');
      bool first = true;
      for (const auto& [key, member] : members) {
        if (!first) out.push_back(',');
        first = false;
        writeString(std::string(key), out);
        out.push_back(':');
        writeCanonical(*member, out, depth + 1, maxDepth);
      }
      out.push_back('}');
      break;
    }
    case nlohmann::json::value_t::array: {
      out.push_back('[');
      bool first = true;
      for (const auto& element : value) {
        if (!first) out.push_back(',');
        first = false;
        writeCanonical(element, out, depth + 1, maxDepth);
      }
      out.push_back(']');
      break;
    }
    case nlohmann::json::value_t::string:
      writeString(value.template get_ref<const std::string&>(), out);
      break;
    case nlohmann::json::value_t::number_float: {
      double d = value.template get<double>();
      if (!std::isfinite(d)) {
        throw CanonicalizationError("non-finite number");
      }
      out += value.dump();
      break;
    }
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
    case nlohmann::json::value_t::boolean:
    case nlohmann::json::value_t::null:
      out += value.dump();
      break;
    case nlohmann::json::value_t::binary:
      throw CanonicalizationError("binary values have no JSON form");
    case nlohmann::json::value_t::discarded:
    default:
      throw CanonicalizationError("discarded value");
  }
}

}  // namespace

std::string canonicalize(const nlohmann::json& value, size_t maxDepth) {
  std::string out;
  writeCanonical(value, out, 0, maxDepth);
  return out;
}

std::string canonicalize(const nlohmann::ordered_json& value,
                         size_t maxDepth) {
  std::string out;
  writeCanonical(value, out, 0, maxDepth);
  return out;
}

std::vector<uint8_t> canonicalBytes(const nlohmann::json& value) {
  auto text = canonicalize(value);
  return std::vector<uint8_t>(text.begin(), text.end());
}

}  // namespace trustchain
