#include <algorithm>
#include <cctype>
#include <vector>

#include "trustchain/http_client.hpp"

namespace trustchain {

namespace {

bool isIpv4Loopback(std::string_view host) {
  std::vector<int> octets;
  size_t pos = 0;
  while (pos <= host.size()) {
    auto dot = host.find('.', pos);
    auto part = host.substr(pos, dot == std::string_view::npos
                                     ? std::string_view::npos
                                     : dot - pos);
    if (part.empty() || part.size() > 3 ||
        !std::all_of(part.begin(), part.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
      return false;
    }
    int value = 0;
    for (char c : part) value = value * 10 + (c - '0');
    if (value > 255) return false;
    octets.push_back(value);
    if (dot == std::string_view::npos) break;
    pos = dot + 1;
  }
  if (octets.size() != 4) return false;
  return octets[0] == 127 ||
         (octets[0] == 0 && octets[1] == 0 && octets[2] == 0 && octets[3] == 0);
}

}  // namespace

std::string joinUrl(std::string_view base, std::string_view path) {
  while (!base.empty() && base.back() == '/') {
    base.remove_suffix(1);
  }
  while (!path.empty() && path.front() == '/') {
    path.remove_prefix(1);
  }
  std::string url(base);
  url.push_back('/');
  url.append(path);
  return url;
}

std::string urlHost(std::string_view url) {
  auto scheme = url.find("://");
  if (scheme != std::string_view::npos) {
    url.remove_prefix(scheme + 3);
  }
  auto end = url.find_first_of("/?#");
  if (end != std::string_view::npos) {
    url = url.substr(0, end);
  }
  auto at = url.rfind('@');
  if (at != std::string_view::npos) {
    url.remove_prefix(at + 1);
  }

  std::string_view host;
  if (!url.empty() && url.front() == '[') {
    auto close = url.find(']');
    if (close == std::string_view::npos) {
      return {};
    }
    host = url.substr(1, close - 1);
  } else {
    host = url.substr(0, url.find(':'));
  }

  std::string lower(host);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return lower;
}

bool isLoopbackUrl(std::string_view url) {
  const std::string host = urlHost(url);
  if (host.empty()) {
    return false;
  }
  return host == "localhost" || host == "::1" || isIpv4Loopback(host);
}

}  // namespace trustchain
