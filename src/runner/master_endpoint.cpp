#include "runner/master_endpoint.hpp"

#include <charconv>

namespace dfr::runner {

auto classify_master(std::string_view master) -> MasterEndpoint {
  if (master == kAutoMaster) {
    return AutoLocal{};
  }
  if (master == kCollectionMaster) {
    return CollectionLocal{};
  }
  if (master == kLocalMaster) {
    return ExplicitLocal{};
  }
  return Remote{std::string(master)};
}

auto is_local(const MasterEndpoint& master) -> bool {
  return !std::holds_alternative<Remote>(master);
}

auto to_string(const MasterEndpoint& master) -> std::string {
  if (std::holds_alternative<AutoLocal>(master)) {
    return std::string(kAutoMaster);
  }
  if (std::holds_alternative<CollectionLocal>(master)) {
    return std::string(kCollectionMaster);
  }
  if (std::holds_alternative<ExplicitLocal>(master)) {
    return std::string(kLocalMaster);
  }
  return std::get<Remote>(master).address;
}

auto parse_host_port(std::string_view address) -> std::optional<HostPort> {
  auto colon = address.rfind(':');
  if (colon == std::string_view::npos || colon == 0) {
    return std::nullopt;
  }
  HostPort result;
  result.host = std::string(address.substr(0, colon));
  auto port_text = address.substr(colon + 1);
  if (port_text.empty()) {
    return result;
  }
  int port = 0;
  auto [end, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
  if (ec != std::errc{} || end != port_text.data() + port_text.size() || port <= 0 || port > 65535) {
    return std::nullopt;
  }
  result.port = port;
  return result;
}

}  // namespace dfr::runner
