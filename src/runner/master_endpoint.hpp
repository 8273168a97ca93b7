#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace dfr::runner {

inline constexpr std::string_view kAutoMaster = "[auto]";
inline constexpr std::string_view kCollectionMaster = "[collection]";
inline constexpr std::string_view kLocalMaster = "[local]";
inline constexpr int kDefaultMasterPort = 8081;

/// Pick a local or remote engine depending on how the job is launched.
struct AutoLocal {};
/// Run in-process on collections, single threaded.
struct CollectionLocal {};
/// Start an embedded local engine.
struct ExplicitLocal {};
/// Submit to a cluster reachable at `address`.
struct Remote {
  std::string address;
};

using MasterEndpoint = std::variant<AutoLocal, CollectionLocal, ExplicitLocal, Remote>;

struct HostPort {
  std::string host;
  int port = kDefaultMasterPort;
};

/// Exact, case-sensitive match against the bracketed tokens; any other string
/// (including typos and empty strings) is Remote.
auto classify_master(std::string_view master) -> MasterEndpoint;

auto is_local(const MasterEndpoint& master) -> bool;

auto to_string(const MasterEndpoint& master) -> std::string;

/// Split `host:port`. An empty port yields the default port; a missing colon,
/// empty host or non-numeric port yields nullopt.
auto parse_host_port(std::string_view address) -> std::optional<HostPort>;

}  // namespace dfr::runner
