#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "common/error.hpp"
#include "runner/master_endpoint.hpp"
#include "runner/options.hpp"

namespace dfr::runner {

inline constexpr std::array<std::string_view, 5> kArchiveExtensions = {".jar", ".zip", ".tar", ".tgz", ".tar.gz"};

/// Environment variable holding a `:`-separated classpath.
inline constexpr const char* kClasspathEnv = "DFR_CLASSPATH";

auto is_archive_path(std::string_view path) -> bool;

/// Process classpath: `DFR_CLASSPATH` when set, otherwise the directory that
/// holds the running executable.
auto default_classpath() -> Expected<std::vector<std::string>>;

/// Archive files reachable from `classpath`, in classpath order. A file entry
/// is kept when it is an archive; a directory entry contributes the archives
/// it directly contains, sorted by name. Missing entries and unreadable
/// directories are StagingResolution errors.
auto discover_archives(const std::vector<std::string>& classpath) -> Expected<std::vector<std::string>>;

/// Decides which files travel to the cluster.
class ResourceStager {
 public:
  /// An empty classpath resolves to `default_classpath()` on first remote use.
  explicit ResourceStager(std::vector<std::string> classpath = {});

  /// Local masters keep `current` as given. A remote master replaces it with
  /// the archives discovered on the classpath.
  auto resolve(const MasterEndpoint& master, const std::vector<std::string>& current) const
    -> Expected<std::vector<std::string>>;

  /// Resolve against `options.master` and overwrite `options.files_to_stage`.
  auto stage(PipelineOptions& options) const -> Expected<void>;

 private:
  std::vector<std::string> classpath_;
};

}  // namespace dfr::runner
