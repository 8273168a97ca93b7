#include "runner/resources.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <unordered_set>
#include <utility>

namespace dfr::runner {
namespace {

auto staging_error(std::string message) -> RunnerError {
  return make_error(ErrorCode::StagingResolution, std::move(message));
}

auto split_classpath(std::string_view value) -> std::vector<std::string> {
  std::vector<std::string> entries;
  std::size_t start = 0;
  while (start <= value.size()) {
    auto end = value.find(':', start);
    if (end == std::string_view::npos) {
      end = value.size();
    }
    if (end > start) {
      entries.emplace_back(value.substr(start, end - start));
    }
    start = end + 1;
  }
  return entries;
}

auto list_directory_archives(const std::filesystem::path& dir) -> Expected<std::vector<std::string>> {
  std::vector<std::string> archives;
  std::error_code iter_error;
  for (std::filesystem::directory_iterator it(dir, iter_error), end; it != end && !iter_error;
       it.increment(iter_error)) {
    std::error_code entry_error;
    if (!it->is_regular_file(entry_error)) {
      continue;
    }
    auto path_string = it->path().string();
    if (is_archive_path(path_string)) {
      archives.push_back(std::move(path_string));
    }
  }
  if (iter_error) {
    return tl::unexpected(
      staging_error(std::format("failed to list classpath directory {}: {}", dir.string(), iter_error.message())));
  }
  std::sort(archives.begin(), archives.end());
  return archives;
}

}  // namespace

auto is_archive_path(std::string_view path) -> bool {
  return std::any_of(kArchiveExtensions.begin(), kArchiveExtensions.end(), [path](std::string_view ext) {
    return path.size() > ext.size() && path.ends_with(ext);
  });
}

auto default_classpath() -> Expected<std::vector<std::string>> {
  if (const char* value = std::getenv(kClasspathEnv); value && *value != '\0') {
    return split_classpath(value);
  }
  std::error_code ec;
  auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) {
    return tl::unexpected(staging_error(std::format("cannot locate running executable: {}", ec.message())));
  }
  return std::vector<std::string>{exe.parent_path().string()};
}

auto discover_archives(const std::vector<std::string>& classpath) -> Expected<std::vector<std::string>> {
  std::vector<std::string> archives;
  std::unordered_set<std::string> seen;
  auto keep = [&](std::string path) {
    if (seen.insert(path).second) {
      archives.push_back(std::move(path));
    }
  };

  for (const auto& entry : classpath) {
    std::filesystem::path path(entry);
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
      return tl::unexpected(staging_error(std::format("classpath entry does not exist: {}", entry)));
    }
    if (std::filesystem::is_directory(status)) {
      auto listed = list_directory_archives(path);
      if (!listed) {
        return tl::unexpected(listed.error());
      }
      for (auto& archive : *listed) {
        keep(std::move(archive));
      }
    } else if (is_archive_path(entry)) {
      keep(entry);
    }
  }
  return archives;
}

ResourceStager::ResourceStager(std::vector<std::string> classpath) : classpath_(std::move(classpath)) {}

auto ResourceStager::resolve(const MasterEndpoint& master, const std::vector<std::string>& current) const
  -> Expected<std::vector<std::string>> {
  if (is_local(master)) {
    return current;
  }
  if (!classpath_.empty()) {
    return discover_archives(classpath_);
  }
  auto classpath = default_classpath();
  if (!classpath) {
    return tl::unexpected(classpath.error());
  }
  return discover_archives(*classpath);
}

auto ResourceStager::stage(PipelineOptions& options) const -> Expected<void> {
  auto staged = resolve(classify_master(options.master), options.files_to_stage);
  if (!staged) {
    return tl::unexpected(staged.error());
  }
  options.files_to_stage = std::move(*staged);
  return {};
}

}  // namespace dfr::runner
