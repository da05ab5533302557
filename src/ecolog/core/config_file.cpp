#include "ecolog/core/config_file.hpp"

#include <filesystem>
#include <regex>
#include <yaml-cpp/yaml.h>

namespace ecolog {

namespace {

auto ReadFlag(const YAML::Node& section, const char* key, bool& value) -> void {
  if (section[key]) {
    value = section[key].as<bool>();
  }
}

auto ReadMillis(
    const YAML::Node& section, const char* key, std::chrono::milliseconds& value)
    -> void {
  if (section[key]) {
    auto millis = section[key].as<int64_t>();
    if (millis < 0) {
      throw YAML::Exception(section[key].Mark(), "negative duration");
    }
    value = std::chrono::milliseconds(millis);
  }
}

}  // namespace

EcologConfigFile::EcologConfigFile(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto EcologConfigFile::CreateDefault(std::shared_ptr<spdlog::logger> logger)
    -> EcologConfigFile {
  return EcologConfigFile(std::move(logger));
}

auto EcologConfigFile::LoadFromFile(
    const CanonicalPath& config_path, std::shared_ptr<spdlog::logger> logger)
    -> std::optional<EcologConfigFile> {
  EcologConfigFile config(logger);

  if (!std::filesystem::exists(config_path.Path())) {
    config.logger_->debug(
        "No .ecolog configuration file found at {}", config_path);
    return std::nullopt;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(config_path.String());

    if (const auto features = yaml["Features"]) {
      ReadFlag(features, "Hover", config.features_.hover);
      ReadFlag(features, "Completion", config.features_.completion);
      ReadFlag(features, "Diagnostics", config.features_.diagnostics);
      ReadFlag(features, "Definition", config.features_.definition);
    }

    if (const auto strict = yaml["Strict"]) {
      ReadFlag(strict, "Hover", config.strict_.hover);
      ReadFlag(strict, "Completion", config.strict_.completion);
    }

    if (const auto analysis = yaml["Analysis"]) {
      ReadMillis(analysis, "DebounceMs", config.debounce_delay_);
    }

    if (const auto workspace = yaml["Workspace"]) {
      const auto& exclude = workspace["Exclude"];
      if (exclude && exclude.IsScalar()) {
        config.exclude_patterns_.push_back(exclude.as<std::string>());
      } else if (exclude && exclude.IsSequence()) {
        for (const auto& pattern : exclude) {
          config.exclude_patterns_.push_back(pattern.as<std::string>());
        }
      }
      if (!config.exclude_patterns_.empty()) {
        config.logger_->debug(
            "Loaded Workspace.Exclude with {} patterns",
            config.exclude_patterns_.size());
      }
    }

    if (const auto provider = yaml["Provider"]) {
      ReadMillis(provider, "LookupTimeoutMs", config.lookup_timeout_);
      ReadMillis(provider, "RefreshTimeoutMs", config.refresh_timeout_);
    }

    config.logger_->debug("Loaded .ecolog configuration from {}", config_path);
    return config;

  } catch (const YAML::Exception& e) {
    config.logger_->error(
        "Error parsing .ecolog configuration file: {}", e.what());
    return std::nullopt;
  } catch (const std::exception& e) {
    config.logger_->error(
        "Error loading .ecolog configuration file: {}", e.what());
    return std::nullopt;
  }
}

auto EcologConfigFile::LoadForWorkspace(
    const CanonicalPath& workspace_root, std::shared_ptr<spdlog::logger> logger)
    -> EcologConfigFile {
  if (auto config =
          LoadFromFile(workspace_root / std::string(kConfigFileName), logger)) {
    return std::move(*config);
  }
  return CreateDefault(std::move(logger));
}

auto EcologConfigFile::ShouldIncludeFile(std::string_view relative_path) const
    -> bool {
  if (exclude_patterns_.empty()) {
    return true;
  }

  std::string path_str(relative_path);
  for (const auto& pattern : exclude_patterns_) {
    try {
      if (std::regex_match(path_str, std::regex(pattern))) {
        return false;
      }
    } catch (const std::regex_error& e) {
      logger_->warn(
          "Invalid exclude pattern '{}' ({}), ignoring it", pattern, e.what());
    }
  }
  return true;
}

}  // namespace ecolog
