/**
 * @file RunConfig.cpp
 * @brief Implementation of .env parsing and run configuration resolution.
 */

#include "src/config/inc/RunConfig.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <optional>

namespace awgcheck {

namespace config {

namespace strings = awgcheck::helpers::strings;

namespace {

/// Join a directory and a file name with exactly one '/'.
std::string joinPath(std::string_view dir, std::string_view name) {
  std::string out(dir);
  if (out.empty() || out.back() != '/') {
    out.push_back('/');
  }
  out.append(name);
  return out;
}

} // namespace

/* ----------------------------- Env Parsing ----------------------------- */

EnvAssignments parseEnvAssignments(std::string_view text) {
  EnvAssignments env;
  for (const std::string_view RAW : strings::splitLines(text)) {
    const std::string_view LINE = strings::trim(RAW);
    if (LINE.empty() || LINE.front() == '#') {
      continue;
    }
    const std::size_t EQ = LINE.find('=');
    if (EQ == std::string_view::npos) {
      continue;
    }
    const std::string_view KEY = strings::trim(LINE.substr(0, EQ));
    if (KEY.empty()) {
      continue;
    }
    env.insert_or_assign(std::string(KEY), std::string(strings::trim(LINE.substr(EQ + 1))));
  }
  return env;
}

std::string valueOr(const EnvAssignments& env, std::string_view key, std::string_view fallback) {
  const auto IT = env.find(key);
  if (IT == env.end() || strings::trim(IT->second).empty()) {
    return std::string(fallback);
  }
  return IT->second;
}

bool hasKeyAssignment(std::string_view text, std::string_view key) {
  if (key.empty()) {
    return false;
  }
  for (const std::string_view LINE : strings::splitLines(text)) {
    if (LINE.size() > key.size() && strings::startsWith(LINE, key) && LINE[key.size()] == '=') {
      return true;
    }
  }
  return false;
}

/* ----------------------------- RunConfig ----------------------------- */

std::string RunConfig::envFilePath() const { return joinPath(rootDir, ENV_FILE_NAME); }

RunConfig resolveRunConfig(std::string_view rootDir, std::string_view envText) {
  const EnvAssignments ENV = parseEnvAssignments(envText);

  RunConfig cfg;
  cfg.rootDir = std::string(rootDir);
  cfg.secretPath = joinPath(rootDir, SECRET_FILE_NAME);
  cfg.awgContainer = valueOr(ENV, KEY_AWG_CONTAINER, DEFAULT_AWG_CONTAINER);
  cfg.xrayContainer = valueOr(ENV, KEY_XRAY_CONTAINER, DEFAULT_XRAY_CONTAINER);
  cfg.dnsContainer = valueOr(ENV, KEY_DNS_CONTAINER, DEFAULT_DNS_CONTAINER);
  cfg.xrayConfigPath = valueOr(ENV, KEY_XRAY_CONFIG_PATH, DEFAULT_XRAY_CONFIG_PATH);
  cfg.awgConfigPath = valueOr(ENV, KEY_AWG_CONFIG_PATH, DEFAULT_AWG_CONFIG_PATH);
  cfg.proxyLogLevel = valueOr(ENV, KEY_PROXY_LOG_LEVEL, DEFAULT_PROXY_LOG_LEVEL);
  return cfg;
}

RunConfig loadRunConfig(std::string_view rootDir) {
  const std::optional<std::string> TEXT =
      helpers::files::readFileToString(joinPath(rootDir, ENV_FILE_NAME));
  return resolveRunConfig(rootDir, TEXT ? std::string_view(*TEXT) : std::string_view{});
}

} // namespace config

} // namespace awgcheck
