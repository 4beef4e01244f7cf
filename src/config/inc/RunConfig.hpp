#ifndef AWGCHECK_CONFIG_RUN_CONFIG_HPP
#define AWGCHECK_CONFIG_RUN_CONFIG_HPP
/**
 * @file RunConfig.hpp
 * @brief Run configuration resolved from the deployment's .env file.
 *
 * The .env file is read, never written. Every key is optional; a missing
 * file, a missing key or a blank value all resolve to the built-in default.
 */

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace awgcheck {

namespace config {

/* ----------------------------- Defaults ----------------------------- */

/// Deployment root holding docker-compose.yml, .env and secret.env.
inline constexpr std::string_view DEFAULT_ROOT_DIR = "/opt/awgbot";

/// Name of the configuration file inside the root.
inline constexpr std::string_view ENV_FILE_NAME = ".env";

/// Name of the credentials file inside the root.
inline constexpr std::string_view SECRET_FILE_NAME = "secret.env";

inline constexpr std::string_view DEFAULT_BOT_SERVICE = "awgbot";
inline constexpr std::string_view DEFAULT_PROXY_SERVICE = "docker-proxy";
inline constexpr std::string_view DEFAULT_AWG_CONTAINER = "amnezia-awg";
inline constexpr std::string_view DEFAULT_XRAY_CONTAINER = "amnezia-xray";
inline constexpr std::string_view DEFAULT_DNS_CONTAINER = "amnezia-dns";
inline constexpr std::string_view DEFAULT_XRAY_CONFIG_PATH = "/opt/amnezia/xray/server.json";
inline constexpr std::string_view DEFAULT_AWG_CONFIG_PATH = "/opt/amnezia/awg/wg0.conf";
inline constexpr std::string_view DEFAULT_PROXY_LOG_LEVEL = "notice";

/// Where the secret is mounted inside the bot container.
inline constexpr std::string_view SECRET_MOUNT_PATH = "/run/secrets/secret.env";

/// Bot data directory inside the container.
inline constexpr std::string_view DATA_DIR = "/app/data";

/// Heartbeat file the bot touches periodically.
inline constexpr std::string_view HEARTBEAT_PATH = "/app/data/heartbeat";

/// DOCKER_HOST the bot must use to reach the Docker API proxy.
inline constexpr std::string_view EXPECTED_DOCKER_HOST = "tcp://docker-proxy:2375";

/// Keys that must be assigned in secret.env.
inline constexpr std::string_view REQUIRED_SECRET_KEYS[] = {"TELEGRAM_TOKEN", "ADMIN_IDS"};

/* ----------------------------- Keys ----------------------------- */

inline constexpr std::string_view KEY_AWG_CONTAINER = "AWG_CONTAINER";
inline constexpr std::string_view KEY_XRAY_CONTAINER = "XRAY_CONTAINER";
inline constexpr std::string_view KEY_DNS_CONTAINER = "DNS_CONTAINER";
inline constexpr std::string_view KEY_XRAY_CONFIG_PATH = "XRAY_CONFIG_PATH";
inline constexpr std::string_view KEY_AWG_CONFIG_PATH = "AWG_CONFIG_PATH";
inline constexpr std::string_view KEY_PROXY_LOG_LEVEL = "DOCKER_PROXY_LOG_LEVEL";

/* ----------------------------- Env Parsing ----------------------------- */

/// Key to value, as assigned in an env file.
using EnvAssignments = std::map<std::string, std::string, std::less<>>;

/**
 * @brief Parse KEY=VALUE lines.
 *
 * Splits at the first '='. Key and value are trimmed. Lines starting with '#'
 * and lines without '=' or with an empty key are ignored. The last assignment
 * of a key wins.
 */
[[nodiscard]] EnvAssignments parseEnvAssignments(std::string_view text);

/**
 * @brief Value for @p key, or @p fallback when absent or blank.
 */
[[nodiscard]] std::string valueOr(const EnvAssignments& env, std::string_view key,
                                  std::string_view fallback);

/**
 * @brief True if some line of @p text starts with "KEY=".
 *
 * Matches the way the bot's env loader sees keys: no leading whitespace, no
 * "export" prefix.
 */
[[nodiscard]] bool hasKeyAssignment(std::string_view text, std::string_view key);

/* ----------------------------- RunConfig ----------------------------- */

/**
 * @brief Fully resolved configuration for one run.
 */
struct RunConfig {
  std::string rootDir{DEFAULT_ROOT_DIR};                 ///< Deployment root
  std::string secretPath;                                ///< Host path of secret.env
  std::string botService{DEFAULT_BOT_SERVICE};           ///< Control service name
  std::string proxyService{DEFAULT_PROXY_SERVICE};       ///< Docker API proxy service name
  std::string awgContainer{DEFAULT_AWG_CONTAINER};       ///< VPN tunnel container
  std::string xrayContainer{DEFAULT_XRAY_CONTAINER};     ///< Proxy container
  std::string dnsContainer{DEFAULT_DNS_CONTAINER};       ///< DNS container
  std::string xrayConfigPath{DEFAULT_XRAY_CONFIG_PATH};  ///< Config inside the XRAY container
  std::string awgConfigPath{DEFAULT_AWG_CONFIG_PATH};    ///< Config inside the AWG container
  std::string proxyLogLevel{DEFAULT_PROXY_LOG_LEVEL};    ///< Reported, not enforced

  /// @brief Path of the .env file for rootDir.
  [[nodiscard]] std::string envFilePath() const;
};

/**
 * @brief Resolve configuration for @p rootDir from already-read .env text.
 * @param rootDir Deployment root.
 * @param envText Contents of the .env file ("" if missing).
 */
[[nodiscard]] RunConfig resolveRunConfig(std::string_view rootDir, std::string_view envText);

/**
 * @brief Read <rootDir>/.env and resolve configuration.
 *
 * A missing or unreadable .env yields the defaults.
 */
[[nodiscard]] RunConfig loadRunConfig(std::string_view rootDir);

} // namespace config

} // namespace awgcheck

#endif // AWGCHECK_CONFIG_RUN_CONFIG_HPP
