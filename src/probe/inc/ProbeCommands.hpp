#ifndef AWGCHECK_PROBE_PROBE_COMMANDS_HPP
#define AWGCHECK_PROBE_PROBE_COMMANDS_HPP
/**
 * @file ProbeCommands.hpp
 * @brief Shell command lines run inside the control container, and parsers
 *        for their output.
 *
 * Every argument embedded in a command is single-quote escaped.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace awgcheck {

namespace probe {

/* ----------------------------- Commands ----------------------------- */

/// @brief "test -r <path>": succeeds if the path is readable.
[[nodiscard]] std::string readableTestCommand(std::string_view path);

/**
 * @brief Write a marker into @p dir and remove it again.
 *
 * Exit status reflects the write; the marker is removed either way.
 */
[[nodiscard]] std::string writeProbeCommand(std::string_view dir);

/// @brief Print the value of an environment variable.
[[nodiscard]] std::string printEnvCommand(std::string_view name);

/// @brief Docker daemon server version, through DOCKER_HOST.
[[nodiscard]] std::string dockerVersionCommand();

/// @brief All running containers as "name<TAB>status" lines.
[[nodiscard]] std::string dockerPsCommand();

/// @brief Run @p innerCommand inside another container through the Docker API.
[[nodiscard]] std::string nestedExecCommand(std::string_view container,
                                            std::string_view innerCommand);

/// @brief One-shot CPU/memory figures as "name<TAB>cpu<TAB>mem<TAB>mem%" lines.
[[nodiscard]] std::string dockerStatsCommand();

/// @brief Human-readable df for @p path.
[[nodiscard]] std::string diskFreeCommand(std::string_view path);

/// @brief Total size of @p path in KiB.
[[nodiscard]] std::string diskUsageCommand(std::string_view path);

/// @brief Effective uid ("id -u") or gid ("id -g").
[[nodiscard]] std::string idCommand(bool group);

/// @brief Seconds since @p path was modified, as an integer.
[[nodiscard]] std::string fileAgeCommand(std::string_view path);

/* ----------------------------- Parsers ----------------------------- */

/**
 * @brief Parse the output of fileAgeCommand().
 * @return Age in seconds; nullopt for empty, non-numeric or negative output.
 */
[[nodiscard]] std::optional<std::int64_t> parseFileAge(std::string_view output);

/**
 * @brief Parse the output of idCommand().
 * @return Non-negative id that fits 32 bits, or nullopt.
 */
[[nodiscard]] std::optional<std::uint32_t> parseNumericId(std::string_view output);

} // namespace probe

} // namespace awgcheck

#endif // AWGCHECK_PROBE_PROBE_COMMANDS_HPP
