#ifndef AWGCHECK_ACCESS_ACCESS_EVALUATOR_HPP
#define AWGCHECK_ACCESS_ACCESS_EVALUATOR_HPP
/**
 * @file AccessEvaluator.hpp
 * @brief Decides whether a secret file is guaranteed readable by a container process.
 *
 * Design goals:
 *  - Pure decision over already-resolved metadata (no syscalls)
 *  - Unknown inputs (failed stat, failed identity query) are valid states, not errors
 *  - Conservative: only modes 600, 640 and 644 can ever be readable
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace awgcheck {

namespace access {

/* ----------------------------- Constants ----------------------------- */

/// Owner read/write only.
inline constexpr std::uint32_t MODE_OWNER_ONLY = 0600;

/// Owner read/write, group read.
inline constexpr std::uint32_t MODE_GROUP_READ = 0640;

/// Owner read/write, group and world read.
inline constexpr std::uint32_t MODE_WORLD_READ = 0644;

/// Identity the bot image runs as when nothing else is known.
inline constexpr std::uint32_t DEFAULT_CONTAINER_ID = 10001;

/* ----------------------------- FileAccessDescriptor ----------------------------- */

/**
 * @brief Snapshot of the secret file's ownership and permission bits.
 *
 * Every numeric field is optional: a failed or partial stat leaves it empty.
 */
struct FileAccessDescriptor {
  std::optional<std::uint32_t> mode;     ///< Permission bits (e.g. 0640)
  std::optional<std::uint32_t> ownerUid; ///< Owning user id
  std::optional<std::uint32_t> ownerGid; ///< Owning group id
  std::string ownerName;                 ///< Owning user name ("" if unresolved)
  std::string groupName;                 ///< Owning group name ("" if unresolved)

  /**
   * @brief One-line description, e.g. "mode=640 owner=app(10001):app(10001)".
   * @note Unknown fields render as "?".
   */
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- ProcessIdentity ----------------------------- */

/**
 * @brief uid/gid a process runs as inside its container.
 */
struct ProcessIdentity {
  std::optional<std::uint32_t> uid; ///< Effective uid, empty if the query failed
  std::optional<std::uint32_t> gid; ///< Effective gid, empty if the query failed

  /// @brief Both uid and gid are known.
  [[nodiscard]] bool isKnown() const noexcept { return uid.has_value() && gid.has_value(); }

  /// @brief "uid:gid" with "?" for unknown parts.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- AccessDecision ----------------------------- */

/**
 * @brief Which rule of the decision table matched.
 */
enum class AccessBranch : std::uint8_t {
  OTHER = 0, ///< Neither owner nor group matched (or identity unknown)
  OWNER = 1, ///< File owner is the process uid
  GROUP = 2  ///< File group is the process gid
};

/**
 * @brief Convert branch to string.
 * @return "owner", "group" or "other".
 */
[[nodiscard]] const char* toString(AccessBranch branch) noexcept;

/**
 * @brief Outcome of evaluateAccess().
 */
struct AccessDecision {
  bool readable = false;                       ///< Guaranteed readable by the process
  AccessBranch branch = AccessBranch::OTHER;   ///< Rule that decided
  std::optional<std::uint32_t> recommendedMode; ///< Tighter mode to suggest, if any

  /// @brief Advisory text ("tighten to 600"), empty when there is nothing to suggest.
  [[nodiscard]] std::string hint() const;

  /// @brief True if a tighter mode is recommended.
  [[nodiscard]] bool hasHint() const noexcept { return recommendedMode.has_value(); }
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Evaluate the readability decision table.
 *
 * First match wins:
 *  1. owner uid == process uid: readable iff mode in {600, 640, 644};
 *     hint "tighten to 600" when readable and mode != 600.
 *  2. group gid == process gid: readable iff mode in {640, 644};
 *     hint "tighten to 640" when readable and mode != 640.
 *  3. otherwise: readable iff mode == 644, never a hint.
 *
 * An unknown or unrecognized mode is never readable.
 */
[[nodiscard]] AccessDecision evaluateAccess(const FileAccessDescriptor& file,
                                            const ProcessIdentity& process) noexcept;

/**
 * @brief Parse permission bits as printed by `stat -c %a`.
 * @param text 1-4 octal digits, surrounding whitespace allowed.
 * @return Mode bits, or nullopt for anything else.
 */
[[nodiscard]] std::optional<std::uint32_t> parseOctalMode(std::string_view text) noexcept;

/**
 * @brief Format mode bits in octal ("640"), "?" when unknown.
 */
[[nodiscard]] std::string formatMode(std::optional<std::uint32_t> mode);

/**
 * @brief Command that makes @p path readable by @p process.
 *
 * With a known identity: "chown <uid>:<gid> <path> && chmod 600 <path>".
 * Otherwise a generic instruction pointing at uid/gid 10001.
 */
[[nodiscard]] std::string remediationCommand(const ProcessIdentity& process,
                                             const std::string& path);

/**
 * @brief Concrete chmod for a decision that carries a hint.
 * @return "chmod <mode> <path>", or empty if the decision has no hint.
 */
[[nodiscard]] std::string securityHint(const AccessDecision& decision, const std::string& path);

} // namespace access

} // namespace awgcheck

#endif // AWGCHECK_ACCESS_ACCESS_EVALUATOR_HPP
