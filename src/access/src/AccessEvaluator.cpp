/**
 * @file AccessEvaluator.cpp
 * @brief Implementation of the secret-file readability decision table.
 */

#include "src/access/inc/AccessEvaluator.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <initializer_list>

#include <fmt/core.h>

namespace awgcheck {

namespace access {

namespace {

/// Render an optional id as decimal, "?" when unknown.
std::string idOrUnknown(std::optional<std::uint32_t> id) {
  return id ? fmt::format("{}", *id) : std::string("?");
}

/// Name or "?" when the lookup failed.
const std::string& nameOrUnknown(const std::string& name) {
  static const std::string UNKNOWN = "?";
  return name.empty() ? UNKNOWN : name;
}

bool isOneOf(std::optional<std::uint32_t> mode, std::initializer_list<std::uint32_t> allowed) {
  if (!mode) {
    return false;
  }
  for (const std::uint32_t M : allowed) {
    if (*mode == M) {
      return true;
    }
  }
  return false;
}

} // namespace

/* ----------------------------- AccessBranch toString ----------------------------- */

const char* toString(AccessBranch branch) noexcept {
  switch (branch) {
  case AccessBranch::OWNER:
    return "owner";
  case AccessBranch::GROUP:
    return "group";
  case AccessBranch::OTHER:
  default:
    return "other";
  }
}

/* ----------------------------- Descriptor Methods ----------------------------- */

std::string FileAccessDescriptor::toString() const {
  return fmt::format("mode={} owner={}({}):{}({})", formatMode(mode), nameOrUnknown(ownerName),
                     idOrUnknown(ownerUid), nameOrUnknown(groupName), idOrUnknown(ownerGid));
}

std::string ProcessIdentity::toString() const {
  return fmt::format("{}:{}", idOrUnknown(uid), idOrUnknown(gid));
}

std::string AccessDecision::hint() const {
  if (!recommendedMode) {
    return {};
  }
  return fmt::format("tighten to {}", formatMode(recommendedMode));
}

/* ----------------------------- API ----------------------------- */

AccessDecision evaluateAccess(const FileAccessDescriptor& file,
                              const ProcessIdentity& process) noexcept {
  AccessDecision decision;

  if (process.uid && file.ownerUid && *file.ownerUid == *process.uid) {
    decision.branch = AccessBranch::OWNER;
    decision.readable = isOneOf(file.mode, {MODE_OWNER_ONLY, MODE_GROUP_READ, MODE_WORLD_READ});
    if (decision.readable && *file.mode != MODE_OWNER_ONLY) {
      decision.recommendedMode = MODE_OWNER_ONLY;
    }
    return decision;
  }

  if (process.gid && file.ownerGid && *file.ownerGid == *process.gid) {
    decision.branch = AccessBranch::GROUP;
    decision.readable = isOneOf(file.mode, {MODE_GROUP_READ, MODE_WORLD_READ});
    if (decision.readable && *file.mode != MODE_GROUP_READ) {
      decision.recommendedMode = MODE_GROUP_READ;
    }
    return decision;
  }

  // World-readable works but gets no hint here; see DESIGN.md.
  decision.branch = AccessBranch::OTHER;
  decision.readable = isOneOf(file.mode, {MODE_WORLD_READ});
  return decision;
}

std::optional<std::uint32_t> parseOctalMode(std::string_view text) noexcept {
  const std::string_view BODY = helpers::strings::trim(text);
  if (BODY.empty() || BODY.size() > 4) {
    return std::nullopt;
  }

  std::uint32_t mode = 0;
  for (const char C : BODY) {
    if (C < '0' || C > '7') {
      return std::nullopt;
    }
    mode = (mode << 3) | static_cast<std::uint32_t>(C - '0');
  }
  return mode;
}

std::string formatMode(std::optional<std::uint32_t> mode) {
  return mode ? fmt::format("{:o}", *mode) : std::string("?");
}

std::string remediationCommand(const ProcessIdentity& process, const std::string& path) {
  if (process.isKnown()) {
    return fmt::format("chown {}:{} {} && chmod 600 {}", *process.uid, *process.gid, path, path);
  }
  return fmt::format("align the owner/permissions of {} with the container user (usually "
                     "uid/gid {})",
                     path, DEFAULT_CONTAINER_ID);
}

std::string securityHint(const AccessDecision& decision, const std::string& path) {
  if (!decision.recommendedMode) {
    return {};
  }
  return fmt::format("chmod {} {}", formatMode(decision.recommendedMode), path);
}

} // namespace access

} // namespace awgcheck
