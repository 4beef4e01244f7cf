/**
 * @file ComposeProbe.cpp
 * @brief Implementation of the Docker Compose backed probe.
 */

#include "src/probe/inc/ComposeProbe.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/probe/inc/ProbeCommands.hpp"

#include <utility>

#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace awgcheck {

namespace probe {

namespace {

constexpr std::size_t NAME_BUFFER_SIZE = 16384;

/// Permission and special bits as printed by "stat -c %a".
constexpr std::uint32_t MODE_BITS_MASK = 07777;

} // namespace

/* ----------------------------- ComposeProbe ----------------------------- */

ComposeProbe::ComposeProbe(ComposeProbeConfig config) noexcept : config_{std::move(config)} {}

std::vector<std::string> ComposeProbe::composeArgv(std::vector<std::string> args) const {
  std::vector<std::string> argv = config_.composeCommand;
  argv.insert(argv.end(), std::make_move_iterator(args.begin()),
              std::make_move_iterator(args.end()));
  return argv;
}

bool ComposeProbe::controlPlaneReachable() noexcept {
  return runCommand(composeArgv({"ps"}), config_.projectDir, config_.timeoutMs).succeeded();
}

std::optional<container::StatusListing> ComposeProbe::listServices() noexcept {
  const CommandOutput OUT =
      runCommand(composeArgv({"ps", "--format", "{{.Service}}\t{{.Status}}"}),
                 config_.projectDir, config_.timeoutMs);
  if (!OUT.succeeded()) {
    return std::nullopt;
  }
  return container::parseStatusListing(OUT.output);
}

ExecResult ComposeProbe::execInService(std::string_view service,
                                       std::string_view command) noexcept {
  const CommandOutput OUT = runCommand(
      composeArgv({"exec", "-T", std::string(service), "sh", "-lc", std::string(command)}),
      config_.projectDir, config_.execTimeoutMs);

  ExecResult res;
  res.ran = OUT.started && !OUT.timedOut;
  res.exitCode = OUT.exitCode;
  res.output = OUT.output;
  return res;
}

std::optional<access::FileAccessDescriptor>
ComposeProbe::statPath(const std::string& path) noexcept {
  return statFileAccess(path);
}

std::optional<std::string> ComposeProbe::readLocalFile(const std::string& path) noexcept {
  return helpers::files::readFileToString(path);
}

bool ComposeProbe::localDirectoryExists(const std::string& path) noexcept {
  return helpers::files::isDirectory(path);
}

access::ProcessIdentity ComposeProbe::queryIdentity(std::string_view service) noexcept {
  access::ProcessIdentity id;
  const ExecResult UID = execInService(service, idCommand(false));
  if (UID.succeeded()) {
    id.uid = parseNumericId(UID.output);
  }
  const ExecResult GID = execInService(service, idCommand(true));
  if (GID.succeeded()) {
    id.gid = parseNumericId(GID.output);
  }
  return id;
}

std::optional<std::int64_t> ComposeProbe::heartbeatAgeSeconds(std::string_view service,
                                                              std::string_view path) noexcept {
  const ExecResult RES = execInService(service, fileAgeCommand(path));
  if (!RES.succeeded()) {
    return std::nullopt;
  }
  return parseFileAge(RES.output);
}

/* ----------------------------- Host Lookups ----------------------------- */

std::string lookupUserName(std::uint32_t uid) {
  struct passwd pwd{};
  struct passwd* found = nullptr;
  std::vector<char> buf(NAME_BUFFER_SIZE);
  if (::getpwuid_r(static_cast<uid_t>(uid), &pwd, buf.data(), buf.size(), &found) != 0 ||
      found == nullptr || found->pw_name == nullptr) {
    return {};
  }
  return found->pw_name;
}

std::string lookupGroupName(std::uint32_t gid) {
  struct group grp{};
  struct group* found = nullptr;
  std::vector<char> buf(NAME_BUFFER_SIZE);
  if (::getgrgid_r(static_cast<gid_t>(gid), &grp, buf.data(), buf.size(), &found) != 0 ||
      found == nullptr || found->gr_name == nullptr) {
    return {};
  }
  return found->gr_name;
}

std::optional<access::FileAccessDescriptor> statFileAccess(const std::string& path) noexcept {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    return std::nullopt;
  }

  access::FileAccessDescriptor desc;
  desc.mode = static_cast<std::uint32_t>(st.st_mode) & MODE_BITS_MASK;
  desc.ownerUid = static_cast<std::uint32_t>(st.st_uid);
  desc.ownerGid = static_cast<std::uint32_t>(st.st_gid);
  desc.ownerName = lookupUserName(*desc.ownerUid);
  desc.groupName = lookupGroupName(*desc.ownerGid);
  return desc;
}

} // namespace probe

} // namespace awgcheck
