#include "tally/version.hpp"

#include <sstream>

#include "tally/hash.hpp"
#include "tally/jsonlite.hpp"

namespace tally {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.semver = SEMVER;
  const auto h = hash_runtime_info();
  m.hash_primitive = h.primitive;
  m.hash_version = h.version;
#if defined(TALLY_WITH_ZSTD)
  m.zstd = true;
#endif
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"semver\":\"" << jsonlite::escape(m.semver) << "\""
    << ",\"abi\":" << m.abi
    << ",\"event_log\":" << m.event_log
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"hash_version\":\"" << jsonlite::escape(m.hash_version) << "\""
    << ",\"compression\":[\"identity\"" << (m.zstd ? ",\"zstd\"" : "") << "]"
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

std::string version_line() {
  return std::string("tally version ") + SEMVER;
}

CompatibilityResult check_compatibility(uint32_t caller_abi_version) {
  CompatibilityResult r;
  if (caller_abi_version != ABI_VERSION) {
    r.ok          = false;
    r.error_code  = "abi_version_mismatch";
    r.description = "Caller ABI version " + std::to_string(caller_abi_version) +
                    " != library ABI version " + std::to_string(ABI_VERSION) +
                    ". Rebuild the caller against the current tally headers.";
    r.required_abi = ABI_VERSION;
    r.actual_abi   = caller_abi_version;
  }
  return r;
}

}  // namespace version
}  // namespace tally
