#pragma once

#include "recall/types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace recall::resources {

/**
 * Outcome of resolving a normative profile id. Either carries a validated
 * profile or records which id failed to resolve; the scorer branches on it
 * once instead of threading a nullable profile through every computation.
 */
class ProfileLookup {
public:
  static ProfileLookup resolved(NormativeProfile profile);
  static ProfileLookup missing(std::string requested_id);

  bool is_resolved() const noexcept { return profile_.has_value(); }
  const std::string& requested_id() const noexcept { return requested_id_; }

  // Throws std::logic_error when the lookup is missing.
  const NormativeProfile& profile() const;

private:
  ProfileLookup(std::string requested_id, std::optional<NormativeProfile> profile);

  std::string requested_id_;
  std::optional<NormativeProfile> profile_;
};

/**
 * Immutable, validated set of normative profiles keyed by id. Construction
 * rejects invalid profiles and duplicate ids; insertion order is preserved
 * for listing.
 */
class ProfileCatalog {
public:
  ProfileCatalog();
  explicit ProfileCatalog(std::vector<NormativeProfile> profiles);

  bool empty() const { return profiles_.empty(); }
  std::size_t size() const { return profiles_.size(); }
  const std::vector<NormativeProfile>& profiles() const { return profiles_; }

  const NormativeProfile* find(std::string_view id) const;
  const NormativeProfile& at(std::string_view id) const;
  ProfileLookup lookup(std::string_view id) const;

private:
  std::vector<NormativeProfile> profiles_;
  std::unordered_map<std::string, std::size_t> by_id_;
};

// Pilot profiles shipped with the application.
const std::vector<NormativeProfile>& builtin_profiles();
ProfileCatalog build_builtin_profile_catalog();

// Accepts an array of profile objects or {"profiles": [...]}.
ProfileCatalog profile_catalog_from_json(const nlohmann::json& document);
ProfileCatalog load_profile_catalog(const std::filesystem::path& path);

} // namespace recall::resources
