#include "resources/normative_profiles.hpp"

#include "../debug_log.hpp"
#include "../json_bridge.hpp"

#include <cmath>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace recall {

void NormativeProfile::validate() const {
  const auto require_finite = [this](double value, const char* field) {
    if (!std::isfinite(value)) {
      throw std::invalid_argument("Normative profile '" + id + "': " + field +
                                  " must be a finite number");
    }
  };
  if (id.empty()) {
    throw std::invalid_argument("Normative profile id must not be empty");
  }
  require_finite(mean_wpm, "mean_wpm");
  require_finite(sd_wpm, "sd_wpm");
  require_finite(mean_coverage, "mean_coverage");
  require_finite(sd_coverage, "sd_coverage");
  require_finite(reliability_coverage, "reliability_coverage");
  if (sd_wpm <= 0.0) {
    throw std::invalid_argument("Normative profile '" + id + "': sd_wpm must be positive");
  }
  if (sd_coverage <= 0.0) {
    throw std::invalid_argument("Normative profile '" + id + "': sd_coverage must be positive");
  }
  if (reliability_coverage <= 0.0 || reliability_coverage >= 1.0) {
    throw std::invalid_argument("Normative profile '" + id +
                                "': reliability_coverage must be within (0, 1)");
  }
}

namespace resources {

ProfileLookup::ProfileLookup(std::string requested_id, std::optional<NormativeProfile> profile)
    : requested_id_(std::move(requested_id)), profile_(std::move(profile)) {}

ProfileLookup ProfileLookup::resolved(NormativeProfile profile) {
  std::string id = profile.id;
  return ProfileLookup(std::move(id), std::move(profile));
}

ProfileLookup ProfileLookup::missing(std::string requested_id) {
  return ProfileLookup(std::move(requested_id), std::nullopt);
}

const NormativeProfile& ProfileLookup::profile() const {
  if (!profile_.has_value()) {
    throw std::logic_error("ProfileLookup: profile '" + requested_id_ + "' did not resolve");
  }
  return profile_.value();
}

ProfileCatalog::ProfileCatalog() = default;

ProfileCatalog::ProfileCatalog(std::vector<NormativeProfile> profiles)
    : profiles_(std::move(profiles)) {
  by_id_.reserve(profiles_.size());
  for (std::size_t i = 0; i < profiles_.size(); ++i) {
    const auto& profile = profiles_[i];
    profile.validate();
    if (!by_id_.emplace(profile.id, i).second) {
      throw std::invalid_argument("Duplicate normative profile id: " + profile.id);
    }
  }
}

const NormativeProfile* ProfileCatalog::find(std::string_view id) const {
  const auto it = by_id_.find(std::string(id));
  if (it == by_id_.end()) {
    return nullptr;
  }
  return &profiles_[it->second];
}

const NormativeProfile& ProfileCatalog::at(std::string_view id) const {
  const auto* profile = find(id);
  if (!profile) {
    throw std::out_of_range("ProfileCatalog: unknown profile " + std::string(id));
  }
  return *profile;
}

ProfileLookup ProfileCatalog::lookup(std::string_view id) const {
  const auto* profile = find(id);
  if (!profile) {
    return ProfileLookup::missing(std::string(id));
  }
  return ProfileLookup::resolved(*profile);
}

const std::vector<NormativeProfile>& builtin_profiles() {
  static const std::vector<NormativeProfile> profiles = {
      {"adult_high_performance", "Adulto (Alto Desempenho) - 39 anos / QI ~132",
       Language::PtBR, 250.0, 40.0, 80.0, 10.0, 0.85},
      {"adult_pt_br_general", "Adulto Geral (pt-BR) - Piloto",
       Language::PtBR, 180.0, 30.0, 65.0, 15.0, 0.80},
      {"elderly_pt_br_general", "Idoso >65 anos (pt-BR) - Piloto",
       Language::PtBR, 140.0, 25.0, 50.0, 12.0, 0.75},
      {"adult_en_us_general", "General Adult (en-US) - Pilot",
       Language::EnUS, 230.0, 40.0, 65.0, 15.0, 0.80},
  };
  return profiles;
}

ProfileCatalog build_builtin_profile_catalog() {
  return ProfileCatalog(builtin_profiles());
}

ProfileCatalog profile_catalog_from_json(const nlohmann::json& document) {
  const nlohmann::json* entries = &document;
  if (document.is_object()) {
    if (!document.contains("profiles")) {
      throw std::invalid_argument("Profile catalog object must contain 'profiles'");
    }
    entries = &document["profiles"];
  }
  if (!entries->is_array()) {
    throw std::invalid_argument("Profile catalog must be an array of profiles");
  }

  std::vector<NormativeProfile> profiles;
  profiles.reserve(entries->size());
  for (const auto& entry : *entries) {
    profiles.push_back(bridge::normative_profile_from_json(entry));
  }
  return ProfileCatalog(std::move(profiles));
}

ProfileCatalog load_profile_catalog(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Normative profile catalog not found at: " + path.string());
  }
  std::ifstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open normative profile catalog: " + path.string());
  }
  std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::invalid_argument("Normative profile catalog is not valid JSON (" +
                                path.string() + "): " + e.what());
  }
  auto catalog = profile_catalog_from_json(document);
  detail::debug_log("profiles", "loaded " + std::to_string(catalog.size()) +
                                    " profiles from " + path.string());
  return catalog;
}

} // namespace resources
} // namespace recall
