#pragma once

#include <optional>
#include <string>

namespace tripsense {

// Backend transport categories. transport_commun is never inferred from
// activity recognition alone; it only comes from a user correction.
enum class TransportType { MARCHE, VELO, TRANSPORT_COMMUN, VOITURE };

inline const char *transport_to_string(TransportType type) {
  switch (type) {
  case TransportType::MARCHE:
    return "marche";
  case TransportType::VELO:
    return "velo";
  case TransportType::TRANSPORT_COMMUN:
    return "transport_commun";
  case TransportType::VOITURE:
    return "voiture";
  }
  return "marche";
}

inline std::optional<TransportType>
transport_from_string(const std::string &name) {
  if (name == "marche")
    return TransportType::MARCHE;
  if (name == "velo")
    return TransportType::VELO;
  if (name == "transport_commun")
    return TransportType::TRANSPORT_COMMUN;
  if (name == "voiture")
    return TransportType::VOITURE;
  return std::nullopt;
}

} // namespace tripsense
