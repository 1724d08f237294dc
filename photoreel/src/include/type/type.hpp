#pragma once

#include <cstdint>
#include <string>

namespace photoreel {

// Opaque file identifier as delivered by the fragment wire format
using item_id_t      = std::string;

// Reference to a listing or section fragment, scoped to one album
using fragment_ref_t = uint64_t;

// Seconds since epoch
using timestamp_t    = int64_t;

// Position of a section in the time-ordered listing
using section_idx_t  = int;

enum class QualityTier { Small, Medium, Large };

inline auto QualityTierName(QualityTier tier) -> const char* {
  switch (tier) {
    case QualityTier::Small:
      return "small";
    case QualityTier::Medium:
      return "medium";
    case QualityTier::Large:
      return "large";
  }
  return "small";
}
};  // namespace photoreel
