#pragma once

#include <cstdint>
#include <string_view>

namespace narrative::core {

/*
  Input limits enforced by the editorial entry points. Overridden from
  the curation.limits config section; zero values keep the defaults.
*/
struct CurationLimits {
  uint32_t max_title_length            = 500;
  uint32_t max_cluster_ids             = 50;
  uint32_t max_children_per_assignment = 20;
  uint32_t max_group_name_length       = 255;
  uint32_t default_dashboard_limit     = 50;
  uint32_t max_dashboard_limit         = 200;
  uint32_t audit_entries_in_details    = 20;
};

// Length in code points; titles are UTF-8.
inline std::size_t Utf8Length(std::string_view text) {
  std::size_t n = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) ++n;
  }
  return n;
}

} // namespace narrative::core
