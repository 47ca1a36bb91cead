#pragma once

#include "adtjson/naming/naming_strategy.h"
#include "adtjson/naming/type_identity.h"

#include <cstddef>
#include <string>
#include <vector>

namespace adtjson::derivation {

// TagCollision records two variants that resolved to the same tag. Decoding
// still works under a collision: the variant declared first always wins.
struct TagCollision {
  std::string tag;
  std::size_t first_index{0};
  std::size_t duplicate_index{0};
  std::string first_variant;      // qualified name
  std::string duplicate_variant;  // qualified name
};

// resolve_tags names every variant in order. Throws ConfigurationError for an
// unmapped user-defined tag.
[[nodiscard]] std::vector<std::string> resolve_tags(
    const std::vector<naming::TypeIdentity>& variants, const naming::NamingStrategy& naming);

// One entry per later variant whose tag repeats an earlier one, in declaration order.
[[nodiscard]] std::vector<TagCollision> find_tag_collisions(
    const std::vector<naming::TypeIdentity>& variants, const std::vector<std::string>& tags);

// Throws ConfigurationError listing every collision; does nothing when there are none.
void reject_tag_collisions(const naming::TypeIdentity& sum,
                           const std::vector<TagCollision>& collisions);

}  // namespace adtjson::derivation
