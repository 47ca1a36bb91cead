#include "adtjson/derivation/tagging.h"

#include "adtjson/core/configuration_error.h"

#include <map>

namespace adtjson::derivation {

std::vector<std::string> resolve_tags(const std::vector<naming::TypeIdentity>& variants,
                                      const naming::NamingStrategy& naming) {
  std::vector<std::string> tags;
  tags.reserve(variants.size());
  for (const auto& identity : variants) {
    tags.push_back(naming.name(identity));
  }
  return tags;
}

std::vector<TagCollision> find_tag_collisions(const std::vector<naming::TypeIdentity>& variants,
                                              const std::vector<std::string>& tags) {
  std::vector<TagCollision> collisions;
  std::map<std::string, std::size_t> first_by_tag;
  for (std::size_t i = 0; i < tags.size() && i < variants.size(); ++i) {
    auto [it, inserted] = first_by_tag.emplace(tags[i], i);
    if (inserted) {
      continue;
    }
    TagCollision collision;
    collision.tag = tags[i];
    collision.first_index = it->second;
    collision.duplicate_index = i;
    collision.first_variant = variants[it->second].qualified_name();
    collision.duplicate_variant = variants[i].qualified_name();
    collisions.push_back(std::move(collision));
  }
  return collisions;
}

void reject_tag_collisions(const naming::TypeIdentity& sum,
                           const std::vector<TagCollision>& collisions) {
  if (collisions.empty()) {
    return;
  }
  std::string message = "duplicate tags in " + sum.qualified_name() + ":";
  for (const auto& c : collisions) {
    message += " \"" + c.tag + "\" (" + c.first_variant + ", " + c.duplicate_variant + ")";
  }
  throw core::ConfigurationError(message);
}

}  // namespace adtjson::derivation
