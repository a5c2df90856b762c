#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"

namespace kes::kube {

/// Decodes a Kubernetes *List response body into CustomResource values.
/// Class abbreviation: rlp
class ResourceListParser {
 public:
  /// Parse sBody, preserving `items` order.
  /// Throws MalformedResponseError if the body is not JSON, has no `items`
  /// array, or any item lacks a string metadata.uid / metadata.resourceVersion.
  static std::vector<common::CustomResource> parse(const std::string& sBody,
                                                   const common::ResourceDescriptor& rdDescriptor);

  /// metadata.selfLink when present and non-empty, otherwise a path built
  /// from the descriptor, metadata.namespace and metadata.name.
  static std::string locatorFor(const nlohmann::json& jMetadata,
                                const common::ResourceDescriptor& rdDescriptor);
};

}  // namespace kes::kube
