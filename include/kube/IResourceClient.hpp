#pragma once

#include <vector>

#include "common/Types.hpp"

namespace kes::kube {

/// Pure abstract interface for listing a custom resource collection.
/// Implementations throw common::FetchError on failure; results are never partial.
class IResourceClient {
 public:
  virtual ~IResourceClient() = default;

  virtual std::vector<common::CustomResource> listResources(
      const common::ResourceDescriptor& rdDescriptor) = 0;
};

}  // namespace kes::kube
