#include "kube/ResourceListParser.hpp"

#include "common/Errors.hpp"

#include <nlohmann/json.hpp>

namespace kes::kube {

namespace {

std::string stringField(const nlohmann::json& jObj, const char* pKey) {
  auto it = jObj.find(pKey);
  if (it == jObj.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

}  // namespace

std::string ResourceListParser::locatorFor(const nlohmann::json& jMetadata,
                                           const common::ResourceDescriptor& rdDescriptor) {
  std::string sSelfLink = stringField(jMetadata, "selfLink");
  if (!sSelfLink.empty()) {
    return sSelfLink;
  }

  // selfLink is no longer populated since Kubernetes 1.20
  std::string sLocator = "/apis/" + rdDescriptor.sGroup + "/" + rdDescriptor.sVersion;
  const std::string sNamespace = stringField(jMetadata, "namespace");
  if (!sNamespace.empty()) {
    sLocator += "/namespaces/" + sNamespace;
  }
  sLocator += "/" + rdDescriptor.sPlural + "/" + stringField(jMetadata, "name");
  return sLocator;
}

std::vector<common::CustomResource> ResourceListParser::parse(
    const std::string& sBody, const common::ResourceDescriptor& rdDescriptor) {
  nlohmann::json jList;
  try {
    jList = nlohmann::json::parse(sBody);
  } catch (const nlohmann::json::parse_error& ex) {
    throw common::MalformedResponseError("invalid_json",
                                         std::string("Response is not valid JSON: ") + ex.what());
  }

  if (!jList.is_object() || !jList.contains("items") || !jList["items"].is_array()) {
    throw common::MalformedResponseError("missing_items", "Response has no items array");
  }

  auto& jItems = jList["items"];
  std::vector<common::CustomResource> vResources;
  vResources.reserve(jItems.size());

  for (size_t i = 0; i < jItems.size(); ++i) {
    auto& jItem = jItems[i];
    if (!jItem.is_object() || !jItem.contains("metadata") || !jItem["metadata"].is_object()) {
      throw common::MalformedResponseError(
          "missing_metadata", "Item " + std::to_string(i) + " has no metadata object");
    }

    const auto& jMetadata = jItem["metadata"];
    common::CustomResource crResource;
    crResource.sUid = stringField(jMetadata, "uid");
    crResource.sResourceVersion = stringField(jMetadata, "resourceVersion");
    if (crResource.sUid.empty() || crResource.sResourceVersion.empty()) {
      throw common::MalformedResponseError(
          "missing_identity",
          "Item " + std::to_string(i) + " lacks metadata.uid or metadata.resourceVersion");
    }
    crResource.sLocator = locatorFor(jMetadata, rdDescriptor);
    crResource.jObject = std::move(jItem);
    vResources.push_back(std::move(crResource));
  }

  return vResources;
}

}  // namespace kes::kube
