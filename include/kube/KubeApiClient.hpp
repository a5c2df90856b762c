#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kube/IResourceClient.hpp"

namespace httplib {
class Client;
}

namespace kes::kube {

/// Connection settings for KubeApiClient.
/// Class abbreviation: kco
struct KubeClientOptions {
  std::string sApiUrl;
  std::optional<std::string> oBearerToken;
  std::optional<std::string> oCaFile;
  bool bInsecureSkipTlsVerify = false;
  int iTimeoutSeconds = 30;
};

/// Lists custom resources through the Kubernetes REST API (cpp-httplib).
/// One keep-alive connection is reused across polls; listResources() must
/// only be called from one thread at a time.
/// Class abbreviation: kac
class KubeApiClient : public IResourceClient {
 public:
  explicit KubeApiClient(KubeClientOptions kcoOptions);
  ~KubeApiClient() override;

  KubeApiClient(const KubeApiClient&) = delete;
  KubeApiClient& operator=(const KubeApiClient&) = delete;

  std::vector<common::CustomResource> listResources(
      const common::ResourceDescriptor& rdDescriptor) override;

  /// /apis/{group}/{version}[/namespaces/{ns}]/{plural}
  static std::string collectionPath(const common::ResourceDescriptor& rdDescriptor);

 private:
  KubeClientOptions _kcoOptions;
  std::unique_ptr<httplib::Client> _upClient;
  size_t _uTokenLength = 0;
};

}  // namespace kes::kube
