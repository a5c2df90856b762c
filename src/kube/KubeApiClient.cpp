#include "kube/KubeApiClient.hpp"

#include "common/Errors.hpp"
#include "kube/ResourceListParser.hpp"

#include <httplib.h>
#include <openssl/crypto.h>

#include <string>

namespace kes::kube {

KubeApiClient::KubeApiClient(KubeClientOptions kcoOptions)
    : _kcoOptions(std::move(kcoOptions)),
      _upClient(std::make_unique<httplib::Client>(_kcoOptions.sApiUrl)) {
  _upClient->set_connection_timeout(_kcoOptions.iTimeoutSeconds, 0);
  _upClient->set_read_timeout(_kcoOptions.iTimeoutSeconds, 0);
  _upClient->set_keep_alive(true);

  if (_kcoOptions.oCaFile) {
    _upClient->set_ca_cert_path(*_kcoOptions.oCaFile);
  }
  _upClient->enable_server_certificate_verification(!_kcoOptions.bInsecureSkipTlsVerify);

  // httplib keeps the only live copy of the token from here on
  if (_kcoOptions.oBearerToken) {
    _uTokenLength = _kcoOptions.oBearerToken->size();
    _upClient->set_bearer_token_auth(*_kcoOptions.oBearerToken);
    OPENSSL_cleanse(_kcoOptions.oBearerToken->data(), _uTokenLength);
    _kcoOptions.oBearerToken.reset();
  }
}

KubeApiClient::~KubeApiClient() {
  if (_uTokenLength > 0) {
    // Same-length assignment overwrites httplib's token buffer in place
    _upClient->set_bearer_token_auth(std::string(_uTokenLength, '\0'));
  }
  _upClient->stop();
}

std::string KubeApiClient::collectionPath(const common::ResourceDescriptor& rdDescriptor) {
  std::string sPath = "/apis/" + rdDescriptor.sGroup + "/" + rdDescriptor.sVersion;
  if (rdDescriptor.oNamespace) {
    sPath += "/namespaces/" + *rdDescriptor.oNamespace;
  }
  sPath += "/" + rdDescriptor.sPlural;
  return sPath;
}

std::vector<common::CustomResource> KubeApiClient::listResources(
    const common::ResourceDescriptor& rdDescriptor) {
  const std::string sPath = collectionPath(rdDescriptor);
  auto res = _upClient->Get(sPath, httplib::Headers{{"Accept", "application/json"}});
  if (!res) {
    throw common::TransportError("transport_failed",
                                 "GET " + sPath + " failed: " + httplib::to_string(res.error()));
  }

  if (res->status == 401 || res->status == 403) {
    throw common::AuthorizationError(res->status, "unauthorized",
                                     "GET " + sPath + " rejected with HTTP " +
                                         std::to_string(res->status));
  }
  if (res->status != 200) {
    throw common::FetchError(res->status, "upstream_status",
                             "GET " + sPath + " returned HTTP " + std::to_string(res->status));
  }

  return ResourceListParser::parse(res->body, rdDescriptor);
}

}  // namespace kes::kube
