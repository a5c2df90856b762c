#include "common/Config.hpp"

#include "common/Errors.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace kes::common {

namespace {

constexpr const char* kServiceAccountTokenPath =
    "/var/run/secrets/kubernetes.io/serviceaccount/token";
constexpr const char* kServiceAccountCaPath =
    "/var/run/secrets/kubernetes.io/serviceaccount/ca.crt";

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    size_t uPos = 0;
    int iValue = std::stoi(sValue, &uPos);
    if (uPos != sValue.size()) {
      throw std::invalid_argument(sValue);
    }
    return iValue;
  } catch (const std::logic_error&) {
    throw ConfigError("invalid_integer",
                      std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return bDefault;
  }
  return sValue == "true" || sValue == "1" || sValue == "yes";
}

bool Config::fileReadable(const std::string& sPath) {
  std::ifstream ifs(sPath);
  return ifs.is_open();
}

std::string Config::readSecretFile(const std::string& sPath, const std::string& sSource) {
  std::ifstream ifs(sPath);
  if (!ifs.is_open()) {
    throw ConfigError("secret_file_unreadable",
                      "Cannot open secret file specified by " + sSource + ": " + sPath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  std::string sValue = oss.str();

  // Trim trailing whitespace/newlines
  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw ConfigError("secret_file_empty",
                      "Secret file is empty: " + sPath + " (from " + sSource + ")");
  }
  return sValue;
}

std::optional<std::string> Config::loadSecret(const char* pVarName) {
  // Try the direct env var first
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  // Try _FILE fallback
  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    return std::nullopt;
  }
  return readSecretFile(sFilePath, sFileVar);
}

Config Config::load() {
  Config cfg;

  // ── Kubernetes API ─────────────────────────────────────────────────────
  const std::string sApiUrl = getEnv("KES_KUBE_API_URL");
  if (!sApiUrl.empty()) {
    cfg.sKubeApiUrl = sApiUrl;
  }

  cfg.oKubeToken = loadSecret("KES_KUBE_TOKEN");
  if (!cfg.oKubeToken && fileReadable(kServiceAccountTokenPath)) {
    cfg.oKubeToken = readSecretFile(kServiceAccountTokenPath, "service account");
  }

  const std::string sCaFile = getEnv("KES_KUBE_CA_FILE");
  if (!sCaFile.empty()) {
    cfg.oKubeCaFile = sCaFile;
  } else if (fileReadable(kServiceAccountCaPath)) {
    cfg.oKubeCaFile = std::string(kServiceAccountCaPath);
  }

  cfg.bKubeInsecureSkipTlsVerify = getEnvBool("KES_KUBE_INSECURE_SKIP_TLS_VERIFY", false);
  cfg.iHttpTimeoutSeconds = getEnvInt("KES_HTTP_TIMEOUT_SECONDS", 30);

  // ── Descriptor ─────────────────────────────────────────────────────────
  const std::string sGroup = getEnv("KES_CRD_GROUP");
  if (!sGroup.empty()) {
    cfg.sCrdGroup = sGroup;
  }
  const std::string sVersion = getEnv("KES_CRD_VERSION");
  if (!sVersion.empty()) {
    cfg.sCrdVersion = sVersion;
  }
  const std::string sPlural = getEnv("KES_CRD_PLURAL");
  if (!sPlural.empty()) {
    cfg.sCrdPlural = sPlural;
  }
  const std::string sNamespace = getEnv("KES_WATCH_NAMESPACE");
  if (!sNamespace.empty()) {
    cfg.oWatchNamespace = sNamespace;
  }

  // ── Poller / health / logging ──────────────────────────────────────────
  cfg.iPollerIntervalMs = getEnvInt("KES_POLLER_INTERVAL_MS", 10000);
  cfg.iHealthPort = getEnvInt("KES_HEALTH_PORT", 3001);

  const std::string sLogLevel = getEnv("KES_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.iPollerIntervalMs < 1) {
    throw ConfigError("invalid_interval",
                      "KES_POLLER_INTERVAL_MS must be >= 1 (got " +
                          std::to_string(cfg.iPollerIntervalMs) + ")");
  }

  if (cfg.iHttpTimeoutSeconds < 1) {
    throw ConfigError("invalid_timeout",
                      "KES_HTTP_TIMEOUT_SECONDS must be >= 1 (got " +
                          std::to_string(cfg.iHttpTimeoutSeconds) + ")");
  }

  if (cfg.iHealthPort < 0 || cfg.iHealthPort > 65535) {
    throw ConfigError("invalid_port",
                      "KES_HEALTH_PORT must be in [0, 65535] (got " +
                          std::to_string(cfg.iHealthPort) + ")");
  }

  if (cfg.sKubeApiUrl.rfind("http://", 0) != 0 && cfg.sKubeApiUrl.rfind("https://", 0) != 0) {
    throw ConfigError("invalid_api_url",
                      "KES_KUBE_API_URL must start with http:// or https:// (got " +
                          cfg.sKubeApiUrl + ")");
  }

  return cfg;
}

}  // namespace kes::common
