#pragma once

#include <optional>
#include <string>

namespace kes::common {

/// Environment variable loader.
/// Loads all env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Kubernetes API ────────────────────────────────────────────────────
  std::string sKubeApiUrl = "https://kubernetes.default.svc";
  std::optional<std::string> oKubeToken;   // raw token (zeroed after handoff to KubeApiClient)
  std::optional<std::string> oKubeCaFile;
  bool bKubeInsecureSkipTlsVerify = false;
  int iHttpTimeoutSeconds = 30;

  // ── Custom resource descriptor ────────────────────────────────────────
  std::string sCrdGroup = "kubernetes-client.io";
  std::string sCrdVersion = "v1";
  std::string sCrdPlural = "externalsecrets";
  std::optional<std::string> oWatchNamespace;

  // ── Poller ────────────────────────────────────────────────────────────
  int iPollerIntervalMs = 10000;

  // ── Health endpoint ───────────────────────────────────────────────────
  int iHealthPort = 3001;  // 0 = disabled

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all config from environment variables.
  /// KES_KUBE_TOKEN falls back to KES_KUBE_TOKEN_FILE, then to the
  /// in-cluster service account token when that file exists.
  /// Throws ConfigError on invalid values.
  static Config load();

 private:
  /// Read an env var with _FILE fallback for secrets.
  /// Returns nullopt when neither varName nor varName + "_FILE" is set.
  /// Trims trailing whitespace/newlines from file contents.
  static std::optional<std::string> loadSecret(const char* pVarName);

  /// Read a whole file, trimming trailing whitespace. Throws if unreadable or empty.
  static std::string readSecretFile(const std::string& sPath, const std::string& sSource);

  /// True when sPath names a readable file.
  static bool fileReadable(const std::string& sPath);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Read an env var as bool (true/false/1/0), default false.
  static bool getEnvBool(const char* pVarName, bool bDefault);
};

}  // namespace kes::common
