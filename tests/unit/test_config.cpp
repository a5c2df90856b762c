#include "common/Config.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace kes::common;

namespace {

void clearAllKesEnv() {
  const char* vVars[] = {
      "KES_KUBE_API_URL", "KES_KUBE_TOKEN", "KES_KUBE_TOKEN_FILE", "KES_KUBE_CA_FILE",
      "KES_KUBE_INSECURE_SKIP_TLS_VERIFY", "KES_HTTP_TIMEOUT_SECONDS", "KES_CRD_GROUP",
      "KES_CRD_VERSION", "KES_CRD_PLURAL", "KES_WATCH_NAMESPACE", "KES_POLLER_INTERVAL_MS",
      "KES_HEALTH_PORT", "KES_LOG_LEVEL",
      nullptr};
  for (int i = 0; vVars[i] != nullptr; ++i) {
    unsetenv(vVars[i]);
  }
}

}  // namespace

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { clearAllKesEnv(); }
  void TearDown() override { clearAllKesEnv(); }
};

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
  auto cfg = Config::load();
  EXPECT_EQ(cfg.sKubeApiUrl, "https://kubernetes.default.svc");
  EXPECT_EQ(cfg.sCrdGroup, "kubernetes-client.io");
  EXPECT_EQ(cfg.sCrdVersion, "v1");
  EXPECT_EQ(cfg.sCrdPlural, "externalsecrets");
  EXPECT_FALSE(cfg.oWatchNamespace.has_value());
  EXPECT_EQ(cfg.iPollerIntervalMs, 10000);
  EXPECT_EQ(cfg.iHealthPort, 3001);
  EXPECT_EQ(cfg.iHttpTimeoutSeconds, 30);
  EXPECT_FALSE(cfg.bKubeInsecureSkipTlsVerify);
  EXPECT_EQ(cfg.sLogLevel, "info");
}

TEST_F(ConfigTest, OverrideDefaults) {
  setenv("KES_KUBE_API_URL", "http://127.0.0.1:8001", 1);
  setenv("KES_CRD_GROUP", "example.io", 1);
  setenv("KES_CRD_VERSION", "v1beta1", 1);
  setenv("KES_CRD_PLURAL", "widgets", 1);
  setenv("KES_WATCH_NAMESPACE", "team-a", 1);
  setenv("KES_POLLER_INTERVAL_MS", "2500", 1);
  setenv("KES_HEALTH_PORT", "0", 1);
  setenv("KES_LOG_LEVEL", "debug", 1);
  setenv("KES_KUBE_INSECURE_SKIP_TLS_VERIFY", "true", 1);
  setenv("KES_KUBE_CA_FILE", "/etc/kes/ca.pem", 1);

  auto cfg = Config::load();
  EXPECT_EQ(cfg.sKubeApiUrl, "http://127.0.0.1:8001");
  EXPECT_EQ(cfg.sCrdGroup, "example.io");
  EXPECT_EQ(cfg.sCrdVersion, "v1beta1");
  EXPECT_EQ(cfg.sCrdPlural, "widgets");
  EXPECT_EQ(cfg.oWatchNamespace, std::optional<std::string>("team-a"));
  EXPECT_EQ(cfg.iPollerIntervalMs, 2500);
  EXPECT_EQ(cfg.iHealthPort, 0);
  EXPECT_EQ(cfg.sLogLevel, "debug");
  EXPECT_TRUE(cfg.bKubeInsecureSkipTlsVerify);
  EXPECT_EQ(cfg.oKubeCaFile, std::optional<std::string>("/etc/kes/ca.pem"));
}

TEST_F(ConfigTest, TokenFromEnvironment) {
  setenv("KES_KUBE_TOKEN", "abc.def.ghi", 1);
  auto cfg = Config::load();
  ASSERT_TRUE(cfg.oKubeToken.has_value());
  EXPECT_EQ(*cfg.oKubeToken, "abc.def.ghi");
}

TEST_F(ConfigTest, FallsBackToFileForToken) {
  const std::string sPath = "/tmp/kes_test_kube_token";
  {
    std::ofstream ofs(sPath);
    ofs << "token-from-file\n";
  }
  setenv("KES_KUBE_TOKEN_FILE", sPath.c_str(), 1);

  auto cfg = Config::load();
  ASSERT_TRUE(cfg.oKubeToken.has_value());
  EXPECT_EQ(*cfg.oKubeToken, "token-from-file");

  std::remove(sPath.c_str());
}

TEST_F(ConfigTest, ThrowsOnUnreadableTokenFile) {
  setenv("KES_KUBE_TOKEN_FILE", "/nonexistent/kes/token", 1);
  EXPECT_THROW(Config::load(), ConfigError);
}

TEST_F(ConfigTest, ThrowsOnEmptyTokenFile) {
  const std::string sPath = "/tmp/kes_test_empty_token";
  {
    std::ofstream ofs(sPath);
    ofs << "\n";
  }
  setenv("KES_KUBE_TOKEN_FILE", sPath.c_str(), 1);

  EXPECT_THROW(Config::load(), ConfigError);
  std::remove(sPath.c_str());
}

TEST_F(ConfigTest, PollerIntervalMustBePositive) {
  setenv("KES_POLLER_INTERVAL_MS", "0", 1);
  EXPECT_THROW(Config::load(), ConfigError);

  setenv("KES_POLLER_INTERVAL_MS", "-100", 1);
  EXPECT_THROW(Config::load(), ConfigError);
}

TEST_F(ConfigTest, RejectsNonNumericInteger) {
  setenv("KES_POLLER_INTERVAL_MS", "10s", 1);
  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, HealthPortMustBeInRange) {
  setenv("KES_HEALTH_PORT", "70000", 1);
  EXPECT_THROW(Config::load(), ConfigError);
}

TEST_F(ConfigTest, HttpTimeoutMustBePositive) {
  setenv("KES_HTTP_TIMEOUT_SECONDS", "0", 1);
  EXPECT_THROW(Config::load(), ConfigError);
}

TEST_F(ConfigTest, ApiUrlNeedsScheme) {
  setenv("KES_KUBE_API_URL", "kubernetes.default.svc", 1);
  EXPECT_THROW(Config::load(), ConfigError);
}
