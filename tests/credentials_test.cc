#include <gtest/gtest.h>

#include <sstream>

#include <boost/property_tree/ini_parser.hpp>

#include "logging/logging.h"
#include "utilities/utils.h"
#include "yadwh/config.h"
#include "yadwh/credentials.h"

static boost::property_tree::ptree parseIni(const std::string& ini) {
  std::stringstream ss{ini};
  boost::property_tree::ptree pt;
  boost::property_tree::ini_parser::read_ini(ss, pt);
  return pt;
}

TEST(CredentialStore, FromEnvironment) {
  boost::process::environment env;
  env["WH_SECRET_BACKEND_PROD"] = "abcdefghijkl";
  env["WH_AUTH_BACKEND_PROD"] = "dXNlcjpwYXNzd29yZA==";
  env["WH_REMOVE_BACKEND_PROD"] = "TRUE";
  env["WH_SECRET_STAGING"] = "  staging-secret-01 ";
  env["WH_REMOVE_STAGING"] = "yes";
  env["PATH"] = "/usr/bin";

  const auto store{yadwh::CredentialStore::fromEnvironment(env)};
  ASSERT_EQ(store.size(), 2);

  const auto prod{store.lookup("BACKEND_PROD")};
  ASSERT_TRUE(prod);
  EXPECT_EQ(prod->name, "BACKEND_PROD");
  EXPECT_EQ(prod->secret, "abcdefghijkl");
  ASSERT_TRUE(prod->registry_auth);
  EXPECT_EQ(*prod->registry_auth, "dXNlcjpwYXNzd29yZA==");
  EXPECT_TRUE(prod->purge_old_image);

  const auto staging{store.lookup("STAGING")};
  ASSERT_TRUE(staging);
  EXPECT_EQ(staging->secret, "staging-secret-01");
  EXPECT_FALSE(staging->registry_auth);
  EXPECT_FALSE(staging->purge_old_image);
}

TEST(CredentialStore, ShortSecretIsDropped) {
  boost::process::environment env;
  env["WH_SECRET_SHORT"] = "abcdefghijk";
  env["WH_SECRET_EXACT"] = "abcdefghijkl";
  env["WH_SECRET_"] = "abcdefghijklmn";

  const auto store{yadwh::CredentialStore::fromEnvironment(env)};
  EXPECT_EQ(store.size(), 1);
  EXPECT_FALSE(store.lookup("SHORT"));
  EXPECT_TRUE(store.lookup("EXACT"));
}

TEST(CredentialStore, NoSecrets) {
  boost::process::environment env;
  env["WH_AUTH_BACKEND"] = "dXNlcjpwYXNzd29yZA==";
  EXPECT_TRUE(yadwh::CredentialStore::fromEnvironment(env).empty());
}

TEST(CredentialStore, LookupIsCaseInsensitive) {
  boost::process::environment env;
  env["WH_SECRET_Backend_Prod"] = "abcdefghijkl";
  const auto store{yadwh::CredentialStore::fromEnvironment(env)};

  EXPECT_TRUE(store.lookup("backend_prod"));
  EXPECT_TRUE(store.lookup("BACKEND_PROD"));
  EXPECT_TRUE(store.lookup(" Backend_Prod "));
  EXPECT_FALSE(store.lookup("backend"));
}

TEST(CredentialStore, Authenticate) {
  boost::process::environment env;
  env["WH_SECRET_BACKEND_PROD"] = "abcdefghijkl";
  const auto store{yadwh::CredentialStore::fromEnvironment(env)};

  EXPECT_EQ(store.authenticate("BACKEND_PROD", "abcdefghijkl").name, "BACKEND_PROD");
  EXPECT_EQ(store.authenticate("backend_prod", " abcdefghijkl\n").name, "BACKEND_PROD");

  try {
    store.authenticate("UNKNOWN_GROUP", "abcdefghijkl");
    FAIL() << "Expected AuthError";
  } catch (const yadwh::AuthError& exc) {
    EXPECT_EQ(exc.kind(), yadwh::AuthError::Kind::NotFound);
    EXPECT_STREQ(exc.what(), "webhook not found");
  }

  for (const auto& wrong : {"short", "abcdefghijkm", "ABCDEFGHIJKL", "abcdefghijkl0", ""}) {
    try {
      store.authenticate("BACKEND_PROD", wrong);
      FAIL() << "Expected AuthError for " << wrong;
    } catch (const yadwh::AuthError& exc) {
      EXPECT_EQ(exc.kind(), yadwh::AuthError::Kind::Mismatch);
      EXPECT_STREQ(exc.what(), "secret mismatch");
    }
  }
}

TEST(CredentialStore, FromConfig) {
  const auto pt{parseIni(
      "[server]\n"
      "port = 8080\n"
      "[group.backend_prod]\n"
      "secret = abcdefghijkl\n"
      "auth = dXNlcjpwYXNzd29yZA==\n"
      "purge = True\n"
      "[group.staging]\n"
      "secret = too-short\n"
      "[group.docs]\n"
      "secret = docs-secret-0001\n")};

  const auto store{yadwh::CredentialStore::fromConfig(pt)};
  ASSERT_EQ(store.size(), 2);

  const auto prod{store.lookup("BACKEND_PROD")};
  ASSERT_TRUE(prod);
  EXPECT_EQ(prod->name, "backend_prod");
  ASSERT_TRUE(prod->registry_auth);
  EXPECT_TRUE(prod->purge_old_image);

  const auto docs{store.lookup("docs")};
  ASSERT_TRUE(docs);
  EXPECT_FALSE(docs->registry_auth);
  EXPECT_FALSE(docs->purge_old_image);
  EXPECT_FALSE(store.lookup("staging"));
}

TEST(CredentialStore, EnvironmentOverridesConfig) {
  const auto pt{parseIni(
      "[group.backend_prod]\n"
      "secret = from-config-file\n"
      "purge = true\n"
      "[group.docs]\n"
      "secret = docs-secret-0001\n")};
  boost::process::environment env;
  env["WH_SECRET_BACKEND_PROD"] = "from-environment";

  const auto store{yadwh::CredentialStore::load(pt, env)};
  ASSERT_EQ(store.size(), 2);
  const auto prod{store.lookup("backend_prod")};
  ASSERT_TRUE(prod);
  EXPECT_EQ(prod->secret, "from-environment");
  EXPECT_FALSE(prod->purge_old_image);
  EXPECT_NO_THROW(store.authenticate("docs", "docs-secret-0001"));
}

TEST(CredentialStore, QuotedValues) {
  const yadwh::Config config{parseIni(
      "[label]\n"
      "key = \"io.d2a.yadwh.ug\"\n"
      "[group.backend_prod]\n"
      "secret = \"abcdefghijkl\"\n"
      "auth = \"dXNlcjpwYXNzd29yZA==\"\n"
      "purge = \"true\"\n")};
  EXPECT_EQ(config.label_key, "io.d2a.yadwh.ug");

  const auto store{yadwh::CredentialStore::fromConfig(config.raw)};
  const auto& cred{store.authenticate("backend_prod", "abcdefghijkl")};
  EXPECT_EQ(cred.secret, "abcdefghijkl");
  ASSERT_TRUE(cred.registry_auth);
  EXPECT_EQ(*cred.registry_auth, "dXNlcjpwYXNzd29yZA==");
  EXPECT_TRUE(cred.purge_old_image);
}

TEST(Config, QuotedValues) {
  const yadwh::Config config{parseIni(
      "[server]\n"
      "host = \"127.0.0.1\"\n"
      "port = \"8080\"\n"
      "[docker]\n"
      "host = \"unix:///run/docker.sock\"\n")};
  EXPECT_EQ(config.server.host, "127.0.0.1");
  EXPECT_EQ(config.server.port, 8080);
  EXPECT_EQ(config.docker.host, "unix:///run/docker.sock");
}

TEST(Utils, StripQuotes) {
  EXPECT_EQ(yadwh::Utils::stripQuotes("\"value\""), "value");
  EXPECT_EQ(yadwh::Utils::stripQuotes("value"), "value");
  EXPECT_EQ(yadwh::Utils::stripQuotes("\"value"), "\"value");
  EXPECT_EQ(yadwh::Utils::stripQuotes("\""), "\"");
  EXPECT_EQ(yadwh::Utils::stripQuotes("\"\""), "");
}

TEST(Config, Defaults) {
  const yadwh::Config config;
  EXPECT_EQ(config.server.host, "0.0.0.0");
  EXPECT_EQ(config.server.port, 80);
  EXPECT_EQ(config.docker.host, "unix:///var/run/docker.sock");
  EXPECT_EQ(config.docker.stop_timeout, std::chrono::seconds(60));
  EXPECT_EQ(config.label_key, "io.d2a.yadwh.ug");
  EXPECT_EQ(config.log_level, 2);
}

TEST(Config, FromPropertyTree) {
  const yadwh::Config config{parseIni(
      "[server]\n"
      "host = 127.0.0.1\n"
      "port = 8080\n"
      "idle_timeout = 10\n"
      "[docker]\n"
      "host = unix:///run/user/1000/docker.sock\n"
      "stop_timeout = 5\n"
      "timeout = 30\n"
      "[label]\n"
      "key = com.example.update\n"
      "[logging]\n"
      "level = 1\n")};

  EXPECT_EQ(config.server.host, "127.0.0.1");
  EXPECT_EQ(config.server.port, 8080);
  EXPECT_EQ(config.server.idle_timeout, std::chrono::seconds(10));
  EXPECT_EQ(config.docker.host, "unix:///run/user/1000/docker.sock");
  EXPECT_EQ(config.docker.stop_timeout, std::chrono::seconds(5));
  EXPECT_EQ(config.docker.timeout, std::chrono::seconds(30));
  EXPECT_EQ(config.label_key, "com.example.update");
  EXPECT_EQ(config.log_level, 1);
}

TEST(Config, InvalidValues) {
  EXPECT_THROW(yadwh::Config(parseIni("[server]\nport = 70000\n")), std::invalid_argument);
  EXPECT_THROW(yadwh::Config(parseIni("[server]\nport = http\n")), std::invalid_argument);
  EXPECT_THROW(yadwh::Config(parseIni("[docker]\nstop_timeout = -1\n")), std::invalid_argument);
  EXPECT_THROW(yadwh::Config(parseIni("[label]\nkey =\n")), std::invalid_argument);
  EXPECT_THROW(yadwh::Config(boost::filesystem::path("/non-existing/yadwh.toml")), std::invalid_argument);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  yadwh::logger_init();
  yadwh::logger_set_threshold(boost::log::trivial::debug);
  return RUN_ALL_TESTS();
}
