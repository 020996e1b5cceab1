#include "yadwh/credentials.h"

#include <boost/algorithm/string.hpp>

#include "logging/logging.h"
#include "utilities/utils.h"

namespace yadwh {

static bool isEnabled(const std::string& value) { return boost::iequals(boost::trim_copy(value), "true"); }

static std::string mask(const std::string& secret) { return std::string(secret.size(), '*'); }

// doesn't short-circuit on the first differing character
static bool secretsEqual(const std::string& lhs, const std::string& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  unsigned char diff{0};
  for (size_t ii = 0; ii < lhs.size(); ++ii) {
    diff |= static_cast<unsigned char>(lhs[ii] ^ rhs[ii]);
  }
  return diff == 0;
}

CredentialStore CredentialStore::load(const boost::property_tree::ptree& config,
                                      const boost::process::environment& env) {
  auto store{fromConfig(config)};
  const auto from_env{fromEnvironment(env)};
  for (const auto& entry : from_env.groups_) {
    if (store.groups_.count(entry.first) != 0) {
      LOG_INFO << "Credentials of " << entry.second.name << " are overridden by the environment";
    }
    store.groups_[entry.first] = entry.second;
  }
  return store;
}

CredentialStore CredentialStore::fromEnvironment(const boost::process::environment& env) {
  CredentialStore store;
  const std::string secret_prefix{EnvSecretPrefix};
  for (const auto& var : env) {
    const std::string var_name{var.get_name()};
    if (!boost::starts_with(var_name, secret_prefix)) {
      continue;
    }
    const auto name{var_name.substr(secret_prefix.size())};
    if (boost::trim_copy(name).empty()) {
      LOG_WARNING << "Empty secret name: " << var_name;
      continue;
    }

    GroupCredential cred;
    cred.name = name;
    cred.secret = boost::trim_copy(var.to_string());

    const auto auth_it{env.find(EnvAuthPrefix + name)};
    if (auth_it != env.end()) {
      const auto auth{boost::trim_copy((*auth_it).to_string())};
      if (!auth.empty()) {
        cred.registry_auth = auth;
      }
    }
    const auto remove_it{env.find(EnvRemovePrefix + name)};
    cred.purge_old_image = remove_it != env.end() && isEnabled((*remove_it).to_string());

    store.add(std::move(cred));
  }
  return store;
}

CredentialStore CredentialStore::fromConfig(const boost::property_tree::ptree& config) {
  CredentialStore store;
  const std::string group_prefix{ConfigGroupPrefix};
  for (const auto& section : config) {
    if (!boost::starts_with(section.first, group_prefix)) {
      continue;
    }
    const auto name{section.first.substr(group_prefix.size())};
    if (boost::trim_copy(name).empty()) {
      LOG_WARNING << "Empty group name in config section: [" << section.first << "]";
      continue;
    }

    GroupCredential cred;
    cred.name = name;
    cred.secret = Utils::stripQuotes(boost::trim_copy(section.second.get<std::string>("secret", "")));
    const auto auth{Utils::stripQuotes(boost::trim_copy(section.second.get<std::string>("auth", "")))};
    if (!auth.empty()) {
      cred.registry_auth = auth;
    }
    cred.purge_old_image = isEnabled(Utils::stripQuotes(section.second.get<std::string>("purge", "false")));

    store.add(std::move(cred));
  }
  return store;
}

boost::optional<const GroupCredential&> CredentialStore::lookup(const std::string& name) const {
  const auto it{groups_.find(key(name))};
  if (it == groups_.end()) {
    return boost::none;
  }
  return it->second;
}

const GroupCredential& CredentialStore::authenticate(const std::string& name, const std::string& secret) const {
  const auto cred{lookup(name)};
  if (!cred) {
    throw AuthError(AuthError::Kind::NotFound, "webhook not found");
  }
  if (!secretsEqual(cred->secret, boost::trim_copy(secret))) {
    throw AuthError(AuthError::Kind::Mismatch, "secret mismatch");
  }
  return *cred;
}

std::string CredentialStore::key(const std::string& name) { return boost::to_lower_copy(boost::trim_copy(name)); }

bool CredentialStore::add(GroupCredential cred) {
  cred.name = boost::trim_copy(cred.name);
  if (cred.secret.size() < MinSecretLength) {
    LOG_WARNING << "Secret of " << cred.name << " is dropped, secrets are required to be at least "
                << MinSecretLength << " chars long";
    return false;
  }
  LOG_INFO << "Found secret for " << cred.name << " = " << mask(cred.secret);
  if (cred.registry_auth) {
    LOG_INFO << "Registry auth for " << cred.name << " = " << mask(*cred.registry_auth);
  }
  if (cred.purge_old_image) {
    LOG_WARNING << "Purge mode is enabled for " << cred.name
                << ", old images will be deleted after their containers have been updated";
  }

  const auto k{key(cred.name)};
  if (groups_.count(k) != 0) {
    LOG_WARNING << "Duplicate group name " << cred.name << " (names are case-insensitive), the last one wins";
  }
  groups_[k] = std::move(cred);
  return true;
}

}  // namespace yadwh
