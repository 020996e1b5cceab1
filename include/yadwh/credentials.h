#ifndef YADWH_CREDENTIALS_H_
#define YADWH_CREDENTIALS_H_

#include <map>
#include <stdexcept>
#include <string>

#include <boost/optional.hpp>
#include <boost/process/environment.hpp>
#include <boost/property_tree/ptree.hpp>

namespace yadwh {

struct GroupCredential {
  std::string name;
  std::string secret;
  // base64 encoded `user:password` used to pull from a private registry
  boost::optional<std::string> registry_auth;
  // delete a container's previous image after the container has been updated
  bool purge_old_image{false};
};

class AuthError : public std::runtime_error {
 public:
  enum class Kind { NotFound, Mismatch };

  AuthError(Kind kind, const std::string& what) : std::runtime_error(what), kind_{kind} {}
  Kind kind() const { return kind_; }

 private:
  Kind kind_;
};

/**
 * Group credentials keyed by group name, built once at startup and read-only afterwards.
 *
 * Group names are trimmed and compared case-insensitively.
 */
class CredentialStore {
 public:
  static constexpr const char* const EnvSecretPrefix{"WH_SECRET_"};
  static constexpr const char* const EnvAuthPrefix{"WH_AUTH_"};
  static constexpr const char* const EnvRemovePrefix{"WH_REMOVE_"};
  static constexpr const char* const ConfigGroupPrefix{"group."};
  static constexpr size_t MinSecretLength{12};

  CredentialStore() = default;

  // `[group.<name>]` sections of the config file, overridden per group by `WH_SECRET_<name>` & co.
  static CredentialStore load(const boost::property_tree::ptree& config, const boost::process::environment& env);
  static CredentialStore fromEnvironment(const boost::process::environment& env);
  static CredentialStore fromConfig(const boost::property_tree::ptree& config);

  boost::optional<const GroupCredential&> lookup(const std::string& name) const;
  // throws AuthError if the group is unknown or the secret doesn't match
  const GroupCredential& authenticate(const std::string& name, const std::string& secret) const;

  size_t size() const { return groups_.size(); }
  bool empty() const { return groups_.empty(); }

 private:
  static std::string key(const std::string& name);
  // returns false if the credential is rejected by the secret policy
  bool add(GroupCredential cred);

  std::map<std::string, GroupCredential> groups_;
};

}  // namespace yadwh

#endif  // YADWH_CREDENTIALS_H_
