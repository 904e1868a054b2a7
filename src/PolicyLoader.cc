// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "PolicyLoader.hh"

#include <fstream>

#include "imageguard/Errors.hh"

namespace imageguard
{
  outcome::std_result<std::shared_ptr<const Policy>> Policy::load_from_json(std::string_view json)
  {
    PolicyLoader loader;
    auto policy = loader.load_from_json(std::string(json));
    if (!policy)
      {
        return policy.error();
      }
    return std::make_shared<const Policy>(std::move(policy.value()));
  }

  outcome::std_result<std::shared_ptr<const Policy>> Policy::load_from_file(const std::filesystem::path &path)
  {
    PolicyLoader loader;
    auto policy = loader.load_from_file(path);
    if (!policy)
      {
        return policy.error();
      }
    return std::make_shared<const Policy>(std::move(policy.value()));
  }

  outcome::std_result<Policy> PolicyLoader::load_from_file(const std::filesystem::path &file_path)
  {
    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file.is_open())
      {
        logger_->error("Failed to open policy file: {}", file_path.string());
        return ImageGuardError::InvalidPolicy;
      }

    std::string json_content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad())
      {
        logger_->error("Error while reading policy file: {}", file_path.string());
        return ImageGuardError::InvalidPolicy;
      }

    return load_from_json(json_content);
  }

  outcome::std_result<Policy> PolicyLoader::load_from_json(const std::string &json_content)
  {
    boost::system::error_code ec;
    boost::json::value parsed = boost::json::parse(json_content, ec);
    if (ec)
      {
        logger_->error("Failed to parse policy JSON: {}", ec.message());
        return ImageGuardError::InvalidPolicy;
      }

    if (!parsed.is_object())
      {
        logger_->error("Policy JSON root is not an object");
        return ImageGuardError::InvalidPolicy;
      }

    const auto &root = parsed.as_object();
    Policy policy;

    if (const auto *it = root.find("default"); it != root.end())
      {
        auto requirement = parse_requirement_list("default", it->value());
        if (!requirement)
          {
            return requirement.error();
          }
        policy.default_requirement = std::move(requirement.value());
      }

    if (const auto *it = root.find("transports"); it != root.end())
      {
        if (!it->value().is_object())
          {
            logger_->error("'transports' must be an object, got: {}", boost::json::serialize(it->value()));
            return ImageGuardError::InvalidPolicy;
          }

        for (const auto &[transport, scopes]: it->value().as_object())
          {
            if (transport != "docker")
              {
                logger_->debug("Ignoring policy for transport '{}'", std::string(transport));
                continue;
              }

            if (!scopes.is_object())
              {
                logger_->error("Scopes of transport '{}' must be an object", std::string(transport));
                return ImageGuardError::InvalidPolicy;
              }

            for (const auto &[scope, requirements]: scopes.as_object())
              {
                auto requirement = parse_requirement_list(std::string(scope), requirements);
                if (!requirement)
                  {
                    return requirement.error();
                  }
                policy.rules.push_back(PolicyRule{.scope = std::string(scope), .requirement = std::move(requirement.value())});
              }
          }
      }

    logger_->info("Loaded policy with {} scopes{}", policy.rules.size(), policy.default_requirement ? " and a default" : "");
    return policy;
  }

  outcome::std_result<PolicyRequirement> PolicyLoader::parse_requirement_list(const std::string &scope, const boost::json::value &value)
  {
    if (!value.is_array() || value.as_array().empty())
      {
        logger_->error("Requirements for scope '{}' must be a non-empty array", scope);
        return ImageGuardError::InvalidPolicy;
      }

    bool reject = false;
    RequireSignature signature_requirement;

    for (const auto &entry: value.as_array())
      {
        if (!entry.is_object())
          {
            logger_->error("Requirement for scope '{}' must be an object, got: {}", scope, boost::json::serialize(entry));
            return ImageGuardError::InvalidPolicy;
          }

        const auto &object = entry.as_object();
        const auto *type_it = object.find("type");
        if (type_it == object.end() || !type_it->value().is_string())
          {
            logger_->error("Requirement for scope '{}' has no 'type'", scope);
            return ImageGuardError::InvalidPolicy;
          }

        std::string type(type_it->value().as_string());
        outcome::std_result<void> result = outcome::success();
        if (type == "insecureAcceptAnything")
          {
            continue;
          }
        if (type == "reject")
          {
            reject = true;
            continue;
          }
        if (type == "signedBy")
          {
            result = parse_signed_by(object, signature_requirement);
          }
        else if (type == "sigstoreSigned")
          {
            result = parse_sigstore_signed(object, signature_requirement);
          }
        else
          {
            logger_->error("Unknown requirement type '{}' for scope '{}'", type, scope);
            return ImageGuardError::InvalidPolicy;
          }

        if (!result)
          {
            logger_->error("Invalid '{}' requirement for scope '{}'", type, scope);
            return result.error();
          }
      }

    if (reject)
      {
        return Reject{};
      }
    if (signature_requirement.requirements.empty())
      {
        return Unrestricted{};
      }
    return signature_requirement;
  }

  outcome::std_result<void> PolicyLoader::parse_signed_by(const boost::json::object &object, RequireSignature &requirement)
  {
    auto key_type = get_optional_string(object, "keyType");
    if (!key_type)
      {
        return key_type.error();
      }
    if (key_type.value() && *key_type.value() != "PEMKeys")
      {
        logger_->error("Unsupported keyType '{}', only PEMKeys keyrings are supported", *key_type.value());
        return ImageGuardError::InvalidPolicy;
      }

    if (object.contains("keyData"))
      {
        logger_->error("Inline keyData is not accepted, keys must come from the key broker");
        return ImageGuardError::InvalidPolicy;
      }

    auto identity = parse_signed_identity(object);
    if (!identity)
      {
        return identity.error();
      }

    std::vector<std::string> key_paths;
    auto key_path = get_optional_string(object, "keyPath");
    if (!key_path)
      {
        return key_path.error();
      }
    if (key_path.value())
      {
        key_paths.push_back(*key_path.value());
      }

    if (const auto *it = object.find("keyPaths"); it != object.end())
      {
        if (!it->value().is_array())
          {
            logger_->error("'keyPaths' must be an array");
            return ImageGuardError::InvalidPolicy;
          }
        for (const auto &path: it->value().as_array())
          {
            if (!path.is_string())
              {
                logger_->error("'keyPaths' entries must be strings");
                return ImageGuardError::InvalidPolicy;
              }
            key_paths.emplace_back(path.as_string());
          }
      }

    if (key_paths.empty())
      {
        logger_->error("signedBy requires 'keyPath' or 'keyPaths'");
        return ImageGuardError::InvalidPolicy;
      }

    for (auto &path: key_paths)
      {
        requirement.requirements.emplace_back(SimpleSigningRequirement{.key_path = std::move(path), .signed_identity = identity.value()});
      }
    return outcome::success();
  }

  outcome::std_result<void> PolicyLoader::parse_sigstore_signed(const boost::json::object &object, RequireSignature &requirement)
  {
    CosignRequirement cosign;

    auto key_path = get_optional_string(object, "keyPath");
    if (!key_path)
      {
        return key_path.error();
      }
    cosign.key_path = key_path.value();

    if (const auto *it = object.find("fulcio"); it != object.end())
      {
        if (!it->value().is_object())
          {
            logger_->error("'fulcio' must be an object");
            return ImageGuardError::InvalidPolicy;
          }
        const auto &fulcio = it->value().as_object();

        auto ca_path = get_optional_string(fulcio, "caPath");
        auto oidc_issuer = get_optional_string(fulcio, "oidcIssuer");
        auto subject_email = get_optional_string(fulcio, "subjectEmail");
        if (!ca_path || !oidc_issuer || !subject_email)
          {
            return ImageGuardError::InvalidPolicy;
          }
        if (!ca_path.value())
          {
            logger_->error("'fulcio' requires 'caPath'");
            return ImageGuardError::InvalidPolicy;
          }
        cosign.ca_path = ca_path.value();
        cosign.oidc_issuer = oidc_issuer.value();
        cosign.subject_email = subject_email.value();
      }

    if (cosign.key_path.has_value() == cosign.ca_path.has_value())
      {
        logger_->error("sigstoreSigned requires exactly one of 'keyPath' and 'fulcio'");
        return ImageGuardError::InvalidPolicy;
      }

    if (object.contains("signedIdentity"))
      {
        auto identity = parse_signed_identity(object);
        if (!identity)
          {
            return identity.error();
          }
        cosign.signed_identity = identity.value();
      }

    requirement.requirements.emplace_back(std::move(cosign));
    return outcome::success();
  }

  outcome::std_result<SignedIdentity> PolicyLoader::parse_signed_identity(const boost::json::object &object)
  {
    SignedIdentity identity;

    const auto *it = object.find("signedIdentity");
    if (it == object.end())
      {
        return identity;
      }
    if (!it->value().is_object())
      {
        logger_->error("'signedIdentity' must be an object");
        return ImageGuardError::InvalidPolicy;
      }

    const auto &identity_object = it->value().as_object();
    auto type = get_optional_string(identity_object, "type");
    if (!type || !type.value())
      {
        logger_->error("'signedIdentity' requires a 'type'");
        return ImageGuardError::InvalidPolicy;
      }

    const auto &type_name = *type.value();
    std::string value_key;
    if (type_name == "matchRepoDigestOrExact")
      {
        identity.type = SignedIdentity::Type::MatchRepoDigestOrExact;
      }
    else if (type_name == "matchExact")
      {
        identity.type = SignedIdentity::Type::MatchExact;
      }
    else if (type_name == "matchRepository")
      {
        identity.type = SignedIdentity::Type::MatchRepository;
      }
    else if (type_name == "exactReference")
      {
        identity.type = SignedIdentity::Type::ExactReference;
        value_key = "dockerReference";
      }
    else if (type_name == "exactRepository")
      {
        identity.type = SignedIdentity::Type::ExactRepository;
        value_key = "dockerRepository";
      }
    else
      {
        logger_->error("Unknown signedIdentity type '{}'", type_name);
        return ImageGuardError::InvalidPolicy;
      }

    if (!value_key.empty())
      {
        auto value = get_optional_string(identity_object, value_key);
        if (!value || !value.value())
          {
            logger_->error("signedIdentity '{}' requires '{}'", type_name, value_key);
            return ImageGuardError::InvalidPolicy;
          }
        if (!ImageReference::parse(*value.value()))
          {
            logger_->error("signedIdentity '{}' has an invalid reference '{}'", type_name, *value.value());
            return ImageGuardError::InvalidPolicy;
          }
        identity.value = *value.value();
      }

    return identity;
  }

  outcome::std_result<std::optional<std::string>> PolicyLoader::get_optional_string(const boost::json::object &object, const std::string &key)
  {
    const auto *it = object.find(key);
    if (it == object.end())
      {
        return std::optional<std::string>{};
      }
    if (!it->value().is_string())
      {
        logger_->error("'{}' must be a string, got: {}", key, boost::json::serialize(it->value()));
        return ImageGuardError::InvalidPolicy;
      }
    return std::optional<std::string>(std::string(it->value().as_string()));
  }

} // namespace imageguard
