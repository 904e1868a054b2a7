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

#include "imageguard/Config.hh"

#include <fstream>
#include <boost/json.hpp>

#include "Base64.hh"
#include "Logging.hh"
#include "imageguard/Errors.hh"

namespace imageguard
{
  namespace
  {
    outcome::std_result<std::optional<std::string>> get_optional_string(const boost::json::object &obj, const char *key)
    {
      const auto *value = obj.if_contains(key);
      if (value == nullptr || value->is_null())
        {
          return std::optional<std::string>{};
        }
      if (!value->is_string())
        {
          Logging::create("imageguard:config")->error("'{}' must be a string, got: {}", key, boost::json::serialize(*value));
          return ImageGuardError::InvalidConfig;
        }
      return std::optional<std::string>{std::string(value->as_string())};
    }
  } // namespace

  outcome::std_result<ImageGuardConfig> ImageGuardConfig::load_from_json(const std::string &json)
  {
    auto logger = Logging::create("imageguard:config");

    boost::system::error_code ec;
    boost::json::value parsed = boost::json::parse(json, ec);
    if (ec)
      {
        logger->error("Failed to parse configuration: {}", ec.message());
        return ImageGuardError::InvalidConfig;
      }
    if (!parsed.is_object())
      {
        logger->error("Configuration root is not an object");
        return ImageGuardError::InvalidConfig;
      }

    const auto &root = parsed.as_object();
    ImageGuardConfig config;

    if (const auto *value = root.if_contains("security_validate"); value != nullptr)
      {
        if (!value->is_bool())
          {
            logger->error("'security_validate' must be a boolean");
            return ImageGuardError::InvalidConfig;
          }
        config.security_validate = value->as_bool();
      }

    auto policy_path = get_optional_string(root, "policy_path");
    auto policy_uri = get_optional_string(root, "policy_uri");
    auto kbc_params = get_optional_string(root, "aa_kbc_params");
    auto resources_path = get_optional_string(root, "offline_fs_resources_path");
    auto socket = get_optional_string(root, "attestation_agent_socket");
    auto signature_dir = get_optional_string(root, "signature_dir");
    for (const auto *result: {&policy_path, &policy_uri, &kbc_params, &resources_path, &socket, &signature_dir})
      {
        if (!*result)
          {
            return result->error();
          }
      }

    if (policy_path.value())
      {
        config.policy_path = *policy_path.value();
      }
    config.policy_uri = policy_uri.value();
    if (kbc_params.value())
      {
        auto parameters = KbcParameters::parse(*kbc_params.value());
        if (!parameters)
          {
            logger->error("Invalid 'aa_kbc_params': {}", *kbc_params.value());
            return ImageGuardError::InvalidConfig;
          }
        config.default_kbc = parameters.value();
      }
    if (resources_path.value())
      {
        config.kbc.offline_fs_resources_path = *resources_path.value();
      }
    if (socket.value())
      {
        config.kbc.attestation_agent_socket = *socket.value();
      }
    if (signature_dir.value())
      {
        config.signature_dir = *signature_dir.value();
      }

    if (const auto *value = root.if_contains("kbc_timeout_ms"); value != nullptr)
      {
        if (!value->is_int64() || value->as_int64() <= 0)
          {
            logger->error("'kbc_timeout_ms' must be a positive integer");
            return ImageGuardError::InvalidConfig;
          }
        config.kbc.request_timeout = std::chrono::milliseconds(value->as_int64());
      }

    if (const auto *value = root.if_contains("sample_kbc_resources"); value != nullptr)
      {
        if (!value->is_object())
          {
            logger->error("'sample_kbc_resources' must be an object");
            return ImageGuardError::InvalidConfig;
          }
        for (const auto &[key, encoded]: value->as_object())
          {
            if (!encoded.is_string())
              {
                logger->error("Sample resource '{}' must be a base64 string", std::string(key));
                return ImageGuardError::InvalidConfig;
              }
            auto decoded = Base64::decode(std::string(encoded.as_string()));
            if (!decoded)
              {
                logger->error("Sample resource '{}' is not valid base64", std::string(key));
                return ImageGuardError::InvalidConfig;
              }
            config.kbc.sample_resources[std::string(key)] = decoded.value();
          }
      }

    return config;
  }

  outcome::std_result<ImageGuardConfig> ImageGuardConfig::load_from_file(const std::filesystem::path &path)
  {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open())
      {
        Logging::create("imageguard:config")->error("Failed to open configuration file: {}", path.string());
        return ImageGuardError::InvalidConfig;
      }

    std::string json_content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad())
      {
        Logging::create("imageguard:config")->error("Error while reading configuration file: {}", path.string());
        return ImageGuardError::InvalidConfig;
      }

    return load_from_json(json_content);
  }

} // namespace imageguard
