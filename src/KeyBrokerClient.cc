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

#include "imageguard/KeyBrokerClient.hh"

#include "AttestationAgentKbc.hh"
#include "Logging.hh"
#include "OfflineFsKbc.hh"
#include "SampleKbc.hh"
#include "imageguard/Errors.hh"

namespace imageguard
{
  outcome::std_result<KbcParameters> KbcParameters::parse(std::string_view parameters)
  {
    auto separator = parameters.find("::");
    if (separator == std::string_view::npos || separator == 0)
      {
        spdlog::error("Invalid attestation parameters '{}', expected <kbc_name>::<kbs_uri>", parameters);
        return ImageGuardError::InvalidConfig;
      }

    KbcParameters result;
    result.kbc_name = std::string(parameters.substr(0, separator));
    result.kbs_uri = std::string(parameters.substr(separator + 2));
    return result;
  }

  std::string KbcParameters::to_string() const
  {
    return kbc_name + "::" + kbs_uri;
  }

  std::string KeyBrokerClient::resource_path(std::string_view resource_id)
  {
    static constexpr std::string_view scheme = "kbs://";
    if (!resource_id.starts_with(scheme))
      {
        return std::string(resource_id);
      }

    auto rest = resource_id.substr(scheme.size());
    auto slash = rest.find('/');
    if (slash == std::string_view::npos)
      {
        return {};
      }
    return std::string(rest.substr(slash + 1));
  }

  KbcSession::KbcSession(std::shared_ptr<KeyBrokerClient> client)
    : client_(std::move(client))
  {
  }

  KbcSession::~KbcSession()
  {
    if (opened_)
      {
        client_->disconnect();
      }
  }

  outcome::std_result<void> KbcSession::open()
  {
    auto result = client_->connect();
    if (!result)
      {
        return result.error();
      }
    opened_ = true;
    return outcome::success();
  }

  const std::shared_ptr<KeyBrokerClient> &KbcSession::client() const
  {
    return client_;
  }

  KeyBrokerClientFactory::KeyBrokerClientFactory(KbcSettings settings)
    : settings_(std::move(settings))
  {
  }

  outcome::std_result<std::shared_ptr<KeyBrokerClient>> KeyBrokerClientFactory::create(const KbcParameters &parameters) const
  {
    if (parameters.kbc_name.empty())
      {
        return KbcError::UnknownBackend;
      }

    if (parameters.kbc_name == SampleKbc::backend_name)
      {
        return std::make_shared<SampleKbc>(settings_.sample_resources);
      }

    if (parameters.kbc_name == OfflineFsKbc::backend_name)
      {
        return std::make_shared<OfflineFsKbc>(settings_.offline_fs_resources_path);
      }

    Logging::create("imageguard:kbc")->debug("Forwarding {} to the attestation agent at {}", parameters.to_string(), settings_.attestation_agent_socket);
    return std::make_shared<AttestationAgentKbc>(parameters, settings_.attestation_agent_socket, settings_.request_timeout);
  }

  const KbcSettings &KeyBrokerClientFactory::settings() const
  {
    return settings_;
  }

} // namespace imageguard
