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

#ifndef IMAGEGUARD_KEY_BROKER_CLIENT_HH
#define IMAGEGUARD_KEY_BROKER_CLIENT_HH

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <boost/outcome/std_result.hpp>

namespace outcome = boost::outcome_v2;

namespace imageguard
{
  using ResourceParameters = std::map<std::string, std::string>;

  /**
   * @brief Attestation parameters selecting a key broker client backend
   *
   * Parsed from the "<kbc_name>::<kbs_uri>" form used by confidential
   * container runtimes, e.g. "offline_fs_kbc::null" or
   * "cc_kbc::http://kbs.example.com:8080".
   */
  struct KbcParameters
  {
    std::string kbc_name;
    std::string kbs_uri;

    static outcome::std_result<KbcParameters> parse(std::string_view parameters);
    std::string to_string() const;
  };

  /**
   * @brief Client side of the key broker protocol
   *
   * A key broker client retrieves secrets (public keys, certificates, policy
   * documents) from the attested key broker. Implementations follow an explicit
   * connect / request / disconnect lifecycle and keep no state that outlives a
   * connection. Every failure is reported as a KbcError.
   *
   * request_resource() may be called concurrently once connected.
   */
  class KeyBrokerClient
  {
  public:
    virtual ~KeyBrokerClient() = default;

    KeyBrokerClient(const KeyBrokerClient &) = delete;
    KeyBrokerClient &operator=(const KeyBrokerClient &) = delete;
    KeyBrokerClient(KeyBrokerClient &&) = delete;
    KeyBrokerClient &operator=(KeyBrokerClient &&) = delete;

    virtual std::string name() const = 0;
    virtual outcome::std_result<void> connect() = 0;
    virtual outcome::std_result<std::string> request_resource(const std::string &resource_id, const ResourceParameters &parameters = {}) = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    /// Maps "kbs://<host>/<repo>/<type>/<tag>" to "<repo>/<type>/<tag>". Other ids are returned unchanged.
    static std::string resource_path(std::string_view resource_id);

  protected:
    KeyBrokerClient() = default;
  };

  /// Keeps a client connected for the lifetime of the session.
  class KbcSession
  {
  public:
    explicit KbcSession(std::shared_ptr<KeyBrokerClient> client);
    ~KbcSession();

    KbcSession(const KbcSession &) = delete;
    KbcSession &operator=(const KbcSession &) = delete;
    KbcSession(KbcSession &&) = delete;
    KbcSession &operator=(KbcSession &&) = delete;

    outcome::std_result<void> open();
    const std::shared_ptr<KeyBrokerClient> &client() const;

  private:
    std::shared_ptr<KeyBrokerClient> client_;
    bool opened_{false};
  };

  struct KbcSettings
  {
    std::filesystem::path offline_fs_resources_path{"/etc/aa-offline_fs_kbc-resources.json"};
    std::string attestation_agent_socket{"/run/confidential-containers/attestation-agent/getresource.sock"};
    std::chrono::milliseconds request_timeout{std::chrono::seconds(10)};
    std::map<std::string, std::string> sample_resources;
  };

  /**
   * @brief Creates key broker client backends from attestation parameters
   *
   * "sample_kbc" and "offline_fs_kbc" are served in process. Any other
   * backend name is forwarded to the attestation agent, which runs the named
   * KBC on our behalf.
   */
  class KeyBrokerClientFactory
  {
  public:
    explicit KeyBrokerClientFactory(KbcSettings settings);

    outcome::std_result<std::shared_ptr<KeyBrokerClient>> create(const KbcParameters &parameters) const;
    const KbcSettings &settings() const;

  private:
    KbcSettings settings_;
  };

} // namespace imageguard

#endif // IMAGEGUARD_KEY_BROKER_CLIENT_HH
