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

#ifndef IMAGEGUARD_IMAGE_PULL_AUTHORIZER_HH
#define IMAGEGUARD_IMAGE_PULL_AUTHORIZER_HH

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "imageguard/Config.hh"
#include "imageguard/ImageReference.hh"
#include "imageguard/KeyBrokerClient.hh"
#include "imageguard/Policy.hh"
#include "imageguard/SignatureSource.hh"
#include "imageguard/VerificationOutcome.hh"

namespace outcome = boost::outcome_v2;

namespace imageguard
{
  struct VerificationContext;

  /// Why a pull was not allowed.
  struct PullDenied
  {
    enum class Kind
    {
      NoSignature,
      SchemeNotAllowed,
      PolicyRejected,
      VerificationRejected,
      Infrastructure
    };

    Kind kind{Kind::Infrastructure};
    std::string reason;

    /// NoSignature, SchemeNotAllowed and PolicyRejected: the policy itself forbids the pull.
    bool is_policy_denied() const;
  };

  std::string to_string(PullDenied::Kind kind);

  using PullDecision = outcome::std_checked<void, PullDenied>;

  /**
   * @brief Decides whether an image may be pulled into the trusted environment
   *
   * For every pull the policy requirement of the image is decided once. An
   * unrestricted image is allowed, a rejected one denied. When signatures are
   * required, the artifacts of the schemes the requirement accepts are
   * verified with trust material from the key broker, and the pull is allowed
   * as soon as one of them verifies.
   *
   * authorize_pull() may be called concurrently. Each call uses its own key
   * broker session and trust material cache.
   */
  class ImagePullAuthorizer
  {
  public:
    ImagePullAuthorizer(ImageGuardConfig config, std::shared_ptr<const Policy> policy, std::shared_ptr<SignatureSource> source);
    ~ImagePullAuthorizer() = default;

    ImagePullAuthorizer(const ImagePullAuthorizer &) = delete;
    ImagePullAuthorizer &operator=(const ImagePullAuthorizer &) = delete;
    ImagePullAuthorizer(ImagePullAuthorizer &&) = delete;
    ImagePullAuthorizer &operator=(ImagePullAuthorizer &&) = delete;

    /**
     * @brief Creates an authorizer, loading the policy named by the configuration
     *
     * The policy is fetched from the key broker when policy_uri is set, read
     * from policy_path otherwise. Without a source the signature directory of
     * the configuration is used, if any.
     */
    static outcome::std_result<std::unique_ptr<ImagePullAuthorizer>> create(ImageGuardConfig config,
                                                                             std::shared_ptr<SignatureSource> source = nullptr);

    PullDecision authorize_pull(const ImageReference &image, const std::optional<KbcParameters> &attestation_parameters = std::nullopt);

    /// Parses both arguments first. An unparsable argument denies the pull as an infrastructure failure.
    PullDecision authorize_pull(std::string_view image, std::optional<std::string_view> attestation_parameters = std::nullopt);

    /// Loads the policy again from its configured origin. The current policy stays in force on failure.
    outcome::std_result<void> reload_policy();
    outcome::std_result<void> reload_policy(std::shared_ptr<const Policy> policy);

    std::shared_ptr<const Policy> policy() const;

  private:
    static outcome::std_result<std::shared_ptr<const Policy>> load_policy(const ImageGuardConfig &config,
                                                                          const KeyBrokerClientFactory &factory);

    PullDecision verify_signatures(const ImageReference &image,
                                   const RequireSignature &requirement,
                                   const std::optional<KbcParameters> &attestation_parameters);
    VerificationOutcome verify_artifact(const SignatureArtifact &artifact,
                                        const SignatureRequirement &requirement,
                                        const VerificationContext &context);

    std::shared_ptr<spdlog::logger> logger_;
    ImageGuardConfig config_;
    KeyBrokerClientFactory factory_;
    PolicyStore policy_store_;
    std::shared_ptr<SignatureSource> source_;
  };

} // namespace imageguard

#endif // IMAGEGUARD_IMAGE_PULL_AUTHORIZER_HH
