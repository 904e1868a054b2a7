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

#include "imageguard/ImagePullAuthorizer.hh"

#include <variant>
#include <vector>
#include <fmt/format.h>

#include "CosignVerifier.hh"
#include "Logging.hh"
#include "SignaturePayload.hh"
#include "SimpleSigningVerifier.hh"
#include "VerificationContext.hh"
#include "imageguard/DirectorySignatureSource.hh"
#include "imageguard/Errors.hh"
#include "imageguard/TrustMaterialResolver.hh"

namespace imageguard
{
  namespace
  {
    template<class... Ts>
    struct overloaded : Ts...
    {
      using Ts::operator()...;
    };
    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    PullDenied deny(PullDenied::Kind kind, std::string reason)
    {
      return PullDenied{kind, std::move(reason)};
    }
  } // namespace

  bool PullDenied::is_policy_denied() const
  {
    return kind == Kind::NoSignature || kind == Kind::SchemeNotAllowed || kind == Kind::PolicyRejected;
  }

  std::string to_string(PullDenied::Kind kind)
  {
    switch (kind)
      {
      case PullDenied::Kind::NoSignature:
        return "NoSignature";
      case PullDenied::Kind::SchemeNotAllowed:
        return "SchemeNotAllowed";
      case PullDenied::Kind::PolicyRejected:
        return "PolicyRejected";
      case PullDenied::Kind::VerificationRejected:
        return "VerificationRejected";
      case PullDenied::Kind::Infrastructure:
        return "Infrastructure";
      }
    return "Unknown";
  }

  ImagePullAuthorizer::ImagePullAuthorizer(ImageGuardConfig config,
                                           std::shared_ptr<const Policy> policy,
                                           std::shared_ptr<SignatureSource> source)
    : logger_(Logging::create("imageguard:authorizer"))
    , config_(std::move(config))
    , factory_(config_.kbc)
    , policy_store_(std::move(policy))
    , source_(std::move(source))
  {
  }

  outcome::std_result<std::unique_ptr<ImagePullAuthorizer>> ImagePullAuthorizer::create(ImageGuardConfig config,
                                                                                          std::shared_ptr<SignatureSource> source)
  {
    KeyBrokerClientFactory factory(config.kbc);
    auto policy = load_policy(config, factory);
    if (!policy)
      {
        return policy.error();
      }

    if (!source && config.signature_dir)
      {
        source = std::make_shared<DirectorySignatureSource>(*config.signature_dir);
      }

    return std::make_unique<ImagePullAuthorizer>(std::move(config), policy.value(), std::move(source));
  }

  outcome::std_result<std::shared_ptr<const Policy>> ImagePullAuthorizer::load_policy(const ImageGuardConfig &config,
                                                                                       const KeyBrokerClientFactory &factory)
  {
    auto logger = Logging::create("imageguard:authorizer");

    if (config.policy_uri)
      {
        auto client = factory.create(config.default_kbc);
        if (!client)
          {
            return client.error();
          }

        KbcSession session(client.value());
        if (auto result = session.open(); !result)
          {
            logger->error("Cannot connect to {} for the policy: {}", config.default_kbc.to_string(), result.error().message());
            return result.error();
          }

        auto policy_json = session.client()->request_resource(*config.policy_uri);
        if (!policy_json)
          {
            logger->error("Cannot fetch policy {}: {}", *config.policy_uri, policy_json.error().message());
            return policy_json.error();
          }
        return Policy::load_from_json(policy_json.value());
      }

    if (config.policy_path)
      {
        return Policy::load_from_file(*config.policy_path);
      }

    if (config.security_validate)
      {
        logger->error("Signature validation is enabled but no policy is configured");
        return ImageGuardError::InvalidConfig;
      }
    return std::make_shared<const Policy>();
  }

  outcome::std_result<void> ImagePullAuthorizer::reload_policy()
  {
    auto policy = load_policy(config_, factory_);
    if (!policy)
      {
        logger_->error("Policy reload failed, keeping the current policy: {}", policy.error().message());
        return policy.error();
      }
    if (auto result = policy_store_.reload(policy.value()); !result)
      {
        return result.error();
      }
    logger_->info("Policy reloaded");
    return outcome::success();
  }

  outcome::std_result<void> ImagePullAuthorizer::reload_policy(std::shared_ptr<const Policy> policy)
  {
    return policy_store_.reload(std::move(policy));
  }

  std::shared_ptr<const Policy> ImagePullAuthorizer::policy() const
  {
    return policy_store_.snapshot();
  }

  PullDecision ImagePullAuthorizer::authorize_pull(std::string_view image, std::optional<std::string_view> attestation_parameters)
  {
    auto reference = ImageReference::parse(image);
    if (!reference)
      {
        logger_->error("Invalid image reference '{}'", image);
        return deny(PullDenied::Kind::Infrastructure, fmt::format("invalid image reference '{}'", image));
      }

    std::optional<KbcParameters> parameters;
    if (attestation_parameters)
      {
        auto parsed = KbcParameters::parse(*attestation_parameters);
        if (!parsed)
          {
            logger_->error("Invalid attestation parameters '{}'", *attestation_parameters);
            return deny(PullDenied::Kind::Infrastructure, fmt::format("invalid attestation parameters '{}'", *attestation_parameters));
          }
        parameters = parsed.value();
      }

    return authorize_pull(reference.value(), parameters);
  }

  PullDecision ImagePullAuthorizer::authorize_pull(const ImageReference &image, const std::optional<KbcParameters> &attestation_parameters)
  {
    if (!config_.security_validate)
      {
        logger_->debug("Security validation disabled, allowing {}", image.to_string());
        return outcome::success();
      }

    PolicyEngine engine(policy_store_.snapshot());
    PolicyRequirement requirement = engine.decide(image);

    return std::visit(overloaded{
                        [&](const Unrestricted &) -> PullDecision {
                          logger_->info("Allowing {}: unrestricted", image.to_string());
                          return outcome::success();
                        },
                        [&](const Reject &) -> PullDecision {
                          logger_->info("Denying {}: rejected by policy", image.to_string());
                          return deny(PullDenied::Kind::PolicyRejected, fmt::format("{} is rejected by policy", image.to_string()));
                        },
                        [&](const RequireSignature &required) -> PullDecision {
                          return verify_signatures(image, required, attestation_parameters);
                        },
                      },
                      requirement);
  }

  PullDecision ImagePullAuthorizer::verify_signatures(const ImageReference &image,
                                                      const RequireSignature &requirement,
                                                      const std::optional<KbcParameters> &attestation_parameters)
  {
    if (!source_)
      {
        logger_->error("Signatures required for {} but no signature source is configured", image.to_string());
        return deny(PullDenied::Kind::Infrastructure, "no signature source configured");
      }

    auto manifest = source_->resolve_manifest(image);
    if (!manifest)
      {
        return deny(PullDenied::Kind::Infrastructure,
                    fmt::format("cannot resolve manifest of {}: {}", image.to_string(), manifest.error().message()));
      }
    if (image.digest() && manifest.value().digest != *image.digest())
      {
        return deny(PullDenied::Kind::Infrastructure,
                    fmt::format("registry returned manifest {} for {}", manifest.value().digest, image.to_string()));
      }
    if (!manifest.value().content.empty() && sha256_digest(manifest.value().content) != manifest.value().digest)
      {
        return deny(PullDenied::Kind::Infrastructure, fmt::format("manifest content of {} does not match its digest", image.to_string()));
      }
    const std::string &digest = manifest.value().digest;

    auto artifacts = source_->fetch_signatures(image, digest);
    if (!artifacts)
      {
        return deny(PullDenied::Kind::Infrastructure,
                    fmt::format("cannot fetch signatures of {}: {}", image.to_string(), artifacts.error().message()));
      }
    if (artifacts.value().empty())
      {
        logger_->info("Denying {}: no signatures", image.to_string());
        return deny(PullDenied::Kind::NoSignature, fmt::format("{} has no signatures", image.to_string()));
      }

    auto allowed = requirement.schemes();
    std::vector<const SignatureArtifact *> candidates;
    for (const auto &artifact: artifacts.value())
      {
        auto scheme = scheme_of(artifact);
        if (scheme && allowed.contains(*scheme))
          {
            candidates.push_back(&artifact);
          }
      }
    if (candidates.empty())
      {
        logger_->info("Denying {}: no signature of an accepted scheme", image.to_string());
        return deny(PullDenied::Kind::SchemeNotAllowed, fmt::format("no signature of {} uses an accepted scheme", image.to_string()));
      }

    const KbcParameters &kbc_parameters = attestation_parameters ? *attestation_parameters : config_.default_kbc;
    auto client = factory_.create(kbc_parameters);
    if (!client)
      {
        return deny(PullDenied::Kind::Infrastructure,
                    fmt::format("cannot create key broker client {}: {}", kbc_parameters.to_string(), client.error().message()));
      }

    KbcSession session(client.value());
    if (auto result = session.open(); !result)
      {
        logger_->error("Cannot connect to {}: {}", kbc_parameters.to_string(), result.error().message());
        return deny(PullDenied::Kind::Infrastructure,
                    fmt::format("cannot connect to key broker {}: {}", kbc_parameters.to_string(), result.error().message()));
      }

    TrustMaterialResolver resolver(session.client());
    VerificationContext context{image, digest, resolver};

    std::optional<std::string> unavailable;
    std::optional<std::string> rejected;
    for (const auto *artifact: candidates)
      {
        for (const auto &signature_requirement: requirement.requirements)
          {
            if (scheme_of(signature_requirement) != scheme_of(*artifact))
              {
                continue;
              }

            auto result = verify_artifact(*artifact, signature_requirement, context);
            switch (result.kind())
              {
              case VerificationOutcome::Kind::Verified:
                logger_->info("Allowing {}: {} signature verified", image.to_string(), to_string(scheme_of(signature_requirement)));
                return outcome::success();
              case VerificationOutcome::Kind::Unavailable:
                if (!unavailable)
                  {
                    unavailable = result.reason();
                  }
                break;
              case VerificationOutcome::Kind::Rejected:
                if (!rejected)
                  {
                    rejected = result.reason();
                  }
                break;
              }
          }
      }

    if (unavailable)
      {
        logger_->warn("Denying {}: {}", image.to_string(), *unavailable);
        return deny(PullDenied::Kind::Infrastructure, *unavailable);
      }
    logger_->info("Denying {}: {}", image.to_string(), rejected.value_or("no signature verified"));
    return deny(PullDenied::Kind::VerificationRejected, rejected.value_or("no signature verified"));
  }

  VerificationOutcome ImagePullAuthorizer::verify_artifact(const SignatureArtifact &artifact,
                                                           const SignatureRequirement &requirement,
                                                           const VerificationContext &context)
  {
    return std::visit(overloaded{
                        [&](const SimpleSigningArtifact &simple) {
                          const auto *required = std::get_if<SimpleSigningRequirement>(&requirement);
                          if (required == nullptr)
                            {
                              return VerificationOutcome::rejected("requirement does not apply to simple signing");
                            }
                          SimpleSigningVerifier verifier;
                          return verifier.verify(simple, *required, context);
                        },
                        [&](const CosignArtifact &cosign) {
                          const auto *required = std::get_if<CosignRequirement>(&requirement);
                          if (required == nullptr)
                            {
                              return VerificationOutcome::rejected("requirement does not apply to cosign");
                            }
                          CosignVerifier verifier;
                          return verifier.verify(cosign, *required, context);
                        },
                        [&](const UnknownArtifact &unknown) {
                          return VerificationOutcome::rejected(fmt::format("no verifier for signature scheme '{}'", unknown.scheme));
                        },
                      },
                      artifact);
  }

} // namespace imageguard
