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

#include "CosignVerifier.hh"

#include <algorithm>
#include <fmt/format.h>

#include "Base64.hh"
#include "SignaturePayload.hh"

namespace imageguard
{
  CosignVerifier::SigningKey CosignVerifier::key_from_resolver(const std::string &key_path, const VerificationContext &context)
  {
    auto key_pem = context.resolver.resolve(key_path);
    if (!key_pem)
      {
        logger_->warn("Cosign key {} unavailable: {}", key_path, key_pem.error().message());
        return VerificationOutcome::unavailable(fmt::format("cosign key {} unavailable: {}", key_path, key_pem.error().message()));
      }

    auto key = PublicKey::from_pem(key_pem.value());
    if (!key)
      {
        logger_->error("Cosign key {} is not a valid PEM public key", key_path);
        return VerificationOutcome::unavailable(fmt::format("cosign key {} is malformed", key_path));
      }
    return key.value();
  }

  CosignVerifier::SigningKey CosignVerifier::key_from_certificate(const CosignArtifact &artifact,
                                                                  const CosignRequirement &requirement,
                                                                  const VerificationContext &context)
  {
    if (!artifact.certificate_pem)
      {
        return VerificationOutcome::rejected("signature carries no signing certificate");
      }

    auto roots_pem = context.resolver.resolve(*requirement.ca_path);
    if (!roots_pem)
      {
        logger_->warn("Root certificates {} unavailable: {}", *requirement.ca_path, roots_pem.error().message());
        return VerificationOutcome::unavailable(
          fmt::format("root certificates {} unavailable: {}", *requirement.ca_path, roots_pem.error().message()));
      }
    auto roots = Certificate::load_bundle(roots_pem.value());
    if (!roots)
      {
        logger_->error("Root certificates {} are malformed", *requirement.ca_path);
        return VerificationOutcome::unavailable(fmt::format("root certificates {} are malformed", *requirement.ca_path));
      }

    auto certificate = Certificate::from_pem(*artifact.certificate_pem);
    if (!certificate)
      {
        return VerificationOutcome::rejected("malformed signing certificate");
      }

    std::vector<std::shared_ptr<Certificate>> intermediates;
    if (artifact.chain_pem && !artifact.chain_pem->empty())
      {
        auto chain = Certificate::load_bundle(*artifact.chain_pem);
        if (!chain)
          {
            return VerificationOutcome::rejected("malformed certificate chain");
          }
        intermediates = chain.value();
      }

    if (!certificate.value()->verify_chain(roots.value(), intermediates))
      {
        logger_->info("Signing certificate {} is not trusted", certificate.value()->subject());
        return VerificationOutcome::rejected("signing certificate does not chain to a trusted root");
      }

    if (requirement.subject_email)
      {
        auto emails = certificate.value()->subject_emails();
        if (std::find(emails.begin(), emails.end(), *requirement.subject_email) == emails.end())
          {
            return VerificationOutcome::rejected(fmt::format("signing certificate is not issued to {}", *requirement.subject_email));
          }
      }

    if (requirement.oidc_issuer && certificate.value()->oidc_issuer() != *requirement.oidc_issuer)
      {
        return VerificationOutcome::rejected(fmt::format("signing certificate is not issued by {}", *requirement.oidc_issuer));
      }

    auto key = certificate.value()->public_key();
    if (!key)
      {
        return VerificationOutcome::rejected("signing certificate has no usable public key");
      }
    return key.value();
  }

  VerificationOutcome CosignVerifier::verify(const CosignArtifact &artifact,
                                             const CosignRequirement &requirement,
                                             const VerificationContext &context)
  {
    if (!requirement.key_path && !requirement.ca_path)
      {
        logger_->error("Cosign requirement names neither a key nor root certificates");
        return VerificationOutcome::rejected("cosign requirement has no trust root");
      }

    SigningKey signing_key = requirement.key_path ? key_from_resolver(*requirement.key_path, context)
                                                  : key_from_certificate(artifact, requirement, context);
    if (const auto *failure = std::get_if<VerificationOutcome>(&signing_key))
      {
        return *failure;
      }
    const auto &key = std::get<std::shared_ptr<PublicKey>>(signing_key);

    auto signature = Base64::decode(artifact.signature_b64);
    if (!signature)
      {
        return VerificationOutcome::rejected("signature is not valid base64");
      }

    if (!key->verify_signature(artifact.payload, signature.value()))
      {
        logger_->info("Cosign signature of {} does not verify", context.image.to_string());
        return VerificationOutcome::rejected("cosign signature does not verify");
      }

    SignaturePayloadParser parser;
    auto payload = parser.parse(artifact.payload);
    if (!payload)
      {
        return VerificationOutcome::rejected(fmt::format("malformed signature payload: {}", payload.error().message()));
      }

    return verify_payload_claims(payload.value(), SignaturePayload::cosign_type, requirement.signed_identity, context);
  }

} // namespace imageguard
