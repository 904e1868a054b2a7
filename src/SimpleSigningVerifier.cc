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

#include "SimpleSigningVerifier.hh"

#include <boost/json.hpp>
#include <fmt/format.h>

#include "Base64.hh"
#include "PublicKey.hh"
#include "SignaturePayload.hh"
#include "imageguard/Errors.hh"

namespace imageguard
{
  outcome::std_result<SimpleSigningVerifier::Envelope> SimpleSigningVerifier::parse_envelope(const std::string &blob)
  {
    boost::system::error_code ec;
    auto json_val = boost::json::parse(blob, ec);
    if (ec)
      {
        logger_->error("Failed to parse signature envelope: {}", ec.message());
        return ImageGuardError::JsonParseError;
      }
    if (!json_val.is_object())
      {
        logger_->error("Signature envelope is not a JSON object");
        return ImageGuardError::InvalidSignature;
      }

    const auto &obj = json_val.as_object();
    const auto *payload = obj.if_contains("payload");
    const auto *signature = obj.if_contains("signature");
    if (payload == nullptr || !payload->is_string() || signature == nullptr || !signature->is_string())
      {
        logger_->error("Signature envelope lacks payload or signature");
        return ImageGuardError::InvalidSignature;
      }

    auto decoded_payload = Base64::decode(std::string(payload->as_string()));
    if (!decoded_payload)
      {
        return decoded_payload.error();
      }
    auto decoded_signature = Base64::decode(std::string(signature->as_string()));
    if (!decoded_signature)
      {
        return decoded_signature.error();
      }

    return Envelope{decoded_payload.value(), decoded_signature.value()};
  }

  VerificationOutcome SimpleSigningVerifier::verify(const SimpleSigningArtifact &artifact,
                                                    const SimpleSigningRequirement &requirement,
                                                    const VerificationContext &context)
  {
    auto envelope = parse_envelope(artifact.signature_blob);
    if (!envelope)
      {
        return VerificationOutcome::rejected(fmt::format("malformed signature: {}", envelope.error().message()));
      }

    auto keyring_pem = context.resolver.resolve(requirement.key_path);
    if (!keyring_pem)
      {
        logger_->warn("Keyring {} unavailable: {}", requirement.key_path, keyring_pem.error().message());
        return VerificationOutcome::unavailable(
          fmt::format("keyring {} unavailable: {}", requirement.key_path, keyring_pem.error().message()));
      }

    auto keyring = PublicKey::load_keyring(keyring_pem.value());
    if (!keyring)
      {
        logger_->error("Keyring {} is not a valid PEM keyring", requirement.key_path);
        return VerificationOutcome::unavailable(fmt::format("keyring {} is malformed", requirement.key_path));
      }

    bool signature_valid = false;
    for (const auto &key: keyring.value())
      {
        if (key->verify_signature(envelope.value().payload, envelope.value().signature))
          {
            signature_valid = true;
            break;
          }
      }
    if (!signature_valid)
      {
        logger_->info("No key of {} verifies the signature of {}", requirement.key_path, context.image.to_string());
        return VerificationOutcome::rejected("signature does not verify with any trusted key");
      }

    SignaturePayloadParser parser;
    auto payload = parser.parse(envelope.value().payload);
    if (!payload)
      {
        return VerificationOutcome::rejected(fmt::format("malformed signature payload: {}", payload.error().message()));
      }

    return verify_payload_claims(payload.value(), SignaturePayload::simple_signing_type, requirement.signed_identity, context);
  }

} // namespace imageguard
