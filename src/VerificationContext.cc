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

#include "VerificationContext.hh"

#include <fmt/format.h>

namespace imageguard
{
  VerificationOutcome verify_payload_claims(const SignaturePayload &payload,
                                            std::string_view expected_type,
                                            const SignedIdentity &signed_identity,
                                            const VerificationContext &context)
  {
    if (payload.type != expected_type)
      {
        return VerificationOutcome::rejected(fmt::format("unexpected signature type '{}'", payload.type));
      }

    if (payload.docker_manifest_digest != context.manifest_digest)
      {
        return VerificationOutcome::rejected(
          fmt::format("signature is for digest {}, image has {}", payload.docker_manifest_digest, context.manifest_digest));
      }

    auto signed_reference = ImageReference::parse(payload.docker_reference, false);
    if (!signed_reference)
      {
        return VerificationOutcome::rejected(fmt::format("signature names invalid reference '{}'", payload.docker_reference));
      }

    if (!signed_identity.matches(context.image, signed_reference.value()))
      {
        return VerificationOutcome::rejected(
          fmt::format("signature identity {} does not match {}", signed_reference.value().to_string(), context.image.to_string()));
      }

    return VerificationOutcome::verified();
  }

} // namespace imageguard
