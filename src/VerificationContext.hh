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

#ifndef IMAGEGUARD_VERIFICATION_CONTEXT_HH
#define IMAGEGUARD_VERIFICATION_CONTEXT_HH

#include <string>
#include <string_view>

#include "SignaturePayload.hh"
#include "imageguard/ImageReference.hh"
#include "imageguard/Policy.hh"
#include "imageguard/TrustMaterialResolver.hh"
#include "imageguard/VerificationOutcome.hh"

namespace imageguard
{
  /// What a verifier checks against during one pull attempt.
  struct VerificationContext
  {
    const ImageReference &image;
    const std::string &manifest_digest;
    TrustMaterialResolver &resolver;
  };

  /// Verifier for images whose policy demands nothing.
  class NoneVerifier
  {
  public:
    VerificationOutcome verify() const
    {
      return VerificationOutcome::verified();
    }
  };

  /// Checks the type, digest and identity claims of a cryptographically valid payload.
  VerificationOutcome verify_payload_claims(const SignaturePayload &payload,
                                            std::string_view expected_type,
                                            const SignedIdentity &signed_identity,
                                            const VerificationContext &context);

} // namespace imageguard

#endif // IMAGEGUARD_VERIFICATION_CONTEXT_HH
