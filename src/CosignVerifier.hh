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

#ifndef IMAGEGUARD_COSIGN_VERIFIER_HH
#define IMAGEGUARD_COSIGN_VERIFIER_HH

#include <memory>
#include <string>
#include <variant>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "Certificate.hh"
#include "Logging.hh"
#include "PublicKey.hh"
#include "VerificationContext.hh"
#include "imageguard/Policy.hh"
#include "imageguard/SignatureArtifact.hh"
#include "imageguard/VerificationOutcome.hh"

namespace outcome = boost::outcome_v2;

namespace imageguard
{
  /**
   * @brief Verifies cosign signatures
   *
   * With a key_path requirement the signature must verify with that public
   * key. With a ca_path requirement the artifact must carry a signing
   * certificate that chains to the roots from the key broker, optionally
   * through the artifact's chain, and whose identity matches the configured
   * email and issuer.
   */
  class CosignVerifier
  {
  public:
    CosignVerifier() = default;

    VerificationOutcome verify(const CosignArtifact &artifact,
                               const CosignRequirement &requirement,
                               const VerificationContext &context);

  private:
    /// The key to check the signature with, or why there is none.
    using SigningKey = std::variant<std::shared_ptr<PublicKey>, VerificationOutcome>;

    SigningKey key_from_resolver(const std::string &key_path, const VerificationContext &context);
    SigningKey key_from_certificate(const CosignArtifact &artifact,
                                    const CosignRequirement &requirement,
                                    const VerificationContext &context);

    std::shared_ptr<spdlog::logger> logger_{Logging::create("imageguard:cosign")};
  };

} // namespace imageguard

#endif // IMAGEGUARD_COSIGN_VERIFIER_HH
