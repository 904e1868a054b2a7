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

#ifndef IMAGEGUARD_SIMPLE_SIGNING_VERIFIER_HH
#define IMAGEGUARD_SIMPLE_SIGNING_VERIFIER_HH

#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "Logging.hh"
#include "VerificationContext.hh"
#include "imageguard/Policy.hh"
#include "imageguard/SignatureArtifact.hh"
#include "imageguard/VerificationOutcome.hh"

namespace outcome = boost::outcome_v2;

namespace imageguard
{
  /**
   * @brief Verifies simple signing signatures against a keyring from the key broker
   *
   * A signature blob is a JSON envelope
   *
   * @code
   * { "payload": "<base64 payload>", "signature": "<base64 signature over the payload>" }
   * @endcode
   *
   * The signature must verify with at least one key of the keyring named by
   * the requirement, and the payload claims must match the pulled image.
   */
  class SimpleSigningVerifier
  {
  public:
    SimpleSigningVerifier() = default;

    VerificationOutcome verify(const SimpleSigningArtifact &artifact,
                               const SimpleSigningRequirement &requirement,
                               const VerificationContext &context);

  private:
    struct Envelope
    {
      std::string payload;
      std::string signature;
    };

    outcome::std_result<Envelope> parse_envelope(const std::string &blob);

    std::shared_ptr<spdlog::logger> logger_{Logging::create("imageguard:simple_signing")};
  };

} // namespace imageguard

#endif // IMAGEGUARD_SIMPLE_SIGNING_VERIFIER_HH
