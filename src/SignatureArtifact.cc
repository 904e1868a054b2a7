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

#include "imageguard/SignatureArtifact.hh"

namespace imageguard
{
  std::string to_string(SigningScheme scheme)
  {
    switch (scheme)
      {
      case SigningScheme::None:
        return "None";
      case SigningScheme::SimpleSigning:
        return "Simple Signing";
      case SigningScheme::Cosign:
        return "Cosign";
      }
    return "Unknown";
  }

  std::optional<SigningScheme> signing_scheme_from_string(std::string_view name)
  {
    if (name == "None")
      {
        return SigningScheme::None;
      }
    if (name == "Simple Signing")
      {
        return SigningScheme::SimpleSigning;
      }
    if (name == "Cosign")
      {
        return SigningScheme::Cosign;
      }
    return std::nullopt;
  }

  std::optional<SigningScheme> scheme_of(const SignatureArtifact &artifact)
  {
    if (std::holds_alternative<SimpleSigningArtifact>(artifact))
      {
        return SigningScheme::SimpleSigning;
      }
    if (std::holds_alternative<CosignArtifact>(artifact))
      {
        return SigningScheme::Cosign;
      }
    return std::nullopt;
  }

} // namespace imageguard
