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

#ifndef IMAGEGUARD_SIGNATURE_ARTIFACT_HH
#define IMAGEGUARD_SIGNATURE_ARTIFACT_HH

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace imageguard
{
  /**
   * @brief Signing schemes the verification pipeline knows about
   *
   * The set is closed: adding a scheme means adding an enumerator, an
   * artifact alternative and a verifier.
   */
  enum class SigningScheme
  {
    None,
    SimpleSigning,
    Cosign
  };

  std::string to_string(SigningScheme scheme);
  std::optional<SigningScheme> signing_scheme_from_string(std::string_view name);

  /// A detached signature stored next to the image, one per manifest digest.
  struct SimpleSigningArtifact
  {
    std::string signature_blob;
  };

  /// One layer of the cosign signature manifest found at tag "sha256-<hex>.sig".
  struct CosignArtifact
  {
    std::string payload;
    std::string signature_b64;
    std::optional<std::string> certificate_pem;
    std::optional<std::string> chain_pem;
  };

  /// A signature object whose scheme has no verifier. Never accepted.
  struct UnknownArtifact
  {
    std::string scheme;
  };

  using SignatureArtifact = std::variant<SimpleSigningArtifact, CosignArtifact, UnknownArtifact>;

  std::optional<SigningScheme> scheme_of(const SignatureArtifact &artifact);

} // namespace imageguard

#endif // IMAGEGUARD_SIGNATURE_ARTIFACT_HH
