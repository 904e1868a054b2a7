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

#ifndef IMAGEGUARD_POLICY_HH
#define IMAGEGUARD_POLICY_HH

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <boost/outcome/std_result.hpp>

#include "imageguard/ImageReference.hh"
#include "imageguard/SignatureArtifact.hh"

namespace outcome = boost::outcome_v2;

namespace imageguard
{
  /**
   * @brief Rule relating the reference claimed by a signature to the pulled image
   */
  struct SignedIdentity
  {
    enum class Type
    {
      MatchRepoDigestOrExact,
      MatchExact,
      MatchRepository,
      ExactReference,
      ExactRepository
    };

    Type type{Type::MatchRepoDigestOrExact};

    /// Reference or repository for the Exact* types.
    std::string value;

    bool matches(const ImageReference &image, const ImageReference &signed_reference) const;
  };

  struct SimpleSigningRequirement
  {
    /// Resource id of the PEM keyring, e.g. "kbs:///default/simple-signing-keys/test".
    std::string key_path;
    SignedIdentity signed_identity;
  };

  struct CosignRequirement
  {
    /// Resource id of the cosign public key. Mutually exclusive with ca_path.
    std::optional<std::string> key_path;

    /// Resource id of the root certificates for certificate based signatures.
    std::optional<std::string> ca_path;
    std::optional<std::string> subject_email;
    std::optional<std::string> oidc_issuer;

    /// Cosign payloads name the repository without a tag.
    SignedIdentity signed_identity{.type = SignedIdentity::Type::MatchRepository};
  };

  using SignatureRequirement = std::variant<SimpleSigningRequirement, CosignRequirement>;

  SigningScheme scheme_of(const SignatureRequirement &requirement);

  struct Unrestricted
  {
  };

  struct Reject
  {
  };

  struct RequireSignature
  {
    std::vector<SignatureRequirement> requirements;

    std::set<SigningScheme> schemes() const;
  };

  using PolicyRequirement = std::variant<Unrestricted, Reject, RequireSignature>;

  struct PolicyRule
  {
    std::string scope;
    PolicyRequirement requirement;
  };

  /**
   * @brief An immutable set of scoped policy rules
   *
   * Scopes are "registry", "registry/namespace", "registry/repository",
   * "registry/repository:tag", "registry/repository@digest" and
   * "*.domain" wildcards.
   */
  struct Policy
  {
    std::optional<PolicyRequirement> default_requirement;
    std::vector<PolicyRule> rules;

    /// Parses a containers-policy.json document.
    static outcome::std_result<std::shared_ptr<const Policy>> load_from_json(std::string_view json);
    static outcome::std_result<std::shared_ptr<const Policy>> load_from_file(const std::filesystem::path &path);
  };

  /**
   * @brief Decides which requirement applies to an image
   *
   * The most specific matching scope wins; among equally specific scopes
   * the first in configuration order wins. Without a match the policy
   * default applies, and without a default the image is unrestricted.
   * decide() is pure: same policy and reference, same answer. Without a
   * policy every image is rejected.
   */
  class PolicyEngine
  {
  public:
    explicit PolicyEngine(std::shared_ptr<const Policy> policy);

    PolicyRequirement decide(const ImageReference &image) const;

    /// Matching specificity of scope for image, or nullopt when it does not match.
    static std::optional<int> scope_specificity(std::string_view scope, const ImageReference &image);

  private:
    std::shared_ptr<const Policy> policy_;
  };

  /// Process wide policy holder. Readers take a snapshot that a reload never mutates.
  class PolicyStore
  {
  public:
    explicit PolicyStore(std::shared_ptr<const Policy> policy);

    std::shared_ptr<const Policy> snapshot() const;

    /// Replaces the policy. A null policy is refused and the current one stays.
    outcome::std_result<void> reload(std::shared_ptr<const Policy> policy);

  private:
    mutable std::mutex mutex_;
    std::shared_ptr<const Policy> policy_;
  };

} // namespace imageguard

#endif // IMAGEGUARD_POLICY_HH
