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

#include "imageguard/Policy.hh"

#include <algorithm>
#include <spdlog/spdlog.h>

#include "imageguard/Errors.hh"

namespace imageguard
{
  namespace
  {
    constexpr int exact_reference_specificity = 10000;
    constexpr int repository_specificity = 1000;
    constexpr int wildcard_specificity = 100;

    int count_components(std::string_view value, char separator)
    {
      return static_cast<int>(std::count(value.begin(), value.end(), separator)) + 1;
    }
  } // namespace

  bool SignedIdentity::matches(const ImageReference &image, const ImageReference &signed_reference) const
  {
    switch (type)
      {
      case Type::MatchRepoDigestOrExact:
        if (image.digest())
          {
            return image.name() == signed_reference.name();
          }
        return image.name() == signed_reference.name() && image.tag() == signed_reference.tag() && !signed_reference.digest();

      case Type::MatchExact:
        if (image.digest() || !image.tag())
          {
            return false;
          }
        return image.name() == signed_reference.name() && image.tag() == signed_reference.tag() && !signed_reference.digest();

      case Type::MatchRepository:
        return image.name() == signed_reference.name();

      case Type::ExactReference:
        {
          auto expected = ImageReference::parse(value, false);
          return expected && expected.value() == signed_reference;
        }

      case Type::ExactRepository:
        {
          auto expected = ImageReference::parse(value);
          return expected && expected.value().name() == signed_reference.name();
        }
      }
    return false;
  }

  SigningScheme scheme_of(const SignatureRequirement &requirement)
  {
    return std::holds_alternative<SimpleSigningRequirement>(requirement) ? SigningScheme::SimpleSigning : SigningScheme::Cosign;
  }

  std::set<SigningScheme> RequireSignature::schemes() const
  {
    std::set<SigningScheme> result;
    for (const auto &requirement: requirements)
      {
        result.insert(scheme_of(requirement));
      }
    return result;
  }

  PolicyEngine::PolicyEngine(std::shared_ptr<const Policy> policy)
    : policy_(std::move(policy))
  {
  }

  std::optional<int> PolicyEngine::scope_specificity(std::string_view scope, const ImageReference &image)
  {
    if (scope.empty())
      {
        return std::nullopt;
      }

    if (scope.starts_with("*."))
      {
        // "*.example.com" matches "registry.example.com" and deeper subdomains, not "example.com".
        const auto &host = image.registry();
        auto suffix = scope.substr(1);
        if (host.size() > suffix.size() && host.ends_with(suffix))
          {
            return wildcard_specificity + count_components(suffix.substr(1), '.');
          }
        return std::nullopt;
      }

    auto last_slash = scope.rfind('/');
    auto tail = last_slash == std::string_view::npos ? scope : scope.substr(last_slash);
    if (tail.find('@') != std::string_view::npos)
      {
        if (image.digest() && scope == image.name() + "@" + *image.digest())
          {
            return exact_reference_specificity;
          }
        return std::nullopt;
      }
    if (last_slash != std::string_view::npos && tail.find(':') != std::string_view::npos)
      {
        if (image.tag() && scope == image.name() + ":" + *image.tag())
          {
            return exact_reference_specificity;
          }
        return std::nullopt;
      }

    auto name = image.name();
    if (name == scope || (name.starts_with(scope) && name[scope.size()] == '/'))
      {
        return repository_specificity + count_components(scope, '/');
      }
    return std::nullopt;
  }

  PolicyRequirement PolicyEngine::decide(const ImageReference &image) const
  {
    if (!policy_)
      {
        spdlog::error("No policy loaded, rejecting {}", image.to_string());
        return Reject{};
      }

    const PolicyRule *best = nullptr;
    int best_specificity = -1;

    for (const auto &rule: policy_->rules)
      {
        auto specificity = scope_specificity(rule.scope, image);
        if (specificity && *specificity > best_specificity)
          {
            best = &rule;
            best_specificity = *specificity;
          }
      }

    if (best != nullptr)
      {
        spdlog::debug("Policy scope '{}' applies to {}", best->scope, image.to_string());
        return best->requirement;
      }

    if (policy_->default_requirement)
      {
        spdlog::debug("Default policy applies to {}", image.to_string());
        return *policy_->default_requirement;
      }

    spdlog::debug("No policy scope for {}, unrestricted", image.to_string());
    return Unrestricted{};
  }

  PolicyStore::PolicyStore(std::shared_ptr<const Policy> policy)
    : policy_(std::move(policy))
  {
  }

  std::shared_ptr<const Policy> PolicyStore::snapshot() const
  {
    std::scoped_lock lock(mutex_);
    return policy_;
  }

  outcome::std_result<void> PolicyStore::reload(std::shared_ptr<const Policy> policy)
  {
    if (!policy)
      {
        spdlog::error("Refusing to replace the policy with an empty pointer");
        return ImageGuardError::InvalidPolicy;
      }
    std::scoped_lock lock(mutex_);
    policy_ = std::move(policy);
    return outcome::success();
  }

} // namespace imageguard
