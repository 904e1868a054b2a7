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

#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>

#include "imageguard/Errors.hh"
#include "imageguard/Policy.hh"

namespace imageguard::test
{
  namespace
  {
    RequireSignature require_key(const std::string &key_path)
    {
      return RequireSignature{{SimpleSigningRequirement{.key_path = key_path, .signed_identity = {}}}};
    }
  } // namespace

  class PolicyEngineTest : public ::testing::Test
  {
  protected:
    static ImageReference ref(const std::string &reference)
    {
      return ImageReference::parse(reference).value();
    }

    /// Key path of the signature requirement chosen for image, or the requirement kind.
    static std::string decide(const Policy &policy, const std::string &image)
    {
      PolicyEngine engine(std::make_shared<const Policy>(policy));
      auto requirement = engine.decide(ref(image));
      if (std::holds_alternative<Unrestricted>(requirement))
        {
          return "unrestricted";
        }
      if (std::holds_alternative<Reject>(requirement))
        {
          return "reject";
        }
      const auto &required = std::get<RequireSignature>(requirement);
      return std::get<SimpleSigningRequirement>(required.requirements.front()).key_path;
    }
  };

  TEST_F(PolicyEngineTest, NoMatchingScopeIsUnrestricted)
  {
    Policy policy;
    policy.rules.push_back({"quay.io/protected", require_key("protected")});

    EXPECT_EQ(decide(policy, "docker.io/library/busybox:latest"), "unrestricted");
    EXPECT_EQ(decide(policy, "quay.io/protectedness/app"), "unrestricted");
  }

  TEST_F(PolicyEngineTest, DefaultAppliesWithoutMatch)
  {
    Policy policy;
    policy.default_requirement = Reject{};
    policy.rules.push_back({"quay.io", Unrestricted{}});

    EXPECT_EQ(decide(policy, "docker.io/library/busybox"), "reject");
    EXPECT_EQ(decide(policy, "quay.io/any/app"), "unrestricted");
  }

  TEST_F(PolicyEngineTest, MostSpecificScopeWins)
  {
    Policy policy;
    policy.rules.push_back({"*.example.com", require_key("wildcard")});
    policy.rules.push_back({"registry.example.com", require_key("registry")});
    policy.rules.push_back({"registry.example.com/team", require_key("namespace")});
    policy.rules.push_back({"registry.example.com/team/app", require_key("repository")});
    policy.rules.push_back({"registry.example.com/team/app:v1", require_key("tag")});

    EXPECT_EQ(decide(policy, "registry.example.com/team/app:v1"), "tag");
    EXPECT_EQ(decide(policy, "registry.example.com/team/app:v2"), "repository");
    EXPECT_EQ(decide(policy, "registry.example.com/team/other"), "namespace");
    EXPECT_EQ(decide(policy, "registry.example.com/solo"), "registry");
    EXPECT_EQ(decide(policy, "mirror.example.com/team/app"), "wildcard");
    EXPECT_EQ(decide(policy, "example.com/team/app"), "unrestricted");
  }

  TEST_F(PolicyEngineTest, ConfigurationOrderBreaksTies)
  {
    Policy policy;
    policy.rules.push_back({"quay.io/team", require_key("first")});
    policy.rules.push_back({"quay.io/team", require_key("second")});

    EXPECT_EQ(decide(policy, "quay.io/team/app"), "first");
  }

  TEST_F(PolicyEngineTest, DigestScope)
  {
    const std::string digest = "sha256:" + std::string(64, 'a');
    Policy policy;
    policy.rules.push_back({"quay.io/team/app@" + digest, require_key("digest")});

    EXPECT_EQ(decide(policy, "quay.io/team/app@" + digest), "digest");
    EXPECT_EQ(decide(policy, "quay.io/team/app:v1"), "unrestricted");
  }

  TEST_F(PolicyEngineTest, ScopeSpecificityOrdering)
  {
    auto image = ref("a.b.example.com/x/y/z:tag");

    auto exact = PolicyEngine::scope_specificity("a.b.example.com/x/y/z:tag", image);
    auto repository = PolicyEngine::scope_specificity("a.b.example.com/x/y/z", image);
    auto name_space = PolicyEngine::scope_specificity("a.b.example.com/x", image);
    auto host = PolicyEngine::scope_specificity("a.b.example.com", image);
    auto deep_wildcard = PolicyEngine::scope_specificity("*.b.example.com", image);
    auto wildcard = PolicyEngine::scope_specificity("*.example.com", image);

    ASSERT_TRUE(exact && repository && name_space && host && deep_wildcard && wildcard);
    EXPECT_GT(*exact, *repository);
    EXPECT_GT(*repository, *name_space);
    EXPECT_GT(*name_space, *host);
    EXPECT_GT(*host, *deep_wildcard);
    EXPECT_GT(*deep_wildcard, *wildcard);
    EXPECT_FALSE(PolicyEngine::scope_specificity("", image));
    EXPECT_FALSE(PolicyEngine::scope_specificity("a.b.example.com/x/y/z:other", image));
  }

  TEST_F(PolicyEngineTest, DecisionIsStable)
  {
    Policy policy;
    policy.rules.push_back({"quay.io", require_key("quay")});
    PolicyEngine engine(std::make_shared<const Policy>(policy));
    auto image = ref("quay.io/team/app:v1");

    for (int i = 0; i < 3; i++)
      {
        auto requirement = engine.decide(image);
        ASSERT_TRUE(std::holds_alternative<RequireSignature>(requirement));
        EXPECT_EQ(std::get<RequireSignature>(requirement).schemes(), std::set<SigningScheme>{SigningScheme::SimpleSigning});
      }
  }

  TEST_F(PolicyEngineTest, SnapshotSurvivesReload)
  {
    auto first = std::make_shared<Policy>();
    first->default_requirement = Reject{};
    PolicyStore store(first);

    auto snapshot = store.snapshot();
    ASSERT_TRUE(store.reload(std::make_shared<const Policy>()));

    EXPECT_TRUE(snapshot->default_requirement.has_value());
    EXPECT_FALSE(store.snapshot()->default_requirement.has_value());
  }

  TEST_F(PolicyEngineTest, NullPolicyIsRefused)
  {
    auto first = std::make_shared<Policy>();
    first->default_requirement = Reject{};
    PolicyStore store(first);

    auto result = store.reload(nullptr);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), ImageGuardError::InvalidPolicy);
    ASSERT_NE(store.snapshot(), nullptr);
    EXPECT_TRUE(store.snapshot()->default_requirement.has_value());
  }

  TEST_F(PolicyEngineTest, EngineWithoutPolicyRejects)
  {
    PolicyEngine engine(nullptr);

    EXPECT_TRUE(std::holds_alternative<Reject>(engine.decide(ref("quay.io/team/app:v1"))));
  }

  TEST_F(PolicyEngineTest, SignedIdentityRules)
  {
    const std::string digest = "sha256:" + std::string(64, 'b');
    auto tagged = ref("quay.io/team/app:v1");
    auto by_digest = ref("quay.io/team/app@" + digest);

    SignedIdentity default_rule;
    EXPECT_TRUE(default_rule.matches(tagged, ref("quay.io/team/app:v1")));
    EXPECT_FALSE(default_rule.matches(tagged, ref("quay.io/team/app:v2")));
    EXPECT_TRUE(default_rule.matches(by_digest, ref("quay.io/team/app:v9")));

    SignedIdentity exact{.type = SignedIdentity::Type::MatchExact};
    EXPECT_TRUE(exact.matches(tagged, ref("quay.io/team/app:v1")));
    EXPECT_FALSE(exact.matches(by_digest, ref("quay.io/team/app:v1")));

    SignedIdentity repository{.type = SignedIdentity::Type::MatchRepository};
    EXPECT_TRUE(repository.matches(tagged, ref("quay.io/team/app:v2")));
    EXPECT_FALSE(repository.matches(tagged, ref("quay.io/team/other:v1")));

    auto repository_only = ImageReference::parse("quay.io/team/app", false).value();
    EXPECT_TRUE(repository.matches(tagged, repository_only));
    EXPECT_TRUE(repository.matches(by_digest, repository_only));
    EXPECT_FALSE(default_rule.matches(tagged, repository_only));
    EXPECT_FALSE(default_rule.matches(ref("quay.io/team/app:latest"), repository_only));
    EXPECT_FALSE(exact.matches(ref("quay.io/team/app:latest"), repository_only));

    SignedIdentity exact_repository{.type = SignedIdentity::Type::ExactRepository, .value = "quay.io/release/app"};
    EXPECT_TRUE(exact_repository.matches(tagged, ref("quay.io/release/app:v3")));
    EXPECT_FALSE(exact_repository.matches(tagged, ref("quay.io/team/app:v1")));
  }

} // namespace imageguard::test
