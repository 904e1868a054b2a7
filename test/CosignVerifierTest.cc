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
#include <gtest/gtest.h>

#include "CosignVerifier.hh"
#include "TestUtils.hh"

namespace imageguard::test
{
  namespace
  {
    constexpr const char *key_id = "kbs:///default/cosign-public-key/test";
    constexpr const char *roots_id = "kbs:///default/fulcio-roots/test";
    constexpr const char *issuer = "https://accounts.example.com";
  } // namespace

  class CosignVerifierTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      image = ImageReference::parse("quay.io/example/app:v1").value();
      digest = sha256_digest("manifest of quay.io/example/app:v1");

      root = make_certificate({.common_name = "fulcio root", .is_ca = true}, root_key, root_key);
      intermediate = make_certificate({.common_name = "fulcio intermediate", .is_ca = true}, intermediate_key, root_key, root.get());

      kbc = std::make_shared<CountingKbc>(std::map<std::string, std::string>{
        {key_id, key.public_pem()},
        {roots_id, certificate_pem(root.get())},
      });
      ASSERT_TRUE(kbc->connect());
      resolver = std::make_unique<TrustMaterialResolver>(kbc);
    }

    VerificationOutcome verify(const CosignArtifact &artifact, const CosignRequirement &requirement)
    {
      VerificationContext context{image, digest, *resolver};
      return verifier.verify(artifact, requirement, context);
    }

    CosignArtifact sign(const TestKey &signer, const std::string &reference = "quay.io/example/app:v1")
    {
      auto payload = make_payload(SignaturePayload::cosign_type, reference, digest);
      return CosignArtifact{payload, base64(signer.sign(payload)), std::nullopt, std::nullopt};
    }

    CosignArtifact sign_with_certificate(const std::string &email)
    {
      auto leaf = make_certificate({.common_name = "signer", .email = email, .oidc_issuer = issuer}, key, intermediate_key, intermediate.get());
      auto artifact = sign(key);
      artifact.certificate_pem = certificate_pem(leaf.get());
      artifact.chain_pem = certificate_pem(intermediate.get());
      return artifact;
    }

    static CosignRequirement key_requirement(const std::string &path)
    {
      CosignRequirement requirement;
      requirement.key_path = path;
      return requirement;
    }

    static CosignRequirement certificate_requirement()
    {
      CosignRequirement requirement;
      requirement.ca_path = roots_id;
      requirement.subject_email = "signer@example.com";
      requirement.oidc_issuer = issuer;
      return requirement;
    }

    TestKey key;
    TestKey other_key;
    TestKey root_key;
    TestKey intermediate_key;
    X509Ptr root;
    X509Ptr intermediate;
    ImageReference image = ImageReference::parse("busybox").value();
    std::string digest;
    std::shared_ptr<CountingKbc> kbc;
    std::unique_ptr<TrustMaterialResolver> resolver;
    CosignVerifier verifier;
  };

  TEST_F(CosignVerifierTest, SignatureWithConfiguredKeyVerifies)
  {
    auto outcome = verify(sign(key), key_requirement(key_id));

    EXPECT_TRUE(outcome.is_verified()) << outcome.reason();
  }

  TEST_F(CosignVerifierTest, SignatureWithOtherKeyIsRejected)
  {
    auto outcome = verify(sign(other_key), key_requirement(key_id));

    EXPECT_EQ(outcome.kind(), VerificationOutcome::Kind::Rejected);
  }

  TEST_F(CosignVerifierTest, PayloadClaimsAreChecked)
  {
    EXPECT_EQ(verify(sign(key, "quay.io/example/other:v1"), key_requirement(key_id)).kind(), VerificationOutcome::Kind::Rejected);

    auto simple_typed = make_payload(SignaturePayload::simple_signing_type, "quay.io/example/app:v1", digest);
    CosignArtifact artifact{simple_typed, base64(key.sign(simple_typed)), std::nullopt, std::nullopt};
    EXPECT_EQ(verify(artifact, key_requirement(key_id)).kind(), VerificationOutcome::Kind::Rejected);
  }

  TEST_F(CosignVerifierTest, UndecodableSignatureIsRejected)
  {
    auto artifact = sign(key);
    artifact.signature_b64 = "%%%";

    EXPECT_EQ(verify(artifact, key_requirement(key_id)).kind(), VerificationOutcome::Kind::Rejected);
  }

  TEST_F(CosignVerifierTest, MissingKeyIsUnavailable)
  {
    auto outcome = verify(sign(key), key_requirement("kbs:///default/cosign-public-key/absent"));

    EXPECT_EQ(outcome.kind(), VerificationOutcome::Kind::Unavailable);
  }

  TEST_F(CosignVerifierTest, CertificateChainingToTrustedRootVerifies)
  {
    auto outcome = verify(sign_with_certificate("signer@example.com"), certificate_requirement());

    EXPECT_TRUE(outcome.is_verified()) << outcome.reason();
  }

  TEST_F(CosignVerifierTest, CertificateIdentityMustMatch)
  {
    auto outcome = verify(sign_with_certificate("intruder@example.com"), certificate_requirement());
    EXPECT_EQ(outcome.kind(), VerificationOutcome::Kind::Rejected);

    auto requirement = certificate_requirement();
    requirement.oidc_issuer = "https://other-issuer.example.com";
    EXPECT_EQ(verify(sign_with_certificate("signer@example.com"), requirement).kind(), VerificationOutcome::Kind::Rejected);
  }

  TEST_F(CosignVerifierTest, CertificateFromUntrustedRootIsRejected)
  {
    TestKey rogue_key;
    auto rogue_root = make_certificate({.common_name = "rogue", .is_ca = true}, rogue_key, rogue_key);
    auto leaf = make_certificate({.common_name = "signer", .email = "signer@example.com", .oidc_issuer = issuer}, key, rogue_key, rogue_root.get());
    auto artifact = sign(key);
    artifact.certificate_pem = certificate_pem(leaf.get());

    EXPECT_EQ(verify(artifact, certificate_requirement()).kind(), VerificationOutcome::Kind::Rejected);
  }

  TEST_F(CosignVerifierTest, CertificateModeNeedsCertificate)
  {
    EXPECT_EQ(verify(sign(key), certificate_requirement()).kind(), VerificationOutcome::Kind::Rejected);
  }

  TEST_F(CosignVerifierTest, MissingRootsAreUnavailable)
  {
    auto requirement = certificate_requirement();
    requirement.ca_path = "kbs:///default/fulcio-roots/absent";

    EXPECT_EQ(verify(sign_with_certificate("signer@example.com"), requirement).kind(), VerificationOutcome::Kind::Unavailable);
  }

} // namespace imageguard::test
