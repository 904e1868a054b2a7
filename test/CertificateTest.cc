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

#include <string>
#include <gtest/gtest.h>

#include "Certificate.hh"
#include "TestUtils.hh"

namespace imageguard::test
{
  class CertificateTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      root = make_certificate({.common_name = "imageguard root", .is_ca = true}, root_key, root_key);
      intermediate = make_certificate({.common_name = "imageguard intermediate", .is_ca = true}, intermediate_key, root_key, root.get());
      leaf = make_certificate({.common_name = "signer",
                               .email = "signer@example.com",
                               .oidc_issuer = "https://accounts.example.com"},
                              leaf_key,
                              intermediate_key,
                              intermediate.get());
    }

    std::shared_ptr<Certificate> load(X509 *cert)
    {
      auto loaded = Certificate::from_pem(certificate_pem(cert));
      EXPECT_TRUE(loaded);
      return loaded.value();
    }

    TestKey root_key;
    TestKey intermediate_key;
    TestKey leaf_key;
    X509Ptr root;
    X509Ptr intermediate;
    X509Ptr leaf;
  };

  TEST_F(CertificateTest, ParseInvalidCertificate)
  {
    EXPECT_FALSE(Certificate::from_pem("invalid certificate data"));
    EXPECT_FALSE(Certificate::from_pem("-----BEGIN CERTIFICATE-----\ntest\n-----END CERTIFICATE-----"));
    EXPECT_FALSE(Certificate::load_bundle("no certificates"));
  }

  TEST_F(CertificateTest, IdentityOfSigningCertificate)
  {
    auto cert = load(leaf.get());

    EXPECT_EQ(cert->subject(), "CN=signer");
    EXPECT_EQ(cert->subject_emails(), std::vector<std::string>{"signer@example.com"});
    EXPECT_EQ(cert->oidc_issuer(), "https://accounts.example.com");
    EXPECT_TRUE(cert->public_key());
  }

  TEST_F(CertificateTest, CertificateWithoutIdentityExtensions)
  {
    auto cert = load(root.get());

    EXPECT_TRUE(cert->subject_emails().empty());
    EXPECT_EQ(cert->oidc_issuer(), "");
  }

  TEST_F(CertificateTest, VerifyChainThroughIntermediate)
  {
    auto bundle = Certificate::load_bundle(certificate_pem(root.get()));
    ASSERT_TRUE(bundle);
    auto cert = load(leaf.get());

    EXPECT_TRUE(cert->verify_chain(bundle.value(), {load(intermediate.get())}));
    EXPECT_FALSE(cert->verify_chain(bundle.value(), {}));
  }

  TEST_F(CertificateTest, VerifyChainWithUntrustedRoot)
  {
    TestKey other_key;
    auto other_root = make_certificate({.common_name = "other root", .is_ca = true}, other_key, other_key);
    auto cert = load(leaf.get());

    EXPECT_FALSE(cert->verify_chain({load(other_root.get())}, {load(intermediate.get())}));
    EXPECT_FALSE(cert->verify_chain({}, {load(intermediate.get())}));
  }

  TEST_F(CertificateTest, LoadBundleWithSeveralCertificates)
  {
    auto bundle = Certificate::load_bundle(certificate_pem(root.get()) + certificate_pem(intermediate.get()));

    ASSERT_TRUE(bundle);
    ASSERT_EQ(bundle.value().size(), 2U);
    EXPECT_EQ(bundle.value()[1]->subject(), "CN=imageguard intermediate");
  }

} // namespace imageguard::test
