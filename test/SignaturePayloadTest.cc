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

#include "SignaturePayload.hh"
#include "TestUtils.hh"
#include "imageguard/Errors.hh"

namespace imageguard::test
{
  class SignaturePayloadTest : public ::testing::Test
  {
  protected:
    SignaturePayloadParser parser;
  };

  TEST_F(SignaturePayloadTest, ParseAtomicContainerSignature)
  {
    auto digest = sha256_digest("manifest");
    auto payload = parser.parse(make_payload(SignaturePayload::simple_signing_type, "quay.io/example/app:v1", digest));

    ASSERT_TRUE(payload);
    EXPECT_EQ(payload.value().type, "atomic container signature");
    EXPECT_EQ(payload.value().docker_reference, "quay.io/example/app:v1");
    EXPECT_EQ(payload.value().docker_manifest_digest, digest);
    EXPECT_EQ(payload.value().optional.at("creator").as_string(), "imageguard tests");
  }

  TEST_F(SignaturePayloadTest, CosignNullOptionalIsAccepted)
  {
    auto payload = parser.parse(R"({
      "critical": {
        "identity": { "docker-reference": "quay.io/example/app" },
        "image": { "docker-manifest-digest": "sha256:0000000000000000000000000000000000000000000000000000000000000000" },
        "type": "cosign container image signature"
      },
      "optional": null
    })");

    ASSERT_TRUE(payload);
    EXPECT_EQ(payload.value().type, SignaturePayload::cosign_type);
    EXPECT_TRUE(payload.value().optional.empty());
  }

  TEST_F(SignaturePayloadTest, IncompletePayloadsAreInvalid)
  {
    for (const auto *json: {"not json",
                            "[]",
                            R"({"optional": {}})",
                            R"({"critical": {"type": "atomic container signature", "identity": {}}})",
                            R"({"critical": {"type": "atomic container signature", "identity": {"docker-reference": "a"}, "image": {}}})"})
      {
        auto payload = parser.parse(json);
        ASSERT_FALSE(payload) << json;
        EXPECT_EQ(payload.error(), ImageGuardError::InvalidPayload) << json;
      }
  }

  TEST_F(SignaturePayloadTest, Sha256DigestIsLowercaseHex)
  {
    EXPECT_EQ(sha256_digest(""), "sha256:e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_digest("abc"), "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  }

} // namespace imageguard::test
