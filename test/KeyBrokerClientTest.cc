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

#include "OfflineFsKbc.hh"
#include "SampleKbc.hh"
#include "TestUtils.hh"
#include "imageguard/Errors.hh"
#include "imageguard/KeyBrokerClient.hh"

namespace imageguard::test
{
  class KeyBrokerClientTest : public ::testing::Test
  {
  protected:
    TempDir temp_dir;
  };

  TEST_F(KeyBrokerClientTest, ParseAttestationParameters)
  {
    auto parameters = KbcParameters::parse("cc_kbc::http://kbs.example.com:8080");

    ASSERT_TRUE(parameters);
    EXPECT_EQ(parameters.value().kbc_name, "cc_kbc");
    EXPECT_EQ(parameters.value().kbs_uri, "http://kbs.example.com:8080");
    EXPECT_EQ(parameters.value().to_string(), "cc_kbc::http://kbs.example.com:8080");

    EXPECT_FALSE(KbcParameters::parse("offline_fs_kbc"));
    EXPECT_FALSE(KbcParameters::parse("::null"));
  }

  TEST_F(KeyBrokerClientTest, ResourcePathDropsSchemeAndHost)
  {
    EXPECT_EQ(KeyBrokerClient::resource_path("kbs:///default/cosign-public-key/test"), "default/cosign-public-key/test");
    EXPECT_EQ(KeyBrokerClient::resource_path("kbs://kbs.example.com/default/key/1"), "default/key/1");
    EXPECT_EQ(KeyBrokerClient::resource_path("default/key/1"), "default/key/1");
  }

  TEST_F(KeyBrokerClientTest, SampleKbcServesFixedResources)
  {
    SampleKbc kbc(std::map<std::string, std::string>{{"default/key/1", "one"}});

    auto before_connect = kbc.request_resource("default/key/1");
    ASSERT_FALSE(before_connect);
    EXPECT_EQ(before_connect.error(), KbcError::NotConnected);

    ASSERT_TRUE(kbc.connect());
    auto by_path = kbc.request_resource("kbs:///default/key/1");
    ASSERT_TRUE(by_path);
    EXPECT_EQ(by_path.value(), "one");

    auto missing = kbc.request_resource("kbs:///default/key/2");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error(), KbcError::ResourceNotFound);
  }

  TEST_F(KeyBrokerClientTest, OfflineFsKbcReadsResourceFile)
  {
    auto path = temp_dir.path() / "resources.json";
    write_file(path, offline_resources_json({{"default/simple-signing-keys/test", "keyring"}, {"policy.json", "{}"}}));
    OfflineFsKbc kbc(path);

    ASSERT_TRUE(kbc.connect());
    EXPECT_TRUE(kbc.is_connected());

    auto keyring = kbc.request_resource("kbs:///default/simple-signing-keys/test");
    ASSERT_TRUE(keyring);
    EXPECT_EQ(keyring.value(), "keyring");

    auto by_name = kbc.request_resource("policy.json");
    ASSERT_TRUE(by_name);
    EXPECT_EQ(by_name.value(), "{}");

    kbc.disconnect();
    EXPECT_FALSE(kbc.is_connected());
    EXPECT_FALSE(kbc.request_resource("policy.json"));
  }

  TEST_F(KeyBrokerClientTest, OfflineFsKbcKeepsResourceIdsDistinct)
  {
    auto path = temp_dir.path() / "resources.json";
    write_file(path, offline_resources_json({{"test", "cosign key"}, {"default/simple-signing-keys/test", "keyring"}}));
    OfflineFsKbc kbc(path);
    ASSERT_TRUE(kbc.connect());

    EXPECT_EQ(kbc.request_resource("kbs:///default/simple-signing-keys/test").value(), "keyring");
    EXPECT_EQ(kbc.request_resource("test").value(), "cosign key");

    for (const auto *id: {"kbs:///other/cosign-public-key/test", "kbs:///default/security-policy/test"})
      {
        auto result = kbc.request_resource(id);
        ASSERT_FALSE(result) << id;
        EXPECT_EQ(result.error(), KbcError::ResourceNotFound) << id;
      }
  }

  TEST_F(KeyBrokerClientTest, OfflineFsKbcRereadsOnConnect)
  {
    auto path = temp_dir.path() / "resources.json";
    write_file(path, offline_resources_json({{"key", "old"}}));
    OfflineFsKbc kbc(path);
    ASSERT_TRUE(kbc.connect());
    EXPECT_EQ(kbc.request_resource("key").value(), "old");
    kbc.disconnect();

    write_file(path, offline_resources_json({{"key", "new"}}));
    ASSERT_TRUE(kbc.connect());
    EXPECT_EQ(kbc.request_resource("key").value(), "new");
  }

  TEST_F(KeyBrokerClientTest, OfflineFsKbcFailures)
  {
    OfflineFsKbc missing(temp_dir.path() / "absent.json");
    auto unreachable = missing.connect();
    ASSERT_FALSE(unreachable);
    EXPECT_EQ(unreachable.error(), KbcError::Unreachable);

    for (const auto *content: {"not json", "[]", R"({"key": 42})", R"({"key": "***"})"})
      {
        auto path = temp_dir.path() / "malformed.json";
        write_file(path, content);
        OfflineFsKbc kbc(path);

        auto result = kbc.connect();
        ASSERT_FALSE(result) << content;
        EXPECT_EQ(result.error(), KbcError::MalformedResponse) << content;
      }
  }

  TEST_F(KeyBrokerClientTest, FactorySelectsBackendByName)
  {
    KbcSettings settings;
    settings.offline_fs_resources_path = temp_dir.path() / "resources.json";
    KeyBrokerClientFactory factory(settings);

    auto sample = factory.create(KbcParameters{"sample_kbc", "null"});
    ASSERT_TRUE(sample);
    EXPECT_EQ(sample.value()->name(), "sample_kbc");

    auto offline = factory.create(KbcParameters{"offline_fs_kbc", "null"});
    ASSERT_TRUE(offline);
    EXPECT_EQ(offline.value()->name(), "offline_fs_kbc");

    auto remote = factory.create(KbcParameters{"cc_kbc", "http://kbs.example.com"});
    ASSERT_TRUE(remote);
    EXPECT_EQ(remote.value()->name(), "cc_kbc");

    auto unnamed = factory.create(KbcParameters{"", "null"});
    ASSERT_FALSE(unnamed);
    EXPECT_EQ(unnamed.error(), KbcError::UnknownBackend);
  }

  TEST_F(KeyBrokerClientTest, SessionDisconnectsOnExit)
  {
    auto kbc = std::make_shared<SampleKbc>(std::map<std::string, std::string>{{"key", "value"}});
    {
      KbcSession session(kbc);
      ASSERT_TRUE(session.open());
      EXPECT_TRUE(kbc->is_connected());
      EXPECT_EQ(session.client()->request_resource("key").value(), "value");
    }
    EXPECT_FALSE(kbc->is_connected());
  }

} // namespace imageguard::test
