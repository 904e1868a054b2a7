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

#include "SignaturePayload.hh"

#include <array>
#include <fmt/format.h>
#include <openssl/sha.h>

#include "imageguard/Errors.hh"

namespace imageguard
{
  namespace
  {
    const boost::json::object *find_object(const boost::json::object &parent, const char *key)
    {
      const auto *it = parent.find(key);
      if (it == parent.end() || !it->value().is_object())
        {
          return nullptr;
        }
      return &it->value().as_object();
    }

    const boost::json::string *find_string(const boost::json::object &parent, const char *key)
    {
      const auto *it = parent.find(key);
      if (it == parent.end() || !it->value().is_string())
        {
          return nullptr;
        }
      return &it->value().as_string();
    }
  } // namespace

  outcome::std_result<SignaturePayload> SignaturePayloadParser::parse(const std::string &json_payload)
  {
    boost::system::error_code ec;
    boost::json::value parsed = boost::json::parse(json_payload, ec);
    if (ec)
      {
        logger_->error("Failed to parse signature payload: {}", ec.message());
        return ImageGuardError::InvalidPayload;
      }

    if (!parsed.is_object())
      {
        logger_->error("Signature payload is not a JSON object");
        return ImageGuardError::InvalidPayload;
      }

    const auto &root = parsed.as_object();
    const auto *critical = find_object(root, "critical");
    if (critical == nullptr)
      {
        logger_->error("Signature payload missing 'critical' section");
        return ImageGuardError::InvalidPayload;
      }

    const auto *type = find_string(*critical, "type");
    const auto *identity = find_object(*critical, "identity");
    const auto *image = find_object(*critical, "image");
    if (type == nullptr || identity == nullptr || image == nullptr)
      {
        logger_->error("Signature payload 'critical' section requires 'type', 'identity' and 'image'");
        return ImageGuardError::InvalidPayload;
      }

    const auto *reference = find_string(*identity, "docker-reference");
    const auto *digest = find_string(*image, "docker-manifest-digest");
    if (reference == nullptr || digest == nullptr)
      {
        logger_->error("Signature payload missing 'docker-reference' or 'docker-manifest-digest'");
        return ImageGuardError::InvalidPayload;
      }

    SignaturePayload payload;
    payload.type = std::string(*type);
    payload.docker_reference = std::string(*reference);
    payload.docker_manifest_digest = std::string(*digest);

    // cosign writes "optional": null
    if (const auto *optional = find_object(root, "optional"); optional != nullptr)
      {
        payload.optional = *optional;
      }

    return payload;
  }

  std::string sha256_digest(std::string_view data)
  {
    std::array<unsigned char, SHA256_DIGEST_LENGTH> hash{};
    SHA256(reinterpret_cast<const unsigned char *>(data.data()), data.size(), hash.data());

    std::string result = "sha256:";
    for (unsigned char byte: hash)
      {
        result += fmt::format("{:02x}", byte);
      }
    return result;
  }

} // namespace imageguard
