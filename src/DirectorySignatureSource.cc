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

#include "imageguard/DirectorySignatureSource.hh"

#include <fstream>
#include <optional>
#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include "Base64.hh"
#include "Logging.hh"
#include "SignaturePayload.hh"
#include "imageguard/Errors.hh"

namespace imageguard
{
  namespace
  {
    constexpr std::string_view sha256_prefix = "sha256:";
    constexpr const char *cosign_signature_annotation = "dev.cosignproject.cosign/signature";
    constexpr const char *cosign_certificate_annotation = "dev.sigstore.cosign/certificate";
    constexpr const char *cosign_chain_annotation = "dev.sigstore.cosign/chain";

    outcome::std_result<std::string> read_file(const std::filesystem::path &path)
    {
      std::ifstream file(path, std::ios::in | std::ios::binary);
      if (!file.is_open())
        {
          return ImageGuardError::RegistryError;
        }
      std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
      if (file.bad())
        {
          return ImageGuardError::RegistryError;
        }
      return content;
    }

    // Absent paths are not an error; anything else the file system reports is.
    outcome::std_result<std::filesystem::file_type> file_type_of(const std::filesystem::path &path)
    {
      std::error_code ec;
      auto status = std::filesystem::status(path, ec);
      if (status.type() == std::filesystem::file_type::not_found)
        {
          return std::filesystem::file_type::not_found;
        }
      if (ec)
        {
          spdlog::error("Cannot access {}: {}", path.string(), ec.message());
          return ImageGuardError::RegistryError;
        }
      return status.type();
    }

    std::optional<std::string> get_annotation(const boost::json::object &annotations, const char *key)
    {
      const auto *value = annotations.if_contains(key);
      if (value == nullptr || !value->is_string())
        {
          return std::nullopt;
        }
      return std::string(value->as_string());
    }
  } // namespace

  DirectorySignatureSource::DirectorySignatureSource(std::filesystem::path root)
    : logger_(Logging::create("imageguard:directory_source"))
    , root_(std::move(root))
  {
  }

  outcome::std_result<ManifestInfo> DirectorySignatureSource::resolve_manifest(const ImageReference &image)
  {
    if (image.digest())
      {
        return ManifestInfo{*image.digest(), {}};
      }

    auto path = root_ / "manifests" / image.registry() / image.repository() / image.tag().value_or("latest");
    auto type = file_type_of(path);
    if (!type)
      {
        return type.error();
      }
    if (type.value() != std::filesystem::file_type::regular)
      {
        logger_->error("No manifest for {} at {}", image.to_string(), path.string());
        return ImageGuardError::RegistryError;
      }

    auto content = read_file(path);
    if (!content)
      {
        logger_->error("Failed to read manifest {}", path.string());
        return content.error();
      }

    std::string digest = sha256_digest(content.value());
    logger_->debug("Resolved {} to {}", image.to_string(), digest);
    return ManifestInfo{digest, content.value()};
  }

  outcome::std_result<std::vector<SignatureArtifact>> DirectorySignatureSource::fetch_signatures(const ImageReference &image,
                                                                                                 const std::string &manifest_digest)
  {
    if (!manifest_digest.starts_with(sha256_prefix))
      {
        logger_->error("Unsupported manifest digest {}", manifest_digest);
        return ImageGuardError::RegistryError;
      }
    std::string hex = manifest_digest.substr(sha256_prefix.size());

    std::vector<SignatureArtifact> artifacts;
    if (auto result = load_simple_signing(image, hex, artifacts); !result)
      {
        return result.error();
      }
    if (auto result = load_cosign(image, hex, artifacts); !result)
      {
        return result.error();
      }
    if (auto result = load_other(image, hex, artifacts); !result)
      {
        return result.error();
      }

    logger_->debug("Found {} signature(s) for {}", artifacts.size(), image.name());
    return artifacts;
  }

  outcome::std_result<void> DirectorySignatureSource::load_simple_signing(const ImageReference &image,
                                                                          const std::string &hex,
                                                                          std::vector<SignatureArtifact> &artifacts)
  {
    auto dir = root_ / "signatures" / image.registry() / (image.repository() + "@sha256=" + hex);
    for (int n = 1;; n++)
      {
        auto path = dir / ("signature-" + std::to_string(n));
        auto type = file_type_of(path);
        if (!type)
          {
            return type.error();
          }
        if (type.value() != std::filesystem::file_type::regular)
          {
            break;
          }
        auto blob = read_file(path);
        if (!blob)
          {
            logger_->error("Failed to read signature {}", path.string());
            return blob.error();
          }
        artifacts.emplace_back(SimpleSigningArtifact{blob.value()});
      }
    return outcome::success();
  }

  outcome::std_result<void> DirectorySignatureSource::load_cosign(const ImageReference &image,
                                                                  const std::string &hex,
                                                                  std::vector<SignatureArtifact> &artifacts)
  {
    auto path = root_ / "cosign" / image.registry() / image.repository() / ("sha256-" + hex + ".sig");
    auto type = file_type_of(path);
    if (!type)
      {
        return type.error();
      }
    if (type.value() != std::filesystem::file_type::regular)
      {
        return outcome::success();
      }

    auto content = read_file(path);
    if (!content)
      {
        logger_->error("Failed to read cosign signature manifest {}", path.string());
        return content.error();
      }

    boost::system::error_code ec;
    auto json_val = boost::json::parse(content.value(), ec);
    if (ec || !json_val.is_object())
      {
        logger_->error("Malformed cosign signature manifest {}", path.string());
        return ImageGuardError::RegistryError;
      }

    const auto *layers = json_val.as_object().if_contains("layers");
    if (layers == nullptr || !layers->is_array())
      {
        logger_->error("Cosign signature manifest {} has no layers", path.string());
        return ImageGuardError::RegistryError;
      }

    for (const auto &layer: layers->as_array())
      {
        if (!layer.is_object())
          {
            logger_->error("Cosign signature layer is not an object");
            return ImageGuardError::RegistryError;
          }
        const auto &layer_obj = layer.as_object();
        const auto *payload = layer_obj.if_contains("payload");
        const auto *annotations = layer_obj.if_contains("annotations");
        if (payload == nullptr || !payload->is_string() || annotations == nullptr || !annotations->is_object())
          {
            logger_->error("Cosign signature layer lacks payload or annotations");
            return ImageGuardError::RegistryError;
          }

        auto decoded_payload = Base64::decode(std::string(payload->as_string()));
        if (!decoded_payload)
          {
            logger_->error("Cosign signature payload is not valid base64");
            return ImageGuardError::RegistryError;
          }

        auto signature = get_annotation(annotations->as_object(), cosign_signature_annotation);
        if (!signature)
          {
            logger_->warn("Skipping cosign layer without {} annotation", cosign_signature_annotation);
            continue;
          }

        CosignArtifact artifact;
        artifact.payload = decoded_payload.value();
        artifact.signature_b64 = *signature;
        artifact.certificate_pem = get_annotation(annotations->as_object(), cosign_certificate_annotation);
        artifact.chain_pem = get_annotation(annotations->as_object(), cosign_chain_annotation);
        artifacts.emplace_back(std::move(artifact));
      }
    return outcome::success();
  }

  outcome::std_result<void> DirectorySignatureSource::load_other(const ImageReference &image,
                                                                 const std::string &hex,
                                                                 std::vector<SignatureArtifact> &artifacts)
  {
    auto dir = root_ / "other" / image.registry() / (image.repository() + "@sha256=" + hex);
    auto type = file_type_of(dir);
    if (!type)
      {
        return type.error();
      }
    if (type.value() != std::filesystem::file_type::directory)
      {
        return outcome::success();
      }

    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
      {
        if (it->is_regular_file(ec))
          {
            artifacts.emplace_back(UnknownArtifact{it->path().filename().string()});
          }
      }
    if (ec)
      {
        logger_->error("Failed to list {}: {}", dir.string(), ec.message());
        return ImageGuardError::RegistryError;
      }
    return outcome::success();
  }

} // namespace imageguard
