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

#include "PublicKey.hh"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>

#include "imageguard/Errors.hh"

namespace imageguard
{
  namespace
  {
    struct BioDeleter
    {
      void operator()(BIO *bio) const
      {
        BIO_free(bio);
      }
    };

    struct EvpMdCtxDeleter
    {
      void operator()(EVP_MD_CTX *ctx) const
      {
        EVP_MD_CTX_free(ctx);
      }
    };

    const EVP_MD *to_evp_md(DigestAlgorithm algorithm)
    {
      switch (algorithm)
        {
        case DigestAlgorithm::SHA384:
          return EVP_sha384();
        case DigestAlgorithm::SHA512:
          return EVP_sha512();
        case DigestAlgorithm::SHA256:
        default:
          return EVP_sha256();
        }
    }

    bool uses_builtin_digest(EVP_PKEY *key)
    {
      int id = EVP_PKEY_base_id(key);
      return id == EVP_PKEY_ED25519 || id == EVP_PKEY_ED448;
    }
  } // namespace

  PublicKey::PublicKey(EvpPkeyPtr key)
    : key_(std::move(key))
  {
  }

  outcome::std_result<std::shared_ptr<PublicKey>> PublicKey::from_pem(std::string_view pem)
  {
    auto keyring = load_keyring(pem);
    if (!keyring)
      {
        return keyring.error();
      }
    if (keyring.value().size() != 1)
      {
        spdlog::error("Expected exactly one public key, found {}", keyring.value().size());
        return ImageGuardError::InvalidPublicKey;
      }
    return keyring.value().front();
  }

  outcome::std_result<std::vector<std::shared_ptr<PublicKey>>> PublicKey::load_keyring(std::string_view pem)
  {
    static constexpr std::string_view begin_marker = "-----BEGIN ";
    static constexpr std::string_view end_marker = "-----END ";
    static constexpr std::string_view dashes = "-----";

    std::vector<std::shared_ptr<PublicKey>> keys;
    size_t pos = 0;
    while ((pos = pem.find(begin_marker, pos)) != std::string_view::npos)
      {
        size_t end = pem.find(end_marker, pos);
        if (end == std::string_view::npos)
          {
            spdlog::error("Unterminated PEM block in keyring");
            return ImageGuardError::InvalidPublicKey;
          }
        size_t close = pem.find(dashes, end + end_marker.size());
        if (close == std::string_view::npos)
          {
            spdlog::error("Unterminated PEM block in keyring");
            return ImageGuardError::InvalidPublicKey;
          }
        close += dashes.size();

        auto block = pem.substr(pos, close - pos);
        std::unique_ptr<BIO, BioDeleter> bio(BIO_new_mem_buf(block.data(), static_cast<int>(block.size())));
        if (!bio)
          {
            return ImageGuardError::SystemError;
          }

        EVP_PKEY *raw = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
        ERR_clear_error();
        if (raw == nullptr)
          {
            spdlog::error("Failed to parse PEM public key #{} of keyring", keys.size() + 1);
            return ImageGuardError::InvalidPublicKey;
          }
        keys.push_back(std::make_shared<PublicKey>(EvpPkeyPtr(raw)));
        pos = close;
      }

    if (keys.empty())
      {
        spdlog::error("No PEM public key found");
        return ImageGuardError::InvalidPublicKey;
      }
    return keys;
  }

  outcome::std_result<void> PublicKey::verify_signature(std::string_view data, std::string_view signature, DigestAlgorithm digest_algorithm) const
  {
    if (signature.empty())
      {
        logger_->debug("Empty signature");
        return ImageGuardError::InvalidSignature;
      }

    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx)
      {
        return ImageGuardError::SystemError;
      }

    const EVP_MD *md = uses_builtin_digest(key_.get()) ? nullptr : to_evp_md(digest_algorithm);
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, md, nullptr, key_.get()) != 1)
      {
        logger_->error("Failed to initialise signature verification for {} key", get_algorithm_name());
        ERR_clear_error();
        return ImageGuardError::InvalidPublicKey;
      }

    int rc = EVP_DigestVerify(ctx.get(),
                              reinterpret_cast<const unsigned char *>(signature.data()),
                              signature.size(),
                              reinterpret_cast<const unsigned char *>(data.data()),
                              data.size());
    ERR_clear_error();
    if (rc != 1)
      {
        logger_->debug("Signature does not verify with {} key", get_algorithm_name());
        return ImageGuardError::InvalidSignature;
      }

    return outcome::success();
  }

  std::string PublicKey::get_algorithm_name() const
  {
    switch (EVP_PKEY_base_id(key_.get()))
      {
      case EVP_PKEY_RSA:
        return "RSA";
      case EVP_PKEY_EC:
        return "EC";
      case EVP_PKEY_ED25519:
        return "Ed25519";
      case EVP_PKEY_ED448:
        return "Ed448";
      default:
        return "unknown";
      }
  }

  EVP_PKEY *PublicKey::get() const
  {
    return key_.get();
  }

} // namespace imageguard
