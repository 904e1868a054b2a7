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

#include "TestUtils.hh"

#include <fstream>
#include <random>
#include <stdexcept>
#include <thread>
#include <boost/json.hpp>
#include <openssl/ec.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>

#include "Base64.hh"
#include "SignaturePayload.hh"

namespace imageguard::test
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

    std::string bio_to_string(BIO *bio)
    {
      char *data = nullptr;
      long length = BIO_get_mem_data(bio, &data);
      return std::string(data, static_cast<size_t>(length));
    }

    void add_extension(X509 *cert, X509 *issuer, int nid, const char *value)
    {
      X509V3_CTX ctx;
      X509V3_set_ctx_nodb(&ctx);
      X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);
      X509_EXTENSION *extension = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value);
      if (extension == nullptr)
        {
          throw std::runtime_error("failed to create certificate extension");
        }
      X509_add_ext(cert, extension, -1);
      X509_EXTENSION_free(extension);
    }
  } // namespace

  TestKey::TestKey()
  {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr), &EVP_PKEY_CTX_free);
    EVP_PKEY *key = nullptr;
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 || EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) != 1
        || EVP_PKEY_keygen(ctx.get(), &key) != 1)
      {
        throw std::runtime_error("failed to generate test key");
      }
    key_.reset(key);
  }

  std::string TestKey::public_pem() const
  {
    std::unique_ptr<BIO, BioDeleter> bio(BIO_new(BIO_s_mem()));
    PEM_write_bio_PUBKEY(bio.get(), key_.get());
    return bio_to_string(bio.get());
  }

  std::string TestKey::sign(std::string_view data) const
  {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key_.get()) != 1)
      {
        throw std::runtime_error("failed to initialise signing");
      }

    size_t length = 0;
    const auto *bytes = reinterpret_cast<const unsigned char *>(data.data());
    if (EVP_DigestSign(ctx.get(), nullptr, &length, bytes, data.size()) != 1)
      {
        throw std::runtime_error("failed to size signature");
      }
    std::string signature(length, '\0');
    if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char *>(signature.data()), &length, bytes, data.size()) != 1)
      {
        throw std::runtime_error("failed to sign");
      }
    signature.resize(length);
    return signature;
  }

  std::string base64(std::string_view data)
  {
    return Base64::encode(data).value();
  }

  std::string make_payload(std::string_view type, std::string_view docker_reference, std::string_view manifest_digest)
  {
    boost::json::object critical;
    critical["type"] = std::string(type);
    critical["identity"] = boost::json::object{{"docker-reference", std::string(docker_reference)}};
    critical["image"] = boost::json::object{{"docker-manifest-digest", std::string(manifest_digest)}};

    boost::json::object payload;
    payload["critical"] = std::move(critical);
    payload["optional"] = boost::json::object{{"creator", "imageguard tests"}};
    return boost::json::serialize(payload);
  }

  std::string make_envelope(const TestKey &key, std::string_view payload)
  {
    boost::json::object envelope;
    envelope["payload"] = base64(payload);
    envelope["signature"] = base64(key.sign(payload));
    return boost::json::serialize(envelope);
  }

  X509Ptr make_certificate(const CertificateOptions &options, const TestKey &subject_key, const TestKey &issuer_key, X509 *issuer)
  {
    static std::atomic<long> serial{1};

    X509Ptr cert(X509_new());
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), serial++);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), -3600);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
    X509_set_pubkey(cert.get(), subject_key.get());

    X509_NAME *name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char *>(options.common_name.c_str()), -1, -1, 0);
    X509_set_issuer_name(cert.get(), issuer != nullptr ? X509_get_subject_name(issuer) : name);

    X509 *issuer_cert = issuer != nullptr ? issuer : cert.get();
    if (options.is_ca)
      {
        add_extension(cert.get(), issuer_cert, NID_basic_constraints, "critical,CA:TRUE");
        add_extension(cert.get(), issuer_cert, NID_key_usage, "critical,keyCertSign,cRLSign");
      }
    else
      {
        add_extension(cert.get(), issuer_cert, NID_basic_constraints, "critical,CA:FALSE");
        add_extension(cert.get(), issuer_cert, NID_key_usage, "critical,digitalSignature");
      }
    add_extension(cert.get(), issuer_cert, NID_subject_key_identifier, "hash");

    if (options.email)
      {
        add_extension(cert.get(), issuer_cert, NID_subject_alt_name, ("email:" + *options.email).c_str());
      }

    if (options.oidc_issuer)
      {
        std::unique_ptr<ASN1_OBJECT, decltype(&ASN1_OBJECT_free)> oid(OBJ_txt2obj("1.3.6.1.4.1.57264.1.1", 1), &ASN1_OBJECT_free);
        std::unique_ptr<ASN1_OCTET_STRING, decltype(&ASN1_OCTET_STRING_free)> data(ASN1_OCTET_STRING_new(), &ASN1_OCTET_STRING_free);
        ASN1_OCTET_STRING_set(data.get(),
                              reinterpret_cast<const unsigned char *>(options.oidc_issuer->data()),
                              static_cast<int>(options.oidc_issuer->size()));
        X509_EXTENSION *extension = X509_EXTENSION_create_by_OBJ(nullptr, oid.get(), 0, data.get());
        X509_add_ext(cert.get(), extension, -1);
        X509_EXTENSION_free(extension);
      }

    if (X509_sign(cert.get(), issuer_key.get(), EVP_sha256()) == 0)
      {
        throw std::runtime_error("failed to sign certificate");
      }
    return cert;
  }

  std::string certificate_pem(X509 *cert)
  {
    std::unique_ptr<BIO, BioDeleter> bio(BIO_new(BIO_s_mem()));
    PEM_write_bio_X509(bio.get(), cert);
    return bio_to_string(bio.get());
  }

  TempDir::TempDir()
  {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() / ("imageguard-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }

  TempDir::~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  void write_file(const std::filesystem::path &path, std::string_view content)
  {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
  }

  std::string offline_resources_json(const std::map<std::string, std::string> &resources)
  {
    boost::json::object obj;
    for (const auto &[key, value]: resources)
      {
        obj[key] = base64(value);
      }
    return boost::json::serialize(obj);
  }

  void InMemorySignatureSource::add_manifest(const ImageReference &image, std::string content)
  {
    std::string digest = sha256_digest(content);
    manifests_[image.to_string()] = ManifestInfo{digest, std::move(content)};
  }

  void InMemorySignatureSource::add_signature(const std::string &manifest_digest, SignatureArtifact artifact)
  {
    signatures_[manifest_digest].push_back(std::move(artifact));
  }

  outcome::std_result<ManifestInfo> InMemorySignatureSource::resolve_manifest(const ImageReference &image)
  {
    auto it = manifests_.find(image.to_string());
    if (fail_manifest_ || it == manifests_.end())
      {
        return ImageGuardError::RegistryError;
      }
    return it->second;
  }

  outcome::std_result<std::vector<SignatureArtifact>> InMemorySignatureSource::fetch_signatures(const ImageReference & /*image*/,
                                                                                                const std::string &manifest_digest)
  {
    auto it = signatures_.find(manifest_digest);
    if (it == signatures_.end())
      {
        return std::vector<SignatureArtifact>{};
      }
    return it->second;
  }

  CountingKbc::CountingKbc(std::map<std::string, std::string> resources, std::chrono::milliseconds delay)
    : resources_(std::move(resources))
    , delay_(delay)
  {
  }

  outcome::std_result<void> CountingKbc::connect()
  {
    connected_ = true;
    return outcome::success();
  }

  outcome::std_result<std::string> CountingKbc::request_resource(const std::string &resource_id, const ResourceParameters & /*parameters*/)
  {
    requests_++;
    if (delay_.count() > 0)
      {
        std::this_thread::sleep_for(delay_);
      }

    {
      std::scoped_lock lock(mutex_);
      auto failure = failures_.find(resource_id);
      if (failure != failures_.end())
        {
          KbcError error = failure->second;
          failures_.erase(failure);
          return error;
        }
    }

    auto it = resources_.find(resource_id);
    if (it == resources_.end())
      {
        return KbcError::ResourceNotFound;
      }
    return it->second;
  }

  void CountingKbc::disconnect()
  {
    connected_ = false;
  }

  bool CountingKbc::is_connected() const
  {
    return connected_;
  }

  void CountingKbc::fail_once(const std::string &resource_id, KbcError error)
  {
    std::scoped_lock lock(mutex_);
    failures_[resource_id] = error;
  }

} // namespace imageguard::test
