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

#include "Certificate.hh"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>
#include <openssl/objects.h>

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

    struct X509StoreDeleter
    {
      void operator()(X509_STORE *store) const
      {
        X509_STORE_free(store);
      }
    };

    struct X509StoreCtxDeleter
    {
      void operator()(X509_STORE_CTX *ctx) const
      {
        X509_STORE_CTX_free(ctx);
      }
    };

    struct X509StackDeleter
    {
      void operator()(STACK_OF(X509) * stack) const
      {
        sk_X509_free(stack);
      }
    };
  } // namespace

  Certificate::Certificate(X509Ptr cert)
    : cert_(std::move(cert))
  {
  }

  outcome::std_result<std::shared_ptr<Certificate>> Certificate::from_pem(std::string_view pem)
  {
    std::unique_ptr<BIO, BioDeleter> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio)
      {
        return ImageGuardError::SystemError;
      }

    X509 *raw = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
    ERR_clear_error();
    if (raw == nullptr)
      {
        return ImageGuardError::InvalidCertificate;
      }
    return std::make_shared<Certificate>(X509Ptr(raw));
  }

  outcome::std_result<std::shared_ptr<Certificate>> Certificate::from_der(std::string_view der)
  {
    const auto *data = reinterpret_cast<const unsigned char *>(der.data());
    X509 *raw = d2i_X509(nullptr, &data, static_cast<long>(der.size()));
    ERR_clear_error();
    if (raw == nullptr)
      {
        return ImageGuardError::InvalidCertificate;
      }
    return std::make_shared<Certificate>(X509Ptr(raw));
  }

  outcome::std_result<std::vector<std::shared_ptr<Certificate>>> Certificate::load_bundle(std::string_view pem)
  {
    static constexpr std::string_view begin_marker = "-----BEGIN CERTIFICATE-----";
    static constexpr std::string_view end_marker = "-----END CERTIFICATE-----";

    std::vector<std::shared_ptr<Certificate>> certificates;
    size_t pos = 0;
    while ((pos = pem.find(begin_marker, pos)) != std::string_view::npos)
      {
        size_t end = pem.find(end_marker, pos);
        if (end == std::string_view::npos)
          {
            return ImageGuardError::InvalidCertificate;
          }
        end += end_marker.size();

        auto certificate = from_pem(pem.substr(pos, end - pos));
        if (!certificate)
          {
            return certificate.error();
          }
        certificates.push_back(certificate.value());
        pos = end;
      }

    if (certificates.empty())
      {
        return ImageGuardError::InvalidCertificate;
      }
    return certificates;
  }

  outcome::std_result<void> Certificate::verify_chain(const std::vector<std::shared_ptr<Certificate>> &roots,
                                                      const std::vector<std::shared_ptr<Certificate>> &intermediates) const
  {
    if (roots.empty())
      {
        logger_->error("No trusted root certificates available");
        return ImageGuardError::InvalidCertificate;
      }

    std::unique_ptr<X509_STORE, X509StoreDeleter> store(X509_STORE_new());
    std::unique_ptr<X509_STORE_CTX, X509StoreCtxDeleter> ctx(X509_STORE_CTX_new());
    std::unique_ptr<STACK_OF(X509), X509StackDeleter> untrusted(sk_X509_new_null());
    if (!store || !ctx || !untrusted)
      {
        return ImageGuardError::SystemError;
      }

    for (const auto &root: roots)
      {
        if (X509_STORE_add_cert(store.get(), root->get_x509()) != 1)
          {
            ERR_clear_error();
            logger_->error("Failed to add root certificate {}", root->subject());
            return ImageGuardError::InvalidCertificate;
          }
      }

    for (const auto &intermediate: intermediates)
      {
        if (sk_X509_push(untrusted.get(), intermediate->get_x509()) == 0)
          {
            return ImageGuardError::SystemError;
          }
      }

    if (X509_STORE_CTX_init(ctx.get(), store.get(), cert_.get(), untrusted.get()) != 1)
      {
        ERR_clear_error();
        return ImageGuardError::SystemError;
      }
    X509_STORE_CTX_set_flags(ctx.get(), X509_V_FLAG_NO_CHECK_TIME);

    if (X509_verify_cert(ctx.get()) != 1)
      {
        int err = X509_STORE_CTX_get_error(ctx.get());
        logger_->info("Certificate chain verification failed for {}: {}", subject(), X509_verify_cert_error_string(err));
        ERR_clear_error();
        return ImageGuardError::InvalidCertificate;
      }

    return outcome::success();
  }

  outcome::std_result<std::shared_ptr<PublicKey>> Certificate::public_key() const
  {
    EVP_PKEY *key = X509_get_pubkey(cert_.get());
    if (key == nullptr)
      {
        ERR_clear_error();
        return ImageGuardError::InvalidPublicKey;
      }
    return std::make_shared<PublicKey>(EvpPkeyPtr(key));
  }

  std::string Certificate::subject() const
  {
    X509_NAME *name = X509_get_subject_name(cert_.get());
    if (name == nullptr)
      {
        return {};
      }

    std::unique_ptr<BIO, BioDeleter> bio(BIO_new(BIO_s_mem()));
    if (!bio || X509_NAME_print_ex(bio.get(), name, 0, XN_FLAG_RFC2253) < 0)
      {
        return {};
      }

    char *data = nullptr;
    long length = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(length));
  }

  std::vector<std::string> Certificate::subject_emails() const
  {
    std::vector<std::string> emails;

    auto *names = static_cast<GENERAL_NAMES *>(X509_get_ext_d2i(cert_.get(), NID_subject_alt_name, nullptr, nullptr));
    if (names == nullptr)
      {
        return emails;
      }

    for (int i = 0; i < sk_GENERAL_NAME_num(names); ++i)
      {
        const GENERAL_NAME *name = sk_GENERAL_NAME_value(names, i);
        if (name->type == GEN_EMAIL)
          {
            const ASN1_IA5STRING *email = name->d.rfc822Name;
            emails.emplace_back(reinterpret_cast<const char *>(ASN1_STRING_get0_data(email)), static_cast<size_t>(ASN1_STRING_length(email)));
          }
      }
    GENERAL_NAMES_free(names);
    return emails;
  }

  std::string Certificate::oidc_issuer() const
  {
    std::unique_ptr<ASN1_OBJECT, decltype(&ASN1_OBJECT_free)> oid(OBJ_txt2obj("1.3.6.1.4.1.57264.1.1", 1), &ASN1_OBJECT_free);
    if (!oid)
      {
        return {};
      }

    int index = X509_get_ext_by_OBJ(cert_.get(), oid.get(), -1);
    if (index < 0)
      {
        return {};
      }

    X509_EXTENSION *extension = X509_get_ext(cert_.get(), index);
    const ASN1_OCTET_STRING *data = X509_EXTENSION_get_data(extension);
    if (data == nullptr)
      {
        return {};
      }

    // The legacy issuer extension holds the raw URL bytes.
    return std::string(reinterpret_cast<const char *>(ASN1_STRING_get0_data(data)), static_cast<size_t>(ASN1_STRING_length(data)));
  }

  X509 *Certificate::get_x509() const
  {
    return cert_.get();
  }

} // namespace imageguard
