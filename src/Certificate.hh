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

#ifndef IMAGEGUARD_CERTIFICATE_HH
#define IMAGEGUARD_CERTIFICATE_HH

#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <boost/outcome/std_result.hpp>
#include <openssl/x509.h>
#include <spdlog/spdlog.h>

#include "Logging.hh"
#include "PublicKey.hh"

namespace outcome = boost::outcome_v2;

namespace imageguard
{
  struct X509Deleter
  {
    void operator()(X509 *cert) const
    {
      X509_free(cert);
    }
  };

  using X509Ptr = std::unique_ptr<X509, X509Deleter>;

  class Certificate
  {
  public:
    explicit Certificate(X509Ptr cert);
    ~Certificate() = default;

    Certificate(const Certificate &) = delete;
    Certificate &operator=(const Certificate &) = delete;
    Certificate(Certificate &&) noexcept = default;
    Certificate &operator=(Certificate &&) noexcept = default;

    static outcome::std_result<std::shared_ptr<Certificate>> from_pem(std::string_view pem);
    static outcome::std_result<std::shared_ptr<Certificate>> from_der(std::string_view der);
    static outcome::std_result<std::vector<std::shared_ptr<Certificate>>> load_bundle(std::string_view pem);

    /**
     * @brief Verifies that this certificate chains up to one of the given roots
     *
     * Validity periods are not checked: signing certificates of keyless
     * signatures expire minutes after issuance and no signing timestamp is
     * available to check against.
     */
    outcome::std_result<void> verify_chain(const std::vector<std::shared_ptr<Certificate>> &roots,
                                           const std::vector<std::shared_ptr<Certificate>> &intermediates) const;

    outcome::std_result<std::shared_ptr<PublicKey>> public_key() const;
    std::string subject() const;

    /// Email addresses in the subject alternative name extension.
    std::vector<std::string> subject_emails() const;

    /// OIDC issuer recorded by Fulcio (OID 1.3.6.1.4.1.57264.1.1), empty if absent.
    std::string oidc_issuer() const;

    X509 *get_x509() const;

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("imageguard:certificate")};
    X509Ptr cert_;
  };

} // namespace imageguard

#endif // IMAGEGUARD_CERTIFICATE_HH
