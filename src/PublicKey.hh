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

#ifndef IMAGEGUARD_PUBLIC_KEY_HH
#define IMAGEGUARD_PUBLIC_KEY_HH

#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <boost/outcome/std_result.hpp>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include "Logging.hh"

namespace outcome = boost::outcome_v2;

namespace imageguard
{
  enum class DigestAlgorithm
  {
    SHA256,
    SHA384,
    SHA512
  };

  struct EvpPkeyDeleter
  {
    void operator()(EVP_PKEY *key) const
    {
      EVP_PKEY_free(key);
    }
  };

  using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

  class PublicKey
  {
  public:
    explicit PublicKey(EvpPkeyPtr key);
    ~PublicKey() = default;

    PublicKey(const PublicKey &) = delete;
    PublicKey &operator=(const PublicKey &) = delete;
    PublicKey(PublicKey &&) noexcept = default;
    PublicKey &operator=(PublicKey &&) noexcept = default;

    static outcome::std_result<std::shared_ptr<PublicKey>> from_pem(std::string_view pem);

    /// Parses every public key of a PEM keyring. Fails when the input holds no
    /// key or when any block is not a valid public key.
    static outcome::std_result<std::vector<std::shared_ptr<PublicKey>>> load_keyring(std::string_view pem);

    outcome::std_result<void> verify_signature(std::string_view data,
                                               std::string_view signature,
                                               DigestAlgorithm digest_algorithm = DigestAlgorithm::SHA256) const;

    std::string get_algorithm_name() const;
    EVP_PKEY *get() const;

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("imageguard:public_key")};
    EvpPkeyPtr key_;
  };

} // namespace imageguard

#endif // IMAGEGUARD_PUBLIC_KEY_HH
