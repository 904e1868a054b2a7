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

#ifndef IMAGEGUARD_CONFIG_HH
#define IMAGEGUARD_CONFIG_HH

#include <filesystem>
#include <optional>
#include <string>
#include <boost/outcome/std_result.hpp>

#include "imageguard/KeyBrokerClient.hh"

namespace outcome = boost::outcome_v2;

namespace imageguard
{
  /**
   * @brief Configuration of the image pull authorizer
   *
   * Loaded from a JSON document such as
   *
   * @code
   * {
   *   "security_validate": true,
   *   "policy_uri": "kbs:///default/security-policy/test",
   *   "aa_kbc_params": "offline_fs_kbc::null",
   *   "offline_fs_resources_path": "/etc/aa-offline_fs_kbc-resources.json",
   *   "kbc_timeout_ms": 5000,
   *   "signature_dir": "/var/lib/imageguard/signatures"
   * }
   * @endcode
   */
  struct ImageGuardConfig
  {
    /// When false every pull is allowed without consulting the policy.
    bool security_validate{true};

    std::optional<std::filesystem::path> policy_path;

    /// Key broker resource holding the policy. Takes precedence over policy_path.
    std::optional<std::string> policy_uri;

    /// Backend used when a pull does not supply attestation parameters.
    KbcParameters default_kbc{"offline_fs_kbc", "null"};

    KbcSettings kbc;

    std::optional<std::filesystem::path> signature_dir;

    static outcome::std_result<ImageGuardConfig> load_from_json(const std::string &json);
    static outcome::std_result<ImageGuardConfig> load_from_file(const std::filesystem::path &path);
  };

} // namespace imageguard

#endif // IMAGEGUARD_CONFIG_HH
