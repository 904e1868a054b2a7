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

#ifndef IMAGEGUARD_POLICY_LOADER_HH
#define IMAGEGUARD_POLICY_LOADER_HH

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <boost/json.hpp>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "Logging.hh"
#include "imageguard/Policy.hh"

namespace outcome = boost::outcome_v2;

namespace imageguard
{
  /// Converts containers-policy.json documents into Policy objects.
  class PolicyLoader
  {
  public:
    PolicyLoader() = default;
    ~PolicyLoader() = default;

    PolicyLoader(const PolicyLoader &) = delete;
    PolicyLoader &operator=(const PolicyLoader &) = delete;
    PolicyLoader(PolicyLoader &&) noexcept = default;
    PolicyLoader &operator=(PolicyLoader &&) noexcept = default;

    outcome::std_result<Policy> load_from_file(const std::filesystem::path &file_path);
    outcome::std_result<Policy> load_from_json(const std::string &json_content);

  private:
    outcome::std_result<PolicyRequirement> parse_requirement_list(const std::string &scope, const boost::json::value &value);
    outcome::std_result<void> parse_signed_by(const boost::json::object &object, RequireSignature &requirement);
    outcome::std_result<void> parse_sigstore_signed(const boost::json::object &object, RequireSignature &requirement);
    outcome::std_result<SignedIdentity> parse_signed_identity(const boost::json::object &object);
    outcome::std_result<std::optional<std::string>> get_optional_string(const boost::json::object &object, const std::string &key);

    std::shared_ptr<spdlog::logger> logger_{Logging::create("imageguard:policy_loader")};
  };

} // namespace imageguard

#endif // IMAGEGUARD_POLICY_LOADER_HH
