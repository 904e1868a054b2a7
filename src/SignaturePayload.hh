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

#ifndef IMAGEGUARD_SIGNATURE_PAYLOAD_HH
#define IMAGEGUARD_SIGNATURE_PAYLOAD_HH

#include <memory>
#include <string>
#include <string_view>
#include <boost/json.hpp>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "Logging.hh"

namespace outcome = boost::outcome_v2;

namespace imageguard
{
  /**
   * @brief The claims of a container image signature
   *
   * Both simple signing and cosign sign a JSON document of the form
   *
   * @code
   * {
   *   "critical": {
   *     "identity": { "docker-reference": "quay.io/example/app:v1" },
   *     "image": { "docker-manifest-digest": "sha256:..." },
   *     "type": "atomic container signature"
   *   },
   *   "optional": { ... }
   * }
   * @endcode
   */
  struct SignaturePayload
  {
    static constexpr std::string_view simple_signing_type = "atomic container signature";
    static constexpr std::string_view cosign_type = "cosign container image signature";

    std::string type;
    std::string docker_reference;
    std::string docker_manifest_digest;
    boost::json::object optional;
  };

  class SignaturePayloadParser
  {
  public:
    outcome::std_result<SignaturePayload> parse(const std::string &json_payload);

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("imageguard:signature_payload")};
  };

  /// "sha256:<lowercase hex>" of data.
  std::string sha256_digest(std::string_view data);

} // namespace imageguard

#endif // IMAGEGUARD_SIGNATURE_PAYLOAD_HH
