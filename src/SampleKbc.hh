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

#ifndef IMAGEGUARD_SAMPLE_KBC_HH
#define IMAGEGUARD_SAMPLE_KBC_HH

#include <map>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

#include "Logging.hh"
#include "imageguard/KeyBrokerClient.hh"

namespace imageguard
{
  /// Answers every request from a fixed resource table. For tests and demos.
  class SampleKbc : public KeyBrokerClient
  {
  public:
    static constexpr const char *backend_name = "sample_kbc";

    explicit SampleKbc(std::map<std::string, std::string> resources);
    ~SampleKbc() override = default;

    std::string name() const override;
    outcome::std_result<void> connect() override;
    outcome::std_result<std::string> request_resource(const std::string &resource_id, const ResourceParameters &parameters = {}) override;
    void disconnect() override;
    bool is_connected() const override;

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("imageguard:sample_kbc")};
    const std::map<std::string, std::string> resources_;
    bool connected_{false};
  };

} // namespace imageguard

#endif // IMAGEGUARD_SAMPLE_KBC_HH
