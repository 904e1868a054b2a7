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

#ifndef IMAGEGUARD_TRUST_MATERIAL_RESOLVER_HH
#define IMAGEGUARD_TRUST_MATERIAL_RESOLVER_HH

#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "imageguard/KeyBrokerClient.hh"

namespace outcome = boost::outcome_v2;

namespace imageguard
{
  /**
   * @brief Resolves logical trust material ids to bytes through a key broker client
   *
   * Resolved material is kept in memory only. With a zero time-to-live an entry
   * lives as long as the resolver, which is normally a single pull attempt.
   *
   * At most one fetch per id is in flight: a concurrent resolve() of an id
   * that is being fetched waits for that fetch and shares its result. Failed
   * fetches are handed to the callers that waited for them and then dropped,
   * so nothing but successfully retrieved material is ever cached.
   */
  class TrustMaterialResolver
  {
  public:
    using Result = outcome::std_result<std::string>;

    explicit TrustMaterialResolver(std::shared_ptr<KeyBrokerClient> client,
                                   ResourceParameters parameters = {},
                                   std::chrono::seconds ttl = std::chrono::seconds::zero());
    ~TrustMaterialResolver() = default;

    TrustMaterialResolver(const TrustMaterialResolver &) = delete;
    TrustMaterialResolver &operator=(const TrustMaterialResolver &) = delete;
    TrustMaterialResolver(TrustMaterialResolver &&) = delete;
    TrustMaterialResolver &operator=(TrustMaterialResolver &&) = delete;

    Result resolve(const std::string &logical_id);

    void invalidate(const std::string &logical_id);
    void clear();

  private:
    struct Entry
    {
      std::shared_future<Result> result;
      std::chrono::steady_clock::time_point created;
      uint64_t generation{0};
    };

    Result fetch(const std::string &logical_id);
    bool is_expired(const Entry &entry) const;

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<KeyBrokerClient> client_;
    ResourceParameters parameters_;
    std::chrono::seconds ttl_;
    std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    uint64_t next_generation_{1};
  };

} // namespace imageguard

#endif // IMAGEGUARD_TRUST_MATERIAL_RESOLVER_HH
