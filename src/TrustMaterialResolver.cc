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

#include "imageguard/TrustMaterialResolver.hh"

#include "Logging.hh"
#include "imageguard/Errors.hh"

namespace imageguard
{
  TrustMaterialResolver::TrustMaterialResolver(std::shared_ptr<KeyBrokerClient> client, ResourceParameters parameters, std::chrono::seconds ttl)
    : logger_(Logging::create("imageguard:resolver"))
    , client_(std::move(client))
    , parameters_(std::move(parameters))
    , ttl_(ttl)
  {
  }

  TrustMaterialResolver::Result TrustMaterialResolver::resolve(const std::string &logical_id)
  {
    std::unique_lock lock(mutex_);

    if (auto it = entries_.find(logical_id); it != entries_.end())
      {
        if (!is_expired(it->second))
          {
            auto pending = it->second.result;
            lock.unlock();
            logger_->trace("Reusing trust material '{}'", logical_id);
            return pending.get();
          }
        logger_->debug("Trust material '{}' expired", logical_id);
        entries_.erase(it);
      }

    std::promise<Result> promise;
    uint64_t generation = next_generation_++;
    entries_[logical_id] = Entry{.result = promise.get_future().share(), .created = std::chrono::steady_clock::now(), .generation = generation};
    lock.unlock();

    Result result = fetch(logical_id);
    promise.set_value(result);

    if (!result)
      {
        lock.lock();
        if (auto it = entries_.find(logical_id); it != entries_.end() && it->second.generation == generation)
          {
            entries_.erase(it);
          }
      }

    return result;
  }

  void TrustMaterialResolver::invalidate(const std::string &logical_id)
  {
    std::scoped_lock lock(mutex_);
    entries_.erase(logical_id);
  }

  void TrustMaterialResolver::clear()
  {
    std::scoped_lock lock(mutex_);
    entries_.clear();
  }

  TrustMaterialResolver::Result TrustMaterialResolver::fetch(const std::string &logical_id)
  {
    if (!client_)
      {
        return KbcError::NotConnected;
      }

    logger_->debug("Fetching trust material '{}' from {}", logical_id, client_->name());
    try
      {
        auto result = client_->request_resource(logical_id, parameters_);
        if (!result)
          {
            logger_->warn("Failed to fetch trust material '{}': {}", logical_id, result.error().message());
          }
        return result;
      }
    catch (const std::exception &e)
      {
        logger_->error("Exception while fetching trust material '{}': {}", logical_id, e.what());
        return ImageGuardError::SystemError;
      }
  }

  bool TrustMaterialResolver::is_expired(const Entry &entry) const
  {
    if (ttl_ == std::chrono::seconds::zero())
      {
        return false;
      }
    return std::chrono::steady_clock::now() - entry.created >= ttl_;
  }

} // namespace imageguard
