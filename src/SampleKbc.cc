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

#include "SampleKbc.hh"

#include "imageguard/Errors.hh"

namespace imageguard
{
  SampleKbc::SampleKbc(std::map<std::string, std::string> resources)
    : resources_(std::move(resources))
  {
  }

  std::string SampleKbc::name() const
  {
    return backend_name;
  }

  outcome::std_result<void> SampleKbc::connect()
  {
    connected_ = true;
    logger_->debug("Connected, {} sample resources", resources_.size());
    return outcome::success();
  }

  outcome::std_result<std::string> SampleKbc::request_resource(const std::string &resource_id, const ResourceParameters & /*parameters*/)
  {
    if (!connected_)
      {
        return KbcError::NotConnected;
      }

    auto it = resources_.find(resource_id);
    if (it == resources_.end())
      {
        it = resources_.find(resource_path(resource_id));
      }
    if (it == resources_.end())
      {
        logger_->warn("No sample resource for '{}'", resource_id);
        return KbcError::ResourceNotFound;
      }

    return it->second;
  }

  void SampleKbc::disconnect()
  {
    connected_ = false;
  }

  bool SampleKbc::is_connected() const
  {
    return connected_;
  }

} // namespace imageguard
