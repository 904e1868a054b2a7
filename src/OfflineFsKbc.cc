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

#include "OfflineFsKbc.hh"

#include <fstream>
#include <boost/json.hpp>

#include "Base64.hh"
#include "imageguard/Errors.hh"

namespace imageguard
{
  OfflineFsKbc::OfflineFsKbc(std::filesystem::path resources_path)
    : resources_path_(std::move(resources_path))
  {
  }

  std::string OfflineFsKbc::name() const
  {
    return backend_name;
  }

  outcome::std_result<void> OfflineFsKbc::connect()
  {
    auto resources = load_resources();
    if (!resources)
      {
        return resources.error();
      }

    resources_ = std::move(resources.value());
    connected_ = true;
    logger_->debug("Loaded {} offline resources from {}", resources_.size(), resources_path_.string());
    return outcome::success();
  }

  outcome::std_result<std::string> OfflineFsKbc::request_resource(const std::string &resource_id, const ResourceParameters & /*parameters*/)
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
        logger_->warn("Resource '{}' not present in {}", resource_id, resources_path_.string());
        return KbcError::ResourceNotFound;
      }

    return it->second;
  }

  void OfflineFsKbc::disconnect()
  {
    resources_.clear();
    connected_ = false;
  }

  bool OfflineFsKbc::is_connected() const
  {
    return connected_;
  }

  outcome::std_result<std::map<std::string, std::string>> OfflineFsKbc::load_resources() const
  {
    std::ifstream file(resources_path_, std::ios::in | std::ios::binary);
    if (!file.is_open())
      {
        logger_->error("Failed to open offline resource file: {}", resources_path_.string());
        return KbcError::Unreachable;
      }

    std::string json_content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad())
      {
        logger_->error("Error while reading offline resource file: {}", resources_path_.string());
        return KbcError::Unreachable;
      }

    boost::system::error_code ec;
    boost::json::value parsed = boost::json::parse(json_content, ec);
    if (ec)
      {
        logger_->error("Failed to parse offline resource file {}: {}", resources_path_.string(), ec.message());
        return KbcError::MalformedResponse;
      }

    if (!parsed.is_object())
      {
        logger_->error("Offline resource file root is not an object");
        return KbcError::MalformedResponse;
      }

    std::map<std::string, std::string> resources;
    for (const auto &[key, value]: parsed.as_object())
      {
        if (!value.is_string())
          {
            logger_->error("Offline resource '{}' must be a base64 string, got: {}", std::string(key), boost::json::serialize(value));
            return KbcError::MalformedResponse;
          }

        std::string encoded(value.as_string());
        auto decoded = Base64::decode(encoded);
        if (!decoded)
          {
            logger_->error("Offline resource '{}' is not valid base64", std::string(key));
            return KbcError::MalformedResponse;
          }
        resources.emplace(std::string(key), std::move(decoded.value()));
      }

    return resources;
  }

} // namespace imageguard
