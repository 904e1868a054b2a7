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

#include "AttestationAgentKbc.hh"

#include "imageguard/Errors.hh"
#include "getresource.pb.h"

namespace imageguard
{
  AttestationAgentKbc::AttestationAgentKbc(KbcParameters parameters, std::string socket_path, std::chrono::milliseconds timeout)
    : parameters_(std::move(parameters))
    , client_(std::move(socket_path), timeout)
  {
  }

  std::string AttestationAgentKbc::name() const
  {
    return parameters_.kbc_name;
  }

  outcome::std_result<void> AttestationAgentKbc::connect()
  {
    return client_.connect();
  }

  outcome::std_result<std::string> AttestationAgentKbc::request_resource(const std::string &resource_id, const ResourceParameters &parameters)
  {
    getresource::GetResourceRequest request;
    request.set_resourcepath(resource_id);
    request.set_kbcname(parameters_.kbc_name);

    auto uri = parameters.find("kbs_uri");
    request.set_kbsuri(uri != parameters.end() ? uri->second : parameters_.kbs_uri);

    std::string payload;
    if (!request.SerializeToString(&payload))
      {
        logger_->error("Failed to serialize GetResource request for '{}'", resource_id);
        return KbcError::MalformedResponse;
      }

    logger_->debug("Requesting '{}' via {} ({})", resource_id, parameters_.kbc_name, request.kbsuri());
    auto reply = client_.call(service_name, method_name, payload);
    if (!reply)
      {
        logger_->error("GetResource '{}' failed: {}", resource_id, reply.error().message());
        return reply.error();
      }

    getresource::GetResourceResponse response;
    if (!response.ParseFromString(reply.value()))
      {
        logger_->error("Malformed GetResource response for '{}'", resource_id);
        return KbcError::MalformedResponse;
      }

    if (response.resource().empty())
      {
        logger_->error("Empty resource returned for '{}'", resource_id);
        return KbcError::MalformedResponse;
      }

    return std::string(response.resource());
  }

  void AttestationAgentKbc::disconnect()
  {
    client_.close();
  }

  bool AttestationAgentKbc::is_connected() const
  {
    return client_.is_open();
  }

} // namespace imageguard
