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

#include "TtrpcClient.hh"

#include <vector>

#include "imageguard/Errors.hh"
#include "ttrpc.pb.h"

namespace imageguard
{
  std::array<uint8_t, TtrpcClient::header_size> TtrpcClient::FrameHeader::encode() const
  {
    return {static_cast<uint8_t>(length >> 24U),
            static_cast<uint8_t>(length >> 16U),
            static_cast<uint8_t>(length >> 8U),
            static_cast<uint8_t>(length),
            static_cast<uint8_t>(stream_id >> 24U),
            static_cast<uint8_t>(stream_id >> 16U),
            static_cast<uint8_t>(stream_id >> 8U),
            static_cast<uint8_t>(stream_id),
            type,
            flags};
  }

  TtrpcClient::FrameHeader TtrpcClient::FrameHeader::decode(const std::array<uint8_t, header_size> &bytes)
  {
    FrameHeader header;
    header.length = (uint32_t{bytes[0]} << 24U) | (uint32_t{bytes[1]} << 16U) | (uint32_t{bytes[2]} << 8U) | uint32_t{bytes[3]};
    header.stream_id = (uint32_t{bytes[4]} << 24U) | (uint32_t{bytes[5]} << 16U) | (uint32_t{bytes[6]} << 8U) | uint32_t{bytes[7]};
    header.type = bytes[8];
    header.flags = bytes[9];
    return header;
  }

  TtrpcClient::TtrpcClient(std::string socket_path, std::chrono::milliseconds timeout)
    : socket_path_(std::move(socket_path))
    , timeout_(timeout)
    , socket_(io_context_)
  {
  }

  TtrpcClient::~TtrpcClient()
  {
    close();
  }

  outcome::std_result<void> TtrpcClient::connect()
  {
    std::scoped_lock lock(mutex_);

    if (socket_.is_open())
      {
        return outcome::success();
      }

    auto deadline = std::chrono::steady_clock::now() + timeout_;
    boost::system::error_code ec = boost::asio::error::would_block;
    socket_.async_connect(boost::asio::local::stream_protocol::endpoint(socket_path_),
                          [&ec](const boost::system::error_code &result) { ec = result; });

    auto result = wait(ec, deadline);
    if (!result)
      {
        logger_->error("Failed to connect to {}: {}", socket_path_, ec.message());
        boost::system::error_code ignored;
        socket_.close(ignored);
        return result.error();
      }

    next_stream_id_ = 1;
    logger_->debug("Connected to {}", socket_path_);
    return outcome::success();
  }

  outcome::std_result<std::string> TtrpcClient::call(const std::string &service, const std::string &method, const std::string &payload)
  {
    std::scoped_lock lock(mutex_);

    if (!socket_.is_open())
      {
        return KbcError::NotConnected;
      }

    auto deadline = std::chrono::steady_clock::now() + timeout_;

    ttrpc::Request request;
    request.set_service(service);
    request.set_method(method);
    request.set_payload(payload);
    request.set_timeout_nano(std::chrono::duration_cast<std::chrono::nanoseconds>(timeout_).count());

    std::string message;
    if (!request.SerializeToString(&message))
      {
        logger_->error("Failed to serialize request for {}/{}", service, method);
        return KbcError::MalformedResponse;
      }

    uint32_t stream_id = next_stream_id_;
    next_stream_id_ += 2;

    auto write_result = write_request(stream_id, message, deadline);
    if (!write_result)
      {
        return write_result.error();
      }

    return read_response(stream_id, deadline);
  }

  void TtrpcClient::close()
  {
    std::scoped_lock lock(mutex_);
    if (socket_.is_open())
      {
        boost::system::error_code ignored;
        socket_.shutdown(boost::asio::local::stream_protocol::socket::shutdown_both, ignored);
        socket_.close(ignored);
      }
  }

  bool TtrpcClient::is_open() const
  {
    std::scoped_lock lock(mutex_);
    return socket_.is_open();
  }

  outcome::std_result<void> TtrpcClient::wait(boost::system::error_code &ec, std::chrono::steady_clock::time_point deadline)
  {
    io_context_.restart();
    auto now = std::chrono::steady_clock::now();
    if (deadline > now)
      {
        io_context_.run_for(deadline - now);
      }

    if (ec == boost::asio::error::would_block)
      {
        // Closing the socket aborts the pending operation; drain its handler.
        boost::system::error_code ignored;
        socket_.close(ignored);
        io_context_.restart();
        io_context_.run();
        logger_->warn("Request to {} timed out after {} ms", socket_path_, timeout_.count());
        return KbcError::Timeout;
      }

    if (ec)
      {
        return KbcError::Unreachable;
      }
    return outcome::success();
  }

  outcome::std_result<void> TtrpcClient::write_request(uint32_t stream_id, const std::string &message, std::chrono::steady_clock::time_point deadline)
  {
    FrameHeader header{.length = static_cast<uint32_t>(message.size()), .stream_id = stream_id, .type = message_type_request, .flags = 0};
    auto header_bytes = header.encode();

    std::vector<boost::asio::const_buffer> buffers{boost::asio::buffer(header_bytes), boost::asio::buffer(message)};

    boost::system::error_code ec = boost::asio::error::would_block;
    boost::asio::async_write(socket_, buffers, [&ec](const boost::system::error_code &result, std::size_t) { ec = result; });

    auto result = wait(ec, deadline);
    if (!result)
      {
        logger_->error("Failed to send request on stream {}: {}", stream_id, ec.message());
        boost::system::error_code ignored;
        socket_.close(ignored);
      }
    return result;
  }

  outcome::std_result<std::string> TtrpcClient::read_response(uint32_t stream_id, std::chrono::steady_clock::time_point deadline)
  {
    std::array<uint8_t, header_size> header_bytes{};
    boost::system::error_code ec = boost::asio::error::would_block;
    boost::asio::async_read(socket_, boost::asio::buffer(header_bytes), [&ec](const boost::system::error_code &result, std::size_t) { ec = result; });

    auto result = wait(ec, deadline);
    if (!result)
      {
        logger_->error("Failed to read response header on stream {}: {}", stream_id, ec.message());
        boost::system::error_code ignored;
        socket_.close(ignored);
        return result.error();
      }

    auto header = FrameHeader::decode(header_bytes);
    if (header.type != message_type_response || header.stream_id != stream_id || header.length > max_message_size)
      {
        logger_->error("Unexpected frame: type {}, stream {}, length {} (expected stream {})", header.type, header.stream_id, header.length, stream_id);
        boost::system::error_code ignored;
        socket_.close(ignored);
        return KbcError::MalformedResponse;
      }

    std::string body(header.length, '\0');
    if (header.length > 0)
      {
        ec = boost::asio::error::would_block;
        boost::asio::async_read(socket_, boost::asio::buffer(body), [&ec](const boost::system::error_code &result, std::size_t) { ec = result; });

        result = wait(ec, deadline);
        if (!result)
          {
            logger_->error("Failed to read response body on stream {}: {}", stream_id, ec.message());
            boost::system::error_code ignored;
            socket_.close(ignored);
            return result.error();
          }
      }

    ttrpc::Response response;
    if (!response.ParseFromString(body))
      {
        logger_->error("Failed to parse ttrpc response on stream {}", stream_id);
        return KbcError::MalformedResponse;
      }

    if (response.has_status() && response.status().code() != 0)
      {
        logger_->error("Remote error {}: {}", response.status().code(), response.status().message());
        return KbcError::RemoteError;
      }

    return std::string(response.payload());
  }

} // namespace imageguard
