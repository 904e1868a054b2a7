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

#ifndef IMAGEGUARD_TTRPC_CLIENT_HH
#define IMAGEGUARD_TTRPC_CLIENT_HH

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "Logging.hh"

namespace outcome = boost::outcome_v2;

namespace imageguard
{
  /**
   * @brief Minimal synchronous ttrpc client over a unix domain socket
   *
   * Every frame starts with a 10 byte header: payload length (uint32, big
   * endian), stream id (uint32, big endian), message type (uint8) and flags
   * (uint8). The payload is a protobuf encoded ttrpc.Request or
   * ttrpc.Response. Client stream ids are odd and increase by two.
   *
   * Calls are serialized; each call must finish before its deadline or the
   * connection is closed and the call fails with KbcError::Timeout.
   */
  class TtrpcClient
  {
  public:
    static constexpr size_t header_size = 10;
    static constexpr uint32_t max_message_size = 4U << 20U;
    static constexpr uint8_t message_type_request = 1;
    static constexpr uint8_t message_type_response = 2;

    struct FrameHeader
    {
      uint32_t length{0};
      uint32_t stream_id{0};
      uint8_t type{0};
      uint8_t flags{0};

      std::array<uint8_t, header_size> encode() const;
      static FrameHeader decode(const std::array<uint8_t, header_size> &bytes);
    };

    TtrpcClient(std::string socket_path, std::chrono::milliseconds timeout);
    ~TtrpcClient();

    TtrpcClient(const TtrpcClient &) = delete;
    TtrpcClient &operator=(const TtrpcClient &) = delete;
    TtrpcClient(TtrpcClient &&) = delete;
    TtrpcClient &operator=(TtrpcClient &&) = delete;

    outcome::std_result<void> connect();
    outcome::std_result<std::string> call(const std::string &service, const std::string &method, const std::string &payload);
    void close();
    bool is_open() const;

  private:
    outcome::std_result<void> wait(boost::system::error_code &ec, std::chrono::steady_clock::time_point deadline);
    outcome::std_result<void> write_request(uint32_t stream_id, const std::string &message, std::chrono::steady_clock::time_point deadline);
    outcome::std_result<std::string> read_response(uint32_t stream_id, std::chrono::steady_clock::time_point deadline);

    std::shared_ptr<spdlog::logger> logger_{Logging::create("imageguard:ttrpc")};
    std::string socket_path_;
    std::chrono::milliseconds timeout_;
    boost::asio::io_context io_context_;
    boost::asio::local::stream_protocol::socket socket_;
    uint32_t next_stream_id_{1};
    mutable std::mutex mutex_;
  };

} // namespace imageguard

#endif // IMAGEGUARD_TTRPC_CLIENT_HH
