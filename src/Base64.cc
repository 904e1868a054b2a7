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

#include "Base64.hh"

#include <cctype>
#include <vector>
#include <openssl/evp.h>

#include "imageguard/Errors.hh"

namespace imageguard
{
  outcome::std_result<std::string> Base64::encode(std::string_view data)
  {
    if (data.empty())
      {
        return std::string{};
      }

    std::vector<unsigned char> buffer(4 * ((data.size() + 2) / 3) + 1);
    int length = EVP_EncodeBlock(buffer.data(), reinterpret_cast<const unsigned char *>(data.data()), static_cast<int>(data.size()));
    if (length < 0)
      {
        return ImageGuardError::InvalidBase64;
      }
    return std::string(reinterpret_cast<const char *>(buffer.data()), static_cast<size_t>(length));
  }

  outcome::std_result<std::string> Base64::decode(std::string_view encoded)
  {
    std::string input;
    input.reserve(encoded.size());
    for (char c: encoded)
      {
        if (std::isspace(static_cast<unsigned char>(c)) == 0)
          {
            input.push_back(c);
          }
      }

    if (input.empty())
      {
        return std::string{};
      }
    if (input.size() % 4 != 0)
      {
        return ImageGuardError::InvalidBase64;
      }

    std::vector<unsigned char> buffer(3 * (input.size() / 4) + 1);
    int length = EVP_DecodeBlock(buffer.data(), reinterpret_cast<const unsigned char *>(input.data()), static_cast<int>(input.size()));
    if (length < 0)
      {
        return ImageGuardError::InvalidBase64;
      }

    // EVP_DecodeBlock counts padding characters as zero bytes.
    size_t padding = 0;
    if (input.ends_with("=="))
      {
        padding = 2;
      }
    else if (input.ends_with("="))
      {
        padding = 1;
      }

    return std::string(reinterpret_cast<const char *>(buffer.data()), static_cast<size_t>(length) - padding);
  }
} // namespace imageguard
