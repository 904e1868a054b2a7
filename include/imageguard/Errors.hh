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

#ifndef IMAGEGUARD_ERRORS_HH
#define IMAGEGUARD_ERRORS_HH

#include <string>
#include <system_error>

namespace imageguard
{
  enum class ImageGuardError
  {
    InvalidReference = 1,
    InvalidPolicy,
    InvalidConfig,
    InvalidSignature,
    InvalidPayload,
    InvalidPublicKey,
    InvalidCertificate,
    InvalidBase64,
    JsonParseError,
    RegistryError,
    SignatureNotFound,
    SystemError,
  };

  class ImageGuardErrorCategory : public std::error_category
  {
  public:
    const char *name() const noexcept override
    {
      return "imageguard";
    }

    std::string message(int ev) const override
    {
      switch (static_cast<ImageGuardError>(ev))
        {
        case ImageGuardError::InvalidReference:
          return "Invalid image reference";
        case ImageGuardError::InvalidPolicy:
          return "Invalid policy";
        case ImageGuardError::InvalidConfig:
          return "Invalid configuration";
        case ImageGuardError::InvalidSignature:
          return "Invalid signature";
        case ImageGuardError::InvalidPayload:
          return "Invalid signature payload";
        case ImageGuardError::InvalidPublicKey:
          return "Invalid public key";
        case ImageGuardError::InvalidCertificate:
          return "Invalid certificate";
        case ImageGuardError::InvalidBase64:
          return "Invalid Base64";
        case ImageGuardError::JsonParseError:
          return "JSON parse error";
        case ImageGuardError::RegistryError:
          return "Registry error";
        case ImageGuardError::SignatureNotFound:
          return "Signature not found";
        case ImageGuardError::SystemError:
          return "System error";
        default:
          return "Unknown error";
        }
    }
  };

  /// Errors of the key broker client layer. Every one of them means the trust
  /// material is unavailable, never that it was rejected.
  enum class KbcError
  {
    NotConnected = 1,
    Unreachable,
    ResourceNotFound,
    MalformedResponse,
    Timeout,
    UnknownBackend,
    RemoteError,
  };

  class KbcErrorCategory : public std::error_category
  {
  public:
    const char *name() const noexcept override
    {
      return "imageguard.kbc";
    }

    std::string message(int ev) const override
    {
      switch (static_cast<KbcError>(ev))
        {
        case KbcError::NotConnected:
          return "Key broker client is not connected";
        case KbcError::Unreachable:
          return "Attestation agent unreachable";
        case KbcError::ResourceNotFound:
          return "Resource not found";
        case KbcError::MalformedResponse:
          return "Malformed key broker response";
        case KbcError::Timeout:
          return "Key broker request timed out";
        case KbcError::UnknownBackend:
          return "Unknown key broker client backend";
        case KbcError::RemoteError:
          return "Key broker returned an error status";
        default:
          return "Unknown error";
        }
    }
  };

  const std::error_category &imageguard_error_category();
  const std::error_category &kbc_error_category();
  std::error_code make_error_code(ImageGuardError e);
  std::error_code make_error_code(KbcError e);

  bool is_kbc_error(const std::error_code &ec);

} // namespace imageguard

namespace std
{
  template<>
  struct is_error_code_enum<imageguard::ImageGuardError> : std::true_type
  {
  };

  template<>
  struct is_error_code_enum<imageguard::KbcError> : std::true_type
  {
  };
} // namespace std

#endif // IMAGEGUARD_ERRORS_HH
