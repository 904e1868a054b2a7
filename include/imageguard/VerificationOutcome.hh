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

#ifndef IMAGEGUARD_VERIFICATION_OUTCOME_HH
#define IMAGEGUARD_VERIFICATION_OUTCOME_HH

#include <string>
#include <utility>

namespace imageguard
{
  /**
   * @brief Result of verifying one signature artifact
   *
   * Rejected means the signature or its content did not check out.
   * Unavailable means the check could not be performed because trust
   * material or other infrastructure was missing.
   */
  class VerificationOutcome
  {
  public:
    enum class Kind
    {
      Verified,
      Rejected,
      Unavailable
    };

    static VerificationOutcome verified()
    {
      return VerificationOutcome(Kind::Verified, {});
    }

    static VerificationOutcome rejected(std::string reason)
    {
      return VerificationOutcome(Kind::Rejected, std::move(reason));
    }

    static VerificationOutcome unavailable(std::string reason)
    {
      return VerificationOutcome(Kind::Unavailable, std::move(reason));
    }

    Kind kind() const
    {
      return kind_;
    }

    bool is_verified() const
    {
      return kind_ == Kind::Verified;
    }

    const std::string &reason() const
    {
      return reason_;
    }

  private:
    VerificationOutcome(Kind kind, std::string reason)
      : kind_(kind)
      , reason_(std::move(reason))
    {
    }

    Kind kind_;
    std::string reason_;
  };

} // namespace imageguard

#endif // IMAGEGUARD_VERIFICATION_OUTCOME_HH
