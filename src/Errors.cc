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

#include "imageguard/Errors.hh"

namespace imageguard
{
  const std::error_category &imageguard_error_category()
  {
    static ImageGuardErrorCategory category;
    return category;
  }

  const std::error_category &kbc_error_category()
  {
    static KbcErrorCategory category;
    return category;
  }

  std::error_code make_error_code(ImageGuardError e)
  {
    return {static_cast<int>(e), imageguard_error_category()};
  }

  std::error_code make_error_code(KbcError e)
  {
    return {static_cast<int>(e), kbc_error_category()};
  }

  bool is_kbc_error(const std::error_code &ec)
  {
    return ec.category() == kbc_error_category();
  }

} // namespace imageguard
