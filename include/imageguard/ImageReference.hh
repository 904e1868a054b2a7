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

#ifndef IMAGEGUARD_IMAGE_REFERENCE_HH
#define IMAGEGUARD_IMAGE_REFERENCE_HH

#include <optional>
#include <string>
#include <string_view>
#include <boost/outcome/std_result.hpp>

namespace outcome = boost::outcome_v2;

namespace imageguard
{
  /**
   * @brief A normalized container image reference
   *
   * Identifies both the content to verify and the policy scope the image
   * falls under. References are normalized the way container runtimes do it:
   * a missing registry becomes "docker.io", single component repositories
   * on docker.io get a "library/" prefix, and a reference without tag and
   * digest gets the "latest" tag.
   *
   * @par Example
   * @code
   * auto ref = ImageReference::parse("busybox");
   * // ref.value().to_string() == "docker.io/library/busybox:latest"
   * @endcode
   */
  class ImageReference
  {
  public:
    static constexpr std::string_view default_registry = "docker.io";
    static constexpr std::string_view default_tag = "latest";

    /// Parses and normalizes @p reference. With @p apply_default_tag unset a
    /// reference without tag and digest stays tagless, which is how signature
    /// payloads name a whole repository.
    static outcome::std_result<ImageReference> parse(std::string_view reference, bool apply_default_tag = true);

    const std::string &registry() const;
    const std::string &repository() const;
    const std::optional<std::string> &tag() const;
    const std::optional<std::string> &digest() const;

    /// "registry/repository", without tag or digest.
    std::string name() const;

    /// Canonical form, "registry/repository[:tag][@digest]".
    std::string to_string() const;

    bool operator==(const ImageReference &other) const = default;

  private:
    ImageReference() = default;

    std::string registry_;
    std::string repository_;
    std::optional<std::string> tag_;
    std::optional<std::string> digest_;
  };

} // namespace imageguard

#endif // IMAGEGUARD_IMAGE_REFERENCE_HH
