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

#ifndef IMAGEGUARD_SIGNATURE_SOURCE_HH
#define IMAGEGUARD_SIGNATURE_SOURCE_HH

#include <string>
#include <vector>
#include <boost/outcome/std_result.hpp>

#include "imageguard/ImageReference.hh"
#include "imageguard/SignatureArtifact.hh"

namespace outcome = boost::outcome_v2;

namespace imageguard
{
  struct ManifestInfo
  {
    /// "sha256:<hex>"
    std::string digest;
    std::string content;
  };

  /**
   * @brief Registry side collaborator that supplies manifests and signatures
   *
   * Every failure is an infrastructure failure of the pull. A manifest
   * without signatures is not a failure: fetch_signatures() then returns an
   * empty list.
   */
  class SignatureSource
  {
  public:
    virtual ~SignatureSource() = default;

    virtual outcome::std_result<ManifestInfo> resolve_manifest(const ImageReference &image) = 0;
    virtual outcome::std_result<std::vector<SignatureArtifact>> fetch_signatures(const ImageReference &image,
                                                                                 const std::string &manifest_digest) = 0;
  };

} // namespace imageguard

#endif // IMAGEGUARD_SIGNATURE_SOURCE_HH
