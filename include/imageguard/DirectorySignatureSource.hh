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

#ifndef IMAGEGUARD_DIRECTORY_SIGNATURE_SOURCE_HH
#define IMAGEGUARD_DIRECTORY_SIGNATURE_SOURCE_HH

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "imageguard/SignatureSource.hh"

namespace outcome = boost::outcome_v2;

namespace imageguard
{
  /**
   * @brief Signature source backed by a local lookaside directory
   *
   * With name = "<registry>/<repository>" the layout is
   *
   * @code
   * <root>/manifests/<name>/<tag>                        manifest bytes
   * <root>/signatures/<name>@sha256=<hex>/signature-<n>  simple signing envelopes, n = 1, 2, ...
   * <root>/cosign/<name>/sha256-<hex>.sig                cosign signature manifest
   * <root>/other/<name>@sha256=<hex>/<scheme>            signatures of other schemes
   * @endcode
   */
  class DirectorySignatureSource : public SignatureSource
  {
  public:
    explicit DirectorySignatureSource(std::filesystem::path root);

    outcome::std_result<ManifestInfo> resolve_manifest(const ImageReference &image) override;
    outcome::std_result<std::vector<SignatureArtifact>> fetch_signatures(const ImageReference &image,
                                                                         const std::string &manifest_digest) override;

  private:
    outcome::std_result<void> load_simple_signing(const ImageReference &image,
                                                  const std::string &hex,
                                                  std::vector<SignatureArtifact> &artifacts);
    outcome::std_result<void> load_cosign(const ImageReference &image, const std::string &hex, std::vector<SignatureArtifact> &artifacts);
    outcome::std_result<void> load_other(const ImageReference &image, const std::string &hex, std::vector<SignatureArtifact> &artifacts);

    std::shared_ptr<spdlog::logger> logger_;
    std::filesystem::path root_;
  };

} // namespace imageguard

#endif // IMAGEGUARD_DIRECTORY_SIGNATURE_SOURCE_HH
