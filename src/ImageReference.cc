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

#include "imageguard/ImageReference.hh"

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

#include "imageguard/Errors.hh"

namespace imageguard
{
  namespace
  {
    constexpr size_t max_tag_length = 128;

    bool is_domain_component(std::string_view component)
    {
      return component.find_first_of(".:") != std::string_view::npos || component == "localhost"
             || std::any_of(component.begin(), component.end(), [](unsigned char c) { return std::isupper(c) != 0; });
    }

    bool is_lower_alnum(unsigned char c)
    {
      return std::islower(c) != 0 || std::isdigit(c) != 0;
    }

    // Separators are ".", "_", "__" or a run of "-", always between alphanumerics.
    bool is_valid_path_component(std::string_view component)
    {
      size_t i = 0;
      while (i < component.size())
        {
          if (!is_lower_alnum(component[i]))
            {
              return false;
            }
          while (i < component.size() && is_lower_alnum(component[i]))
            {
              i++;
            }
          if (i == component.size())
            {
              return true;
            }

          auto separator_start = i;
          if (component[i] == '.')
            {
              i++;
            }
          else if (component[i] == '_')
            {
              i += component.substr(i, 2) == "__" ? 2 : 1;
            }
          else if (component[i] == '-')
            {
              while (i < component.size() && component[i] == '-')
                {
                  i++;
                }
            }
          else
            {
              return false;
            }
          if (i == separator_start || i == component.size())
            {
              return false;
            }
        }
      return false;
    }

    bool is_valid_repository(std::string_view repository)
    {
      if (repository.empty())
        {
          return false;
        }
      size_t start = 0;
      while (true)
        {
          auto slash = repository.find('/', start);
          if (!is_valid_path_component(repository.substr(start, slash == std::string_view::npos ? std::string_view::npos : slash - start)))
            {
              return false;
            }
          if (slash == std::string_view::npos)
            {
              return true;
            }
          start = slash + 1;
        }
    }

    bool is_valid_registry(std::string_view registry)
    {
      auto host = registry;
      if (auto colon = registry.rfind(':'); colon != std::string_view::npos)
        {
          auto port = registry.substr(colon + 1);
          if (port.empty() || !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
            {
              return false;
            }
          host = registry.substr(0, colon);
        }

      size_t start = 0;
      while (true)
        {
          auto dot = host.find('.', start);
          auto label = host.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
          if (label.empty() || label.front() == '-' || label.back() == '-'
              || !std::all_of(label.begin(), label.end(), [](unsigned char c) { return std::isalnum(c) != 0 || c == '-'; }))
            {
              return false;
            }
          if (dot == std::string_view::npos)
            {
              return true;
            }
          start = dot + 1;
        }
    }

    bool is_valid_tag(std::string_view tag)
    {
      if (tag.empty() || tag.size() > max_tag_length || tag.front() == '.' || tag.front() == '-')
        {
          return false;
        }
      return std::all_of(tag.begin(), tag.end(), [](unsigned char c) { return std::isalnum(c) != 0 || c == '_' || c == '.' || c == '-'; });
    }

    bool is_valid_digest(std::string_view digest)
    {
      auto colon = digest.find(':');
      if (colon == std::string_view::npos || colon == 0 || colon + 1 == digest.size())
        {
          return false;
        }

      auto algorithm = digest.substr(0, colon);
      auto hex = digest.substr(colon + 1);
      if (!std::all_of(algorithm.begin(), algorithm.end(), [](unsigned char c) { return std::isalnum(c) != 0 || c == '+' || c == '.' || c == '_' || c == '-'; }))
        {
          return false;
        }
      if (algorithm == "sha256" && hex.size() != 64)
        {
          return false;
        }
      return std::all_of(hex.begin(), hex.end(), [](unsigned char c) { return std::isxdigit(c) != 0 && std::isupper(c) == 0; });
    }
  } // namespace

  outcome::std_result<ImageReference> ImageReference::parse(std::string_view reference, bool apply_default_tag)
  {
    if (reference.empty())
      {
        spdlog::debug("Empty image reference");
        return ImageGuardError::InvalidReference;
      }

    ImageReference result;
    std::string_view remainder = reference;

    if (auto at = remainder.find('@'); at != std::string_view::npos)
      {
        auto digest = remainder.substr(at + 1);
        if (!is_valid_digest(digest))
          {
            spdlog::debug("Invalid digest in image reference '{}'", reference);
            return ImageGuardError::InvalidReference;
          }
        result.digest_ = std::string(digest);
        remainder = remainder.substr(0, at);
      }

    auto last_slash = remainder.rfind('/');
    auto last_colon = remainder.rfind(':');
    if (last_colon != std::string_view::npos && (last_slash == std::string_view::npos || last_colon > last_slash))
      {
        auto tag = remainder.substr(last_colon + 1);
        if (!is_valid_tag(tag))
          {
            spdlog::debug("Invalid tag in image reference '{}'", reference);
            return ImageGuardError::InvalidReference;
          }
        result.tag_ = std::string(tag);
        remainder = remainder.substr(0, last_colon);
      }

    auto first_slash = remainder.find('/');
    if (first_slash != std::string_view::npos && is_domain_component(remainder.substr(0, first_slash)))
      {
        result.registry_ = std::string(remainder.substr(0, first_slash));
        result.repository_ = std::string(remainder.substr(first_slash + 1));
      }
    else
      {
        result.registry_ = std::string(default_registry);
        result.repository_ = std::string(remainder);
      }

    if (result.registry_ == "index.docker.io")
      {
        result.registry_ = std::string(default_registry);
      }

    if (result.registry_ == default_registry && result.repository_.find('/') == std::string::npos)
      {
        result.repository_ = "library/" + result.repository_;
      }

    if (!is_valid_registry(result.registry_))
      {
        spdlog::debug("Invalid registry in image reference '{}'", reference);
        return ImageGuardError::InvalidReference;
      }

    if (!is_valid_repository(result.repository_))
      {
        spdlog::debug("Invalid repository in image reference '{}'", reference);
        return ImageGuardError::InvalidReference;
      }

    if (apply_default_tag && !result.tag_ && !result.digest_)
      {
        result.tag_ = std::string(default_tag);
      }

    return result;
  }

  const std::string &ImageReference::registry() const
  {
    return registry_;
  }

  const std::string &ImageReference::repository() const
  {
    return repository_;
  }

  const std::optional<std::string> &ImageReference::tag() const
  {
    return tag_;
  }

  const std::optional<std::string> &ImageReference::digest() const
  {
    return digest_;
  }

  std::string ImageReference::name() const
  {
    return registry_ + "/" + repository_;
  }

  std::string ImageReference::to_string() const
  {
    std::string result = name();
    if (tag_)
      {
        result += ":" + *tag_;
      }
    if (digest_)
      {
        result += "@" + *digest_;
      }
    return result;
  }

} // namespace imageguard
