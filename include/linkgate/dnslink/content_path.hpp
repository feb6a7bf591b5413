// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "linkgate/network/url.hpp"

namespace linkgate
{
namespace dnslink
{

  /// \brief Syntactic checks for content-addressed paths and URLs.
  ///
  /// Only well-formedness is checked: `/ipfs/<root>` needs a root made of
  /// base-encoding characters, `/ipns/<name>` a root made of key or DNS name
  /// characters. Roots are not decoded, so retrievability is not implied.
  class ContentPath
  {
  public:
    static bool isIpfsPath(const std::string& path)
    {
      return hasValidRoot(path, "/ipfs/", &isCidChar);
    }

    static bool isIpnsPath(const std::string& path)
    {
      return hasValidRoot(path, "/ipns/", &isNameChar);
    }

    /// \brief True for `/ipfs/...` and `/ipns/...` paths with a well-formed
    /// root segment.
    static bool isContentPath(const std::string& path)
    {
      return isIpfsPath(path) || isIpnsPath(path);
    }

    /// \brief True for http(s) URLs served by a path gateway
    /// (`https://gw/ipfs/<cid>/...`) or a subdomain gateway
    /// (`https://<cid>.ipfs.gw/...`, `https://<name>.ipns.gw/...`).
    static bool isContentAddressedUrl(const std::string& url)
    {
      auto parsed = network::Url::tryParse(url);
      if (!parsed || !parsed->isHttp())
      {
        return false;
      }
      return isContentPath(parsed->path) || isSubdomainGatewayHost(parsed->hostname());
    }

    static bool isSubdomainGatewayHost(const std::string& host)
    {
      std::vector<std::string> labels;
      std::size_t start = 0;
      while (true)
      {
        auto dot = host.find('.', start);
        labels.push_back(host.substr(start, dot - start));
        if (dot == std::string::npos)
          break;
        start = dot + 1;
      }

      // Rightmost namespace label that has both a root before it and a
      // gateway domain after it
      for (std::size_t i = labels.size() - 1; i-- > 1;)
      {
        if (labels[i] != "ipfs" && labels[i] != "ipns")
        {
          continue;
        }
        std::string root = labels[0];
        for (std::size_t j = 1; j < i; ++j)
        {
          root += "." + labels[j];
        }
        if (labels[i] == "ipfs")
        {
          // Hostnames like docs.ipfs.tech must not pass for a CID label
          return i == 1 && root.size() >= kMinSubdomainCidLength && isRoot(root, &isCidChar);
        }
        return isRoot(root, &isNameChar);
      }
      return false;
    }

  private:
    /// Shortest CID in DNS-safe encoding (CIDv0 is 46 characters)
    static constexpr std::size_t kMinSubdomainCidLength = 46;

    static bool isCidChar(unsigned char c) { return std::isalnum(c) != 0; }

    static bool isNameChar(unsigned char c)
    {
      return std::isalnum(c) != 0 || c == '.' || c == '-' || c == '_';
    }

    static bool isRoot(const std::string& root, bool (*allowed)(unsigned char))
    {
      return !root.empty() && std::all_of(root.begin(), root.end(), [allowed](char c)
                                          { return allowed(static_cast<unsigned char>(c)); });
    }

    static bool hasValidRoot(const std::string& path, const std::string& prefix,
                             bool (*allowed)(unsigned char))
    {
      if (path.compare(0, prefix.size(), prefix) != 0)
      {
        return false;
      }
      auto end = path.find_first_of("/?#", prefix.size());
      std::string root = path.substr(prefix.size(), end == std::string::npos
                                                        ? std::string::npos
                                                        : end - prefix.size());
      if (!isRoot(root, allowed))
      {
        return false;
      }
      // Query and fragment never belong to a content path
      return end == std::string::npos || path[end] == '/';
    }
  };

} // namespace dnslink
} // namespace linkgate
