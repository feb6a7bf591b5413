// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace linkgate
{
namespace network
{

  /// \brief Absolute URL split into components, normalised so that two
  /// spellings of the same origin serialise identically.
  struct Url
  {
    std::string scheme;   // lower-case, without "://"
    std::string userinfo; // without the trailing '@'
    std::string host;     // lower-case; IPv6 literals keep their brackets
    std::optional<std::uint16_t> port; // empty when equal to the scheme default
    std::string path = "/";
    std::optional<std::string> query;    // without '?'
    std::optional<std::string> fragment; // without '#'

    /// \brief Parses an absolute URL.
    /// \throws std::invalid_argument when scheme or host is missing or the
    /// port is not a number in range
    static Url parse(const std::string& text)
    {
      Url url;

      auto schemeEnd = text.find("://");
      if (schemeEnd == std::string::npos || schemeEnd == 0)
      {
        throw std::invalid_argument("Invalid URL format: " + text);
      }
      url.scheme = toLower(text.substr(0, schemeEnd));
      if (!std::isalpha(static_cast<unsigned char>(url.scheme[0])) ||
          !std::all_of(url.scheme.begin(), url.scheme.end(),
                       [](unsigned char c)
                       { return std::isalnum(c) || c == '+' || c == '-' || c == '.'; }))
      {
        throw std::invalid_argument("Invalid URL scheme: " + text);
      }

      std::size_t authorityStart = schemeEnd + 3;
      std::size_t authorityEnd = text.find_first_of("/?#", authorityStart);
      if (authorityEnd == std::string::npos)
      {
        authorityEnd = text.size();
      }
      std::string authority = text.substr(authorityStart, authorityEnd - authorityStart);

      auto at = authority.rfind('@');
      if (at != std::string::npos)
      {
        url.userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
      }

      std::string portText;
      if (!authority.empty() && authority[0] == '[')
      {
        auto close = authority.find(']');
        if (close == std::string::npos)
        {
          throw std::invalid_argument("Invalid IPv6 host in URL: " + text);
        }
        url.host = toLower(authority.substr(0, close + 1));
        std::string rest = authority.substr(close + 1);
        if (!rest.empty())
        {
          if (rest[0] != ':')
          {
            throw std::invalid_argument("Invalid authority in URL: " + text);
          }
          portText = rest.substr(1);
        }
      }
      else
      {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos)
        {
          portText = authority.substr(colon + 1);
          authority = authority.substr(0, colon);
        }
        url.host = toLower(authority);
      }

      if (url.host.empty() || url.host == "[]")
      {
        throw std::invalid_argument("URL has no host: " + text);
      }
      if (url.host.find_first_of(" \t\r\n") != std::string::npos)
      {
        throw std::invalid_argument("Invalid characters in URL host: " + text);
      }

      if (!portText.empty())
      {
        if (portText.size() > 5 ||
            !std::all_of(portText.begin(), portText.end(),
                         [](unsigned char c) { return std::isdigit(c); }))
        {
          throw std::invalid_argument("Invalid port in URL: " + text);
        }
        unsigned long port = std::stoul(portText);
        if (port > 65535)
        {
          throw std::invalid_argument("Port out of range in URL: " + text);
        }
        if (port != defaultPortFor(url.scheme))
        {
          url.port = static_cast<std::uint16_t>(port);
        }
      }

      std::string rest = text.substr(authorityEnd);
      auto hash = rest.find('#');
      if (hash != std::string::npos)
      {
        url.fragment = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
      }
      auto question = rest.find('?');
      if (question != std::string::npos)
      {
        url.query = rest.substr(question + 1);
        rest = rest.substr(0, question);
      }
      url.path = rest.empty() ? "/" : rest;
      return url;
    }

    /// \brief Parses without throwing.
    static std::optional<Url> tryParse(const std::string& text)
    {
      try
      {
        return parse(text);
      }
      catch (const std::invalid_argument&)
      {
        return std::nullopt;
      }
    }

    /// \brief Host without brackets or port; this is the DNS name a request
    /// targets.
    std::string hostname() const
    {
      if (host.size() > 2 && host.front() == '[' && host.back() == ']')
      {
        return host.substr(1, host.size() - 2);
      }
      return host;
    }

    /// \brief Explicit port, or the scheme default (0 for unknown schemes).
    std::uint16_t effectivePort() const
    {
      return port ? *port : defaultPortFor(scheme);
    }

    bool isHttp() const { return scheme == "http" || scheme == "https"; }

    bool isHttps() const { return scheme == "https"; }

    /// \brief "host[:port]" as it appears in the authority.
    std::string hostPort() const
    {
      return port ? host + ":" + std::to_string(*port) : host;
    }

    std::string pathWithQuery() const
    {
      return query ? path + "?" + *query : path;
    }

    std::string toString() const
    {
      std::string out = scheme + "://";
      if (!userinfo.empty())
      {
        out += userinfo + "@";
      }
      out += hostPort();
      out += pathWithQuery();
      if (fragment)
      {
        out += "#" + *fragment;
      }
      return out;
    }

    static std::uint16_t defaultPortFor(const std::string& scheme)
    {
      if (scheme == "http")
        return 80;
      if (scheme == "https")
        return 443;
      return 0;
    }

  private:
    static std::string toLower(std::string s)
    {
      std::transform(s.begin(), s.end(), s.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      return s;
    }
  };

} // namespace network
} // namespace linkgate
