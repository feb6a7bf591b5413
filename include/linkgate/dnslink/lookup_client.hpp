// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "linkgate/core/json.hpp"
#include "linkgate/core/logger.hpp"
#include "linkgate/dnslink/content_path.hpp"
#include "linkgate/dnslink/dnslink_value.hpp"
#include "linkgate/dnslink/host_state.hpp"
#include "linkgate/network/http_client.hpp"

namespace linkgate
{
namespace dnslink
{

  /// \brief Why a backend lookup did not produce a value.
  struct LookupError
  {
    enum class Kind
    {
      HttpStatus,  ///< backend answered with a status other than 200/500
      Transport,   ///< connect, TLS, timeout or malformed HTTP
      Parse,       ///< body is not JSON or lacks a string "Path"
      InvalidPath  ///< "Path" is not a well-formed content path
    };

    Kind kind = Kind::Transport;
    std::string message;
    int statusCode = 0;
  };

  inline const char* toString(LookupError::Kind kind)
  {
    switch (kind)
    {
    case LookupError::Kind::HttpStatus:
      return "http-status";
    case LookupError::Kind::Transport:
      return "transport";
    case LookupError::Kind::Parse:
      return "parse";
    case LookupError::Kind::InvalidPath:
      return "invalid-path";
    }
    return "unknown";
  }

  /// \brief Result of one backend lookup: a value (resolved or confirmed
  /// absent) when ok, otherwise an error.
  struct LookupResult
  {
    bool ok = false;
    DnslinkValue value = DnslinkValue::absent();
    LookupError error;

    static LookupResult success(DnslinkValue v)
    {
      LookupResult r;
      r.ok = true;
      r.value = std::move(v);
      return r;
    }

    static LookupResult failure(LookupError::Kind kind, std::string message,
                                int statusCode = 0)
    {
      LookupResult r;
      r.error = LookupError{kind, std::move(message), statusCode};
      return r;
    }
  };

  /// \brief Source of DNSLink records for a single FQDN. Implementations block
  /// until they have an answer.
  class LookupClient
  {
  public:
    virtual ~LookupClient() = default;

    virtual LookupResult lookup(const std::string& fqdn) = 0;
  };

  /// \brief Looks up DNSLink records through the node's HTTP API:
  /// `GET {apiBaseUrl}api/v0/dns/{fqdn}` with `Accept: application/json`.
  ///
  /// 200 carries `{"Path": "..."}`, 500 is the backend's way of saying the
  /// host has no DNSLink, anything else is an error.
  class HttpLookupClient : public LookupClient
  {
  public:
    HttpLookupClient(HostStateProvider stateProvider,
                     const network::HttpClient::Config& httpConfig =
                         network::HttpClient::Config{})
      : _stateProvider(std::move(stateProvider)), _http(httpConfig)
    {
      if (!_stateProvider)
      {
        throw std::invalid_argument("HttpLookupClient: state provider is required");
      }
    }

    void setTlsConfig(const network::HttpClient::TlsConfig& tls) { _http.setTlsConfig(tls); }

    /// \brief Endpoint queried for the given FQDN under the given API base.
    static std::string lookupUrl(const std::string& apiBaseUrl, const std::string& fqdn)
    {
      std::string base = apiBaseUrl;
      while (!base.empty() && base.back() == '/')
      {
        base.pop_back();
      }
      return base + "/api/v0/dns/" + fqdn;
    }

    LookupResult lookup(const std::string& fqdn) override
    {
      std::string url = lookupUrl(_stateProvider().apiBaseUrl, fqdn);

      network::HttpClient::Response response;
      try
      {
        // Synchronous wait over the asynchronous request; the transport
        // timeouts bound it
        response = _http.getAsync(url, {{"Accept", "application/json"}}).get();
      }
      catch (const std::exception& e)
      {
        return LookupResult::failure(LookupError::Kind::Transport, e.what());
      }

      if (response.statusCode == 500)
      {
        return LookupResult::success(DnslinkValue::absent());
      }
      if (response.statusCode != 200)
      {
        std::string text = response.statusText.empty()
                               ? "HTTP " + std::to_string(response.statusCode)
                               : response.statusText;
        return LookupResult::failure(LookupError::Kind::HttpStatus, text, response.statusCode);
      }

      std::string path;
      try
      {
        auto json = network::HttpClient::parseJsonOrThrow(response);
        if (!json.is_object() || !json.contains("Path") || !json["Path"].is_string())
        {
          return LookupResult::failure(LookupError::Kind::Parse,
                                       "response has no string field 'Path'", 200);
        }
        path = json["Path"].get<std::string>();
      }
      catch (const std::exception& e)
      {
        return LookupResult::failure(LookupError::Kind::Parse, e.what(), 200);
      }

      if (!ContentPath::isContentPath(path))
      {
        return LookupResult::failure(LookupError::Kind::InvalidPath,
                                     "invalid DNSLink path for '" + fqdn + "': '" + path +
                                         "'",
                                     200);
      }
      return LookupResult::success(DnslinkValue::resolved(path));
    }

  private:
    HostStateProvider _stateProvider;
    network::HttpClient _http;
  };

} // namespace dnslink
} // namespace linkgate
