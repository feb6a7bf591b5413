// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include "linkgate/core/json.hpp"
#include "linkgate/core/logger.hpp"
#include "linkgate/network/url.hpp"

namespace linkgate
{
namespace network
{

  /// \brief Case-insensitive ordering for HTTP header names.
  struct CaseInsensitiveLess
  {
    bool operator()(const std::string& a, const std::string& b) const
    {
      return std::lexicographical_compare(
          a.begin(), a.end(), b.begin(), b.end(),
          [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }
  };

  using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

  /// \brief Blocking HTTP/1.1 client over POSIX sockets, with HTTPS through
  /// OpenSSL.
  /// \details
  ///   - One connection per request (`Connection: close`)
  ///   - Connect and per-read/write timeouts from Config
  ///   - Content-Length, chunked and read-until-close bodies
  class HttpClient
  {
  public:
    /// \brief TLS configuration for HTTPS requests
    struct TlsConfig
    {
      std::string caFile;
      bool verifyPeer = true;
    };

    /// \brief HTTP response structure
    struct Response
    {
      int statusCode = 0;
      std::string statusText;
      HeaderMap headers;
      std::string body;
      bool success() const { return statusCode >= 200 && statusCode < 300; }
    };

    /// \brief Configuration for HTTP client
    struct Config
    {
      std::chrono::milliseconds connectTimeout;
      std::chrono::milliseconds requestTimeout;
      std::string userAgent;
      std::size_t maxResponseSize;

      Config()
        : connectTimeout(2000),
          requestTimeout(3000),
          userAgent("linkgate/1.0"),
          maxResponseSize(1024 * 1024)
      {
      }

      /// \brief Create a config optimized for localhost/testing
      static Config forLocalhost()
      {
        Config c;
        c.connectTimeout = std::chrono::milliseconds(200);
        c.requestTimeout = std::chrono::milliseconds(1000);
        return c;
      }
    };

    explicit HttpClient(const Config& config = Config{}) : _config(config) {}

    ~HttpClient()
    {
      if (_sslContext)
      {
        SSL_CTX_free(_sslContext);
      }
    }

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// \brief Set TLS configuration; takes effect for the next HTTPS request
    void setTlsConfig(const TlsConfig& config)
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _tlsConfig = config;
      if (_sslContext)
      {
        SSL_CTX_free(_sslContext);
        _sslContext = nullptr;
      }
    }

    const Config& config() const { return _config; }

    /// \brief Perform synchronous GET request
    /// \throws std::invalid_argument for a malformed URL
    /// \throws std::runtime_error on connection, TLS or protocol failure
    Response get(const std::string& url, const HeaderMap& headers = {})
    {
      return performRequest("GET", url, headers);
    }

    /// \brief Perform asynchronous GET request
    std::future<Response> getAsync(const std::string& url, const HeaderMap& headers = {})
    {
      return std::async(std::launch::async,
                        [this, url, headers]() { return get(url, headers); });
    }

    /// \brief Parse JSON response or throw on error
    static core::Json parseJsonOrThrow(const Response& response)
    {
      if (!response.success())
      {
        throw std::runtime_error("HTTP failed with status: " +
                                 std::to_string(response.statusCode));
      }
      try
      {
        return core::Json::parse(response.body);
      }
      catch (const core::Json::parse_error& e)
      {
        throw std::runtime_error(std::string("JSON parse error: ") + e.what());
      }
    }

  private:
    /// \brief Owns one socket and, for HTTPS, its TLS session.
    class Connection
    {
    public:
      Connection() = default;
      ~Connection()
      {
        if (_ssl)
        {
          if (SSL_is_init_finished(_ssl))
          {
            SSL_shutdown(_ssl);
          }
          SSL_free(_ssl);
        }
        if (_fd >= 0)
        {
          ::close(_fd);
        }
      }

      Connection(const Connection&) = delete;
      Connection& operator=(const Connection&) = delete;

      void attachSocket(int fd) { _fd = fd; }
      void attachSsl(SSL* ssl) { _ssl = ssl; }
      int fd() const { return _fd; }
      SSL* ssl() const { return _ssl; }

      void sendAll(const std::string& data)
      {
        std::size_t sent = 0;
        while (sent < data.size())
        {
          int n;
          if (_ssl)
          {
            n = SSL_write(_ssl, data.data() + sent, static_cast<int>(data.size() - sent));
            if (n <= 0)
            {
              throw std::runtime_error("TLS write failed: " + sslErrorString());
            }
          }
          else
          {
            ssize_t w = ::send(_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (w < 0)
            {
              if (errno == EINTR)
                continue;
              if (errno == EAGAIN || errno == EWOULDBLOCK)
                throw std::runtime_error("HTTP request send timeout");
              throw std::runtime_error(std::string("Failed to send HTTP request: ") +
                                       std::strerror(errno));
            }
            n = static_cast<int>(w);
          }
          sent += static_cast<std::size_t>(n);
        }
      }

      /// \brief Returns bytes read, 0 on orderly close.
      std::size_t receive(char* buffer, std::size_t len)
      {
        if (_ssl)
        {
          int n = SSL_read(_ssl, buffer, static_cast<int>(len));
          if (n > 0)
            return static_cast<std::size_t>(n);
          int err = SSL_get_error(_ssl, n);
          if (err == SSL_ERROR_ZERO_RETURN)
            return 0;
          if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))
            throw std::runtime_error("HTTP response timeout");
          if (err == SSL_ERROR_SYSCALL && errno == 0)
            return 0; // peer closed without close_notify
          throw std::runtime_error("TLS read failed: " + sslErrorString());
        }
        while (true)
        {
          ssize_t n = ::recv(_fd, buffer, len, 0);
          if (n >= 0)
            return static_cast<std::size_t>(n);
          if (errno == EINTR)
            continue;
          if (errno == EAGAIN || errno == EWOULDBLOCK)
            throw std::runtime_error("HTTP response timeout");
          throw std::runtime_error(std::string("Failed to receive HTTP response: ") +
                                   std::strerror(errno));
        }
      }

    private:
      int _fd = -1;
      SSL* _ssl = nullptr;
    };

    mutable std::mutex _mutex;
    Config _config;
    TlsConfig _tlsConfig;
    SSL_CTX* _sslContext = nullptr;

    static std::string sslErrorString()
    {
      unsigned long code = ERR_get_error();
      if (code == 0)
      {
        return "unknown TLS error";
      }
      char buf[256];
      ERR_error_string_n(code, buf, sizeof(buf));
      return buf;
    }

    static std::string errnoString(int err) { return std::strerror(err); }

    Response performRequest(const std::string& method, const std::string& url,
                            const HeaderMap& headers)
    {
      core::Logger::info("HttpClient: " + method + " " + url);
      try
      {
        auto response = executeRequest(method, Url::parse(url), headers);
        core::Logger::info("HttpClient: Received " + std::to_string(response.statusCode) +
                           " response from " + url + " (body size: " +
                           std::to_string(response.body.size()) + " bytes)");
        return response;
      }
      catch (const std::exception& e)
      {
        core::Logger::error("HttpClient: Request to " + url + " failed: " + e.what());
        throw;
      }
    }

    Response executeRequest(const std::string& method, const Url& url,
                            const HeaderMap& headers)
    {
      if (!url.isHttp())
      {
        throw std::invalid_argument("Unsupported URL scheme: " + url.scheme);
      }

      Connection connection;
      connection.attachSocket(connectSocket(url));
      if (url.isHttps())
      {
        startTls(connection, url.hostname());
      }

      std::ostringstream request;
      request << method << " " << url.pathWithQuery() << " HTTP/1.1\r\n";
      request << "Host: " << url.hostPort() << "\r\n";
      request << "User-Agent: " << _config.userAgent << "\r\n";
      request << "Connection: close\r\n";
      for (const auto& [name, value] : headers)
      {
        request << name << ": " << value << "\r\n";
      }
      request << "\r\n";
      connection.sendAll(request.str());

      std::string responseData;
      char buffer[8192];
      while (!isCompleteHttpResponse(responseData, method))
      {
        std::size_t len = connection.receive(buffer, sizeof(buffer));
        if (len == 0)
        {
          if (responseData.find("\r\n\r\n") == std::string::npos)
          {
            throw std::runtime_error(
                "Connection closed before receiving complete HTTP response");
          }
          break;
        }
        responseData.append(buffer, len);
        if (responseData.size() > _config.maxResponseSize)
        {
          throw std::runtime_error("HTTP response exceeds maximum size of " +
                                   std::to_string(_config.maxResponseSize) + " bytes");
        }
      }
      return parseHttpResponse(responseData);
    }

    /// \brief Resolves and connects with a bounded wait; returns a blocking
    /// socket with send/receive timeouts applied.
    int connectSocket(const Url& url) const
    {
      addrinfo hints{};
      hints.ai_family = AF_UNSPEC;
      hints.ai_socktype = SOCK_STREAM;
      addrinfo* results = nullptr;
      std::string service = std::to_string(url.effectivePort());
      int rc = ::getaddrinfo(url.hostname().c_str(), service.c_str(), &hints, &results);
      if (rc != 0)
      {
        throw std::runtime_error("Failed to resolve " + url.hostname() + ": " +
                                 gai_strerror(rc));
      }
      std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(results, &::freeaddrinfo);

      std::string lastError = "no addresses";
      for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next)
      {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0)
        {
          lastError = errnoString(errno);
          continue;
        }
        if (connectWithTimeout(fd, ai, lastError))
        {
          timeval tv{};
          auto ms = _config.requestTimeout.count();
          tv.tv_sec = static_cast<time_t>(ms / 1000);
          tv.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);
          ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
          ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
          return fd;
        }
        ::close(fd);
      }
      throw std::runtime_error("Connection failed to " + url.hostPort() + " (" + lastError +
                               ")");
    }

    bool connectWithTimeout(int fd, const addrinfo* ai, std::string& error) const
    {
      int flags = ::fcntl(fd, F_GETFL, 0);
      ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

      int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
      if (rc < 0 && errno != EINPROGRESS)
      {
        error = errnoString(errno);
        return false;
      }
      if (rc < 0)
      {
        pollfd pfd{fd, POLLOUT, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(_config.connectTimeout.count()));
        if (ready == 0)
        {
          error = "connect timeout after " + std::to_string(_config.connectTimeout.count()) +
                  "ms";
          return false;
        }
        if (ready < 0)
        {
          error = errnoString(errno);
          return false;
        }
        int soError = 0;
        socklen_t len = sizeof(soError);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len);
        if (soError != 0)
        {
          error = errnoString(soError);
          return false;
        }
      }
      ::fcntl(fd, F_SETFL, flags);
      return true;
    }

    SSL_CTX* sslContext()
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_sslContext)
      {
        return _sslContext;
      }
      SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
      if (!ctx)
      {
        throw std::runtime_error("Failed to create TLS context: " + sslErrorString());
      }
      SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
      if (_tlsConfig.verifyPeer)
      {
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        int loaded = _tlsConfig.caFile.empty()
                         ? SSL_CTX_set_default_verify_paths(ctx)
                         : SSL_CTX_load_verify_locations(ctx, _tlsConfig.caFile.c_str(), nullptr);
        if (loaded != 1)
        {
          SSL_CTX_free(ctx);
          throw std::runtime_error("Failed to load TLS trust store: " + sslErrorString());
        }
      }
      else
      {
        SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
      }
      _sslContext = ctx;
      return _sslContext;
    }

    void startTls(Connection& connection, const std::string& hostname)
    {
      SSL* ssl = SSL_new(sslContext());
      if (!ssl)
      {
        throw std::runtime_error("Failed to create TLS session: " + sslErrorString());
      }
      connection.attachSsl(ssl);
      SSL_set_fd(ssl, connection.fd());
      SSL_set_tlsext_host_name(ssl, hostname.c_str());
      if (_tlsConfig.verifyPeer)
      {
        SSL_set1_host(ssl, hostname.c_str());
      }
      if (SSL_connect(ssl) != 1)
      {
        long verify = SSL_get_verify_result(ssl);
        std::string reason = verify != X509_V_OK
                                 ? X509_verify_cert_error_string(verify)
                                 : sslErrorString();
        throw std::runtime_error("TLS handshake with " + hostname + " failed: " + reason);
      }
    }

    /// \brief Check if we have a complete HTTP response
    static bool isCompleteHttpResponse(const std::string& data, const std::string& method)
    {
      auto headerEnd = data.find("\r\n\r\n");
      if (headerEnd == std::string::npos)
      {
        return false;
      }
      std::string headers = data.substr(0, headerEnd);
      std::size_t bodySize = data.size() - headerEnd - 4;

      int status = 0;
      auto space = headers.find(' ');
      if (space != std::string::npos)
      {
        status = std::atoi(headers.c_str() + space + 1);
      }
      if (method == "HEAD" || status == 204 || status == 304 || (status >= 100 && status < 200))
      {
        return true;
      }

      auto value = findHeader(headers, "content-length");
      if (value)
      {
        return bodySize >= std::stoul(*value);
      }
      auto encoding = findHeader(headers, "transfer-encoding");
      if (encoding && encoding->find("chunked") != std::string::npos)
      {
        return data.find("\r\n0\r\n", headerEnd) != std::string::npos &&
               data.compare(data.size() - 4, 4, "\r\n\r\n") == 0;
      }
      // Body runs until the server closes the connection
      return false;
    }

    static std::optional<std::string> findHeader(const std::string& headerBlock,
                                                 const std::string& lowerName)
    {
      std::istringstream stream(headerBlock);
      std::string line;
      while (std::getline(stream, line))
      {
        auto colon = line.find(':');
        if (colon == std::string::npos)
          continue;
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == lowerName)
        {
          std::string value = line.substr(colon + 1);
          value.erase(0, value.find_first_not_of(" \t"));
          value.erase(value.find_last_not_of(" \t\r") + 1);
          return value;
        }
      }
      return std::nullopt;
    }

    /// \brief Parse HTTP response from raw data
    static Response parseHttpResponse(const std::string& data)
    {
      Response response;

      auto headerEnd = data.find("\r\n\r\n");
      if (headerEnd == std::string::npos)
      {
        throw std::runtime_error("Invalid HTTP response: no header separator found");
      }
      std::string headerSection = data.substr(0, headerEnd);
      std::string bodySection = data.substr(headerEnd + 4);

      std::istringstream headerStream(headerSection);
      std::string statusLine;
      std::getline(headerStream, statusLine);
      if (!statusLine.empty() && statusLine.back() == '\r')
      {
        statusLine.pop_back();
      }

      // "HTTP/1.1 200 OK"
      if (statusLine.compare(0, 5, "HTTP/") != 0)
      {
        throw std::runtime_error("Invalid HTTP status line: " + statusLine);
      }
      auto codeStart = statusLine.find(' ');
      if (codeStart == std::string::npos || codeStart + 4 > statusLine.size() ||
          !std::isdigit(static_cast<unsigned char>(statusLine[codeStart + 1])) ||
          !std::isdigit(static_cast<unsigned char>(statusLine[codeStart + 2])) ||
          !std::isdigit(static_cast<unsigned char>(statusLine[codeStart + 3])))
      {
        throw std::runtime_error("Invalid HTTP status line: " + statusLine);
      }
      response.statusCode = std::stoi(statusLine.substr(codeStart + 1, 3));
      if (codeStart + 4 < statusLine.size())
      {
        response.statusText = statusLine.substr(codeStart + 5);
      }

      std::string headerLine;
      while (std::getline(headerStream, headerLine))
      {
        if (!headerLine.empty() && headerLine.back() == '\r')
        {
          headerLine.pop_back();
        }
        auto colonPos = headerLine.find(':');
        if (colonPos != std::string::npos)
        {
          std::string name = headerLine.substr(0, colonPos);
          std::string value = headerLine.substr(colonPos + 1);
          name.erase(0, name.find_first_not_of(" \t"));
          name.erase(name.find_last_not_of(" \t") + 1);
          value.erase(0, value.find_first_not_of(" \t"));
          value.erase(value.find_last_not_of(" \t") + 1);
          response.headers[name] = value;
        }
      }

      auto contentLengthIt = response.headers.find("Content-Length");
      auto transferEncodingIt = response.headers.find("Transfer-Encoding");
      if (contentLengthIt != response.headers.end())
      {
        std::size_t contentLength = std::stoul(contentLengthIt->second);
        response.body = bodySection.substr(0, contentLength);
      }
      else if (transferEncodingIt != response.headers.end() &&
               transferEncodingIt->second.find("chunked") != std::string::npos)
      {
        response.body = decodeChunkedBody(bodySection);
      }
      else
      {
        response.body = bodySection;
      }
      return response;
    }

    /// \brief Decode chunked transfer encoding
    static std::string decodeChunkedBody(const std::string& chunkedData)
    {
      std::string result;
      std::size_t pos = 0;
      while (pos < chunkedData.size())
      {
        auto lineEnd = chunkedData.find("\r\n", pos);
        if (lineEnd == std::string::npos)
        {
          throw std::runtime_error("Invalid chunked encoding: missing chunk size line");
        }
        std::size_t chunkSize = std::stoul(chunkedData.substr(pos, lineEnd - pos), nullptr, 16);
        pos = lineEnd + 2;
        if (chunkSize == 0)
        {
          break;
        }
        if (pos + chunkSize > chunkedData.size())
        {
          throw std::runtime_error("Invalid chunked encoding: truncated chunk");
        }
        result.append(chunkedData, pos, chunkSize);
        pos += chunkSize + 2; // skip trailing CRLF
      }
      return result;
    }
  };

} // namespace network
} // namespace linkgate
