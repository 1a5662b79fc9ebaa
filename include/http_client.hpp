/**
 * @file http_client.hpp
 * @brief Minimal libcurl wrapper shared by the Docker client, notification sinks and
 * configuration export.
 */

#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <chrono>
#include <expected>
#include <string>
#include <vector>

/**
 * @brief One HTTP request.
 */
struct HttpRequest {
    std::string method = "GET";                           ///< "GET" or "POST".
    std::string url;                                      ///< Absolute URL.
    std::string unixSocket;                               ///< Connect through this unix socket when set.
    std::vector<std::string> headers;                     ///< Raw "Name: value" headers.
    std::string body;                                     ///< POST body.
    std::chrono::seconds timeout = std::chrono::seconds(10);
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

struct HttpError {
    std::string message;
    bool timedOut = false;
};

/**
 * @brief Performs a blocking HTTP request.
 *
 * Any HTTP status is a successful transfer; only transport failures are errors.
 */
std::expected<HttpResponse, HttpError> performHttpRequest(const HttpRequest& request);

/**
 * @brief URL-escapes a string.
 */
std::string urlEscape(const std::string& value);

#endif // HTTP_CLIENT_HPP
