#pragma once

#include <string_view>

#include "bolt/http-status-code.hpp"

namespace bolt::http {

// Header field names, in their canonical form for emission. Lookups compare them case-insensitively.
inline constexpr std::string_view Accept = "Accept";
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view ContentDisposition = "Content-Disposition";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view XContentTypeOptions = "X-Content-Type-Options";

inline constexpr std::string_view nosniff = "nosniff";

// Content types
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextPlainUtf8 = "text/plain; charset=utf-8";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

// Reason phrases for the statuses the dispatcher may emit on its own, and a few common ones for handlers.
inline constexpr std::string_view ReasonOK = "OK";
inline constexpr std::string_view ReasonCreated = "Created";
inline constexpr std::string_view ReasonNoContent = "No Content";
inline constexpr std::string_view ReasonMovedPermanently = "Moved Permanently";
inline constexpr std::string_view ReasonBadRequest = "Bad Request";
inline constexpr std::string_view ReasonUnauthorized = "Unauthorized";
inline constexpr std::string_view ReasonForbidden = "Forbidden";
inline constexpr std::string_view ReasonNotFound = "Not Found";
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";
inline constexpr std::string_view ReasonTooManyRequests = "Too Many Requests";
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";
inline constexpr std::string_view ReasonNotImplemented = "Not Implemented";
inline constexpr std::string_view ReasonServiceUnavailable = "Service Unavailable";

// Return the canonical reason phrase for a subset of status codes, or an empty view for the others.
constexpr std::string_view ReasonPhraseFor(StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeCreated:
      return ReasonCreated;
    case StatusCodeNoContent:
      return ReasonNoContent;
    case StatusCodeMovedPermanently:
      return ReasonMovedPermanently;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeUnauthorized:
      return ReasonUnauthorized;
    case StatusCodeForbidden:
      return ReasonForbidden;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeMethodNotAllowed:
      return ReasonMethodNotAllowed;
    case StatusCodeTooManyRequests:
      return ReasonTooManyRequests;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    case StatusCodeNotImplemented:
      return ReasonNotImplemented;
    case StatusCodeServiceUnavailable:
      return ReasonServiceUnavailable;
    default:
      return {};
  }
}

}  // namespace bolt::http
