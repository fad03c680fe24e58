#pragma once

#include <string_view>

#include "switchyard/http-status-code.hpp"

namespace switchyard::http {

// Header field names are stored in their canonical form for emission.
// Lookups on requests and responses are case-insensitive.

inline constexpr std::string_view HeaderSep = ": ";

// Standard Header Field Names
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Location = "Location";

// Reason phrases
inline constexpr std::string_view ReasonOK = "OK";                                          // 200
inline constexpr std::string_view ReasonCreated = "Created";                                // 201
inline constexpr std::string_view ReasonAccepted = "Accepted";                              // 202
inline constexpr std::string_view ReasonNoContent = "No Content";                           // 204
inline constexpr std::string_view ReasonMovedPermanently = "Moved Permanently";             // 301
inline constexpr std::string_view ReasonFound = "Found";                                    // 302
inline constexpr std::string_view ReasonBadRequest = "Bad Request";                         // 400
inline constexpr std::string_view ReasonUnauthorized = "Unauthorized";                      // 401
inline constexpr std::string_view ReasonForbidden = "Forbidden";                            // 403
inline constexpr std::string_view ReasonNotFound = "Not Found";                             // 404
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";            // 405
inline constexpr std::string_view ReasonConflict = "Conflict";                              // 409
inline constexpr std::string_view ReasonUnprocessableEntity = "Unprocessable Entity";       // 422
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";      // 500
inline constexpr std::string_view ReasonNotImplemented = "Not Implemented";                 // 501
inline constexpr std::string_view ReasonServiceUnavailable = "Service Unavailable";         // 503

// Content type
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";

// Return the canonical reason phrase for a subset of status codes we care about.
constexpr std::string_view ReasonPhraseFor(http::StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeCreated:
      return ReasonCreated;
    case StatusCodeAccepted:
      return ReasonAccepted;
    case StatusCodeNoContent:
      return ReasonNoContent;
    case StatusCodeMovedPermanently:
      return ReasonMovedPermanently;
    case StatusCodeFound:
      return ReasonFound;
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
    case StatusCodeConflict:
      return ReasonConflict;
    case StatusCodeUnprocessableEntity:
      return ReasonUnprocessableEntity;
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

}  // namespace switchyard::http
