#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fieldsync::codec {

/*
  multipart/form-data (RFC 7578) building and parsing.

  Only what the field endpoints exchange: named parts, optional
  filename, optional per-part content type.
*/
struct MultipartPart {
  std::string name;
  std::string filename;     // empty for plain text parts
  std::string content_type; // empty = text/plain
  std::string data;
};

// Random boundary guaranteed not to occur inside any part.
std::string ChooseBoundary(const std::vector<MultipartPart>& parts);

std::string BuildMultipartBody(const std::vector<MultipartPart>& parts, const std::string& boundary);

std::optional<std::string> BoundaryFromContentType(std::string_view content_type);

// Throws util::InvalidArgument on a malformed body.
std::vector<MultipartPart> ParseMultipartBody(std::string_view body, std::string_view boundary);

} // namespace fieldsync::codec
