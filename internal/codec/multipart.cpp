#include "multipart.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/url.hpp"
#include "internal/util/uuid.hpp"

namespace fieldsync::codec {

namespace {

// Quotes and line breaks cannot appear raw inside a quoted parameter.
// '%' is escaped too so a literal "%22" in a filename survives the trip.
std::string EscapeParam(std::string_view value) {
  std::string out;
  for (char c : value) {
    switch (c) {
      case '%':
        out += "%25";
        break;
      case '"':
        out += "%22";
        break;
      case '\r':
        out += "%0D";
        break;
      case '\n':
        out += "%0A";
        break;
      default:
        out += c;
    }
  }
  return out;
}

std::string UnescapeParam(std::string_view value) {
  std::string out;
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size()) {
      auto code = value.substr(i, 3);
      if (code == "%25") {
        out += '%';
        i += 2;
        continue;
      }
      if (code == "%22") {
        out += '"';
        i += 2;
        continue;
      }
      if (code == "%0D") {
        out += '\r';
        i += 2;
        continue;
      }
      if (code == "%0A") {
        out += '\n';
        i += 2;
        continue;
      }
    }
    out += value[i];
  }
  return out;
}

bool BoundaryCollides(const std::vector<MultipartPart>& parts, const std::string& boundary) {
  return std::any_of(parts.begin(), parts.end(), [&](const MultipartPart& part) {
    return part.data.find(boundary) != std::string::npos || part.name.find(boundary) != std::string::npos ||
           part.filename.find(boundary) != std::string::npos;
  });
}

// Value of `key="..."` (or unquoted) inside a header line, if present.
std::optional<std::string> HeaderParam(std::string_view line, std::string_view key) {
  const std::string lowered = util::ToLower(line);
  const std::string needle  = util::ToLower(key) + "=";

  size_t pos = 0;
  while ((pos = lowered.find(needle, pos)) != std::string::npos) {
    // must start a parameter, not end another one ("filename=" contains "name=")
    if (pos > 0 && lowered[pos - 1] != ';' && lowered[pos - 1] != ' ') {
      pos += needle.size();
      continue;
    }

    size_t start = pos + needle.size();
    if (start < line.size() && line[start] == '"') {
      auto end = line.find('"', start + 1);
      if (end == std::string_view::npos) return std::nullopt;
      return std::string(line.substr(start + 1, end - start - 1));
    }
    auto end = line.find(';', start);
    auto raw = line.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    while (!raw.empty() && raw.back() == ' ') raw.remove_suffix(1);
    return std::string(raw);
  }
  return std::nullopt;
}

} // namespace

std::string ChooseBoundary(const std::vector<MultipartPart>& parts) {
  while (true) {
    std::string boundary = "----fieldsync-";
    for (char c : util::NewId()) {
      if (c != '-') boundary += c;
    }
    if (!BoundaryCollides(parts, boundary)) return boundary;
  }
}

std::string BuildMultipartBody(const std::vector<MultipartPart>& parts, const std::string& boundary) {
  std::string body;
  for (const auto& part : parts) {
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"" + EscapeParam(part.name) + "\"";
    if (!part.filename.empty()) {
      body += "; filename=\"" + EscapeParam(part.filename) + "\"";
    }
    body += "\r\n";
    if (!part.content_type.empty()) {
      body += "Content-Type: " + part.content_type + "\r\n";
    }
    body += "\r\n";
    body += part.data;
    body += "\r\n";
  }
  body += "--" + boundary + "--\r\n";
  return body;
}

std::optional<std::string> BoundaryFromContentType(std::string_view content_type) {
  if (!util::StartsWith(util::ToLower(content_type), "multipart/form-data")) return std::nullopt;
  auto boundary = HeaderParam(content_type, "boundary");
  if (!boundary || boundary->empty()) return std::nullopt;
  return boundary;
}

std::vector<MultipartPart> ParseMultipartBody(std::string_view body, std::string_view boundary) {
  if (boundary.empty()) throw util::InvalidArgument("multipart: empty boundary");

  const std::string delimiter = "--" + std::string(boundary);
  const std::string separator = "\r\n" + delimiter;

  size_t pos = body.find(delimiter);
  if (pos == std::string_view::npos) throw util::InvalidArgument("multipart: boundary not found");
  pos += delimiter.size();

  std::vector<MultipartPart> parts;
  while (true) {
    if (body.substr(pos, 2) == "--") return parts;
    if (body.substr(pos, 2) != "\r\n") throw util::InvalidArgument("multipart: malformed delimiter line");
    pos += 2;

    auto headers_end = body.find("\r\n\r\n", pos);
    if (headers_end == std::string_view::npos) throw util::InvalidArgument("multipart: unterminated part headers");

    MultipartPart part;
    bool          has_disposition = false;

    std::string_view headers = body.substr(pos, headers_end - pos);
    while (!headers.empty()) {
      auto             line_end = headers.find("\r\n");
      std::string_view line     = headers.substr(0, line_end);
      headers = line_end == std::string_view::npos ? std::string_view() : headers.substr(line_end + 2);

      auto colon = line.find(':');
      if (colon == std::string_view::npos) continue;

      const std::string name  = util::ToLower(line.substr(0, colon));
      std::string_view  value = line.substr(colon + 1);
      while (!value.empty() && value.front() == ' ') value.remove_prefix(1);

      if (name == "content-disposition") {
        auto field_name = HeaderParam(value, "name");
        if (!field_name) throw util::InvalidArgument("multipart: part without a name");
        part.name       = UnescapeParam(*field_name);
        part.filename   = UnescapeParam(HeaderParam(value, "filename").value_or(""));
        has_disposition = true;
      } else if (name == "content-type") {
        part.content_type = std::string(value);
      }
    }
    if (!has_disposition) throw util::InvalidArgument("multipart: part without Content-Disposition");

    const size_t data_start = headers_end + 4;
    const size_t data_end   = body.find(separator, data_start);
    if (data_end == std::string_view::npos) throw util::InvalidArgument("multipart: unterminated part");

    part.data = std::string(body.substr(data_start, data_end - data_start));
    parts.push_back(std::move(part));

    pos = data_end + separator.size();
  }
}

} // namespace fieldsync::codec
