// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#include "discovery/ssdp_validator.hpp"
#include "discovery/protocol.hpp"
#include "discovery/url.hpp"
#include <algorithm>
#include <boost/asio/buffer.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <cctype>

namespace bridgescout {
namespace discovery {

namespace http = boost::beast::http;

namespace {
std::string_view Trim(std::string_view s) {
  auto is_space = [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) || c == '\0';
  };
  while (!s.empty() && is_space(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && is_space(s.back())) {
    s.remove_suffix(1);
  }
  return s;
}

std::string ToLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

// "HTTP/1.1 200 OK" -> true
bool IsSuccessStatusLine(std::string_view line) {
  std::string lower = ToLower(line);
  if (lower.rfind("http/1.", 0) != 0) {
    return false;
  }
  size_t space = lower.find(' ');
  if (space == std::string::npos) {
    return false;
  }
  std::string_view rest = Trim(std::string_view(lower).substr(space + 1));
  return rest.substr(0, 3) == "200" &&
         (rest.size() == 3 || std::isspace(static_cast<unsigned char>(rest[3])));
}

std::string_view View(boost::beast::string_view s) {
  return std::string_view(s.data(), s.size());
}

// Line-by-line pass for replies the HTTP parser refuses (bare LF endings,
// junk header lines)
SsdpResponse ParseTolerant(std::string_view raw) {
  SsdpResponse response;
  bool first = true;

  while (!raw.empty()) {
    size_t eol = raw.find('\n');
    std::string_view line = raw.substr(0, eol);
    raw = eol == std::string_view::npos ? std::string_view{} : raw.substr(eol + 1);

    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    line = Trim(line);

    if (first) {
      response.status_line.assign(line);
      first = false;
      continue;
    }
    if (line.empty()) {
      break; // end of headers
    }

    size_t colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      continue;
    }
    std::string name = ToLower(Trim(line.substr(0, colon)));
    response.headers.emplace(std::move(name),
                             std::string(Trim(line.substr(colon + 1))));
  }
  return response;
}
} // namespace

const std::string *SsdpResponse::header(const std::string &lower_name) const {
  auto it = headers.find(lower_name);
  return it == headers.end() ? nullptr : &it->second;
}

SsdpResponse ParseSsdpHeaders(std::string_view raw) {
  http::response_parser<http::empty_body> parser;
  parser.eager(false);
  boost::system::error_code ec;
  parser.put(boost::asio::buffer(raw.data(), raw.size()), ec);
  if (ec || !parser.is_header_done()) {
    return ParseTolerant(raw);
  }

  const auto &message = parser.get();
  SsdpResponse response;
  response.well_formed = true;
  response.status_line = "HTTP/" + std::to_string(message.version() / 10) +
                         "." + std::to_string(message.version() % 10) + " " +
                         std::to_string(message.result_int());
  if (!message.reason().empty()) {
    response.status_line += " ";
    response.status_line += View(message.reason());
  }
  for (const auto &field : message) {
    response.headers.emplace(ToLower(View(field.name_string())),
                             std::string(Trim(View(field.value()))));
  }
  return response;
}

ValidationResult ValidateSsdpResponse(std::string_view raw,
                                      const std::string &origin) {
  SsdpResponse response = ParseSsdpHeaders(raw);

  if (!IsSuccessStatusLine(response.status_line)) {
    return ValidationResult::Fail("invalid status line '" +
                                  response.status_line + "'");
  }

  if (!response.header("usn") || !response.header("st")) {
    return ValidationResult::Fail("missing USN or ST header");
  }

  const std::string *server = response.header("server");
  if (!server || ToLower(*server).find(protocol::BRIDGE_SERVER_TOKEN) ==
                     std::string::npos) {
    return ValidationResult::Fail("server banner is not a bridge");
  }

  const std::string *location = response.header("location");
  if (!location) {
    return ValidationResult::Fail("missing LOCATION header");
  }
  auto url = ParseUrl(*location);
  if (!url || url->scheme != "http") {
    return ValidationResult::Fail("malformed LOCATION '" + *location + "'");
  }
  if (url->host != ToLower(origin)) {
    return ValidationResult::Fail("LOCATION host " + url->host +
                                  " does not match sender " + origin);
  }

  return ValidationResult::Ok();
}

} // namespace discovery
} // namespace bridgescout
