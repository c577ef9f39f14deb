#include "transfer/metadata.hpp"
#include <nlohmann/json.hpp>
#include <boost/log/trivial.hpp>
#include <sstream>

namespace ftecho {
namespace transfer {

namespace {

using json = nlohmann::json;

json parse_object(const std::string& payload, const char* what) {
  json doc;
  try {
    doc = json::parse(payload);
  } catch (const json::parse_error& e) {
    BOOST_LOG_TRIVIAL(warning) << "Metadata: Malformed " << what << " payload: " << e.what();
    throw InvalidRequestError(std::string(what) + " payload is not valid JSON");
  }
  if (!doc.is_object()) {
    throw InvalidRequestError(std::string(what) + " payload must be a JSON object");
  }
  return doc;
}

void reject_unknown_fields(const json& doc, const std::vector<std::string>& allowed, const char* what) {
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    bool known = false;
    for (const auto& field : allowed) {
      if (it.key() == field) {
        known = true;
        break;
      }
    }
    if (!known) {
      throw InvalidRequestError(std::string(what) + " payload has unknown field '" + it.key() + "'");
    }
  }
}

std::uint64_t require_unsigned(const json& doc, const std::string& field, const char* what) {
  auto it = doc.find(field);
  if (it == doc.end()) {
    throw InvalidRequestError(std::string(what) + " payload is missing '" + field + "'");
  }
  if (!it->is_number_unsigned()) {
    throw InvalidRequestError(std::string(what) + " field '" + field + "' must be a non-negative integer");
  }
  return it->get<std::uint64_t>();
}

// Decimal digits only: no sign, no whitespace, no exponent
std::uint64_t parse_decimal(const std::string& text, const char* field) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    throw InvalidRequestError(std::string(field) + " '" + text + "' is not a non-negative integer");
  }
  try {
    return std::stoull(text);
  } catch (const std::out_of_range&) {
    throw InvalidRequestError(std::string(field) + " '" + text + "' is out of range");
  }
}

} // namespace

//==============================================
// PUT
//==============================================

PutRequest parse_put_request(const std::string& payload) {
  json doc = parse_object(payload, "PUT");
  reject_unknown_fields(doc, {"filename", "size"}, "PUT");

  auto name = doc.find("filename");
  if (name == doc.end()) {
    throw InvalidRequestError("PUT payload is missing 'filename'");
  }
  if (!name->is_string()) {
    throw InvalidRequestError("PUT field 'filename' must be a string");
  }

  PutRequest request;
  request.filename = name->get<std::string>();
  request.size = require_unsigned(doc, "size", "PUT");
  return request;
}

std::string encode_put_request(const PutRequest& request) {
  json doc = {{"filename", request.filename}, {"size", request.size}};
  return doc.dump();
}

//==============================================
// RESUME
//==============================================

ResumeRequest parse_resume_request(const std::string& payload) {
  std::vector<std::string> parts;
  std::string::size_type start = 0;
  while (true) {
    std::string::size_type bar = payload.find('|', start);
    parts.push_back(payload.substr(start, bar == std::string::npos ? std::string::npos : bar - start));
    if (bar == std::string::npos) {
      break;
    }
    start = bar + 1;
  }

  if (parts.size() != 3) {
    throw InvalidRequestError("RESUME payload must be filename|offset|direction");
  }

  ResumeRequest request;
  request.filename = parts[0];
  request.offset = parse_decimal(parts[1], "offset");

  if (parts[2] == "get") {
    request.direction = Direction::GET;
  } else if (parts[2] == "put") {
    request.direction = Direction::PUT;
  } else {
    throw InvalidRequestError("Invalid direction: " + parts[2]);
  }
  return request;
}

std::string encode_resume_request(const ResumeRequest& request) {
  return request.filename + "|" + std::to_string(request.offset) + "|" + direction_to_string(request.direction);
}

std::string encode_resume_ready(std::uint64_t offset) {
  json doc = {{"offset", offset}, {"ready", true}};
  return doc.dump();
}

std::uint64_t parse_resume_ready(const std::string& payload) {
  json doc = parse_object(payload, "RESUME reply");
  auto ready = doc.find("ready");
  if (ready == doc.end() || !ready->is_boolean() || !ready->get<bool>()) {
    throw InvalidRequestError("RESUME reply is not ready");
  }
  return require_unsigned(doc, "offset", "RESUME reply");
}

//==============================================
// GET
//==============================================

std::string encode_file_metadata(const FileMetadata& metadata) {
  json doc = {{"size", metadata.size}};
  if (metadata.offset) {
    doc["offset"] = *metadata.offset;
  }
  return doc.dump();
}

FileMetadata parse_file_metadata(const std::string& payload) {
  json doc = parse_object(payload, "GET reply");
  reject_unknown_fields(doc, {"size", "offset"}, "GET reply");

  FileMetadata metadata;
  metadata.size = require_unsigned(doc, "size", "GET reply");
  if (doc.contains("offset")) {
    metadata.offset = require_unsigned(doc, "offset", "GET reply");
  }
  return metadata;
}

//==============================================
// LIST
//==============================================

std::string encode_listing(const std::vector<store::FileEntry>& entries) {
  std::ostringstream out;
  for (const auto& entry : entries) {
    out << entry.name << '|' << entry.size << '\n';
  }
  // An empty namespace still answers with one newline
  if (entries.empty()) {
    out << '\n';
  }
  return out.str();
}

std::vector<store::FileEntry> parse_listing(const std::string& payload) {
  std::vector<store::FileEntry> entries;
  std::istringstream in(payload);
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    std::string::size_type bar = line.rfind('|');
    if (bar == std::string::npos) {
      throw InvalidRequestError("listing record '" + line + "' has no size");
    }
    entries.push_back(store::FileEntry{line.substr(0, bar), parse_decimal(line.substr(bar + 1), "size")});
  }
  return entries;
}

} // namespace transfer
} // namespace ftecho
