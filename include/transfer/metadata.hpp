#ifndef FTECHO_TRANSFER_METADATA_HPP
#define FTECHO_TRANSFER_METADATA_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "store/storage_manager.hpp"
#include "transfer/transfer_error.hpp"

namespace ftecho {
namespace transfer {

enum class Direction {
    GET,
    PUT
};

inline const char* direction_to_string(Direction direction) {
    return direction == Direction::GET ? "get" : "put";
}

// PUT payload: {"filename": string, "size": unsigned}
struct PutRequest {
    std::string filename;
    std::uint64_t size = 0;
};

// RESUME payload: filename|offset|direction
struct ResumeRequest {
    std::string filename;
    std::uint64_t offset = 0;
    Direction direction = Direction::GET;
};

// GET / RESUME-GET metadata in the O frame: {"size": N[, "offset": K]}
struct FileMetadata {
    std::uint64_t size = 0;
    std::optional<std::uint64_t> offset;
};

// ---- PUT ----
// Strict: both fields required, no others allowed
PutRequest parse_put_request(const std::string& payload);
std::string encode_put_request(const PutRequest& request);

// ---- RESUME ----
ResumeRequest parse_resume_request(const std::string& payload);
std::string encode_resume_request(const ResumeRequest& request);
// Server's go-ahead for RESUME-PUT: {"offset": K, "ready": true}
std::string encode_resume_ready(std::uint64_t offset);
std::uint64_t parse_resume_ready(const std::string& payload);

// ---- GET ----
std::string encode_file_metadata(const FileMetadata& metadata);
FileMetadata parse_file_metadata(const std::string& payload);

// ---- LIST ----
// One "name|size\n" record per file
std::string encode_listing(const std::vector<store::FileEntry>& entries);
std::vector<store::FileEntry> parse_listing(const std::string& payload);

} // namespace transfer
} // namespace ftecho

#endif // FTECHO_TRANSFER_METADATA_HPP
