#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>
#include "store/store_error.hpp"

namespace ftecho {
namespace store {

class StorageManager;

// A committed file as seen by LIST
struct FileEntry {
  std::string name;
  std::uint64_t size;

  bool operator==(const FileEntry& other) const {
    return name == other.name && size == other.size;
  }
  bool operator<(const FileEntry& other) const {
    return name < other.name;
  }
};

// Read handle on a committed file. The size is taken from the opened
// descriptor, so a concurrent commit cannot change what this handle sees.
class CommittedFile {
public:
  CommittedFile(const CommittedFile&) = delete;
  CommittedFile& operator=(const CommittedFile&) = delete;

  // Reads up to max_size bytes, returns the count read (0 at end of file)
  std::size_t read(char* buffer, std::size_t max_size);
  // Positions the next read at the given byte offset
  void seek(std::uint64_t offset);

  const std::string& name() const { return name_; }
  std::uint64_t size() const { return size_; }

private:
  friend class StorageManager;
  CommittedFile(std::string name, std::ifstream stream, std::uint64_t size);

  std::string name_;
  std::ifstream stream_;
  std::uint64_t size_;
};

// Write handle on a partial file. Owning one means owning the filename's
// writer slot; destroying it without commit() abandons the partial file.
class PartialFile {
public:
  ~PartialFile();

  PartialFile(const PartialFile&) = delete;
  PartialFile& operator=(const PartialFile&) = delete;

  // Appends bytes to the partial file
  void write(const char* data, std::size_t size);
  void write(const std::string& chunk) { write(chunk.data(), chunk.size()); }

  // Streams the bytes present before this handle was opened to the consumer,
  // in file order and in chunks of at most chunk_size bytes
  std::uint64_t read_prefix(const std::function<void(const char*, std::size_t)>& consumer,
                            std::size_t chunk_size = 8192) const;

  const std::string& name() const { return name_; }
  // Offset the handle was opened at
  std::uint64_t start_offset() const { return start_offset_; }
  // Current logical size: start offset plus bytes written through this handle
  std::uint64_t size() const { return start_offset_ + written_; }
  bool is_open() const { return open_; }

private:
  friend class StorageManager;
  PartialFile(StorageManager& storage, std::string name, std::filesystem::path path,
              std::ofstream stream, std::uint64_t start_offset);

  StorageManager& storage_;
  std::string name_;
  std::filesystem::path path_;
  std::ofstream stream_;
  std::uint64_t start_offset_;
  std::uint64_t written_ = 0;
  bool open_ = true;
};

// Owns the flat file namespace under one storage root
class StorageManager {
public:
  // Suffix that marks an upload in progress
  static constexpr const char* PARTIAL_SUFFIX = ".part";
  // Longest accepted name: <name>.part must still fit in NAME_MAX (255)
  static constexpr std::size_t MAX_FILENAME_LENGTH = 255 - std::char_traits<char>::length(PARTIAL_SUFFIX);

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit StorageManager(const std::filesystem::path& root);

  StorageManager(const StorageManager&) = delete;
  StorageManager& operator=(const StorageManager&) = delete;


  // ---- QUERY OPERATIONS ----
  // Snapshot of committed files, sorted by name
  std::vector<FileEntry> list() const;
  // Path of the committed file, throws NotFoundError
  std::filesystem::path resolve_committed(const std::string& name) const;
  // Size of the partial file, 0 if none exists
  std::uint64_t partial_size(const std::string& name) const;
  // True while an upload holds the filename's writer slot
  bool is_writing(const std::string& name) const;


  // ---- READ OPERATIONS ----
  std::unique_ptr<CommittedFile> open_committed(const std::string& name) const;


  // ---- WRITE OPERATIONS ----
  // Starts a fresh upload at offset 0, truncating any earlier partial file
  std::unique_ptr<PartialFile> create_partial(const std::string& name);
  // Continues an upload. Fails with OffsetMismatchError unless the partial
  // file holds exactly expected_offset bytes; the file is left untouched.
  std::unique_ptr<PartialFile> open_partial_for_append(const std::string& name,
                                                       std::uint64_t expected_offset);
  // Atomically promotes the partial file to the committed name
  void commit(PartialFile& partial);
  // Closes the partial file and keeps it on disk for a later resume
  void abandon_partial(PartialFile& partial);


  // ---- FILENAME VALIDATION ----
  // Throws InvalidFilenameError for names that could leave the storage root
  // or collide with partial files
  static void validate_filename(const std::string& name);


  // ---- GETTERS ----
  const std::filesystem::path& root() const { return root_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path root_;

  // Filenames currently owned by an upload
  mutable std::mutex writers_mutex_;
  std::unordered_set<std::string> active_writers_;


  // ---- WRITER EXCLUSION ----
  void claim_writer(const std::string& name);
  void release_writer(const std::string& name);


  // ---- PATH RESOLUTION ----
  std::filesystem::path committed_path(const std::string& name) const;
  std::filesystem::path partial_path(const std::string& name) const;
  static bool is_partial_name(const std::string& filename);
};

} // namespace store
} // namespace ftecho
