#include "store/storage_manager.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <system_error>

namespace ftecho {
namespace store {

//==============================================
// COMMITTED FILE
//==============================================

CommittedFile::CommittedFile(std::string name, std::ifstream stream, std::uint64_t size)
  : name_(std::move(name))
  , stream_(std::move(stream))
  , size_(size) {
}

std::size_t CommittedFile::read(char* buffer, std::size_t max_size) {
  stream_.read(buffer, static_cast<std::streamsize>(max_size));
  if (stream_.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Storage manager: Read failed on committed file: " << name_;
    throw IOFailureError("failed to read " + name_);
  }
  return static_cast<std::size_t>(stream_.gcount());
}

void CommittedFile::seek(std::uint64_t offset) {
  if (offset > size_) {
    throw OffsetMismatchError(size_, offset);
  }
  stream_.clear();
  if (!stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg)) {
    BOOST_LOG_TRIVIAL(error) << "Storage manager: Seek to " << offset << " failed on: " << name_;
    throw IOFailureError("failed to seek in " + name_);
  }
}

//==============================================
// PARTIAL FILE
//==============================================

PartialFile::PartialFile(StorageManager& storage, std::string name, std::filesystem::path path,
                         std::ofstream stream, std::uint64_t start_offset)
  : storage_(storage)
  , name_(std::move(name))
  , path_(std::move(path))
  , stream_(std::move(stream))
  , start_offset_(start_offset) {
}

PartialFile::~PartialFile() {
  if (!open_) {
    return;
  }
  try {
    storage_.abandon_partial(*this);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Storage manager: Failed to abandon partial file " << name_ << ": " << e.what();
  }
}

void PartialFile::write(const char* data, std::size_t size) {
  if (!open_) {
    throw IOFailureError("partial file " + name_ + " is closed");
  }
  if (!stream_.write(data, static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Storage manager: Failed to write " << size << " bytes to partial file: " << path_.string();
    throw IOFailureError("failed to write partial file for " + name_);
  }
  written_ += size;
}

std::uint64_t PartialFile::read_prefix(const std::function<void(const char*, std::size_t)>& consumer,
                                       std::size_t chunk_size) const {
  if (start_offset_ == 0) {
    return 0;
  }

  std::ifstream input(path_, std::ios::binary);
  if (!input) {
    BOOST_LOG_TRIVIAL(error) << "Storage manager: Failed to reopen partial file: " << path_.string();
    throw IOFailureError("failed to reopen partial file for " + name_);
  }

  std::vector<char> buffer(std::max<std::size_t>(chunk_size, 1));
  std::uint64_t total = 0;
  while (total < start_offset_) {
    std::uint64_t remaining = start_offset_ - total;
    std::size_t want = remaining < buffer.size() ? static_cast<std::size_t>(remaining) : buffer.size();
    input.read(buffer.data(), static_cast<std::streamsize>(want));
    std::size_t got = static_cast<std::size_t>(input.gcount());
    if (got == 0) {
      break;
    }
    consumer(buffer.data(), got);
    total += got;
  }

  if (total != start_offset_) {
    BOOST_LOG_TRIVIAL(error) << "Storage manager: Partial file " << name_ << " shrank to " << total
                             << " bytes while being resumed at " << start_offset_;
    throw IOFailureError("partial file for " + name_ + " is shorter than its resume offset");
  }
  return total;
}

//==============================================
// CONSTRUCTOR
//==============================================

StorageManager::StorageManager(const std::filesystem::path& root) : root_(root) {
  BOOST_LOG_TRIVIAL(info) << "Storage manager: Initializing storage root: " << root_.string();

  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec || !std::filesystem::is_directory(root_, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Storage manager: Storage root unusable: " << root_.string();
    throw IOFailureError("storage root " + root_.string() + " is not a usable directory");
  }
}

//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<FileEntry> StorageManager::list() const {
  std::vector<FileEntry> entries;
  std::error_code ec;

  std::filesystem::directory_iterator it(root_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Storage manager: Failed to open storage root: " << ec.message();
    throw IOFailureError("failed to list " + root_.string() + ": " + ec.message());
  }

  // Entries may vanish or be replaced by a concurrent commit; skip what
  // cannot be inspected rather than failing the whole listing
  for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Storage manager: Listing stopped early: " << ec.message();
      break;
    }

    std::string filename = it->path().filename().string();
    if (is_partial_name(filename)) {
      continue;
    }

    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec) || entry_ec) {
      continue;
    }
    std::uintmax_t size = std::filesystem::file_size(it->path(), entry_ec);
    if (entry_ec) {
      continue;
    }
    entries.push_back(FileEntry{filename, static_cast<std::uint64_t>(size)});
  }

  std::sort(entries.begin(), entries.end());
  BOOST_LOG_TRIVIAL(debug) << "Storage manager: Listed " << entries.size() << " committed files";
  return entries;
}

std::filesystem::path StorageManager::resolve_committed(const std::string& name) const {
  validate_filename(name);

  std::filesystem::path path = committed_path(name);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Storage manager: No committed file named: " << name;
    throw NotFoundError(name);
  }
  return path;
}

std::uint64_t StorageManager::partial_size(const std::string& name) const {
  validate_filename(name);

  std::error_code ec;
  std::uintmax_t size = std::filesystem::file_size(partial_path(name), ec);
  if (ec) {
    return 0;
  }
  return static_cast<std::uint64_t>(size);
}

bool StorageManager::is_writing(const std::string& name) const {
  std::lock_guard<std::mutex> lock(writers_mutex_);
  return active_writers_.count(name) > 0;
}

//==============================================
// READ OPERATIONS
//==============================================

std::unique_ptr<CommittedFile> StorageManager::open_committed(const std::string& name) const {
  std::filesystem::path path = resolve_committed(name);

  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      throw NotFoundError(name);
    }
    BOOST_LOG_TRIVIAL(error) << "Storage manager: Failed to open committed file: " << path.string();
    throw IOFailureError("failed to open " + name);
  }

  // Measure through the open descriptor, not by path
  stream.seekg(0, std::ios::end);
  std::streamoff end = stream.tellg();
  stream.seekg(0, std::ios::beg);
  if (end < 0 || !stream) {
    throw IOFailureError("failed to measure " + name);
  }

  BOOST_LOG_TRIVIAL(debug) << "Storage manager: Opened committed file " << name << " (" << end << " bytes)";
  return std::unique_ptr<CommittedFile>(
    new CommittedFile(name, std::move(stream), static_cast<std::uint64_t>(end)));
}

//==============================================
// WRITE OPERATIONS
//==============================================

std::unique_ptr<PartialFile> StorageManager::create_partial(const std::string& name) {
  validate_filename(name);
  claim_writer(name);

  try {
    std::filesystem::path path = partial_path(name);
    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    if (!stream) {
      BOOST_LOG_TRIVIAL(error) << "Storage manager: Failed to create partial file: " << path.string();
      throw IOFailureError("failed to create partial file for " + name);
    }

    BOOST_LOG_TRIVIAL(info) << "Storage manager: Started upload of " << name;
    return std::unique_ptr<PartialFile>(new PartialFile(*this, name, path, std::move(stream), 0));
  } catch (...) {
    release_writer(name);
    throw;
  }
}

std::unique_ptr<PartialFile> StorageManager::open_partial_for_append(const std::string& name,
                                                                     std::uint64_t expected_offset) {
  validate_filename(name);
  claim_writer(name);

  try {
    std::uint64_t actual = partial_size(name);
    if (actual != expected_offset) {
      BOOST_LOG_TRIVIAL(warning) << "Storage manager: Resume of " << name << " at " << expected_offset
                                 << " rejected, partial file holds " << actual << " bytes";
      throw OffsetMismatchError(actual, expected_offset);
    }

    std::filesystem::path path = partial_path(name);
    std::ofstream stream(path, std::ios::binary | std::ios::app);
    if (!stream) {
      BOOST_LOG_TRIVIAL(error) << "Storage manager: Failed to open partial file: " << path.string();
      throw IOFailureError("failed to open partial file for " + name);
    }

    BOOST_LOG_TRIVIAL(info) << "Storage manager: Resumed upload of " << name << " at offset " << expected_offset;
    return std::unique_ptr<PartialFile>(
      new PartialFile(*this, name, path, std::move(stream), expected_offset));
  } catch (...) {
    release_writer(name);
    throw;
  }
}

void StorageManager::commit(PartialFile& partial) {
  if (!partial.open_) {
    throw IOFailureError("partial file for " + partial.name_ + " is already closed");
  }

  partial.stream_.flush();
  partial.stream_.close();
  partial.open_ = false;

  if (!partial.stream_) {
    release_writer(partial.name_);
    BOOST_LOG_TRIVIAL(error) << "Storage manager: Failed to close partial file: " << partial.path_.string();
    throw IOFailureError("failed to close partial file for " + partial.name_);
  }

  // Single rename(2): readers see the old file or the new one, never neither
  std::error_code ec;
  std::filesystem::rename(partial.path_, committed_path(partial.name_), ec);
  release_writer(partial.name_);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Storage manager: Commit of " << partial.name_ << " failed: " << ec.message();
    throw IOFailureError("failed to commit " + partial.name_ + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "Storage manager: Committed " << partial.name_ << " (" << partial.size() << " bytes)";
}

void StorageManager::abandon_partial(PartialFile& partial) {
  if (!partial.open_) {
    return;
  }

  partial.stream_.flush();
  partial.stream_.close();
  partial.open_ = false;
  release_writer(partial.name_);

  BOOST_LOG_TRIVIAL(info) << "Storage manager: Abandoned upload of " << partial.name_
                          << " at " << partial.size() << " bytes, kept for resume";
}

//==============================================
// FILENAME VALIDATION
//==============================================

void StorageManager::validate_filename(const std::string& name) {
  if (name.empty()) {
    throw InvalidFilenameError("empty name");
  }
  if (name == "." || name == "..") {
    throw InvalidFilenameError("'" + name + "' refers to a directory");
  }
  if (name.size() > MAX_FILENAME_LENGTH) {
    throw InvalidFilenameError("name longer than " + std::to_string(MAX_FILENAME_LENGTH) + " bytes");
  }
  if (name.find_first_of(std::string("/\\|\n\r\0", 6)) != std::string::npos) {
    throw InvalidFilenameError("'" + name + "' contains a reserved character");
  }
  if (is_partial_name(name)) {
    throw InvalidFilenameError("'" + name + "' uses the reserved suffix " + PARTIAL_SUFFIX);
  }
}

//==============================================
// WRITER EXCLUSION
//==============================================

void StorageManager::claim_writer(const std::string& name) {
  std::lock_guard<std::mutex> lock(writers_mutex_);
  if (!active_writers_.insert(name).second) {
    BOOST_LOG_TRIVIAL(warning) << "Storage manager: Rejected concurrent upload of " << name;
    throw BusyError(name);
  }
}

void StorageManager::release_writer(const std::string& name) {
  std::lock_guard<std::mutex> lock(writers_mutex_);
  active_writers_.erase(name);
}

//==============================================
// PATH RESOLUTION
//==============================================

std::filesystem::path StorageManager::committed_path(const std::string& name) const {
  return root_ / name;
}

std::filesystem::path StorageManager::partial_path(const std::string& name) const {
  return root_ / (name + PARTIAL_SUFFIX);
}

bool StorageManager::is_partial_name(const std::string& filename) {
  const std::string suffix(PARTIAL_SUFFIX);
  return filename.size() >= suffix.size() &&
         filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace store
} // namespace ftecho
