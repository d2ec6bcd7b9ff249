#include "FileStore.h"
#include <filesystem>

namespace bt {

FileStore::FileStore() : Module("tracker.store.file") {}

FileStore::~FileStore() { close(); }

void FileStore::reset(const std::string &filepath) {
  close();
  filepath_ = filepath;
  currentSize_ = 0;
  headerValid_ = false;
  recordCount_ = 0;
  recordIndex_.clear();
}

FileStore::Roe<void> FileStore::init(const std::string &filepath) {
  reset(filepath);

  if (filepath_.empty()) {
    return Error("Filepath is not set");
  }

  if (std::filesystem::exists(filepath_)) {
    return Error("File already exists: " + filepath_ +
                 ". Use mount() to load existing file.");
  }

  auto result = open();
  if (!result) {
    log().error << "Failed to create file: " << filepath_;
    return result.error();
  }

  auto headerResult = writeHeader();
  if (!headerResult) {
    log().error << "Failed to write header to new file: " << filepath_;
    return headerResult.error();
  }
  currentSize_ = HEADER_SIZE;
  log().debug << "Created new file with header: " << filepath_;

  return {};
}

FileStore::Roe<void> FileStore::mount(const std::string &filepath) {
  reset(filepath);

  if (filepath_.empty()) {
    return Error("Filepath is not set");
  }

  if (!std::filesystem::exists(filepath_)) {
    return Error("File does not exist: " + filepath_ +
                 ". Use init() to create new file.");
  }

  auto result = open();
  if (!result) {
    log().error << "Failed to open file: " << filepath_;
    return result.error();
  }

  auto headerResult = readHeader();
  if (!headerResult) {
    log().error << "Failed to read header from existing file: " << filepath_;
    return headerResult.error();
  }

  currentSize_ = std::filesystem::file_size(filepath_);

  auto indexResult = buildRecordIndex();
  if (!indexResult) {
    return indexResult.error();
  }

  log().debug << "Mounted existing file: " << filepath_
              << " (total size: " << currentSize_
              << " bytes, version: " << header_.version
              << ", records: " << recordCount_ << ")";

  return {};
}

FileStore::Roe<void> FileStore::openOrInit(const std::string &filepath) {
  if (std::filesystem::exists(filepath)) {
    return mount(filepath);
  }
  return init(filepath);
}

FileStore::Roe<void> FileStore::open() {
  bool fileExists = std::filesystem::exists(filepath_);

  if (fileExists) {
    file_.open(filepath_, std::ios::binary | std::ios::in | std::ios::out);
  } else {
    file_.open(filepath_, std::ios::binary | std::ios::out);
    if (file_.is_open()) {
      file_.close();
      file_.open(filepath_, std::ios::binary | std::ios::in | std::ios::out);
    }
  }

  if (!file_.is_open()) {
    return Error("Failed to open file: " + filepath_);
  }

  return {};
}

FileStore::Roe<void> FileStore::reopen() {
  if (file_.is_open()) {
    file_.close();
  }
  return open();
}

bool FileStore::isOpen() const { return file_.is_open(); }

void FileStore::close() {
  if (file_.is_open()) {
    auto result = updateHeaderRecordCount();
    if (!result.isOk()) {
      log().warning << "Failed to update header record count: "
                    << result.error().message;
    }
    file_.close();
    log().debug << "Closed file: " << filepath_ << " (records: " << recordCount_
                << ")";
  }
}

FileStore::Roe<uint64_t> FileStore::appendRecord(const std::string &record) {
  if (!isOpen() || !headerValid_) {
    return Error("File is not open: " + filepath_);
  }

  file_.clear();
  file_.seekp(static_cast<std::streamoff>(currentSize_), std::ios::beg);
  int64_t fileOffset = static_cast<int64_t>(currentSize_);

  uint64_t size = record.size();
  file_.write(reinterpret_cast<const char *>(&size), SIZE_PREFIX_BYTES);
  file_.write(record.data(), static_cast<std::streamsize>(size));
  file_.flush();

  if (!file_.good()) {
    log().error << "Failed to write record to file: " << filepath_;
    // Cut back whatever part of the record reached the file
    file_.clear();
    std::error_code ec;
    std::filesystem::resize_file(filepath_, currentSize_, ec);
    auto reopenResult = reopen();
    if (!reopenResult) {
      return reopenResult.error();
    }
    return Error("Failed to write record to file: " + filepath_);
  }

  recordIndex_.push_back(RecordEntry{ fileOffset, size });
  uint64_t recordIdx = recordCount_;
  recordCount_++;
  currentSize_ += SIZE_PREFIX_BYTES + size;

  auto headerResult = updateHeaderRecordCount();
  if (!headerResult.isOk()) {
    log().warning << "Failed to update header record count: "
                  << headerResult.error().message;
  }

  log().debug << "Wrote record " << recordIdx << " (" << size
              << " bytes) at file offset " << fileOffset;

  return recordIdx;
}

FileStore::Roe<std::string> FileStore::readRecord(uint64_t index) const {
  if (!isOpen() || !headerValid_) {
    return Error("File is not open: " + filepath_);
  }

  if (index >= recordIndex_.size()) {
    return Error("Record index " + std::to_string(index) +
                 " out of range (max: " + std::to_string(recordIndex_.size()) +
                 ")");
  }

  const RecordEntry &entry = recordIndex_[index];
  std::string buffer(entry.size, '\0');

  int64_t dataOffset = entry.offset + static_cast<int64_t>(SIZE_PREFIX_BYTES);
  file_.clear();
  file_.seekg(dataOffset, std::ios::beg);
  if (!file_.good()) {
    return Error("Failed to seek to offset " + std::to_string(dataOffset));
  }

  if (entry.size > 0) {
    file_.read(&buffer[0], static_cast<std::streamsize>(entry.size));
    if (file_.gcount() != static_cast<std::streamsize>(entry.size)) {
      return Error("Failed to read complete record data");
    }
  }

  return buffer;
}

FileStore::Roe<void> FileStore::rewindTo(uint64_t index) {
  if (!isOpen() || !headerValid_) {
    return Error("File is not open: " + filepath_);
  }

  if (index > recordCount_) {
    return Error("Cannot rewind to index " + std::to_string(index) +
                 " (max: " + std::to_string(recordCount_) + ")");
  }
  if (index == recordCount_) {
    return {};
  }

  int64_t truncateOffset =
      index == 0 ? static_cast<int64_t>(HEADER_SIZE) : recordIndex_[index].offset;

  file_.close();
  std::error_code ec;
  std::filesystem::resize_file(filepath_, static_cast<uintmax_t>(truncateOffset), ec);
  if (ec) {
    auto reopenResult = open();
    if (!reopenResult) {
      return reopenResult.error();
    }
    return Error("Failed to truncate " + filepath_ + ": " + ec.message());
  }

  auto openResult = open();
  if (!openResult) {
    return openResult.error();
  }

  recordCount_ = index;
  currentSize_ = static_cast<size_t>(truncateOffset);
  recordIndex_.resize(index);

  return updateHeaderRecordCount();
}

FileStore::Roe<void> FileStore::writeHeader() {
  file_.seekp(0, std::ios::beg);

  header_ = FileHeader();
  header_.recordCount = recordCount_;

  file_.write(reinterpret_cast<const char *>(&header_), sizeof(FileHeader));
  file_.flush();
  if (!file_.good()) {
    return Error("Failed to write header to file: " + filepath_);
  }

  headerValid_ = true;
  return {};
}

FileStore::Roe<void> FileStore::readHeader() {
  file_.seekg(0, std::ios::beg);
  file_.read(reinterpret_cast<char *>(&header_), sizeof(FileHeader));

  if (file_.gcount() != static_cast<std::streamsize>(sizeof(FileHeader))) {
    return Error("Failed to read complete header from file: " + filepath_);
  }

  if (header_.magic != FileHeader::MAGIC) {
    return Error("Invalid magic number in file header: " + filepath_);
  }

  if (header_.version > FileHeader::CURRENT_VERSION) {
    return Error("Unsupported file version " + std::to_string(header_.version) +
                 " (current: " + std::to_string(FileHeader::CURRENT_VERSION) +
                 ")");
  }

  headerValid_ = true;
  return {};
}

FileStore::Roe<void> FileStore::updateHeaderRecordCount() {
  if (!isOpen()) {
    return Error("File is not open: " + filepath_);
  }

  // Position: after magic (4) + version (2) + reserved (2) = offset 8
  file_.clear();
  file_.seekp(8, std::ios::beg);
  file_.write(reinterpret_cast<const char *>(&recordCount_), sizeof(uint64_t));
  file_.flush();
  if (!file_.good()) {
    return Error("Failed to update record count in header: " + filepath_);
  }

  header_.recordCount = recordCount_;
  return {};
}

FileStore::Roe<void> FileStore::buildRecordIndex() {
  recordIndex_.clear();

  int64_t offset = static_cast<int64_t>(HEADER_SIZE);
  int64_t fileEnd = static_cast<int64_t>(currentSize_);

  while (offset + static_cast<int64_t>(SIZE_PREFIX_BYTES) <= fileEnd) {
    file_.clear();
    file_.seekg(offset, std::ios::beg);

    uint64_t recordSize = 0;
    file_.read(reinterpret_cast<char *>(&recordSize), SIZE_PREFIX_BYTES);
    if (file_.gcount() != static_cast<std::streamsize>(SIZE_PREFIX_BYTES)) {
      break;
    }

    if (recordSize > static_cast<uint64_t>(fileEnd - offset) - SIZE_PREFIX_BYTES) {
      break;
    }

    recordIndex_.push_back(RecordEntry{ offset, recordSize });
    offset += static_cast<int64_t>(SIZE_PREFIX_BYTES + recordSize);
  }

  if (offset < fileEnd) {
    log().warning << "Dropping torn record tail of " << (fileEnd - offset)
                  << " bytes from " << filepath_;
    file_.close();
    std::error_code ec;
    std::filesystem::resize_file(filepath_, static_cast<uintmax_t>(offset), ec);
    if (ec) {
      return Error("Failed to truncate torn tail of " + filepath_ + ": " +
                   ec.message());
    }
    auto openResult = open();
    if (!openResult) {
      return openResult.error();
    }
    currentSize_ = static_cast<size_t>(offset);
  }

  if (recordIndex_.size() != header_.recordCount) {
    log().debug << "Record count mismatch: header says " << header_.recordCount
                << ", scanned " << recordIndex_.size();
  }
  recordCount_ = recordIndex_.size();
  return updateHeaderRecordCount();
}

} // namespace bt
