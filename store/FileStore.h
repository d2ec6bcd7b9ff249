#pragma once

#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace bt {

/**
 * FileStore manages an append-only log of records in a single file.
 *
 * File format:
 * - Header: magic, version, recordCount, headerSize
 * - Record data: [size (8 bytes)][data (size bytes)]*
 *
 * The header count is rewritten after every append. On mount the file is
 * scanned, and a torn trailing record left by a crash mid-append is cut off,
 * so the log always holds whole records only.
 */
class FileStore : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  FileStore();
  ~FileStore() override;

  FileStore(const FileStore &) = delete;
  FileStore &operator=(const FileStore &) = delete;

  /**
   * Create a new, empty record file
   * @param filepath Path to a file that must not exist yet
   */
  Roe<void> init(const std::string &filepath);

  /**
   * Mount an existing record file
   * @param filepath Path to existing file
   */
  Roe<void> mount(const std::string &filepath);

  /**
   * Mount the file if it exists, create it otherwise
   */
  Roe<void> openOrInit(const std::string &filepath);

  Roe<std::string> readRecord(uint64_t index) const;
  Roe<uint64_t> appendRecord(const std::string &record);

  /**
   * Drop every record at and after index
   */
  Roe<void> rewindTo(uint64_t index);

  uint64_t getRecordCount() const { return recordCount_; }

  size_t getCurrentSize() const { return currentSize_; }

  const std::string &getFilePath() const { return filepath_; }

  bool isOpen() const;

  void close();

private:
  struct FileHeader {
    static constexpr uint32_t MAGIC = 0x4254524C; // "BTRL" (tracker record log)
    static constexpr uint16_t CURRENT_VERSION = 1;

    uint32_t magic{ MAGIC };
    uint16_t version{ CURRENT_VERSION };
    uint16_t reserved{ 0 };
    uint64_t recordCount{ 0 };
    uint64_t headerSize{ sizeof(FileHeader) };
  };

  struct RecordEntry {
    int64_t offset{ 0 }; // Offset to the size prefix in the file
    uint64_t size{ 0 };  // Size of the record data (excluding size prefix)
  };

  static constexpr size_t HEADER_SIZE = sizeof(FileHeader);
  static constexpr size_t SIZE_PREFIX_BYTES = sizeof(uint64_t);

  void reset(const std::string &filepath);
  Roe<void> open();
  Roe<void> reopen();
  Roe<void> writeHeader();
  Roe<void> readHeader();
  Roe<void> updateHeaderRecordCount();
  Roe<void> buildRecordIndex();

  std::string filepath_;
  size_t currentSize_{ 0 };
  mutable std::fstream file_;
  FileHeader header_;
  bool headerValid_{ false };

  uint64_t recordCount_{ 0 };
  std::vector<RecordEntry> recordIndex_;
};

} // namespace bt
