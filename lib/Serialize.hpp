#ifndef BT_TRACKER_SERIALIZE_HPP
#define BT_TRACKER_SERIALIZE_HPP

#include <cstdint>
#include <cstring>
#include <istream>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace bt {

namespace detail {

template <typename T> static constexpr bool is_pointer_v = std::is_pointer_v<T>;

// Cache endianness detection result - initialized once on first use
inline bool isLittleEndian() {
  static const bool cached = []() {
    const uint16_t test = 0x0102;
    return reinterpret_cast<const uint8_t *>(&test)[0] == 0x02;
  }();
  return cached;
}

template <typename T> T swapBytes(T value) {
  uint8_t *bytes = reinterpret_cast<uint8_t *>(&value);
  constexpr size_t size = sizeof(T);
  for (size_t i = 0; i < size / 2; ++i) {
    std::swap(bytes[i], bytes[size - 1 - i]);
  }
  return value;
}

// Convert to/from big endian (network byte order)
template <typename T> inline T toBigEndian(T value) {
  static_assert(std::is_same_v<T, uint16_t> || std::is_same_v<T, uint32_t> ||
                    std::is_same_v<T, uint64_t>,
                "toBigEndian only supports uint16_t, uint32_t, and uint64_t");
  return isLittleEndian() ? swapBytes(value) : value;
}

template <typename T> inline T fromBigEndian(T value) { return toBigEndian(value); }

} // namespace detail

/**
 * OutputArchive for serialization (writing)
 * Supports the & operator pattern used by custom structs
 *
 * Usage:
 *   std::ostringstream oss;
 *   OutputArchive ar(oss);
 *   ar & myValue;
 *   std::string data = oss.str();
 */
class OutputArchive {
public:
  explicit OutputArchive(std::ostream &os) : os_(os) {}

  void write(uint8_t value) {
    os_.write(reinterpret_cast<const char *>(&value), sizeof(value));
  }

  void write(uint16_t value) { writeBig(value); }
  void write(uint32_t value) { writeBig(value); }
  void write(uint64_t value) { writeBig(value); }

  void write(const std::string &value) {
    uint64_t size = value.size();
    write(size);
    if (size > 0) {
      os_.write(value.data(), size);
    }
  }

  /**
   * Write raw bytes without a length prefix (fixed width fields)
   */
  void writeRaw(const std::string &value) {
    os_.write(value.data(), value.size());
  }

  template <typename T> void write(const std::vector<T> &value) {
    static_assert(!detail::is_pointer_v<T>, "Archive does not support pointers");
    uint64_t size = value.size();
    write(size);
    for (const auto &item : value) {
      (*this) & item;
    }
  }

  OutputArchive &operator&(uint8_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(uint16_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(uint32_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(uint64_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(const std::string &value) {
    write(value);
    return *this;
  }

  template <typename T> OutputArchive &operator&(const std::vector<T> &value) {
    write(value);
    return *this;
  }

  // Custom types: serialize() is non-const but only reads while writing
  template <typename T>
  auto operator&(const T &value)
      -> decltype(std::declval<T &>().template serialize<OutputArchive>(
                      std::declval<OutputArchive &>()),
                  *this) {
    const_cast<T &>(value).template serialize<OutputArchive>(*this);
    return *this;
  }

private:
  template <typename U> void writeBig(U value) {
    value = detail::toBigEndian(value);
    os_.write(reinterpret_cast<const char *>(&value), sizeof(value));
  }

  std::ostream &os_;
};

/**
 * InputArchive for deserialization (reading)
 *
 * Usage:
 *   std::istringstream iss(data);
 *   InputArchive ar(iss);
 *   ar & myValue;
 *   if (ar.failed()) { handle error }
 */
class InputArchive {
public:
  // Upper bound on any single length prefix, guards against corrupt input
  static constexpr uint64_t MAX_LENGTH = 64ull * 1024 * 1024;

  explicit InputArchive(std::istream &is) : is_(is) {}

  bool read(uint8_t &value) {
    if (!is_.read(reinterpret_cast<char *>(&value), sizeof(value))) {
      failed_ = true;
      return false;
    }
    return true;
  }

  bool read(uint16_t &value) { return readBig(value); }
  bool read(uint32_t &value) { return readBig(value); }
  bool read(uint64_t &value) { return readBig(value); }

  bool read(std::string &value) {
    uint64_t size = 0;
    if (!read(size)) {
      return false;
    }
    if (size > MAX_LENGTH) {
      failed_ = true;
      return false;
    }
    return readRaw(value, size);
  }

  /**
   * Read exactly size raw bytes (fixed width fields)
   */
  bool readRaw(std::string &value, uint64_t size) {
    value.assign(size, '\0');
    if (size > 0 && !is_.read(&value[0], size)) {
      failed_ = true;
      return false;
    }
    return true;
  }

  template <typename T> bool read(std::vector<T> &value) {
    uint64_t size = 0;
    if (!read(size)) {
      return false;
    }
    if (size > MAX_LENGTH) {
      failed_ = true;
      return false;
    }
    value.clear();
    for (uint64_t i = 0; i < size; ++i) {
      T item;
      (*this) & item;
      if (failed_) {
        return false;
      }
      value.push_back(std::move(item));
    }
    return true;
  }

  InputArchive &operator&(uint8_t &value) {
    read(value);
    return *this;
  }

  InputArchive &operator&(uint16_t &value) {
    read(value);
    return *this;
  }

  InputArchive &operator&(uint32_t &value) {
    read(value);
    return *this;
  }

  InputArchive &operator&(uint64_t &value) {
    read(value);
    return *this;
  }

  InputArchive &operator&(std::string &value) {
    read(value);
    return *this;
  }

  template <typename T> InputArchive &operator&(std::vector<T> &value) {
    read(value);
    return *this;
  }

  template <typename T>
  auto operator&(T &value)
      -> decltype(value.template serialize<InputArchive>(*this), *this) {
    value.template serialize<InputArchive>(*this);
    return *this;
  }

  bool failed() const { return failed_; }

  /**
   * True when every byte of the underlying stream has been consumed
   */
  bool atEnd() const { return is_.peek() == std::char_traits<char>::eof(); }

private:
  template <typename U> bool readBig(U &value) {
    if (!is_.read(reinterpret_cast<char *>(&value), sizeof(value))) {
      failed_ = true;
      return false;
    }
    value = detail::fromBigEndian(value);
    return true;
  }

  std::istream &is_;
  bool failed_ = false;
};

} // namespace bt

#endif // BT_TRACKER_SERIALIZE_HPP
