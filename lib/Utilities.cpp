#include "Utilities.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sodium.h>
#include <sstream>
#include <stdexcept>

namespace bt {
namespace utl {

// Initialize libsodium (safe to call multiple times)
namespace {
struct SodiumInitializer {
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};
static SodiumInitializer sodium_initializer;
} // namespace

int64_t getCurrentTime() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

Roe<nlohmann::json> loadJsonFile(const std::string &configPath) {
  if (!std::filesystem::exists(configPath)) {
    return Error(E_CONFIG, "Configuration file not found: " + configPath);
  }

  auto content = readFile(configPath);
  if (!content) {
    return content.error();
  }
  return parseJson(content.value());
}

Roe<nlohmann::json> parseJson(const std::string &text) {
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(E_CONFIG, "Failed to parse JSON: " + std::string(e.what()));
  }
}

std::string hexEncode(const std::string &data) {
  std::stringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

static int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string hexDecode(const std::string &hex) {
  size_t start = 0;
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    start = 2;
  }
  if ((hex.size() - start) % 2 != 0) {
    return {};
  }
  std::string out;
  out.reserve((hex.size() - start) / 2);
  for (size_t i = start; i < hex.size(); i += 2) {
    int hi = hexValue(hex[i]);
    int lo = hexValue(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return {};
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

std::string randomBytes(size_t size) {
  std::string out(size, '\0');
  randombytes_buf(out.data(), out.size());
  return out;
}

void secureZero(std::string &data) {
  if (!data.empty()) {
    sodium_memzero(data.data(), data.size());
  }
}

Roe<void> writeToNewFile(const std::string &filePath, const std::string &content) {
  if (std::filesystem::exists(filePath)) {
    return Error(E_STORAGE, "File already exists: " + filePath);
  }

  std::filesystem::path path(filePath);
  std::filesystem::path parentDir = path.parent_path();
  if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
    std::error_code ec;
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(E_STORAGE, "Failed to create parent directories for " +
                                  filePath + ": " + ec.message());
    }
  }

  std::ofstream file(filePath);
  if (!file.is_open()) {
    return Error(E_STORAGE, "Failed to open file for writing: " + filePath);
  }

  file << content;
  file.close();

  if (!file.good()) {
    return Error(E_STORAGE, "Failed to write content to file: " + filePath);
  }

  return {};
}

Roe<void> writeFileAtomic(const std::string &filePath, const std::string &content) {
  std::string tempPath = filePath + ".tmp";
  {
    std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
    if (!file) {
      return Error(E_STORAGE, "Failed to open file for writing: " + tempPath);
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file.good()) {
      return Error(E_STORAGE, "Failed to write file: " + tempPath);
    }
  }

  std::error_code ec;
  std::filesystem::rename(tempPath, filePath, ec);
  if (ec) {
    return Error(E_STORAGE, "Failed to rename " + tempPath + ": " + ec.message());
  }
  return {};
}

Roe<std::string> readFile(const std::string &filePath) {
  std::ifstream file(filePath, std::ios::binary);
  if (!file.is_open()) {
    return Error(E_STORAGE, "Failed to open file: " + filePath);
  }
  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  if (file.bad()) {
    return Error(E_STORAGE, "Failed to read file: " + filePath);
  }
  return content;
}

} // namespace utl
} // namespace bt
