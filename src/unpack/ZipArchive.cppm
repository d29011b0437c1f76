module;
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

export module protoDotCpp.unpack.ZipArchive;

#include "alias.hpp"
#include "macro.hpp"

namespace protoDotCpp {
// Read only view of a zip (or jar) file. The central directory is parsed on
// construction, entry contents are read and inflated on demand.
export class ZipArchive {
 public:
  DEF_EXCEPTION(ArchiveError, (const Path &path, const std::string &reason),
                "cannot read archive " + path.generic_string() + ": " +
                    reason);

  struct Entry {
    std::string name;
    std::uint16_t method = 0;
    std::uint32_t crc = 0;
    std::uint64_t compressedSize = 0;
    std::uint64_t size = 0;
    std::uint64_t localHeaderOffset = 0;

    bool isDirectory() const { return !name.empty() && name.back() == '/'; }
  };

 private:
  const Path path;
  mutable std::ifstream is;
  std::uint64_t fileSize = 0;
  std::vector<Entry> entries;

  std::string readAt(std::uint64_t offset, std::uint64_t count) const;
  std::uint16_t readU16(const std::string &buffer, std::size_t offset) const;
  std::uint32_t readU32(const std::string &buffer, std::size_t offset) const;
  void readCentralDirectory();
  std::string inflate(const Entry &entry, const std::string &raw) const;

 public:
  explicit ZipArchive(const Path &path);

  const std::vector<Entry> &getEntries() const { return entries; }

  std::string read(const Entry &entry) const;
};
}  // namespace protoDotCpp
