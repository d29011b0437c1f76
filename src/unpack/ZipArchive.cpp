module;
#include <zlib.h>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

module protoDotCpp.unpack.ZipArchive;

#include "alias.hpp"

namespace protoDotCpp {
namespace {
constexpr std::uint32_t localHeaderSignature = 0x04034b50;
constexpr std::uint32_t centralHeaderSignature = 0x02014b50;
constexpr std::uint32_t endOfCentralDirSignature = 0x06054b50;

constexpr std::size_t localHeaderSize = 30;
constexpr std::size_t centralHeaderSize = 46;
constexpr std::size_t endOfCentralDirSize = 22;
constexpr std::size_t maxCommentSize = 0xffff;

constexpr std::uint16_t methodStored = 0;
constexpr std::uint16_t methodDeflated = 8;
}  // namespace

ZipArchive::ZipArchive(const Path &path) : path(path) {
  is.open(path, std::ios::binary | std::ios::ate);
  if (!is) throw ArchiveError(path, "cannot open file");
  fileSize = static_cast<std::uint64_t>(is.tellg());
  readCentralDirectory();
}

std::string ZipArchive::readAt(std::uint64_t offset,
                               std::uint64_t count) const {
  if (offset > fileSize || count > fileSize - offset)
    throw ArchiveError(path, "truncated");
  std::string buffer(count, '\0');
  is.clear();
  is.seekg(static_cast<std::streamoff>(offset));
  is.read(buffer.data(), static_cast<std::streamsize>(count));
  if (static_cast<std::uint64_t>(is.gcount()) != count)
    throw ArchiveError(path, "i/o error");
  return buffer;
}

std::uint16_t ZipArchive::readU16(const std::string &buffer,
                                  std::size_t offset) const {
  if (offset + 2 > buffer.size()) throw ArchiveError(path, "truncated");
  const auto *p =
      reinterpret_cast<const unsigned char *>(buffer.data()) + offset;
  return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t ZipArchive::readU32(const std::string &buffer,
                                  std::size_t offset) const {
  return static_cast<std::uint32_t>(readU16(buffer, offset)) |
         (static_cast<std::uint32_t>(readU16(buffer, offset + 2)) << 16);
}

void ZipArchive::readCentralDirectory() {
  if (fileSize < endOfCentralDirSize)
    throw ArchiveError(path, "not a zip file");
  // the record sits at the end, followed by a comment of at most 64k
  const auto tailSize = std::min<std::uint64_t>(
      fileSize, endOfCentralDirSize + maxCommentSize);
  const auto tail = readAt(fileSize - tailSize, tailSize);
  std::size_t eocd = tail.size() - endOfCentralDirSize + 1;
  while (eocd-- > 0) {
    if (readU32(tail, eocd) == endOfCentralDirSignature) break;
  }
  if (eocd == static_cast<std::size_t>(-1))
    throw ArchiveError(path, "end of central directory not found");

  const std::uint16_t count = readU16(tail, eocd + 10);
  const std::uint32_t cdSize = readU32(tail, eocd + 12);
  const std::uint32_t cdOffset = readU32(tail, eocd + 16);
  if (count == 0xffff || cdSize == 0xffffffff || cdOffset == 0xffffffff)
    throw ArchiveError(path, "zip64 archives are not supported");

  const auto centralDir = readAt(cdOffset, cdSize);
  entries.reserve(count);
  std::size_t offset = 0;
  for (std::uint16_t i = 0; i < count; i++) {
    if (readU32(centralDir, offset) != centralHeaderSignature)
      throw ArchiveError(path, "corrupt central directory");
    Entry entry;
    entry.method = readU16(centralDir, offset + 10);
    entry.crc = readU32(centralDir, offset + 16);
    entry.compressedSize = readU32(centralDir, offset + 20);
    entry.size = readU32(centralDir, offset + 24);
    const std::uint16_t nameLen = readU16(centralDir, offset + 28);
    const std::uint16_t extraLen = readU16(centralDir, offset + 30);
    const std::uint16_t commentLen = readU16(centralDir, offset + 32);
    entry.localHeaderOffset = readU32(centralDir, offset + 42);
    const std::size_t nameOffset = offset + centralHeaderSize;
    if (nameOffset + nameLen > centralDir.size())
      throw ArchiveError(path, "truncated");
    entry.name = centralDir.substr(nameOffset, nameLen);
    entries.emplace_back(std::move(entry));
    offset = nameOffset + nameLen + extraLen + commentLen;
  }
}

std::string ZipArchive::read(const Entry &entry) const {
  const auto header = readAt(entry.localHeaderOffset, localHeaderSize);
  if (readU32(header, 0) != localHeaderSignature)
    throw ArchiveError(path, "corrupt local header of " + entry.name);
  const auto begin = entry.localHeaderOffset + localHeaderSize +
                     readU16(header, 26) + readU16(header, 28);
  if (begin > fileSize || entry.compressedSize > fileSize - begin)
    throw ArchiveError(path, "truncated data of " + entry.name);
  const auto raw = readAt(begin, entry.compressedSize);

  std::string content;
  switch (entry.method) {
    case methodStored:
      content = raw;
      break;
    case methodDeflated:
      content = inflate(entry, raw);
      break;
    default:
      throw ArchiveError(path, "unsupported compression method " +
                                   std::to_string(entry.method) + " of " +
                                   entry.name);
  }

  const auto crc =
      crc32(crc32(0L, Z_NULL, 0),
            reinterpret_cast<const Bytef *>(content.data()),
            static_cast<uInt>(content.size()));
  if (content.size() != entry.size || crc != entry.crc)
    throw ArchiveError(path, "checksum mismatch of " + entry.name);
  return content;
}

std::string ZipArchive::inflate(const Entry &entry,
                                const std::string &raw) const {
  std::string content(entry.size, '\0');
  z_stream zs{};
  if (inflateInit2(&zs, -MAX_WBITS) != Z_OK)
    throw ArchiveError(path, "cannot initialize zlib");
  zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(raw.data()));
  zs.avail_in = static_cast<uInt>(raw.size());
  zs.next_out = reinterpret_cast<Bytef *>(content.data());
  zs.avail_out = static_cast<uInt>(content.size());
  const int ret = ::inflate(&zs, Z_FINISH);
  const auto written = zs.total_out;
  inflateEnd(&zs);
  if (ret != Z_STREAM_END || written != entry.size)
    throw ArchiveError(path, "corrupt deflate stream of " + entry.name);
  return content;
}
}  // namespace protoDotCpp
