module;
#include <boost/json.hpp>
#include <algorithm>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <ios>
#include <optional>
#include <set>
#include <system_error>
#include <vector>

module protoDotCpp.cache.FileCache;
import protoDotCpp.sys.logger;
import protoDotCpp.utils;

#include "alias.hpp"

namespace protoDotCpp {
Fingerprint Fingerprint::of(const Path &path) {
  std::error_code ec;
  const auto time = fs::last_write_time(path, ec);
  if (ec) return {path, false, 0};
  return {path, true,
          static_cast<std::int64_t>(time.time_since_epoch().count())};
}

std::vector<Fingerprint> FileCache::fingerprint(const std::set<Path> &inputs) {
  std::vector<Fingerprint> fingerprints;
  fingerprints.reserve(inputs.size());
  for (const auto &input : inputs)
    fingerprints.emplace_back(Fingerprint::of(input));
  return fingerprints;
}

bool FileCache::isFresh(const CacheRecord &record,
                        const std::vector<Fingerprint> &current) {
  auto recorded = record.inputs;
  std::sort(recorded.begin(), recorded.end(),
            [](const auto &a, const auto &b) { return a.path < b.path; });
  if (recorded != current) return false;
  return std::all_of(record.outputs.begin(), record.outputs.end(),
                     [](const Path &output) { return fs::exists(output); });
}

std::optional<CacheRecord> FileCache::load() const {
  const auto storePath = getStorePath();
  if (!fs::exists(storePath)) return std::nullopt;
  try {
    return json::value_to<CacheRecord>(parseJson(storePath));
  } catch (const std::exception &e) {
    logger::debug() << "Ignoring unreadable cache " << storePath << ": "
                    << e.what() << std::endl;
    return std::nullopt;
  }
}

void FileCache::store(const CacheRecord &record) const {
  const auto storePath = getStorePath();
  try {
    writeJson(storePath, json::value_from(record));
  } catch (const fs::filesystem_error &e) {
    logger::warn() << "Cannot write cache " << storePath << ": " << e.what()
                   << std::endl;
  } catch (const std::ios_base::failure &e) {
    logger::warn() << "Cannot write cache " << storePath << ": " << e.what()
                   << std::endl;
  }
}

std::set<Path> FileCache::evaluate(const std::set<Path> &inputs,
                                   const Compute &compute) const {
  auto current = fingerprint(inputs);
  const auto record = load();
  if (record.has_value() && isFresh(record.value(), current)) {
    logger::debug() << "Schemas are up to date" << std::endl;
    return std::set<Path>(record->outputs.begin(), record->outputs.end());
  }
  auto outputs = compute(inputs);
  store({std::move(current),
         std::vector<Path>(outputs.begin(), outputs.end())});
  return outputs;
}

void FileCache::clear() const { fs::remove_all(cacheDir); }
}  // namespace protoDotCpp
