module;
#include <boost/describe.hpp>
#include <boost/json.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <type_traits>
#include <vector>

export module protoDotCpp.cache.FileCache;

#include "alias.hpp"

namespace protoDotCpp {
// Last known state of one tracked input file.
export struct Fingerprint {
  Path path;
  bool exists = false;
  std::int64_t lastModified = 0;

  static Fingerprint of(const Path &path);

  bool operator==(const Fingerprint &) const = default;

 private:
  BOOST_DESCRIBE_CLASS(Fingerprint, (), (path, exists, lastModified), (), ())
};

export struct CacheRecord {
  std::vector<Fingerprint> inputs;
  std::vector<Path> outputs;

 private:
  BOOST_DESCRIBE_CLASS(CacheRecord, (), (inputs, outputs), (), ())
};

// Remembers the outputs computed from a set of input files. The stored
// outputs are reused while no input is added, removed or touched and every
// output still exists. A store that cannot be read or written only costs a
// recompute.
export class FileCache {
 public:
  using Compute = std::function<std::set<Path>(const std::set<Path> &)>;

 private:
  const Path cacheDir;

  std::optional<CacheRecord> load() const;
  void store(const CacheRecord &record) const;

 public:
  explicit FileCache(const Path &cacheDir) : cacheDir(cacheDir) {}

  Path getStorePath() const { return cacheDir / "cache.json"; }

  static std::vector<Fingerprint> fingerprint(const std::set<Path> &inputs);

  static bool isFresh(const CacheRecord &record,
                      const std::vector<Fingerprint> &current);

  std::set<Path> evaluate(const std::set<Path> &inputs,
                          const Compute &compute) const;

  void clear() const;
};
}  // namespace protoDotCpp

namespace boost {
namespace json {
template <>
struct is_described_class<protoDotCpp::Fingerprint> : std::true_type {};
template <>
struct is_described_class<protoDotCpp::CacheRecord> : std::true_type {};
}  // namespace json
}  // namespace boost
