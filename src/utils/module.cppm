module;
#include <boost/describe.hpp>
#include <boost/json.hpp>
#include <boost/mp11.hpp>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <type_traits>
#include <utility>

export module protoDotCpp.utils;

#include "alias.hpp"
#include "macro.hpp"

namespace protoDotCpp {
export inline std::string readAsStr(const Path& path) {
  std::ifstream is(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(is), {});
}

export inline json::value parseJson(const Path& path) {
  const auto input = readAsStr(path);
  return json::parse(input);
}

export inline void writeJson(const Path& path, const json::value& value) {
  fs::create_directories(path.parent_path());
  std::ofstream os(path);
  os.exceptions(std::ofstream::failbit);
  os << value;
}

// Reads only the members present in the json object, the rest keep their
// default values.
export template <class T>
struct Merge : public T {};

export DEF_EXCEPTION(InvalidJsonMember, (const std::string& name),
                     "invalid json member: " + name);

export template <class T>
Merge<T> tag_invoke(const json::value_to_tag<Merge<T>>&,
                    const json::value& jv) {
  Merge<T> t;
  const auto& obj = jv.as_object();
  using namespace boost::describe;
  boost::mp11::mp_for_each<describe_members<T, mod_public>>([&](auto&& m) {
    auto& member = t.*m.pointer;
    using memberType = std::remove_reference_t<decltype(member)>;
    const auto* value = obj.if_contains(m.name);
    if (value) {
      auto cValue = json::try_value_to<memberType>(*value);
      if (!cValue) throw InvalidJsonMember(m.name);
      member = std::move(*cValue);
    }
  });
  return t;
}
}  // namespace protoDotCpp
