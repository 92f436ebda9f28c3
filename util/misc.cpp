#include "util/misc.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::function<bool()> setBool(bool* var) {
  return [var]() {
    *var = true;
    return true;
  };
}

std::function<bool(kj::StringPtr)> setString(std::string* var) {
  return [var](kj::StringPtr p) {
    *var = p.cStr();
    return true;
  };
}

std::function<bool(kj::StringPtr)> setInt(int32_t* var) {
  return [var](kj::StringPtr p) {
    char* end = nullptr;
    errno = 0;
    long long value = strtoll(p.cStr(), &end, 10);  // NOLINT
    if (p.size() == 0 || *end != '\0' || errno == ERANGE ||
        value < INT32_MIN || value > INT32_MAX) {
      return false;
    }
    *var = static_cast<int32_t>(value);
    return true;
  };
}

std::function<bool(kj::StringPtr)> appendString(
    std::vector<std::string>* var) {
  return [var](kj::StringPtr p) {
    var->emplace_back(p.cStr());
    return true;
  };
}

}  // namespace util
