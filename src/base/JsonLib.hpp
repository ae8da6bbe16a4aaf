#ifndef __TD_JSON_LIB__
#define __TD_JSON_LIB__

#include "Headers.hpp"
#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

namespace td {
/**
 * @throws std::runtime_error if the file cannot be read or parsed.
 */
inline json readJsonFile(const string& path) {
  ifstream in(path);
  if (!in) {
    throw std::runtime_error("Could not open " + path);
  }
  try {
    return json::parse(in);
  } catch (const json::parse_error& pe) {
    throw std::runtime_error("Invalid JSON in " + path + ": " + pe.what());
  }
}

inline void writeJsonFile(const string& path, const json& j) {
  ofstream out(path, ios::trunc);
  if (!out) {
    throw std::runtime_error("Could not write " + path);
  }
  out << j.dump(2) << endl;
}
}  // namespace td

#endif  // __TD_JSON_LIB__
