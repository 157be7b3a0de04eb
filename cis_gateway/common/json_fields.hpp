#pragma once
#include <string>
#include <vector>

namespace cis {

// Flat key extraction over a JSON text. Keys are matched by their quoted name
// anywhere in the text, so callers hand in the narrowest object they have.
bool json_number(const std::string& s, const std::string& key, double& out);
bool json_int(const std::string& s, const std::string& key, int& out);
bool json_bool(const std::string& s, const std::string& key, bool& out);
bool json_string(const std::string& s, const std::string& key, std::string& out);

// Splits the array stored under `key` into its top-level {...} members.
bool json_objects(const std::string& s, const std::string& key, std::vector<std::string>& out);

std::string json_escape(const std::string& s);
// Shortest text for a reading ("1.23", "26000"); "null" when not finite.
std::string format_number(double v);

// Appends "key":value pairs to a single JSON object.
class JsonWriter {
  std::string buf_;
  bool first_ = true;
  void key(const char* k);
public:
  JsonWriter& num(const char* k, double v);
  JsonWriter& integer(const char* k, long long v);
  JsonWriter& boolean(const char* k, bool v);
  JsonWriter& str(const char* k, const std::string& v);
  JsonWriter& raw(const char* k, const std::string& json);
  std::string done() const { return "{" + buf_ + "}"; }
};

} // namespace cis
