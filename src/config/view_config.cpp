#include "file_lines/view_config.hpp"
#include "file_lines/errors.hpp"

#include <simdjson.h>

namespace fl {

static ViewConfig parse_padded(const simdjson::padded_string& json) {
  ViewConfig cfg;
  simdjson::ondemand::parser parser;

  try {
    simdjson::ondemand::document doc = parser.iterate(json);
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      std::string_view key = field.unescaped_key();
      simdjson::ondemand::value v = field.value();

      if (key == "path") {
        std::string_view s = v.get_string();
        cfg.path.assign(s.data(), s.size());
      } else if (key == "encoding") {
        bool is_null = v.is_null();
        if (is_null) {
          cfg.encoding.reset();
        } else {
          std::string_view s = v.get_string();
          cfg.encoding = std::string(s);
        }
      } else if (key == "compressed") {
        cfg.compressed = bool(v.get_bool());
      } else if (key == "chunk_bytes") {
        cfg.chunk_bytes = static_cast<std::size_t>(std::uint64_t(v.get_uint64()));
      } else if (key == "max_line_bytes") {
        cfg.max_line_bytes = static_cast<std::size_t>(std::uint64_t(v.get_uint64()));
      }
      // unknown keys are ignored
    }
  } catch (const simdjson::simdjson_error& e) {
    throw ConfigError(std::string("invalid view config: ") + e.what());
  }

  if (cfg.path.empty()) throw ConfigError("invalid view config: \"path\" is required");
  if (cfg.chunk_bytes == 0) throw ConfigError("invalid view config: \"chunk_bytes\" must be > 0");
  if (cfg.encoding && cfg.encoding->empty()) cfg.encoding.reset();
  return cfg;
}

ViewConfig parse_view_config(std::string_view json) {
  simdjson::padded_string padded(json);
  return parse_padded(padded);
}

ViewConfig load_view_config(const std::string& json_path) {
  simdjson::padded_string json;
  auto err = simdjson::padded_string::load(json_path).get(json);
  if (err) {
    throw ConfigError("cannot read view config " + json_path + ": " + simdjson::error_message(err));
  }
  return parse_padded(json);
}

}
