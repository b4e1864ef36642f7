#pragma once

#include <string>
#include <vector>

namespace keysync::db::model {

/*
  One row of the config table.

  Keys are unique by convention only; the table has no constraint.
*/
struct ConfigRecord {
  std::string key;
  std::string value;
};

// Rows seeded into a fresh store, in insertion order.
inline const std::vector<ConfigRecord>& DefaultConfig() {
  static const std::vector<ConfigRecord> defaults = {
      {"prompt_update_check", "1"},
      {"update_check", "0"},
      {"startup_minimized", "0"},
      {"startup_autoconnect", "0"},
      {"smart_layers_enabled", "1"},
      {"api_enabled", "0"},
      {"api_port", "50051"},
  };
  return defaults;
}

} // namespace keysync::db::model
