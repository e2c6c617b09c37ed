#pragma once
#include <string>

namespace fl {

// Writes <report_root>/<slug>/run.json, creating directories as needed.
// Returns false and fills err_out on failure.
bool write_report_dir(const std::string& report_root,
                      const std::string& slug,
                      const std::string& run_json_str,
                      std::string* err_out = nullptr);

}
