#include "file_lines/report_writer.hpp"
#include "file_lines/path_utils.hpp"
#include <filesystem>
#include <fstream>

namespace fl {

bool write_report_dir(const std::string& report_root,
                      const std::string& slug,
                      const std::string& run_json_str,
                      std::string* err_out) {
  const std::filesystem::path out_file =
      std::filesystem::path(report_root) / slug / "run.json";

  if (!ensure_parent_dirs(out_file)) {
    if (err_out) *err_out = "cannot create " + out_file.parent_path().string();
    return false;
  }

  std::ofstream rj(out_file, std::ios::binary | std::ios::trunc);
  if (!rj) {
    if (err_out) *err_out = "failed to open " + out_file.string();
    return false;
  }
  rj.write(run_json_str.data(),
           static_cast<std::streamsize>(run_json_str.size()));
  rj.close();
  if (!rj) {
    if (err_out) *err_out = "failed to write " + out_file.string();
    return false;
  }
  return true;
}

}
