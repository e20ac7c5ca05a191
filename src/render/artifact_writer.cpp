#include "chunkstream/artifact_writer.hpp"
#include "chunkstream/path_utils.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>

namespace cs {

bool write_summary(const std::string& path,
                   const std::string& run_json_str,
                   std::string* err_out) {
  const std::filesystem::path out(path);
  if (!ensure_parent_dirs(out)) {
    if (err_out) *err_out = "cannot create parent directory of " + path;
    return false;
  }

  std::filesystem::path tmp = out;
  tmp += ".tmp";
  {
    std::ofstream rj(tmp, std::ios::binary | std::ios::trunc);
    if (!rj) {
      if (err_out) *err_out = "failed to open " + tmp.string();
      return false;
    }
    rj.write(run_json_str.data(),
             static_cast<std::streamsize>(run_json_str.size()));
    rj.flush();
    if (!rj) {
      if (err_out) *err_out = "failed to write " + tmp.string();
      return false;
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, out, ec);
  if (ec) {
    if (err_out) *err_out = "failed to move summary into place: " + ec.message();
    std::filesystem::remove(tmp, ec);
    return false;
  }
  return true;
}

}
