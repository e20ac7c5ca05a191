#pragma once
#include <string>

namespace cs {

// Writes a run summary JSON document to `path`, creating parent
// directories as needed. The file is written to `<path>.tmp` and renamed
// into place so readers never observe a partial summary.
bool write_summary(const std::string& path,
                   const std::string& run_json_str,
                   std::string* err_out = nullptr);

}
