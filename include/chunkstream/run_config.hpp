#pragma once
#include <string>
#include <string_view>

#include "chunkstream/tokenizer.hpp"

namespace cs {

// Settings of one command-line run. Defaults match the library defaults
// except the delimiter, which defaults to a newline.
struct RunConfig {
  std::string     delimiter = "\n";
  TokenizeOptions tokenize;
  std::string     summary_path;      // empty: no run summary
  bool            print_tokens = false;
};

// Overlays keys from a JSON object file onto `cfg`:
//   read_buffer_size, chunk_size_threshold, max_token_bytes  (unsigned integers)
//   encoding, delimiter, summary                              (strings)
//   strip_cr, print_tokens                                    (booleans)
// Unknown keys, wrong types and invalid values are errors. `cfg` is left
// untouched when false is returned.
bool load_run_config(const std::string& path, RunConfig& cfg, std::string* err_out = nullptr);

// Expands \n \r \t \0 and \\ in a command-line delimiter.
bool unescape_delimiter(std::string_view in, std::string& out, std::string* err_out = nullptr);

// Checks the invariants the reader and tokenizer expect.
bool validate(const RunConfig& cfg, std::string* err_out = nullptr);

}
