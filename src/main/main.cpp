#include "chunkstream/artifact_writer.hpp"
#include "chunkstream/chunk_reader.hpp"
#include "chunkstream/metrics.hpp"
#include "chunkstream/path_utils.hpp"
#include "chunkstream/run_config.hpp"
#include "chunkstream/run_json.hpp"
#include "chunkstream/text_decoder.hpp"
#include "chunkstream/tokenizer.hpp"

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 2;
constexpr int kExitFailed = 3;

struct Cli {
  cs::RunConfig cfg;
  bool chunks_only = false;
  std::vector<std::string> inputs;
};

void print_usage() {
  std::cout <<
    "Usage: chunkstream [--config=FILE] [--delimiter=STR] [--read-buffer=N]\n"
    "                   [--threshold=N] [--encoding=utf8|latin1|ascii]\n"
    "                   [--strip-cr] [--max-token=N] [--summary=PATH]\n"
    "                   [--print-tokens] [--chunks] <file>...\n"
    "Delimiter escapes: \\n \\r \\t \\0 \\\\ (default \\n)\n";
}

// Returns -1 to continue, otherwise an exit code.
int parse_cli(int argc, char** argv, Cli& c) {
  // --config is applied first so that explicit flags override the file.
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    if (a.rfind("--config=", 0) == 0) {
      std::string err;
      if (!cs::load_run_config(a.substr(9), c.cfg, &err)) {
        std::cerr << "[config] " << err << "\n";
        return kExitUsage;
      }
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_n = [&](const char* pfx, std::size_t* out){
      if (a.rfind(pfx, 0) != 0) return false;
      const std::string num = a.substr(std::string(pfx).size());
      // stoull would accept "-1" and wrap it; only plain digits are sizes.
      if (num.empty() || num.find_first_not_of("0123456789") != std::string::npos)
        throw std::invalid_argument(num);
      *out = static_cast<std::size_t>(std::stoull(num));
      return true;
    };
    std::string val;
    try {
      if (a.rfind("--config=", 0) == 0) continue;
      if (eat_n("--read-buffer=", &c.cfg.tokenize.reader.read_buffer_size)) continue;
      if (eat_n("--threshold=", &c.cfg.tokenize.reader.chunk_size_threshold)) continue;
      if (eat_n("--max-token=", &c.cfg.tokenize.max_token_bytes)) continue;
    } catch (const std::exception&) {
      std::cerr << "[config] not a number: " << a << "\n";
      return kExitUsage;
    }
    if (eat("--delimiter=", &val)) {
      std::string err;
      if (!cs::unescape_delimiter(val, c.cfg.delimiter, &err)) {
        std::cerr << "[config] " << err << "\n";
        return kExitUsage;
      }
      continue;
    }
    if (eat("--encoding=", &val)) {
      auto enc = cs::parse_encoding(val);
      if (!enc) { std::cerr << "[config] unknown encoding: " << val << "\n"; return kExitUsage; }
      c.cfg.tokenize.reader.encoding = *enc;
      continue;
    }
    if (eat("--summary=", &c.cfg.summary_path)) continue;
    if (a == "--strip-cr")     { c.cfg.tokenize.strip_cr = true; continue; }
    if (a == "--print-tokens") { c.cfg.print_tokens = true; continue; }
    if (a == "--chunks")       { c.chunks_only = true; continue; }
    if (a == "-h" || a == "--help") { print_usage(); return kExitOk; }
    if (a.rfind("--", 0) == 0) {
      std::cerr << "[config] unknown option: " << a << "\n";
      return kExitUsage;
    }
    c.inputs.push_back(a);
  }

  std::string err;
  if (!cs::validate(c.cfg, &err)) { std::cerr << "[config] " << err << "\n"; return kExitUsage; }
  if (c.inputs.empty()) { print_usage(); return kExitUsage; }
  return -1;
}

void fill_outcome(cs::RunSummary& s, const std::optional<cs::ReadError>& err) {
  s.ok = !err.has_value();
  if (err) {
    s.error_kind = cs::to_string(err->kind);
    s.error = err->message;
  }
}

int scan_one_file(const std::string& filepath, const Cli& cli, cs::RunSummary& summary) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();
  const cs::RunConfig& cfg = cli.cfg;

  cs::MetricsRegistry metrics;
  std::optional<cs::ReadError> result;

  if (cli.chunks_only) {
    cs::ChunkReader reader(filepath, cfg.tokenize.reader);
    reader.attach_metrics(&metrics);
    reader.process(
      [&](std::string_view text, bool is_final) {
        if (cfg.print_tokens) {
          std::cout << "[chunk] #" << metrics.chunks() << " bytes=" << text.size()
                    << (is_final ? " final" : "") << "\n";
        }
        return cs::ChunkResult::Continue();
      },
      [&](const std::optional<cs::ReadError>& err) { result = err; });
  } else {
    cs::Tokenizer tok(cfg.delimiter, cfg.tokenize);
    tok.attach_metrics(&metrics);
    tok.tokenize(
      filepath,
      [&](std::string_view token) {
        if (cfg.print_tokens) { std::cout.write(token.data(), static_cast<std::streamsize>(token.size())); std::cout << '\n'; }
        return true;
      },
      [&](const std::optional<cs::ReadError>& err) { result = err; });
  }

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  const cs::RunStats stats = metrics.snapshot(wall_ms);

  summary = cs::RunSummary{};
  fill_outcome(summary, result);
  summary.tokens = stats.tokens;
  summary.empty_tokens = stats.empty_tokens;
  summary.longest_token = stats.longest_token;
  summary.chunks = stats.chunks;
  summary.bytes = stats.bytes;
  summary.wall_time_ms = stats.wall_time_ms;
  summary.throughput_mb_s = stats.throughput_mb_s;
  summary.tokens_per_sec = stats.tokens_per_sec;
  for (const auto& st : stats.stages) summary.stage_times.emplace_back(st.name, st.duration_us);
  summary.filename = filepath;
  summary.file_size = cs::file_size_or_zero(filepath);
  summary.mode = cli.chunks_only ? "chunks" : "tokenize";
  summary.delimiter = cli.chunks_only ? std::string() : cfg.delimiter;
  summary.encoding = cs::encoding_name(cfg.tokenize.reader.encoding);
  summary.read_buffer_size = cfg.tokenize.reader.read_buffer_size;
  summary.chunk_size_threshold = cfg.tokenize.reader.chunk_size_threshold;

  const char* tag = cli.chunks_only ? "[chunks]" : "[tokenize]";
  if (result) {
    std::cerr << tag << " " << cs::to_string(result->kind) << " error: " << result->message << "\n";
    return kExitFailed;
  }
  std::cerr << tag << " ok: " << filepath
            << " tokens=" << stats.tokens
            << " chunks=" << stats.chunks
            << " bytes=" << stats.bytes
            << " delimiter=\"" << cs::printable(cfg.delimiter) << "\""
            << " time=" << wall_ms << "ms\n";
  return kExitOk;
}

}

int main(int argc, char** argv) {
  Cli cli;
  int rc = parse_cli(argc, argv, cli);
  if (rc >= 0) return rc;

  rc = kExitOk;
  cs::RunSummary summary;
  for (const auto& f : cli.inputs) {
    if (scan_one_file(f, cli, summary) != kExitOk) rc = kExitFailed;

    // With several inputs the summary file ends up describing the last one.
    if (!cli.cfg.summary_path.empty()) {
      std::string err;
      if (!cs::write_summary(cli.cfg.summary_path, cs::RunJsonWriter::to_json(summary), &err)) {
        std::cerr << "[summary] " << err << "\n";
        rc = kExitFailed;
      }
    }
  }
  return rc;
}
