#include "cli.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>

static const char* USAGE =
"docrefine refine <path> [--config file.json] [--out dir] [--format md|json] [--sqlite path] [--quiet|--verbose]\n"
"docrefine chunk <path> [--config file.json] [--out dir] [--format md|json|jsonl] [--strategy name]\n"
"                [--max N] [--min N] [--overlap N] [--sqlite path] [--enrich] [--model path] [--quiet|--verbose]\n"
"docrefine analyze <path> [--config file.json] [--strategy name] [--max N] [--min N] [--overlap N] [--quiet|--verbose]\n"
"\n"
"<path> is a file or a folder. Strategies: Auto, Sentence, Paragraph, Token, Semantic, Hierarchical.\n";

static int to_int(const std::string& flag, const std::string& v) {
  try {
    size_t used = 0;
    int n = std::stoi(v, &used);
    if (used != v.size()) throw std::invalid_argument(v);
    return n;
  } catch (const std::exception&) {
    std::cerr << "Bad number for " << flag << ": " << v << "\n";
    std::exit(1);
  }
}

Args parse_cli(int argc, char** argv) {
  Args a;
  if (argc < 2) { std::cerr << USAGE; std::exit(1); }
  a.mode = argv[1];
  if (a.mode == "-h" || a.mode == "--help") { std::cout << USAGE; std::exit(0); }
  if (a.mode != "refine" && a.mode != "chunk" && a.mode != "analyze") { std::cerr << USAGE; std::exit(1); }
  int i = 2;
  if (i >= argc) { std::cerr << USAGE; std::exit(1); }
  a.input_path = argv[i++];

  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&](std::string& dst){
      if (i >= argc) { std::cerr << "Missing value after " << f << "\n"; std::exit(1); }
      dst = argv[i++];
    };
    if (f == "--config") next(a.config_path);
    else if (f == "--out") next(a.out_dir);
    else if (f == "--format") next(a.format);
    else if (f == "--strategy") next(a.strategy);
    else if (f == "--sqlite") next(a.sqlite_path);
    else if (f == "--model") next(a.model_path);
    else if (f == "--max") { std::string v; next(v); a.max_chunk = to_int(f, v); }
    else if (f == "--min") { std::string v; next(v); a.min_chunk = to_int(f, v); }
    else if (f == "--overlap") { std::string v; next(v); a.overlap = to_int(f, v); }
    else if (f == "--enrich") a.enrich = true;
    else if (f == "--quiet") a.quiet = true;
    else if (f == "--verbose") a.verbose = true;
    else { std::cerr << "Unknown flag: " << f << "\n" << USAGE; std::exit(1); }
  }
  if (a.quiet && a.verbose) { std::cerr << "--quiet and --verbose are exclusive\n"; std::exit(1); }
  return a;
}
