#pragma once
#include <string>

struct Args {
  std::string mode;          // "refine", "chunk" or "analyze"
  std::string input_path;
  std::string config_path;
  // empty / negative means "keep the config value"
  std::string out_dir;
  std::string format;
  std::string strategy;
  std::string sqlite_path;
  std::string model_path;
  int max_chunk = -1;
  int min_chunk = -1;
  int overlap = -1;
  bool enrich = false;
  bool quiet = false;
  bool verbose = false;
};

Args parse_cli(int argc, char** argv);
