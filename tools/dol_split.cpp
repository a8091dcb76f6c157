#include "dol/diagnostics_json.hpp"
#include "dol/errors.hpp"
#include "dol/splitter.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// Splits multi-declaration DOL files into one canonical file per declaration.

static int usage() {
  std::cerr << "usage: dol_split [--out <dir>] <root> [module...]\n"
               "       dol_split --print <file.dol>\n";
  return 2;
}

static std::string read_file(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw dol::io_error("failed to open: " + path);
  std::ostringstream oss; oss << ifs.rdbuf();
  return oss.str();
}

static int print_file(const std::string &path) {
  auto files = dol::split_text(read_file(path));
  for (const auto &f : files) {
    std::cout << "==> " << f.path << "\n" << f.content;
  }
  std::cerr << files.size() << " declarations\n";
  return 0;
}

int main(int argc, char **argv) {
  try {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) return usage();
    if (args[0] == "--print") {
      if (args.size() != 2) return usage();
      return print_file(args[1]);
    }
    std::string out_root;
    size_t i = 0;
    if (args[0] == "--out") {
      if (args.size() < 3) return usage();
      out_root = args[1];
      i = 2;
    }
    std::string root = args[i++];
    if (out_root.empty()) out_root = root;
    std::vector<std::string> modules(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
    if (modules.empty()) modules = dol::default_modules();

    dol::FileSystemSource source(root);
    dol::FileSystemSink sink(out_root);
    auto report = dol::split_modules(source, sink, modules, &std::cout);
    for (const auto &e : report.errors) {
      std::cerr << "error[" << e.code << "] " << e.module << ".dol";
      if (e.line >= 0) std::cerr << ":" << e.line << ":" << e.col;
      std::cerr << ": " << e.message << "\n";
    }
    dol::maybe_print_json(report);
    return report.success ? 0 : 1;
  } catch (const dol::split_error &ex) {
    std::cerr << "error[" << ex.code << "]: " << ex.what() << "\n";
    return 1;
  } catch (const std::exception &ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }
}
