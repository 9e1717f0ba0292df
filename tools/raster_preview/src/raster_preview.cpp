#include "content.hpp"
#include "log.hpp"
#include "preview.hpp"
#include "printer.hpp"
#include "transport.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

/*
 * raster_preview: renders a receipt without a printer attached.
 * - Prints the composed canvas as half-block characters to stdout.
 * - Optionally writes the exact bytes the printer would receive.
 */

namespace {
// keeps everything written; answers status queries with silence
class CaptureTransport : public Transport {
public:
  bool is_open() const override { return true; }
  bool write(const std::vector<uint8_t>& b) override { bytes.insert(bytes.end(), b.begin(), b.end()); return true; }
  std::optional<uint8_t> read_byte(std::chrono::milliseconds) override { return std::nullopt; }
  void drain() override {}
  void discard_input() override {}
  std::vector<uint8_t> bytes;
};
}

struct Args {
  std::string spec = "sample";
  int max_lines = 0;
  int scale = 2;
  std::string raw_path;   // optional ESC/POS dump
};

static void usage(const char* prog){
  std::cerr << "Usage: " << prog << " [--spec sample|status|text:Title|line...] [--max-lines N]\n"
            << "       [--scale N] [--raw out.bin]\n";
}

static Args parse_args(int argc, char** argv){
  Args a;
  for (int i=1;i<argc;i++){
    std::string k = argv[i];
    auto need = [&](const char*){ if (i+1>=argc) { usage(argv[0]); std::exit(2);} return std::string(argv[++i]); };
    if (k=="--spec") a.spec = need("--spec");
    else if (k=="--max-lines") a.max_lines = std::stoi(need("--max-lines"));
    else if (k=="--scale") a.scale = std::stoi(need("--scale"));
    else if (k=="--raw") a.raw_path = need("--raw");
    else if (k=="-h" || k=="--help"){ usage(argv[0]); std::exit(0); }
    else { usage(argv[0]); std::exit(2); }
  }
  return a;
}

int main(int argc, char** argv){
  Args args = parse_args(argc, argv);

  CaptureTransport cap;
  Printer printer(cap, PrinterConfig(), EscPosTiming::none());
  int height = 0;
  printer.set_preview_sink([&](const Bitmap& b){
    height += b.height();
    write_preview(std::cout, b, args.scale);
  });

  std::vector<ModulePtr> modules;
  try {
    modules = parse_modules(args.spec, []{ return std::vector<std::string>{"preview only"}; });
  } catch (const std::exception& e){
    std::cerr << e.what() << "\n";
    return 2;
  }
  print_job(printer, modules, args.max_lines);
  std::cerr << "canvas height " << height << " dots"
            << (printer.was_truncated() ? ", truncated" : "") << "\n";

  if (!args.raw_path.empty()){
    std::ofstream out(args.raw_path, std::ios::binary | std::ios::trunc);
    if (!out){ perror(args.raw_path.c_str()); return 1; }
    out.write(reinterpret_cast<const char*>(cap.bytes.data()), static_cast<std::streamsize>(cap.bytes.size()));
  }
  return 0;
}
