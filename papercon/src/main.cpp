#include "button_driver.hpp"
#include "console.hpp"
#include "content.hpp"
#include "dial_driver.hpp"
#include "event_loop.hpp"
#include "log.hpp"
#include "preview.hpp"
#include "printer.hpp"
#include "serial_port.hpp"

#include <algorithm>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

static volatile std::sig_atomic_t g_stop = 0;
static void on_signal(int){ g_stop = 1; }

static std::vector<unsigned> parse_lines(const std::string& s){
  std::vector<unsigned> v; std::stringstream ss(s); std::string tok;
  while (std::getline(ss, tok, ',')) v.push_back(static_cast<unsigned>(std::stoul(tok)));
  return v;
}

struct Args {
  std::string chip = "/dev/gpiochip0";
  unsigned button_line = 18;
  std::vector<unsigned> dial_lines = {5, 6, 13, 19, 26, 16, 20, 21};
  int dial_common = -1;               // -1 = common tied to GND
  int position = 0;                   // 0 = read from the dial
  std::string port;                   // empty = detect
  unsigned baud = 9600;
  PaperSensor paper_sensor = PaperSensor::NearEndOnly;
  int long_press_ms = 5000;
  int factory_reset_ms = 15000;
  int max_lines = 0;
  int max_ops = 1000;
  int print_debounce_ms = 2000;
  int cutter_feed = 3;
  int retry_count = 10;
  int retry_interval_ms = 30000;
  int quick_actions_timeout_ms = 60000;
  std::map<int, std::string> channels;
  std::string factory_reset_cmd;
  bool preview = false;
  bool no_hardware = false;
  bool verbose = false;
};

static void usage(const char* prog){
  std::cerr <<
  "Usage: " << prog << " [--chip /dev/gpiochipN] [--button-line N] [--dial-lines a,b,...]\n"
  "       [--dial-common N] [--position 1-8] [--port /dev/ttyX] [--baud 9600]\n"
  "       [--paper-sensor near-end|near-end-and-out]\n"
  "       [--long-press-ms 5000] [--factory-reset-ms 15000]\n"
  "       [--max-lines 0] [--max-ops 1000] [--print-debounce-ms 2000] [--cutter-feed 3]\n"
  "       [--retry-count 10] [--retry-interval-ms 30000] [--quick-actions-timeout-ms 60000]\n"
  "       [--channel N=SPEC]... [--factory-reset-cmd CMD]\n"
  "       [--preview] [--no-hardware] [--verbose]\n"
  "SPEC: text:Title|line|line, sample, status; chain modules with '+'\n";
}

static Args parse_args(int argc, char** argv){
  Args a;
  for (int i=1;i<argc;i++){
    std::string k = argv[i];
    auto need = [&](const char* name){
      if (i+1>=argc) { std::cerr<<"Missing value for "<<name<<"\n"; std::exit(2);}
      return std::string(argv[++i]);
    };
    if (k=="--chip") a.chip = need("--chip");
    else if (k=="--button-line") a.button_line = static_cast<unsigned>(std::stoul(need("--button-line")));
    else if (k=="--dial-lines") a.dial_lines = parse_lines(need("--dial-lines"));
    else if (k=="--dial-common") a.dial_common = std::stoi(need("--dial-common"));
    else if (k=="--position") a.position = std::stoi(need("--position"));
    else if (k=="--port") a.port = need("--port");
    else if (k=="--paper-sensor"){
      std::string v = need("--paper-sensor");
      if (v == "near-end") a.paper_sensor = PaperSensor::NearEndOnly;
      else if (v == "near-end-and-out") a.paper_sensor = PaperSensor::NearEndAndOut;
      else { std::cerr<<"--paper-sensor expects near-end or near-end-and-out\n"; std::exit(2); }
    }
    else if (k=="--baud") a.baud = static_cast<unsigned>(std::stoul(need("--baud")));
    else if (k=="--long-press-ms") a.long_press_ms = std::stoi(need("--long-press-ms"));
    else if (k=="--factory-reset-ms") a.factory_reset_ms = std::stoi(need("--factory-reset-ms"));
    else if (k=="--max-lines") a.max_lines = std::stoi(need("--max-lines"));
    else if (k=="--max-ops") a.max_ops = std::stoi(need("--max-ops"));
    else if (k=="--print-debounce-ms") a.print_debounce_ms = std::stoi(need("--print-debounce-ms"));
    else if (k=="--cutter-feed") a.cutter_feed = std::stoi(need("--cutter-feed"));
    else if (k=="--retry-count") a.retry_count = std::stoi(need("--retry-count"));
    else if (k=="--retry-interval-ms") a.retry_interval_ms = std::stoi(need("--retry-interval-ms"));
    else if (k=="--quick-actions-timeout-ms") a.quick_actions_timeout_ms = std::stoi(need("--quick-actions-timeout-ms"));
    else if (k=="--channel"){
      std::string v = need("--channel");
      auto eq = v.find('=');
      if (eq == std::string::npos){ std::cerr<<"--channel expects N=SPEC\n"; std::exit(2); }
      int pos = std::stoi(v.substr(0, eq));
      if (pos < 1 || pos > kDialPositions){ std::cerr<<"channel must be 1.."<<kDialPositions<<"\n"; std::exit(2); }
      a.channels[pos] = v.substr(eq + 1);
    }
    else if (k=="--factory-reset-cmd") a.factory_reset_cmd = need("--factory-reset-cmd");
    else if (k=="--preview") a.preview = true;
    else if (k=="--no-hardware") a.no_hardware = true;
    else if (k=="--verbose" || k=="-v") a.verbose = true;
    else if (k=="-h" || k=="--help"){ usage(argv[0]); std::exit(0); }
    else { usage(argv[0]); std::exit(2); }
  }
  if (a.long_press_ms <= 0 || a.factory_reset_ms <= a.long_press_ms){
    std::cerr << "--factory-reset-ms must be greater than --long-press-ms > 0\n";
    std::exit(2);
  }
  return a;
}

int main(int argc, char** argv){
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  Args args;
  try {
    args = parse_args(argc, argv);
  } catch (const std::exception& e){
    std::cerr << "bad argument: " << e.what() << "\n";
    return 2;
  }
  if (args.verbose) set_log_level(LogLevel::Debug);

  RetryPolicy retry{args.retry_count, std::chrono::milliseconds(args.retry_interval_ms)};

  SerialPort port(SerialConfig{args.port, args.baud});
  PrinterConfig pc;
  pc.max_ops = static_cast<size_t>(std::max(1, args.max_ops));
  pc.cutter_feed = args.cutter_feed;
  pc.paper_sensor = args.paper_sensor;
  Printer printer(port, pc);
  printer.initialize();
  if (args.preview)
    printer.set_preview_sink([](const Bitmap& b){ write_preview(std::cout, b); std::cout.flush(); });

  DialConfig dc;
  dc.chip = args.chip;
  dc.lines = args.dial_lines;
  if (args.dial_common >= 0) dc.common_line = static_cast<unsigned>(args.dial_common);
  dc.retry = retry;
  DialDriver dial(dc);

  ButtonConfig bc;
  bc.chip = args.chip;
  bc.line = args.button_line;
  bc.thresholds.long_press = std::chrono::milliseconds(args.long_press_ms);
  bc.thresholds.factory_reset = std::chrono::milliseconds(args.factory_reset_ms);
  bc.retry = retry;
  ButtonDriver button(bc);

  EventLoop loop;
  ConsoleConfig cc;
  cc.max_lines = args.max_lines;
  cc.print_debounce = std::chrono::milliseconds(args.print_debounce_ms);
  cc.quick_actions_timeout = std::chrono::milliseconds(args.quick_actions_timeout_ms);
  cc.factory_reset_cmd = args.factory_reset_cmd;
  Console console(loop, printer, dial, cc);

  auto status_lines = [&]{
    return std::vector<std::string>{
      "Dial: " + std::string(to_string(dial.state())) + ", position " + std::to_string(dial.read_position()),
      "Button: " + std::string(to_string(button.state())),
      "Port: " + port.path() + (port.is_open() ? "" : " (closed)")
    };
  };
  console.set_status_lines(status_lines);

  for (const auto& [pos, spec] : args.channels){
    try {
      console.set_channel(pos, parse_modules(spec, status_lines));
    } catch (const std::exception& e){
      std::cerr << "channel " << pos << ": " << e.what() << "\n";
      return 2;
    }
  }

  console.attach(dial);
  console.attach(button);
  if (args.position != 0) dial.set_position(args.position);

  if (!args.no_hardware){
    dial.start();
    button.start();
  } else {
    log_info("main") << "running without GPIO";
  }

  log_info("main") << "ready";
  loop.run([]{ return g_stop != 0; });

  log_info("main") << "shutting down";
  button.stop();
  dial.stop();
  console.wait_idle();
  return 0;
}
