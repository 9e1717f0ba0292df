#include "log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_mu;

const char* level_name(LogLevel lvl){
  switch (lvl){
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "?";
}
}

void set_log_level(LogLevel lvl){ g_level = static_cast<int>(lvl); }
LogLevel log_level(){ return static_cast<LogLevel>(g_level.load()); }

void log_line(LogLevel lvl, const std::string& tag, const std::string& msg){
  std::lock_guard<std::mutex> lk(g_mu);
  std::cerr << "[" << level_name(lvl) << "] " << tag << ": " << msg << "\n";
}
