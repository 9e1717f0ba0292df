#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "printer.hpp"

// A printable channel. Modules only talk to the Printer content API.
class ContentModule {
public:
  virtual ~ContentModule() = default;
  virtual std::string name() const = 0;
  virtual void render(Printer& p) = 0;
};

using ModulePtr = std::shared_ptr<ContentModule>;

class TextModule : public ContentModule {
public:
  TextModule(std::string title, std::vector<std::string> lines)
      : title_(std::move(title)), lines_(std::move(lines)) {}
  std::string name() const override { return title_; }
  void render(Printer& p) override;
private:
  std::string title_;
  std::vector<std::string> lines_;
};

// one of every operation kind; doubles as a test page
class SampleModule : public ContentModule {
public:
  explicit SampleModule(unsigned seed = 7) : seed_(seed) {}
  std::string name() const override { return "Sample"; }
  void render(Printer& p) override;
private:
  unsigned seed_;
};

class StatusModule : public ContentModule {
public:
  using LinesFn = std::function<std::vector<std::string>()>;
  explicit StatusModule(LinesFn extra = LinesFn()) : extra_(std::move(extra)) {}
  std::string name() const override { return "Status"; }
  void render(Printer& p) override;
private:
  LinesFn extra_;
};

// Module list grammar: "text:line|line", "sample", "status", chained with '+'.
// Throws std::invalid_argument on an unknown kind or an empty list.
std::vector<ModulePtr> parse_modules(const std::string& spec, const StatusModule::LinesFn& status_lines);

// Odd-sized wall/path grid with the entrance at row 0 column 1 and the exit
// at the last row, second-to-last column.
Grid generate_maze(int rows, int cols, unsigned seed);

// Appends the short notice printed when a module cannot render.
void print_error_receipt(Printer& p, const std::string& module_name);

// One complete job: reset, every module separated by a blank line, flush,
// cutter feed. A module that throws is replaced by its error receipt.
// Returns the number of modules that rendered without error.
int print_job(Printer& p, const std::vector<ModulePtr>& modules, int max_lines = 0);
