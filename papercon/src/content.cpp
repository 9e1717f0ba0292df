#include "content.hpp"
#include "log.hpp"

#include <algorithm>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

void TextModule::render(Printer& p){
  p.print_header(title_);
  for (const auto& l : lines_){
    if (p.is_max_lines_exceeded()) break;
    p.print_body(l);
  }
}

Grid generate_maze(int rows, int cols, unsigned seed){
  if (rows < 3 || cols < 3) throw std::invalid_argument("maze needs at least 3x3 cells");
  if (rows % 2 == 0) ++rows;
  if (cols % 2 == 0) ++cols;

  Grid g(rows, std::vector<int>(cols, 1));
  std::mt19937 rng(seed);
  std::vector<std::pair<int,int>> stack{{1, 1}};
  g[1][1] = 0;
  const int dr[4] = {-2, 2, 0, 0};
  const int dc[4] = {0, 0, -2, 2};

  while (!stack.empty()){
    auto [r, c] = stack.back();
    std::vector<int> open;
    for (int d = 0; d < 4; ++d){
      int nr = r + dr[d], nc = c + dc[d];
      if (nr > 0 && nr < rows - 1 && nc > 0 && nc < cols - 1 && g[nr][nc] == 1) open.push_back(d);
    }
    if (open.empty()){
      stack.pop_back();
      continue;
    }
    int d = open[std::uniform_int_distribution<size_t>(0, open.size() - 1)(rng)];
    g[r + dr[d] / 2][c + dc[d] / 2] = 0;
    g[r + dr[d]][c + dc[d]] = 0;
    stack.emplace_back(r + dr[d], c + dc[d]);
  }

  g[0][1] = 0;
  g[rows - 1][cols - 2] = 0;
  return g;
}

namespace {
// 0 = blank
const Grid kSamplePuzzle = {
  {5,3,0, 0,7,0, 0,0,0},
  {6,0,0, 1,9,5, 0,0,0},
  {0,9,8, 0,0,0, 0,6,0},
  {8,0,0, 0,6,0, 0,0,3},
  {4,0,0, 8,0,3, 0,0,1},
  {7,0,0, 0,2,0, 0,0,6},
  {0,6,0, 0,0,0, 2,8,0},
  {0,0,0, 4,1,9, 0,0,5},
  {0,0,0, 0,8,0, 0,7,9},
};
}

void SampleModule::render(Printer& p){
  p.print_header("Sample");
  p.print_subheader("Every print operation");
  p.print_body("Body text wraps at the paper edge, so a long sentence like this one "
               "continues on the next line.");
  p.print_bold("Bold text");
  p.print_caption("Caption text");
  p.print_text("Small text", TextStyle::RegularSmall);
  p.print_line();
  p.print_subheader("Moon, day 10");
  p.print_moon_phase(10.0, 60);
  p.print_subheader("Maze");
  p.print_maze(generate_maze(21, 31, seed_), 8);
  p.print_subheader("Sudoku");
  p.print_sudoku(kSamplePuzzle, 16);
  p.print_caption("QR code");
  p.print_qr("https://example.com/papercon", 4, 'M');
}

void StatusModule::render(Printer& p){
  p.print_header("Status");
  PaperStatus ps = p.check_paper_status();
  std::string paper = ps.error ? std::string("unknown (") + to_string(*ps.error) + ")"
                     : ps.out ? "out" : ps.near_end ? "near end" : "ok";
  p.print_body("Paper: " + paper);
  p.print_body(std::string("Printer: ") + (p.connected() ? (p.is_printer_busy() ? "busy" : "ready")
                                                          : "not connected"));
  if (extra_){
    for (const auto& l : extra_()) p.print_caption(l);
  }
}

static std::vector<std::string> split(const std::string& s, char sep){
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string tok;
  while (std::getline(ss, tok, sep)) out.push_back(tok);
  if (!s.empty() && s.back() == sep) out.emplace_back();
  return out;
}

std::vector<ModulePtr> parse_modules(const std::string& spec, const StatusModule::LinesFn& status_lines){
  std::vector<ModulePtr> out;
  for (const auto& part : split(spec, '+')){
    if (part == "sample") out.push_back(std::make_shared<SampleModule>());
    else if (part == "status") out.push_back(std::make_shared<StatusModule>(status_lines));
    else if (part.rfind("text:", 0) == 0){
      auto lines = split(part.substr(5), '|');
      if (lines.empty()) throw std::invalid_argument("text module needs a title");
      std::string title = lines.front();
      lines.erase(lines.begin());
      out.push_back(std::make_shared<TextModule>(title, lines));
    }
    else throw std::invalid_argument("unknown module '" + part + "'");
  }
  if (out.empty()) throw std::invalid_argument("empty module spec");
  return out;
}

void print_error_receipt(Printer& p, const std::string& module_name){
  p.print_header(module_name.empty() ? "Error" : module_name);
  p.print_body("could not load this content");
}

int print_job(Printer& p, const std::vector<ModulePtr>& modules, int max_lines){
  int ok = 0;
  p.reset_buffer(max_lines);
  for (size_t i = 0; i < modules.size(); ++i){
    const auto& m = modules[i];
    if (i > 0) p.feed(1);
    try {
      m->render(p);
      ++ok;
    } catch (const std::exception& e){
      log_error("content") << m->name() << ": " << e.what();
      print_error_receipt(p, m->name());
    }
  }
  p.flush_buffer();
  p.feed_direct(p.cutter_feed());
  return ok;
}
