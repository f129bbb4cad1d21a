#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "flow/report.hpp"

using regflow::flow::FormatReport;
using regflow::flow::kReportLineCount;
using regflow::flow::ReconciliationResult;
using regflow::flow::WriteReport;

namespace {

ReconciliationResult Sample() {
  ReconciliationResult r;
  r.txid = "b1c5d7e9f1a3c5e7b9d1f3a5c7e9b1d3f5a7c9e1b3d5f7a9c1e3b5d7f9a1c3e5";
  r.input_address = "bcrt1qminer";
  r.input_amount = 5'000'000'000;
  r.output_address = "bcrt1qtrader";
  r.output_amount = 2'000'000'000;
  r.change_address = "bcrt1qchange";
  r.change_amount = 2'999'990'000;
  r.fee = 10'000;
  r.block_height = 102;
  r.block_hash = "3a7bd3e2360a3d29eea436fcfb7e44c735d117c42d1c1835420b6b9942dd4f1b";
  return r;
}

std::vector<std::string> Lines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

std::string ReadAll(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

}  // namespace

int main() {
  const auto sample = Sample();
  const auto text = FormatReport(sample);
  const std::vector<std::string> expected = {
      sample.txid, "bcrt1qminer", "50", "bcrt1qtrader", "20", "bcrt1qchange", "29.9999",
      "0.0001", "102", sample.block_hash,
  };
  if (Lines(text) != expected || text.back() != '\n') {
    std::cerr << "report_tests: unexpected report\n" << text;
    return EXIT_FAILURE;
  }

  // Defaults still produce ten lines, blank where a string is missing.
  const auto blank = FormatReport(ReconciliationResult{});
  if (blank != "\n\n0\n\n0\n\n0\n0\n0\n\n") {
    std::cerr << "report_tests: default report mismatch\n" << blank;
    return EXIT_FAILURE;
  }
  auto multiline = sample;
  multiline.change_address = "line1\nline2";
  if (Lines(FormatReport(multiline)).size() != kReportLineCount) {
    std::cerr << "report_tests: embedded newline broke the line layout\n";
    return EXIT_FAILURE;
  }

  const auto dir = std::filesystem::temp_directory_path() / "regflow_report_tests";
  std::filesystem::remove_all(dir);
  const auto path = dir / "nested" / "out.txt";
  WriteReport(path, sample);
  if (ReadAll(path) != text) {
    std::cerr << "report_tests: written file differs from formatted report\n";
    return EXIT_FAILURE;
  }
  // A second run replaces the file rather than appending.
  auto second = sample;
  second.block_height = 205;
  WriteReport(path, second);
  const auto rewritten = Lines(ReadAll(path));
  if (rewritten.size() != kReportLineCount || rewritten[8] != "205") {
    std::cerr << "report_tests: report not overwritten\n";
    return EXIT_FAILURE;
  }

  // A directory in the way of the target cannot be replaced by a file.
  const auto blocked = dir / "blocked";
  std::filesystem::create_directories(blocked / "child");
  try {
    WriteReport(blocked, sample);
    std::cerr << "report_tests: writing over a directory did not throw\n";
    return EXIT_FAILURE;
  } catch (const std::runtime_error& ex) {
    if (std::string(ex.what()).find("failed to write report") == std::string::npos) {
      std::cerr << "report_tests: unexpected error text: " << ex.what() << "\n";
      return EXIT_FAILURE;
    }
  }
  std::filesystem::remove_all(dir);

  std::cout << "report_tests: OK\n";
  return EXIT_SUCCESS;
}
