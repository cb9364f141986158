#include "page_stream.hpp"
#include "stream_options.hpp"
#include "token_source.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage(const char* prog) {
  std::cerr << "Usage: " << prog << " [options] <input.pdf | --tokens=file.tsv>\n"
            << "  --x-tol=<n>                horizontal tolerance (default 20)\n"
            << "  --y-tol=<n>                vertical tolerance (default 3)\n"
            << "  --mask                     mask numeric payloads\n"
            << "  --mask-char=<c>            digit mask character (default X)\n"
            << "  --numeric=embedded|whole   numeric matching policy\n"
            << "  --column=first|nearest     column assignment policy\n"
            << "  --cluster=anchor|centroid  baseline clustering policy\n"
            << "  --rows=first|mean          row reference policy\n"
            << "  --first-page=<n>           first PDF page\n"
            << "  --last-page=<n>            last PDF page\n"
            << "  --tokens=<file>            read tokens from a TSV file\n"
            << "  --out=<file>               write the stream to a file\n"
            << "  --verbose                  debug logging\n";
}

bool takeValue(const std::string& arg, const std::string& prefix, std::string& value) {
  if (arg.rfind(prefix, 0) != 0) return false;
  value = arg.substr(prefix.size());
  return true;
}

} // namespace

int main(int argc, char** argv)
{
  spdlog::set_default_logger(spdlog::stderr_color_mt("layoutstream"));
  spdlog::set_pattern("[%l] %v");

  std::string pdfPath;
  std::string tokensPath;
  std::string outPath;
  int firstPage = 1;
  int lastPage = -1;
  bool verbose = false;
  StreamOptions options;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      std::string value;
      if (arg == "--mask") {
        options.maskNumbers = true;
      } else if (arg == "--verbose") {
        verbose = true;
      } else if (arg == "--help" || arg == "-h") {
        printUsage(argv[0]);
        return 0;
      } else if (takeValue(arg, "--x-tol=", value)) {
        options.xTolerance = std::stod(value);
      } else if (takeValue(arg, "--y-tol=", value)) {
        options.yTolerance = std::stod(value);
      } else if (takeValue(arg, "--mask-char=", value)) {
        if (value.size() != 1) throw std::invalid_argument("--mask-char takes a single character");
        options.maskChar = value[0];
      } else if (takeValue(arg, "--numeric=", value)) {
        options.numericPolicy = parseNumericPolicy(value);
      } else if (takeValue(arg, "--column=", value)) {
        options.columnPolicy = parseColumnPolicy(value);
      } else if (takeValue(arg, "--cluster=", value)) {
        options.clusterPolicy = parseClusterPolicy(value);
      } else if (takeValue(arg, "--rows=", value)) {
        options.rowPolicy = parseRowPolicy(value);
      } else if (takeValue(arg, "--first-page=", value)) {
        firstPage = std::stoi(value);
      } else if (takeValue(arg, "--last-page=", value)) {
        lastPage = std::stoi(value);
      } else if (takeValue(arg, "--tokens=", value)) {
        tokensPath = value;
      } else if (takeValue(arg, "--out=", value)) {
        outPath = value;
      } else if (arg.rfind("--", 0) == 0) {
        throw std::invalid_argument("unknown option " + arg);
      } else if (pdfPath.empty()) {
        pdfPath = arg;
      }
    }
    validateOptions(options);
    if (firstPage < 1) throw std::invalid_argument("--first-page must be at least 1");
  } catch (const std::logic_error& ex) {
    // std::stod/stoi report bad numbers as invalid_argument or out_of_range.
    std::cerr << "Invalid argument: " << ex.what() << "\n";
    printUsage(argv[0]);
    return 2;
  }

  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  spdlog::cfg::load_env_levels();

  const std::string& inputPath = tokensPath.empty() ? pdfPath : tokensPath;
  if (inputPath.empty() || !std::filesystem::exists(inputPath)) {
    std::cerr << "Input not found: " << (inputPath.empty() ? "<none>" : inputPath) << "\n";
    printUsage(argv[0]);
    return 2;
  }

  try {
    std::vector<PageTokens> pages = tokensPath.empty()
      ? extractTokensFromPdf(pdfPath, firstPage, lastPage)
      : readTokenFile(tokensPath);

    std::vector<PageStream> summary;
    std::string stream = streamDocument(pages, options, &summary);
    spdlog::info("Streamed {} page(s) with content out of {}", summary.size(), pages.size());

    if (outPath.empty()) {
      std::cout << stream << "\n";
      return 0;
    }

    std::ofstream ofs(outPath);
    if (!ofs) throw std::runtime_error("Cannot open output file '" + outPath + "'");
    ofs << stream << "\n";
    ofs.close();
    if (!ofs) throw std::runtime_error("Failed writing output file '" + outPath + "'");
    spdlog::info("Wrote stream to '{}'", outPath);
    return 0;
  } catch (const std::exception& ex) {
    spdlog::debug("Aborting: {}", ex.what());
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
