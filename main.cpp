#include "cli_options.hpp"
#include "converter.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char** argv)
{
  CommandLine cl;
  try {
    cl = parseCommandLine(argc, argv);
  } catch (const std::invalid_argument& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    std::cerr << usageText(argv[0]);
    return 2;
  }

  if (cl.showHelp) {
    std::cout << usageText(argv[0]);
    return 0;
  }

  try {
    BatchSummary summary = convertAll(cl.config, defaultBackends(), std::cout, std::cerr);
    std::cout << summary.converted << " converted, " << summary.skipped << " skipped, "
              << summary.failed << " failed; " << summary.written.size() << " CSV file(s) in '"
              << cl.config.outputDir << "'\n";
    return summary.failed == 0 ? 0 : 1;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    std::cerr << usageText(argv[0]);
    return 2;
  }
}
