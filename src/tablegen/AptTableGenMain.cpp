#include <cxxopts.hpp>
#include <iostream>

#include "TableCompiler.hpp"

using namespace apt;

int main(int argc, char** argv) {
  cxxopts::Options options("apt-tablegen",
                           "Compiles the APT protocol table into C++ lookups");
  try {
    options.add_options()         //
        ("h,help", "Print help")  //
        ("i,input", "Protocol table (csv)",
         cxxopts::value<std::string>())  //
        ("o,output", "Generated header",
         cxxopts::value<std::string>())  //
        ("check", "Validate the table without writing output")  //
        ;

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      std::cout << options.help({}) << std::endl;
      return 0;
    }
    if (!result.count("input")) {
      std::cerr << "apt-tablegen: --input is required" << std::endl;
      return 1;
    }
    const std::string input = result["input"].as<std::string>();

    std::vector<TableRow> rows = TableCompiler::parseFile(input);
    TableCompiler::validate(rows);
    if (result.count("check")) {
      std::cout << input << ": " << rows.size() << " messages, "
                << TableCompiler::channelNames(rows).size() << " channels"
                << std::endl;
      return 0;
    }
    if (!result.count("output")) {
      std::cerr << "apt-tablegen: --output is required" << std::endl;
      return 1;
    }
    const std::string output = result["output"].as<std::string>();
    const std::string header = TableCompiler::emitHeader(rows, input);

    TableCompiler::writeHeader(output, header);
    return 0;
  } catch (const TableError& te) {
    std::cerr << "apt-tablegen: " << te.what() << std::endl;
    return 1;
  } catch (const cxxopts::OptionException& oe) {
    std::cerr << "apt-tablegen: " << oe.what() << std::endl << std::endl
              << options.help({}) << std::endl;
    return 1;
  }
}
