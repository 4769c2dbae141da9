#include "convert.hpp"
#include <iostream>
#include <string>
#include <argparse.hpp>

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("cprconv", "1.0.0", argparse::default_arguments::all);

    program.add_argument("--to-bin")
        .help("Convert a CPR cartridge file to a raw BIN dump")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--to-cpr")
        .help("Convert a raw BIN dump to a CPR cartridge file")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("-q", "--quiet")
        .help("Only print errors")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("input")
        .help("The file to convert")
        .required();

    program.add_argument("output")
        .help("The file to write")
        .required();

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    auto direction = cpr::resolveDirection(program.get<bool>("--to-bin"), program.get<bool>("--to-cpr"));
    if (!direction) {
        std::cerr << "Exactly one of --to-bin or --to-cpr is required" << std::endl;
        std::cerr << program;
        return 1;
    }

    std::string input = program.get<std::string>("input");
    std::string output = program.get<std::string>("output");
    bool quiet = program.get<bool>("--quiet");

    try {
        if (!quiet) {
            std::cout << "Converting " << input << " -> " << output << "...\n";
        }

        auto summary = cpr::convertFile(*direction, input, output);

        if (!quiet) {
            std::cout << "Conversion successful! Output written to " << output << "\n";
            std::cout << "Processed " << summary.blocks << " block" << (summary.blocks == 1 ? "" : "s")
                      << " of 16KB each\n";
        }

    } catch (const cpr::FormatException& e) {
        std::cerr << "Error: " << cpr::to_string(e.kind()) << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
