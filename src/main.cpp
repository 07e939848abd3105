#include "assembler.hpp"
#include "lexer.hpp"
#include <argparse/argparse.hpp>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

std::string read_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }

    // Efficiently read the whole file into a string
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void print_listing(const AssemblyResult& result) {
    std::cout << std::uppercase << std::hex << std::setfill('0');
    std::cout << "Start Address: $" << std::setw(4) << result.startAddress << "\n";
    std::cout << std::dec << "Bytes: " << result.bytes.size() << "\n\nHex Output:\n" << std::hex;
    for (size_t i = 0; i < result.bytes.size(); ++i) {
        if (i > 0) std::cout << (i % 16 == 0 ? "\n" : " ");
        std::cout << std::setw(2) << static_cast<int>(result.bytes[i]);
    }
    std::cout << "\n";

    if (!result.labels.empty()) {
        std::cout << "\nLabels:\n";
        for (const auto& [name, address] : result.labels) {
            std::cout << name << ": $" << std::setw(4) << address << "\n";
        }
    }
    std::cout << std::dec << std::nouppercase << std::setfill(' ');
}

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("asm65", "0.1.0", argparse::default_arguments::all);

    program.add_argument("filename")
        .help("The 6502 assembly source to assemble")
        .required();

    program.add_argument("-o", "--output")
        .help("The output filename (default: input file with .bin extension)")
        .default_value(std::string(""));

    program.add_argument("--labels", "-l")
        .help("Write debugger labels (Mesen .mlb format) to this file")
        .default_value(std::string(""));

    program.add_argument("--split-address")
        .help("Labels at or above this address go to the high region, rebased")
        .default_value(0x8000)
        .scan<'i', int>();

    program.add_argument("--high-region")
        .help("Region name for labels at or above the split address")
        .default_value(std::string("NesPrgRom"));

    program.add_argument("--low-region")
        .help("Region name for labels below the split address")
        .default_value(std::string("NesInternalRam"));

    program.add_argument("--emit-tokens")
        .help("Emit the tokens to stdout")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--hex")
        .help("Print start address, hex dump and label table")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    std::string filename = program.get<std::string>("filename");
    std::string output = program.get<std::string>("--output");
    std::string labels = program.get<std::string>("--labels");

    DebugSymbolOptions symbolOptions;
    symbolOptions.splitAddress = program.get<int>("--split-address");
    symbolOptions.highRegion = program.get<std::string>("--high-region");
    symbolOptions.lowRegion = program.get<std::string>("--low-region");

    try {
        std::cout << "Assembling " << filename << "...\n";
        // 1. Read file (This string MUST stay in scope while tokens live)
        std::string source_code = read_file(filename);

        if (program.get<bool>("--emit-tokens")) {
            Lexer lexer(source_code);
            for (const auto& token : lexer.tokenize()) {
                std::cout << token.to_string() << "\n";
            }
        }

        // 2. Both passes
        auto result = assemble(source_code, symbolOptions);

        // 3. Output binary
        auto out_filename = output;
        if (out_filename.empty()) {
            out_filename = filename;
            size_t dot_pos = out_filename.find_last_of('.');
            if (dot_pos != std::string::npos) {
                out_filename = out_filename.substr(0, dot_pos);
            }
            out_filename += ".bin";
        }
        std::ofstream outfile(out_filename, std::ios::binary);
        if (!outfile) {
            throw std::runtime_error("Could not write file: " + out_filename);
        }
        outfile.write(reinterpret_cast<const char*>(result.bytes.data()), result.bytes.size());

        if (!labels.empty()) {
            std::ofstream labelfile(labels);
            if (!labelfile) {
                throw std::runtime_error("Could not write file: " + labels);
            }
            labelfile << result.debugSymbols;
        }

        if (program.get<bool>("--hex")) {
            print_listing(result);
        }

        std::cout << "Assembly successful! " << result.bytes.size() << " bytes written to " << out_filename << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Assembly Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
