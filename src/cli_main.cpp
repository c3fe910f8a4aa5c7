#include <cxxopts.hpp>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "gura/Convert.hpp"
#include "gura/Errors.hpp"
#include "gura/Log.hpp"
#include "gura/Parser.hpp"

using namespace gura;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("gura-cpp", "Check, normalize and convert Gura files");
        options.positional_help("COMMAND FILE");

        options.add_options()
            ("t,to", "Output format for convert: json, toml or gura", cxxopts::value<std::string>()->default_value("json"))
            ("indent", "JSON indentation, -1 for a single line", cxxopts::value<int>()->default_value("2"))
            ("o,out", "Write the output to this file instead of stdout", cxxopts::value<std::string>())
            ("v,verbose", "Log import resolution")
            ("h,help", "Show help");

        // Command + file captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: check FILE | dump FILE | convert FILE [--to json|toml|gura] [--indent N] [--out FILE]\n";
            return 0;
        }

        if (result.count("verbose")) {
            Log::set_level(LogLevel::Debug);
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];
        if (cmdv.size() < 2) {
            std::cerr << "Error: missing FILE for command '" << cmd << "'\n";
            return 1;
        }
        const std::string file = cmdv[1];

        // CHECK
        if (cmd == "check") {
            const Value parsed = parse_file(file);
            std::cout << file << ": OK (" << parsed.size() << " top-level keys)\n";
            return 0;
        }

        // DUMP
        if (cmd == "dump") {
            std::cout << dump(parse_file(file)) << "\n";
            return 0;
        }

        // CONVERT
        if (cmd == "convert") {
            const std::string to = result["to"].as<std::string>();
            const Value data = read_file_any(file);

            std::string text;
            if (to == "json") {
                text = to_json_string(data, result["indent"].as<int>());
            } else if (to == "toml") {
                text = to_toml_string(data);
            } else if (to == "gura") {
                text = dump(data);
            } else {
                std::cerr << "Error: unsupported output format '" << to << "'\n";
                return 1;
            }

            if (result.count("out")) {
                const std::string out = result["out"].as<std::string>();
                std::ofstream ofs(out);
                if (!ofs) {
                    std::cerr << "Error: cannot write to " << out << "\n";
                    return 1;
                }
                ofs << text << "\n";
                Log::info("Wrote " + to + " to " + out);
            } else {
                std::cout << text << "\n";
            }
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const ParseError& err) {
        std::cerr << "Error: " << err.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
