#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "arbor/Document.hpp"
#include "arbor/Errors.hpp"
#include "arbor/Merge.hpp"
#include "arbor/Operations.hpp"

using namespace arbor;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("arbor", "Read and rewrite JSON/TOML documents by path, without touching the input");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("f,file", "Input document (.json or .toml)", cxxopts::value<std::string>())
            ("w,with", "Second document for `merge`", cxxopts::value<std::string>())
            ("i,indent", "JSON output indent (-1 for one line)", cxxopts::value<int>()->default_value("2"))
            ("o,out", "Write the resulting document to this JSON file", cxxopts::value<std::string>())
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: get PATH | has PATH | set PATH VALUE | remove PATH | add PATH VALUE"
                         " | assign PATH VALUE | merge [PATH] | dump\n";
            return 0;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];

        if (!result.count("file")) {
            std::cerr << "Error: --file must be provided\n";
            return 1;
        }
        const Value root = load_document(result["file"].as<std::string>());
        const int indent = result["indent"].as<int>();

        // Helpers to require extra args
        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
                return false;
            }
            return true;
        };

        // Writes go to --out when given, stdout otherwise
        auto emit = [&](const Value& doc) {
            if (result.count("out")) {
                const auto out = result["out"].as<std::string>();
                write_json_file(out, doc, indent);
                std::cout << "Wrote " << out << "\n";
            } else {
                std::cout << dump_json(doc, indent) << "\n";
            }
            return 0;
        };

        // GET
        if (cmd == "get") {
            if (!expect_args(2)) return 1;
            const Value found = get(cmdv[1], root);
            if (found.is_undefined()) {
                std::cerr << "Path not found: " << cmdv[1] << "\n";
                return 1;
            }
            std::cout << dump_json(found, indent) << "\n";
            return 0;
        }

        // HAS
        if (cmd == "has") {
            if (!expect_args(2)) return 1;
            const bool ok = has(cmdv[1], root);
            std::cout << (ok ? "true" : "false") << "\n";
            return ok ? 0 : 1;
        }

        // SET / ADD / ASSIGN
        if (cmd == "set" || cmd == "add" || cmd == "assign") {
            if (!expect_args(3)) return 1;
            const Value parsed = parse_json_or_string(cmdv[2]);
            if (cmd == "set") return emit(set(cmdv[1], parsed, root));
            if (cmd == "add") return emit(add(cmdv[1], parsed, root));
            return emit(assign(cmdv[1], parsed, root));
        }

        // REMOVE
        if (cmd == "remove") {
            if (!expect_args(2)) return 1;
            return emit(remove(cmdv[1], root));
        }

        // MERGE (requires --with)
        if (cmd == "merge") {
            if (!result.count("with")) {
                std::cerr << "Error: --with must be provided for `merge`\n";
                return 1;
            }
            const Value other = load_document(result["with"].as<std::string>());
            if (cmdv.size() < 2) {
                return emit(deep_merge(root, other));
            }
            return emit(merge_at(cmdv[1], other, root));
        }

        // DUMP
        if (cmd == "dump") {
            return emit(root);
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const PathSyntaxError& pse) {
        std::cerr << "Error: " << pse.what() << "\n";
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
