// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <cxxopts.hpp>
#include <iostream>

#include "devguard/commands.hpp"
#include "devguard/errors.hpp"
#include "devguard/version.hpp"

using namespace devguard;

void print_banner() {
    std::cout << R"(
      _                                       _
   __| | _____   ____ _ _   _  __ _ _ __ __| |
  / _` |/ _ \ \ / / _` | | | |/ _` | '__/ _` |
 | (_| |  __/\ V / (_| | |_| | (_| | | | (_| |
  \__,_|\___| \_/ \__, |\__,_|\__,_|_|  \__,_|
                  |___/
)" << "  Code Integrity Analyzer v"
              << VERSION_STRING << "\n"
              << std::endl;
}

int main(int argc, char *argv[]) {
    cxxopts::Options options(
        "devguard",
        "Code Integrity Analyzer - Dependency graph, integrity audit and blast radius for "
        "Python, JavaScript and TypeScript code");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("v,version", "Print version");
    opts("i,input", "Ingestion batch JSON ({\"files\": [{path, language, content}]})",
         cxxopts::value<std::string>());
    opts("d,dir", "Ingest supported source files below a directory",
         cxxopts::value<std::string>());
    opts("load", "Load a snapshot written by --graph", cxxopts::value<std::string>());
    opts("c,config", "JSON configuration file", cxxopts::value<std::string>());
    opts("j,jobs", "Number of extraction threads (0 = auto)",
         cxxopts::value<unsigned int>()->default_value("0"));
    opts("graph", "Write the snapshot (nodes, edges, unparsed files, diagnostics)");
    opts("audit", "Run the integrity analyzer and write its report");
    opts("impact", "Simulate a change to a symbol (node id, qualified name or path::name)",
         cxxopts::value<std::string>());
    opts("change", "Change kind for --impact: rename, remove or signature",
         cxxopts::value<std::string>()->default_value("remove"));
    opts("search", "Search symbols by substring", cxxopts::value<std::string>());
    opts("o,output", "Output file (default: stdout)",
         cxxopts::value<std::string>()->default_value("-"));
    opts("verbose", "Print progress while ingesting");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_banner();
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  devguard --dir src --audit              Audit a source tree"
                      << std::endl;
            std::cout << "  devguard --input batch.json --graph -o snapshot.json"
                      << std::endl;
            std::cout << "  devguard --load snapshot.json --impact 'models.py::User' "
                         "--change rename"
                      << std::endl;
            std::cout << "  devguard --dir . --search 'user'        Search for symbols matching 'user'"
                      << std::endl;
            return 0;
        }

        if (result.count("version")) {
            std::cout << "devguard v" << VERSION_STRING << std::endl;
            return 0;
        }

        InputSource source;
        size_t inputs = 0;
        if (result.count("input")) {
            source.batch = result["input"].as<std::string>();
            inputs++;
        }
        if (result.count("dir")) {
            source.directory = result["dir"].as<std::string>();
            inputs++;
        }
        if (result.count("load")) {
            source.snapshot = result["load"].as<std::string>();
            inputs++;
        }

        if (inputs != 1) {
            if (inputs > 1)
                std::cerr << "Error: use only one of --input, --dir and --load" << std::endl;
            else
                print_banner();
            std::cout << options.help() << std::endl;
            return 1;
        }

        EngineConfig config;
        if (result.count("config"))
            config = load_config(result["config"].as<std::string>());
        if (result.count("jobs"))
            config.indexer.num_threads = result["jobs"].as<unsigned int>();
        if (result.count("verbose"))
            config.indexer.verbose = true;

        Engine engine(config);
        int status = cmd_ingest(engine, source);
        if (status != 0)
            return status;

        std::string output = result["output"].as<std::string>();

        if (result.count("impact")) {
            return cmd_impact(engine, result["impact"].as<std::string>(),
                              result["change"].as<std::string>(), output);
        }

        if (result.count("search")) {
            return cmd_search(engine, result["search"].as<std::string>());
        }

        if (result.count("audit")) {
            return cmd_audit(engine, output);
        }

        // Default to the snapshot itself
        return cmd_graph(engine, output);

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 1;
    } catch (const NotFoundError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
