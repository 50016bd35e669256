#include "SessionRecording.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

void printUsage() {
    std::cout << "haptic_merge_recordings usage:\n"
              << "  haptic_merge_recordings output.rec input.rec [input.rec ...] [-f]\n"
              << "  -f, --force   overwrite an existing output file\n";
}

} // namespace

int main(int argc, char** argv) {
    bool force = false;
    std::vector<std::string> paths;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-f" || arg == "--force") {
            force = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (!arg.empty() && arg[0] != '-') {
            paths.push_back(arg);
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }
    if (paths.size() < 2) {
        printUsage();
        return 1;
    }

    const std::string output = paths.front();
    const std::vector<std::string> inputs(paths.begin() + 1, paths.end());
    std::error_code ec;
    if (!force && std::filesystem::exists(output, ec)) {
        std::cerr << "/!\\ '" << output << "' exists, pass -f to overwrite\n";
        return 1;
    }
    for (const auto& in : inputs) {
        if (std::filesystem::equivalent(in, output, ec)) {
            std::cerr << "/!\\ output '" << output << "' is also an input\n";
            return 1;
        }
    }

    std::string err;
    if (!rh::mergeRecordings(output, inputs, &err)) {
        std::cerr << "/!\\ " << err << "\n";
        return 1;
    }
    std::cout << "Merged " << inputs.size() << " recording(s) into: " << output << "\n";
    return 0;
}
