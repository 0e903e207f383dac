// src/tools/dump_layerfile.cpp
// Prints the summary, and with -v the index and every value reference, of
// one image layer file given by path.
#include "layerstore/layer/image_layer.h"
#include "layerstore/storage_error/error_utils.h"

#include <filesystem>
#include <iostream>
#include <string>

namespace {

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [-v] <layer file>" << std::endl;
}

} // end anonymous namespace

int main(int argc, char** argv) {
    bool verbose = false;
    std::string path;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (path.empty()) {
            path = arg;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }
    if (path.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        auto layer = layerstore::layer::ImageLayer::newForPath(std::filesystem::path(path));
        layer->dump(verbose, std::cout);
    } catch (const storage::StorageError& e) {
        std::cerr << e.toDetailedString() << std::endl;
        return 1;
    }
    return 0;
}
