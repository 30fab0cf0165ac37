#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "config/intake_config.hpp"
#include "ingest/ingestion_service.hpp"
#include "storage/submission_store.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/thread_pool.hpp"

namespace {

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --file <path> --name <name> --email <email> --phone <phone> [--config <path>]\n";
}

// Accepts "--key value" pairs only; returns false on anything else.
bool parseArgs(int argc, char** argv, std::map<std::string, std::string>& args) {
    for (int i = 1; i < argc; ++i) {
        std::string key = argv[i];
        if (key == "--help" || key == "-h") {
            return false;
        }
        if (key.rfind("--", 0) != 0 || i + 1 >= argc) {
            std::cerr << "Invalid argument: " << key << "\n";
            return false;
        }
        args[key.substr(2)] = argv[++i];
    }
    return true;
}

bool readFile(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

} // namespace

int main(int argc, char** argv) {
    namespace logger = safeintake::util::logger;

    std::map<std::string, std::string> args;
    if (!parseArgs(argc, argv, args)) {
        printUsage(argv[0]);
        return 1;
    }
    for (const char* required : {"file", "name", "email", "phone"}) {
        if (args.find(required) == args.end()) {
            std::cerr << "Missing --" << required << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    // 1. Configuration
    safeintake::config::IntakeConfig config;
    try {
        safeintake::util::ConfigParser parser(config);
        parser.loadFromFile(args.count("config") ? args["config"] : "safeintake.conf");
        logger::setLogLevel(logger::parseLogLevel(config.logLevel));
    } catch (const std::exception& e) {
        logger::error(std::string("[main] ") + e.what());
        return 1;
    }
    if (!config.logFile.empty() && !logger::enableFileOutput(config.logFile)) {
        logger::warn("[main] Could not open log file " + config.logFile);
    }

    // 2. Upload
    safeintake::ingest::Upload upload;
    upload.filename = args["file"];
    if (!readFile(upload.filename, upload.content)) {
        logger::error("[main] Could not read " + upload.filename);
        return 1;
    }
    upload.contentType = safeintake::ingest::GuessContentType(upload.filename);

    // 3. Ingest
    try {
        std::unique_ptr<safeintake::storage::BlobStorage> blobs =
            safeintake::ingest::MakeBlobStorage(config);
        safeintake::storage::SubmissionStore index(config.databasePath);
        safeintake::util::ThreadPool pool(config.workerThreads);
        safeintake::ingest::IngestionService service(config, *blobs, &index, &pool);

        safeintake::ingest::IngestionResult result =
            service.Ingest(upload, args["name"], args["email"], args["phone"]);
        std::cout << result.ToJson() << std::endl;
    } catch (const std::exception& e) {
        logger::error(std::string("[main] Upload failed: ") + e.what());
        return 1;
    }

    return 0;
}
