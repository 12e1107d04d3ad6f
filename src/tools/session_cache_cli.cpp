#include "cache/data_cache_factory.hpp"
#include "common/config_loader.hpp"
#include "common/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

void PrintUsage(const char* program) {
    std::fprintf(stderr,
                 "Usage: %s [--config <path>] <command> [args]\n"
                 "Commands:\n"
                 "  get <key>\n"
                 "  put <key> <value>\n"
                 "  putnx <key> <value>\n"
                 "  reserve <key>\n"
                 "  expire <key> <seconds>\n"
                 "  del <key>\n",
                 program);
}

int Fail(const session_cache::common::Status& status) {
    std::cerr << session_cache::common::StatusCodeToString(status.Code()) << ": " << status.Message()
              << std::endl;
    return EXIT_FAILURE;
}

int RunCommand(session_cache::cache::DataCache& cache, const std::vector<std::string>& args) {
    const std::string& command = args[0];
    if (command == "get" && args.size() == 2) {
        auto value = cache.Read(args[1]);
        if (!value.IsOk()) {
            return Fail(value.GetStatus());
        }
        if (!value.Value()) {
            std::cout << "(nil)" << std::endl;
        } else {
            std::cout << *value.Value() << std::endl;
        }
        return EXIT_SUCCESS;
    }
    if (command == "put" && args.size() == 3) {
        auto status = cache.Write(args[1], args[2]);
        if (!status.IsOk()) {
            return Fail(status);
        }
        std::cout << "OK" << std::endl;
        return EXIT_SUCCESS;
    }
    if ((command == "putnx" && args.size() == 3) || (command == "reserve" && args.size() == 2)) {
        auto created = command == "reserve" ? cache.ReserveKey(args[1]) : cache.WriteIfAbsent(args[1], args[2]);
        if (!created.IsOk()) {
            return Fail(created.GetStatus());
        }
        std::cout << (created.Value() ? "created" : "exists") << std::endl;
        return EXIT_SUCCESS;
    }
    if (command == "expire" && args.size() == 3) {
        int seconds = 0;
        try {
            seconds = std::stoi(args[2]);
        } catch (const std::exception&) {
            std::cerr << "invalid seconds: " << args[2] << std::endl;
            return EXIT_FAILURE;
        }
        auto status = cache.SetExpiry(args[1], seconds);
        if (!status.IsOk()) {
            return Fail(status);
        }
        std::cout << "OK" << std::endl;
        return EXIT_SUCCESS;
    }
    if (command == "del" && args.size() == 2) {
        auto status = cache.Delete(args[1]);
        if (!status.IsOk()) {
            return Fail(status);
        }
        std::cout << "OK" << std::endl;
        return EXIT_SUCCESS;
    }
    return -1;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            args.push_back(std::move(arg));
        }
    }
    if (args.empty()) {
        PrintUsage(argv[0]);
        return EXIT_FAILURE;
    }
    if (config_path.empty()) {
        config_path = session_cache::common::ConfigLoader::DetectConfigPath();
    }

    auto config = session_cache::common::ConfigLoader::Load(config_path);
    if (!config.IsOk()) {
        std::fprintf(stderr, "Failed to load config %s: %s\n", config_path.c_str(),
                     config.GetStatus().Message().c_str());
        return EXIT_FAILURE;
    }

    session_cache::common::InitLogger(config.Value().logging);
    SESSION_CACHE_LOG_INFO("session_cache_cli using config {}", config_path);

    session_cache::cache::DataCacheProvider provider(config.Value().redis);
    auto cache = provider.Get();
    if (!cache.IsOk()) {
        int rc = Fail(cache.GetStatus());
        session_cache::common::ShutdownLogger();
        return rc;
    }

    int rc = RunCommand(*cache.Value(), args);
    if (rc < 0) {
        PrintUsage(argv[0]);
        rc = EXIT_FAILURE;
    }
    session_cache::common::ShutdownLogger();
    return rc;
}
