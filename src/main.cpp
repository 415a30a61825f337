#include <iostream>
#include <string>
#include <vector>
#include <curl/curl.h>
#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "ranking.hpp"
#include "scheduler.hpp"
#include "utils.hpp"
#include "version.hpp"

void printHelp() {
    std::cout << "Usage: subscout <command> [options] <paths...>\n\n"
              << "Commands:\n"
              << "  list <paths...>             List available subtitles for videos\n"
              << "  download <paths...>         Download the best subtitles for videos\n"
              << "  config [options]            Configure provider credentials\n"
              << "    --opensubtitles-key <key>       Set OpenSubtitles API key\n"
              << "    --opensubtitles-user <name>     Set OpenSubtitles username\n"
              << "    --opensubtitles-password <pw>   Set OpenSubtitles password\n"
              << "  version                     Show version\n"
              << "  help                        Show this help message\n"
              << "  Options:\n"
              << "    -l, --language <code>     Wanted language (repeatable)\n"
              << "    -p, --provider <name>     Provider to use (repeatable)\n"
              << "    -w, --workers <num>       Number of concurrent workers\n"
              << "    -m, --multi               One subtitle per language\n"
              << "    -f, --force               Ignore subtitles already on disk\n"
              << "    -d, --depth <num>         Directory recursion depth, 0 for unlimited\n"
              << "    --sort <criteria>         Comma separated: language, provider,\n"
              << "                              provider_confidence, matching_confidence\n"
              << "    --cache-dir <dir>         Provider cache directory\n"
              << "    --config <path>           Specify custom config file location\n"
              << "    --verbose                 Print debug logs\n";
}

int runConfig(Config& config, const std::string& configPath, int argc, char* argv[]) {
    bool updated = false;
    for (int i = 2; i < argc; i++) {
        std::string option = argv[i];
        if (option == "--opensubtitles-key" && i + 1 < argc) {
            config.opensubtitles_api_key = argv[++i];
            updated = true;
        }
        else if (option == "--opensubtitles-user" && i + 1 < argc) {
            config.opensubtitles_username = argv[++i];
            updated = true;
        }
        else if (option == "--opensubtitles-password" && i + 1 < argc) {
            config.opensubtitles_password = argv[++i];
            updated = true;
        }
        else if (option == "--config") {
            i++;
        }
    }

    if (!updated) {
        std::string api_key;
        std::cout << "Enter OpenSubtitles API key (press Enter to skip): ";
        std::getline(std::cin, api_key);
        if (!api_key.empty()) config.opensubtitles_api_key = api_key;

        std::string username;
        std::cout << "Enter OpenSubtitles username (press Enter to skip): ";
        std::getline(std::cin, username);
        if (!username.empty()) {
            config.opensubtitles_username = username;

            std::string password;
            std::cout << "Enter OpenSubtitles password: ";
            std::getline(std::cin, password);
            config.opensubtitles_password = password;
        }
    }

    config.save(configPath);
    std::cout << "Configuration saved to " << configPath << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printHelp();
        return 1;
    }

    std::string command = argv[1];
    if (command == "help" || command == "--help" || command == "-h") {
        printHelp();
        return 0;
    }
    if (command == "version") {
        std::cout << "subscout " << version::CURRENT_VERSION << "\n";
        return 0;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int status = 0;

    try {
        std::string configPath = Config::getConfigPath();
        for (int i = 1; i < argc - 1; i++) {
            if (std::string(argv[i]) == "--config") {
                configPath = argv[i + 1];
                break;
            }
        }

        auto config = Config::load(configPath);

        if (command == "config") {
            status = runConfig(config, configPath, argc, argv);
            curl_global_cleanup();
            return status;
        }

        std::vector<std::string> languages;
        std::vector<std::string> providers;
        std::vector<std::string> paths;

        for (int i = 2; i < argc; i++) {
            std::string option = argv[i];
            bool has_value = i + 1 < argc;

            if (option == "-m" || option == "--multi") {
                config.multi = true;
            }
            else if (option == "-f" || option == "--force") {
                config.force = true;
            }
            else if (option == "--verbose") {
                logging::setLevel(logging::Level::Debug);
            }
            else if ((option == "-l" || option == "--language") && has_value) {
                languages.push_back(argv[++i]);
            }
            else if ((option == "-p" || option == "--provider") && has_value) {
                providers.push_back(argv[++i]);
            }
            else if ((option == "-w" || option == "--workers") && has_value) {
                config.workers = std::stoi(argv[++i]);
            }
            else if ((option == "-d" || option == "--depth") && has_value) {
                config.max_depth = std::stoi(argv[++i]);
            }
            else if (option == "--sort" && has_value) {
                config.sort_order = utils::splitString(argv[++i], ',');
            }
            else if (option == "--cache-dir" && has_value) {
                config.cache_dir = argv[++i];
            }
            else if (option == "--config" && has_value) {
                i++;
            }
            else if (!option.empty() && option[0] == '-') {
                std::cerr << "Error: Unknown option " << option << "\n";
                curl_global_cleanup();
                return 1;
            }
            else {
                paths.push_back(option);
            }
        }

        if (!languages.empty()) config.languages = languages;
        if (!providers.empty()) config.providers = providers;

        if (paths.empty()) {
            std::cerr << "Error: No video path given\n";
            curl_global_cleanup();
            return 1;
        }

        Scheduler scheduler(config.toSchedulerOptions());

        if (command == "list") {
            auto results = scheduler.listSubtitles(paths);
            for (const auto& [video, subtitles] : results) {
                std::cout << video->path << " - " << video->describe() << "\n";
                if (subtitles.empty()) {
                    std::cout << "  no subtitles\n";
                }
                for (const auto& subtitle : subtitles) {
                    std::cout << "  " << subtitle.describe() << "\n";
                }
            }
        }
        else if (command == "download") {
            auto downloaded = scheduler.downloadSubtitles(paths);
            for (const auto& subtitle : downloaded) {
                std::cout << subtitle.path << " (" << subtitle.provider << ", " << subtitle.language << ")\n";
            }
            if (downloaded.empty()) {
                std::cout << "No subtitles downloaded.\n";
            }
        }
        else {
            printHelp();
            status = 1;
        }
    }
    catch (const InvalidLanguageError& e) {
        std::cerr << "Error: " << e.what() << " (expected an ISO 639-1 code)\n";
        status = 1;
    }
    catch (const PluginError& e) {
        std::cerr << "Provider error: " << e.what() << "\n";
        status = 1;
    }
    catch (const SubscoutError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        status = 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        status = 1;
    }

    curl_global_cleanup();
    return status;
}
