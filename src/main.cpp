#include "EmuApp.hpp"
#include "Logger.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <unistd.h>

namespace {

std::atomic<bool> g_interrupted(false);

void handleSignal(int) {
    g_interrupted.store(true);
}

} // namespace

void printHelp(const char* programName) {
    std::cout << "Usage: " << programName << " [OPTIONS]\n\n";
    std::cout << "Android emulator and iOS simulator manager\n";
    std::cout << "Lists, starts, stops, creates, wipes and deletes virtual devices.\n\n";
    std::cout << "Optional Arguments:\n";
    std::cout << "  -c, --config FILE        Path to configuration JSON file\n";
    std::cout << "  --log-level LEVEL        debug, info, warning or error\n";
    std::cout << "  --log-file FILE          Append log output to FILE\n";
    std::cout << "  -l, --list               Print the device lists and exit\n";
    std::cout << "  -h, --help               Display this help message and exit\n\n";
    std::cout << "Environment:\n";
    std::cout << "  ANDROID_HOME, ANDROID_SDK_ROOT   Android SDK root when not set in the config\n";
    std::cout << "  ANDROID_AVD_HOME                 AVD directory, defaults to ~/.android/avd\n\n";
    std::cout << "Interactive keys (one per line, or several characters on one line):\n";
    std::cout << "  up/down, j/k    Move selection        tab, left/right  Switch panel\n";
    std::cout << "  enter           Start/stop device     c                Create device\n";
    std::cout << "  d               Delete device         w                Wipe device\n";
    std::cout << "  i               Toggle details        m                Manage API levels\n";
    std::cout << "  r               Refresh               f                Cycle log filter\n";
    std::cout << "  s               Toggle auto scroll    x                Dismiss notifications\n";
    std::cout << "  pageup/pagedown Scroll logs           q, quit          Exit\n";
}

int main(int argc, char* argv[]) {
    std::string configFile;
    CommandLineOverrides overrides;
    bool listOnly = false;

    // Parse command line arguments manually for better control
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printHelp(argv[0]);
            return 0;
        } else if (arg == "-l" || arg == "--list") {
            listOnly = true;
        } else if (arg == "-c" || arg == "--config" || arg == "--log-level" || arg == "--log-file") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument." << std::endl;
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "--log-level") {
                overrides.logLevel = value;
            } else if (arg == "--log-file") {
                overrides.logFile = value;
            } else {
                configFile = value;
            }
        } else {
            std::cerr << "Error: Unknown argument: " << arg << std::endl;
            std::cerr << "Use -h or --help for usage information." << std::endl;
            return 1;
        }
    }

    if (!configFile.empty() && access(configFile.c_str(), R_OK) != 0) {
        std::cerr << "Error: config file is not readable: " << configFile << std::endl;
        return 1;
    }

    // Emulator children may close their pipes early
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    EmuApp app;
    if (!app.initialize(configFile, overrides)) {
        std::cerr << "Error: " << app.getLastError() << std::endl;
        return 1;
    }

    if (listOnly) {
        int rc = app.listDevices(std::cout);
        app.shutdown();
        return rc;
    }

    try {
        app.run(STDIN_FILENO, std::cout, g_interrupted);
    } catch (const std::exception& e) {
        LOG_ERROR("Exception in interactive loop: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        app.shutdown();
        return 1;
    }

    app.shutdown();
    return 0;
}
