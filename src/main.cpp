#include "backup_cli.hpp"
#include <curl/curl.h>
#include <iostream>

int main(int argc, char* argv[]) {
    std::vector<std::string> arguments(argv + 1, argv + argc);
    auto options = parseCliArguments(arguments);
    if (!options) {
        std::cerr << "Error: " << options.error() << "\n" << cliUsage(argv[0]);
        return 1;
    }
    if (options->help) {
        std::cout << cliUsage(argv[0]);
        return 0;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int status = runCli(*options, std::cout, std::cerr);
    curl_global_cleanup();
    return status;
}
