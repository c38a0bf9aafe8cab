#include <crow/logging.h>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "token_cli.hpp"

using namespace bootstrap;

void terminateHandler() {
    CROW_LOG_ERROR << "Unhandled exception caught! bootstrap-token is giving up";

    auto ex = std::current_exception();
    if (ex) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            CROW_LOG_ERROR << "exception caught: " << e.what();
        }
    }
    std::abort();
}

int main(int argc, char* argv[])
{
    std::set_terminate(terminateHandler);

    std::vector<std::string> args(argv, argv + argc);
    return TokenCli::run(args, std::cout, std::cerr);
}
