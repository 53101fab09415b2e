#include <iostream>
#include <string>
#include <vector>

#include "kalkon/options.h"
#include "kalkon/repl.h"

int main(int argc, char* argv[]) {
    kalkon::Options options;
    try {
        options = kalkon::parseOptions(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const kalkon::OptionsError& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    if (options.show_help) {
        kalkon::printUsage(std::cout);
        kalkon::Repl::printHelp(std::cout);
        return 0;
    }

    kalkon::Session session(options.session);
    kalkon::Repl repl;

    if (options.file) {
        return repl.runFile(session, *options.file, std::cout, std::cerr);
    }
    return repl.runInteractive(session, std::cin, std::cout, std::cerr);
}
