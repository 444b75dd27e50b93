#include "Packwright/CliParser.hpp"
#include "Packwright/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser is responsible for defining and parsing all command-line
    // arguments using the CLI11 library.
    Packwright::CliParser parser;
    auto app = parser.setupCli();

    // Usage errors exit with the same code as other user errors; --help and
    // --version exit with 0.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app->exit(e);
        return code == 0 ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    if (parser.getCommands().active_command.empty()) {
        std::cout << app->help() << std::endl;
        return 0;
    }

    // Core maps every Packwright error to its exit code; anything reaching
    // this handler is an internal failure.
    try {
        Packwright::Core core(parser.getCommands());
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
