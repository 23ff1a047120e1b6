#include <iostream>
#include <string>
#include "cli/templative_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        TemplativeCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
