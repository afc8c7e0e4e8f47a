#include <iostream>
#include <string>
#include <vector>
#include "AdminCommands.hxx"

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    try {
        return SQLiteLogKit::admin::run(args, std::cout, std::cerr);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
