#include "../h/cli.h"
#include "../h/logger.h"
#include <clocale>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    setlocale(LC_ALL, "");
    Logger logger;
    CommandLine cli(logger);
    std::vector<std::string> args(argv + 1, argv + argc);
    return cli.run(args, std::cout, std::cerr);
}
