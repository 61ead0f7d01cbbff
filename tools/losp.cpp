#include "runtime/losp.hpp"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>


static void usage()
{
    std::cerr << "usage: losp repl\n"
              << "       losp debug\n"
              << "       losp run <file>\n"
              << "       losp debug <file>" << std::endl;
}


static int repl(losp::Context& context)
{
    std::string input;
    while (true) {
        std::cout << "> " << std::flush;
        if (not std::getline(std::cin, input)) {
            std::cout << std::endl;
            return EXIT_SUCCESS;
        }
        if (input.empty()) {
            continue;
        }
        try {
            losp::print(context.eval(input), std::cout);
            std::cout << std::endl;
        } catch (const std::exception& ex) {
            std::cout << "Error: " << ex.what() << std::endl;
        }
    }
}


static int dofile(losp::Context& context, const char* fname)
{
    std::ifstream t(fname);
    if (not t) {
        std::cerr << "Error: unable to open " << fname << std::endl;
        return EXIT_FAILURE;
    }
    std::stringstream buffer;
    buffer << t.rdbuf();
    try {
        context.exec(buffer.str());
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}


int main(int argc, char** argv)
{
    if (argc < 2 or argc > 3) {
        usage();
        return EXIT_FAILURE;
    }
    const bool debug = std::strcmp(argv[1], "debug") == 0;
    const bool run = std::strcmp(argv[1], "run") == 0;
    const bool interactive = std::strcmp(argv[1], "repl") == 0;
    if ((run and argc not_eq 3) or (interactive and argc not_eq 2) or
        not(debug or run or interactive)) {
        usage();
        return EXIT_FAILURE;
    }
    losp::Context context;
    losp::TracePrinter tracer(std::cout);
    if (debug) {
        context.setObserver(&tracer);
    }
    if (argc == 3) {
        return dofile(context, argv[2]);
    }
    return repl(context);
}
