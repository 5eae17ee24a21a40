#include "cli.hpp"

#include <libxml/parser.h>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }

    xmlInitParser();
    int status = svgstego::runCli(args, std::cout);
    xmlCleanupParser();
    return status;
}
