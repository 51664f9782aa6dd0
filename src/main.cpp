#include "tool/run.hpp"
#include <iostream>

int main(int argc, char *argv[])
{
    return fastuuid::tool::run_tool(argc, argv, std::cout);
}
