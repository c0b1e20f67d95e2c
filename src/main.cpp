#include "odtdeploy/deploy/deployment_main.hpp"
#include <iostream>

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    return odtdeploy::run_deployment_main(args, std::cout, std::cerr);
}
