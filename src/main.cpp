#include "sharecost/cli.hpp"

int main(int argc, char *argv[])
{
    return sharecost::cli::run(argc, argv);
}
