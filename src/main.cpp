#include "aeon/cli.hpp"

int main(int argc, char *argv[])
{
    return aeon::cli::run(argc, argv);
}
