#pragma once

namespace aeon::cli
{

    /**
     * Entry point for the aeon command-line tool.
     * Exit codes: 0 success, 1 usage or input error, 2 verification failed.
     */
    int run(int argc, char *argv[]);

} // namespace aeon::cli
