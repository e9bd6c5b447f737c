// options.cpp
// Command-line options of the sflp_benders driver

#include <stdexcept>
#include <string>

#include "options.h"

Options parse_opts(int argc, char **argv)
{
    Options opt;
    for (int k = 2; k < argc; ++k)
    {
        std::string a = argv[k];
        auto need = [&]()
        {
            if (k + 1 >= argc)
                throw std::runtime_error("Missing value after " + a);
            ++k;
            return std::string(argv[k]);
        };
        if (a == "--timelimit")
            opt.benders.time_limit = std::stod(need());
        else if (a == "--maxiter")
            opt.benders.max_iterations = std::stoi(need());
        else if (a == "--threads")
            opt.benders.threads = std::stoi(need());
        else if (a == "--eps")
            opt.benders.eps = std::stod(need());
        else if (a == "--tol-abs")
            opt.benders.tol_abs = std::stod(need());
        else if (a == "--tol-rel")
            opt.benders.tol_rel = std::stod(need());
        else if (a == "--extensive")
            opt.extensive = true;
        else if (a == "--log")
            opt.benders.log_output = true;
        else if (a == "--solver-log")
            opt.benders.solver_log = true;
        else if (a == "--print")
            opt.print_allocation = true;
        else
            throw std::runtime_error("Unknown option: " + a);
    }
    if (opt.benders.max_iterations < 1)
        throw std::runtime_error("--maxiter must be at least 1");
    return opt;
}
