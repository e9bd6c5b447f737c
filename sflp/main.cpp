// main.cpp
// Command-line driver: Benders decomposition (default) or extensive form
//
// Usage:
//   ./sflp_benders INSTANCE.txt [--timelimit T] [--maxiter N] [--threads K]
//                  [--eps E] [--tol-abs A] [--tol-rel R] [--extensive] [--log] [--solver-log] [--print]

#include <iostream>
#include <string>

#include <ilcplex/ilocplex.h>

#include "benders.h"
#include "extensive.h"
#include "instance.h"
#include "options.h"
#include "report.h"

ILOSTLBEGIN

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0]
                  << " <instance_path> [--timelimit T] [--maxiter N] [--threads K]"
                     " [--eps E] [--tol-abs A] [--tol-rel R] [--extensive] [--log] [--solver-log] [--print]\n";
        return 1;
    }

    const std::string path = argv[1];
    Options opt;
    try
    {
        opt = parse_opts(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Arg error: " << e.what() << "\n";
        return 1;
    }

    try
    {
        ModelData data = ModelData::from_txt(path);
        data.validate();

        std::cerr << "Solving stochastic facility location problem:\n"
                  << "  - instance: " << path << "\n"
                  << "  - facilities: " << data.num_facilities() << "\n"
                  << "  - customers: " << data.num_customers() << "\n"
                  << "  - scenarios: " << data.num_scenarios() << "\n"
                  << "  - max duration: " << opt.benders.time_limit << " seconds\n";

        if (opt.extensive)
        {
            ExtensiveForm ef(data, opt.benders.time_limit, opt.benders.threads, opt.benders.solver_log);
            ExtensiveResult res = ef.solve();
            print_report(std::cout, data, res, opt.print_allocation);
            return res.open.empty() ? 2 : 0;
        }

        BendersLoop loop(data, opt.benders);
        BendersResult res = loop.run();
        print_report(std::cout, data, res, opt.print_allocation);
        return res.has_incumbent ? 0 : 2;
    }
    catch (const IloException &e)
    {
        std::cerr << "CPLEX/Concert exception: " << e << "\n";
        return 3;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 4;
    }
}
