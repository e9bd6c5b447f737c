// report.cpp
// Plain-text reports of Benders and extensive-form runs

#include <iomanip>
#include <vector>

#include "report.h"

namespace
{

void print_open(std::ostream &out, const ModelData &data, const std::vector<int> &open)
{
    std::vector<int> idx;
    for (int i = 0; i < data.num_facilities(); ++i)
        if (open[i])
            idx.push_back(i);

    out << "Open facilities:\n";
    out << "  count = " << idx.size() << " { ";
    for (size_t k = 0; k < idx.size(); ++k)
        out << data.facilities[idx[k]].id << " ";
    out << "}\n";
}

// shipments above 1e-9 as "scenario: facility -> customer = amount"
void print_allocation(std::ostream &out, const ModelData &data,
                      const std::vector<std::vector<double>> &allocation)
{
    const int nC = data.num_customers();
    out << "\nAllocations (scenario: facility -> customer):\n";
    for (int s = 0; s < static_cast<int>(allocation.size()); ++s)
        for (int i = 0; i < data.num_facilities(); ++i)
            for (int j = 0; j < nC; ++j)
            {
                const double q = allocation[s][idx2(i, j, nC)];
                if (q > 1e-9)
                    out << "  " << data.scenarios[s].id << ": " << data.facilities[i].id
                        << " -> " << data.customers[j].id << " = " << q << "\n";
            }
}

} // namespace

void print_report(std::ostream &out, const ModelData &data, const BendersResult &res, bool print_allocation_)
{
    const std::ios::fmtflags flags = out.flags();
    const std::streamsize prec = out.precision();
    out.setf(std::ios::fixed);
    out.precision(6);

    out << "Status     : " << to_string(res.state) << "\n";
    out << "Objective  : " << res.objective << "\n";
    out << "Best LB    : " << res.lower_bound << "\n";
    out << "Gap        : " << res.gap << "\n";
    out << "Rel. gap   : " << res.relative_gap() << "\n";
    out << "Iterations : " << res.iterations << "\n";
    out << "Cuts       : " << res.cuts.size() << " (optimality " << res.optimality_cuts
        << ", feasibility " << res.feasibility_cuts << ")\n";
    if (res.numeric_warnings > 0)
        out << "Warnings   : " << res.numeric_warnings << "\n";
    out << "Time(s)    : " << res.time_sec << "\n";

    if (res.has_incumbent)
    {
        print_open(out, data, res.open);
        out << "Scenario costs:\n";
        for (int s = 0; s < data.num_scenarios(); ++s)
            out << "  " << data.scenarios[s].id << " (p=" << data.scenarios[s].probability
                << ") = " << res.scenario_costs[s] << "\n";
        if (print_allocation_)
            print_allocation(out, data, res.allocation);
    }
    else
    {
        out << "No incumbent found.\n";
    }

    out.flags(flags);
    out.precision(prec);
}

void print_report(std::ostream &out, const ModelData &data, const ExtensiveResult &res, bool print_allocation_)
{
    const std::ios::fmtflags flags = out.flags();
    const std::streamsize prec = out.precision();
    out.setf(std::ios::fixed);
    out.precision(6);

    out << "Status     : " << to_string(res.status) << "\n";
    if (!res.open.empty())
    {
        out << "Objective  : " << res.objective << "\n";
        out << "Best LB    : " << res.best_bound << "\n";
        out << "Time(s)    : " << res.time_sec << "\n";
        print_open(out, data, res.open);
        if (print_allocation_)
            print_allocation(out, data, res.allocation);
    }
    else
    {
        out << "No solution found.\n";
    }

    out.flags(flags);
    out.precision(prec);
}
