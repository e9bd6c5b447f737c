// cuts.cpp
// Benders cuts over the open-facility variables

#include <algorithm>
#include <cmath>

#include "cuts.h"

const char *to_string(CutType type)
{
    return type == CutType::Optimality ? "optimality" : "feasibility";
}

double evaluate(const Cut &cut, const std::vector<int> &open)
{
    double v = cut.constant;
    for (size_t i = 0; i < cut.coef.size(); ++i)
        v += cut.coef[i] * static_cast<double>(open[i]);
    return v;
}

bool is_satisfied(const Cut &cut, const std::vector<int> &open, double theta, double tol)
{
    const double rhs = evaluate(cut, open);
    if (cut.type == CutType::Optimality)
        return theta >= rhs - tol;
    return rhs <= tol;
}

void CutGenerator::_fill(Cut &cut, int scenario,
                         const std::vector<double> &dual_demand,
                         const std::vector<double> &dual_capacity) const
{
    cut.scenario = scenario;
    cut.constant = 0.0;
    for (int j = 0; j < data.num_customers(); ++j)
        cut.constant += dual_demand[j] * data.demand(j, scenario);
    cut.coef.assign(data.num_facilities(), 0.0);
    for (int i = 0; i < data.num_facilities(); ++i)
        cut.coef[i] = dual_capacity[i] * data.facilities[i].capacity; // <= 0
}

Cut CutGenerator::optimality_cut(int scenario,
                                 const std::vector<double> &dual_demand,
                                 const std::vector<double> &dual_capacity,
                                 int iteration) const
{
    Cut cut;
    cut.type = CutType::Optimality;
    cut.iteration = iteration;
    _fill(cut, scenario, dual_demand, dual_capacity);
    return cut;
}

Cut CutGenerator::feasibility_cut(int scenario,
                                  const std::vector<double> &ray_demand,
                                  const std::vector<double> &ray_capacity,
                                  int iteration) const
{
    Cut cut;
    cut.type = CutType::Feasibility;
    cut.iteration = iteration;
    _fill(cut, scenario, ray_demand, ray_capacity);

    double scale = std::abs(cut.constant);
    for (double a : cut.coef)
        scale = std::max(scale, std::abs(a));
    if (scale > 0.0)
    {
        cut.constant /= scale;
        for (double &a : cut.coef)
            a /= scale;
    }
    return cut;
}

Cut CutGenerator::operator()(int scenario, const SubproblemResult &res, int iteration) const
{
    if (res.feasible)
        return optimality_cut(scenario, res.dual_demand, res.dual_capacity, iteration);
    return feasibility_cut(scenario, res.dual_demand, res.dual_capacity, iteration);
}
