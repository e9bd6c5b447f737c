// cuts.h
// Benders cuts over the open-facility variables

#ifndef SFLP_CUTS_H
#define SFLP_CUTS_H

#include <vector>

#include "instance.h"
#include "subproblem.h"

enum class CutType
{
    Optimality,
    Feasibility
};

const char *to_string(CutType type);

//
// Optimality:  theta_s >= constant + sum_i coef_i open_i
// Feasibility:            constant + sum_i coef_i open_i <= 0
//
struct Cut
{
    CutType type{CutType::Optimality};
    int scenario{-1};
    std::vector<double> coef; // one per facility
    double constant{0.0};
    int iteration{-1}; // audit only
};

// constant + sum_i coef_i open_i
double evaluate(const Cut &cut, const std::vector<int> &open);

// Optimality cuts are checked against theta, feasibility cuts ignore it.
bool is_satisfied(const Cut &cut, const std::vector<int> &open, double theta, double tol = 1e-6);

//
// Turns subproblem dual information into cuts. Pure: it never touches the
// master, the caller decides what to do with the cut.
//
class CutGenerator
{
public:
    const ModelData &data;

    explicit CutGenerator(const ModelData &data_) : data(data_) {}

    // Feasible result -> optimality cut, infeasible result -> feasibility cut.
    Cut operator()(int scenario, const SubproblemResult &res, int iteration) const;

    Cut optimality_cut(int scenario,
                       const std::vector<double> &dual_demand,
                       const std::vector<double> &dual_capacity,
                       int iteration) const;

    // The ray is scaled so that its largest coefficient is 1 in magnitude.
    Cut feasibility_cut(int scenario,
                        const std::vector<double> &ray_demand,
                        const std::vector<double> &ray_capacity,
                        int iteration) const;

private:
    void _fill(Cut &cut, int scenario,
               const std::vector<double> &dual_demand,
               const std::vector<double> &dual_capacity) const;
};

#endif // SFLP_CUTS_H
