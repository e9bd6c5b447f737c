// subproblem.h
// Second-stage transportation LP of one scenario

#ifndef SFLP_SUBPROBLEM_H
#define SFLP_SUBPROBLEM_H

#include <vector>

#include "errors.h"
#include "instance.h"

//
// Outcome of a scenario LP at a fixed open-set.
// When feasible, dual_demand >= 0 and dual_capacity <= 0 are the LP duals.
// When infeasible, the same vectors hold a Farkas ray (u >= 0, v <= 0) with
//   sum_j u_j d_js + sum_i v_i cap_i open_i > 0.
//
struct SubproblemResult
{
    SolveStatus status{SolveStatus::Error};
    bool feasible{false};
    double objective{0.0};
    std::vector<double> dual_demand;   // nC
    std::vector<double> dual_capacity; // nF
    std::vector<double> production;    // nF*nC, empty when infeasible

    // sum_j u_j d_js + sum_i v_i cap_i open_i at the open-set that was solved
    double dual_objective{0.0};
};

//
// ScenarioSubproblem: min sum_ij c_ij x_ij
//   s.t. sum_i x_ij >= d_js          (demand, dual u_j)
//        sum_j x_ij <= cap_i open_i  (capacity, dual v_i)
//        x_ij >= 0, x_ij = 0 on ineligible arcs
//
// Each solve() builds its own IloEnv, so distinct objects (or the same object)
// can be solved from several threads at once.
//
class ScenarioSubproblem
{
public:
    const ModelData &data;
    int scenario;
    bool log_output;

    ScenarioSubproblem(const ModelData &data_, int scenario_, bool log_output_ = false)
        : data(data_), scenario(scenario_), log_output(log_output_)
    {
    }

    // Throws SolverTimeoutError / SolverFailureError; infeasibility is a result.
    // A time_limit of 0 is a spent budget and fails without solving.
    SubproblemResult solve(const std::vector<int> &open, double time_limit = NO_TIME_LIMIT) const;

private:
    double _certificate_value(const std::vector<double> &u,
                              const std::vector<double> &v,
                              const std::vector<int> &open) const;
};

#endif // SFLP_SUBPROBLEM_H
