// extensive.h
// Extensive form (deterministic equivalent) of the stochastic facility location

#ifndef SFLP_EXTENSIVE_H
#define SFLP_EXTENSIVE_H

#include <vector>

#include "errors.h"
#include "instance.h"

struct ExtensiveResult
{
    SolveStatus status{SolveStatus::Error};
    std::vector<int> open;
    double objective{0.0};
    double best_bound{0.0};
    std::vector<std::vector<double>> allocation; // per scenario, nF*nC
    double time_sec{0.0};
};

//
// All scenarios in one MIP:
//   min sum_i f_i open_i + sum_s p_s sum_ij c_ij x_ijs
//   s.t. sum_i x_ijs >= d_js, sum_j x_ijs <= cap_i open_i, x_ijs = 0 off the eligible arcs
//
class ExtensiveForm
{
public:
    const ModelData &data;
    double time_limit;
    int threads;
    bool log_output;

    ExtensiveForm(const ModelData &data_,
                  double time_limit_ = -1.0,
                  int threads_ = 0,
                  bool log_output_ = false)
        : data(data_), time_limit(time_limit_), threads(threads_), log_output(log_output_)
    {
    }

    // Infeasible models are reported through the status; solver errors throw.
    ExtensiveResult solve() const;
};

#endif // SFLP_EXTENSIVE_H
