// benders.h
// Benders decomposition loop for the two-stage stochastic facility location

#ifndef SFLP_BENDERS_H
#define SFLP_BENDERS_H

#include <limits>
#include <string>
#include <vector>

#include "cuts.h"
#include "instance.h"
#include "master.h"
#include "subproblem.h"

enum class LoopState
{
    Init,
    Iterating,
    Converged,
    MaxIterReached,
    TimeLimitReached,
    InfeasibleModel
};

const char *to_string(LoopState state);

struct BendersOptions
{
    double eps{1e-6};         // theta_s < z_s - eps triggers an optimality cut
    double tol_abs{1e-6};     // UB - LB
    double tol_rel{1e-6};     // (UB - LB) / |UB|
    int max_iterations{1000}; // master solves
    double time_limit{-1.0};  // wall clock seconds, <= 0 = unlimited
    int threads{0};           // scenario workers and master threads, 0 = hardware
    double numeric_tol{1e-5}; // strong duality / reproduction residual
    bool log_output{false};   // iteration log on stdout
    bool solver_log{false};   // CPLEX log of the master
};

struct IterationLog
{
    int iteration{0};
    double lower_bound{0.0};
    double upper_bound{0.0};
    double gap{0.0};
    int optimality_cuts{0};
    int feasibility_cuts{0};
    double time_sec{0.0};
};

struct BendersResult
{
    LoopState state{LoopState::Init};

    bool has_incumbent{false};
    std::vector<int> open;                     // incumbent open-set
    double objective{std::numeric_limits<double>::infinity()};    // UB
    double lower_bound{-std::numeric_limits<double>::infinity()}; // LB
    double gap{std::numeric_limits<double>::infinity()};          // UB - LB
    int iterations{0};
    int incumbent_iteration{-1};

    std::vector<double> scenario_costs;          // second-stage cost per scenario at the incumbent
    std::vector<std::vector<double>> allocation; // per scenario, nF*nC shipments at the incumbent

    std::vector<Cut> cuts;
    std::vector<IterationLog> history;

    int optimality_cuts{0};
    int feasibility_cuts{0};
    int numeric_warnings{0};
    double time_sec{0.0};

    double relative_gap() const;
};

//
// BendersLoop: master -> scenario LPs (bounded worker pool) -> cuts -> master ...
//
class BendersLoop
{
public:
    const ModelData &data;
    BendersOptions opt;
    LoopState state{LoopState::Init};

    BendersLoop(const ModelData &data_, const BendersOptions &opt_ = BendersOptions())
        : data(data_), opt(opt_)
    {
    }

    // Throws InvalidModelError before iterating, or SolverFailureError when a
    // solve fails twice. Infeasibility, iteration and time limits end in a state.
    BendersResult run();

    // Solves every scenario at a fixed open-set; joins all workers before returning.
    std::vector<SubproblemResult> solve_scenarios(const std::vector<int> &open, double time_limit = NO_TIME_LIMIT) const;

private:
    int _num_workers() const;
    bool _converged(double ub, double lb) const;
    void _warn(BendersResult &res, const std::string &msg) const;
};

#endif // SFLP_BENDERS_H
