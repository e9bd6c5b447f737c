// master.h
// First-stage master MIP with its append-only cut pool

#ifndef SFLP_MASTER_H
#define SFLP_MASTER_H

#include <vector>

#include <ilcplex/ilocplex.h>

#include "cuts.h"
#include "errors.h"
#include "instance.h"

struct MasterSolution
{
    std::vector<int> open;     // nF, 0/1
    std::vector<double> theta; // nS
    double objective{0.0};     // best bound of the master = lower bound
    double incumbent{0.0};     // value of the returned (open, theta)
};

//
// MasterProblem:
//   min  sum_i f_i open_i + sum_s p_s theta_s
//   s.t. sum_i cap_i open_i >= max_s sum_j d_js
//        cuts of the pool
//        open_i in {0,1}, theta_s >= 0
//
// theta_s >= 0 is valid because every variable cost is non-negative, and it
// keeps the first master bounded before any optimality cut exists.
//
// Ties between open-sets of equal cost are not broken explicitly: CPLEX runs
// in deterministic parallel mode, so the same model and cut pool always
// return the same open-set.
//
class MasterProblem
{
public:
    const ModelData &data;

    MasterProblem(const ModelData &data_, int threads_ = 0, bool log_output_ = false);
    ~MasterProblem();

    MasterProblem(const MasterProblem &) = delete;
    MasterProblem &operator=(const MasterProblem &) = delete;

    // theta_s >= sum_j u_j d_js + sum_i v_i cap_i open_i
    void add_optimality_cut(int scenario,
                            const std::vector<double> &dual_demand,
                            const std::vector<double> &dual_capacity,
                            int iteration);

    // sum_j u_j d_js + sum_i v_i cap_i open_i <= 0
    void add_feasibility_cut(int scenario,
                             const std::vector<double> &ray_demand,
                             const std::vector<double> &ray_capacity,
                             int iteration);

    void add_cut(const Cut &cut);

    // Throws ModelInfeasibleError, SolverTimeoutError or SolverFailureError.
    // A time_limit of 0 is a spent budget and fails without solving.
    MasterSolution solve(double time_limit = NO_TIME_LIMIT);

    const std::vector<Cut> &cuts() const { return pool; }
    int num_cuts() const { return static_cast<int>(pool.size()); }

private:
    CutGenerator gen;
    std::vector<Cut> pool;

    IloEnv env;
    IloModel model;
    IloCplex cplex;
    IloBoolVarArray open;
    IloNumVarArray theta;
};

#endif // SFLP_MASTER_H
