// master.cpp
// First-stage master MIP with its append-only cut pool

#include <string>

#include "cplex_status.h"
#include "errors.h"
#include "master.h"

ILOSTLBEGIN

MasterProblem::MasterProblem(const ModelData &data_, int threads_, bool log_output_)
    : data(data_), gen(data_), env(), model(env), cplex(env),
      open(env, data_.num_facilities()),
      theta(env, data_.num_scenarios(), 0.0, IloInfinity, ILOFLOAT)
{
    try
    {
        const int nF = data.num_facilities();
        const int nS = data.num_scenarios();

        for (int i = 0; i < nF; ++i)
            open[i] = IloBoolVar(env, ("open_" + data.facilities[i].id).c_str());
        for (int s = 0; s < nS; ++s)
            theta[s].setName(("theta_" + data.scenarios[s].id).c_str());

        // capacity sufficiency: opening everything is always a feasible choice
        {
            IloExpr e(env);
            for (int i = 0; i < nF; ++i)
                e += data.facilities[i].capacity * open[i];
            model.add(IloRange(env, data.max_total_demand(), e, IloInfinity, "sufficiency"));
            e.end();
        }

        // objective: sum f_i open_i + sum p_s theta_s
        {
            IloExpr obj(env);
            for (int i = 0; i < nF; ++i)
                obj += data.facilities[i].fixed_cost * open[i];
            for (int s = 0; s < nS; ++s)
                obj += data.scenarios[s].probability * theta[s];
            model.add(IloMinimize(env, obj));
            obj.end();
        }

        cplex.extract(model);
        set_output(cplex, env, log_output_);
        cplex.setParam(IloCplex::Param::Threads, threads_);
        cplex.setParam(IloCplex::Param::Parallel, IloCplex::Deterministic);
        // the master objective is the Benders lower bound: solve it exactly
        cplex.setParam(IloCplex::Param::MIP::Tolerances::MIPGap, 0.0);
    }
    catch (const IloException &e)
    {
        const std::string msg = e.getMessage();
        env.end();
        throw SolverFailureError("CPLEX exception while building master: " + msg);
    }
    catch (...)
    {
        env.end();
        throw;
    }
}

MasterProblem::~MasterProblem()
{
    env.end();
}

void MasterProblem::add_optimality_cut(int scenario,
                                       const std::vector<double> &dual_demand,
                                       const std::vector<double> &dual_capacity,
                                       int iteration)
{
    add_cut(gen.optimality_cut(scenario, dual_demand, dual_capacity, iteration));
}

void MasterProblem::add_feasibility_cut(int scenario,
                                        const std::vector<double> &ray_demand,
                                        const std::vector<double> &ray_capacity,
                                        int iteration)
{
    add_cut(gen.feasibility_cut(scenario, ray_demand, ray_capacity, iteration));
}

void MasterProblem::add_cut(const Cut &cut)
{
    const std::string name = std::string(cut.type == CutType::Optimality ? "opt_" : "feas_") +
                             std::to_string(pool.size());
    try
    {
        IloExpr lin(env);
        for (int i = 0; i < data.num_facilities(); ++i)
            if (cut.coef[i] != 0.0)
                lin += cut.coef[i] * open[i];

        if (cut.type == CutType::Optimality)
            // theta_s - sum coef_i open_i >= constant
            model.add(IloRange(env, cut.constant, theta[cut.scenario] - lin, IloInfinity, name.c_str()));
        else
            // sum coef_i open_i <= -constant
            model.add(IloRange(env, -IloInfinity, lin, -cut.constant, name.c_str()));
        lin.end();
    }
    catch (const IloException &e)
    {
        throw SolverFailureError("CPLEX exception while adding cut " + name + ": " + e.getMessage());
    }
    pool.push_back(cut);
}

MasterSolution MasterProblem::solve(double time_limit)
{
    if (time_limit == 0.0)
        throw SolverTimeoutError("Master problem: no time left.");

    MasterSolution sol;
    try
    {
        set_time_limit(cplex, time_limit);
        const IloBool solved = cplex.solve();
        const SolveStatus st = classify(cplex);

        if (st == SolveStatus::Infeasible)
            throw ModelInfeasibleError("Master problem is infeasible.");
        if (st == SolveStatus::Timeout)
            throw SolverTimeoutError("Master problem: time limit reached.");
        if (st != SolveStatus::Optimal || !solved)
            throw SolverFailureError(std::string("Master problem: unexpected solver status (") +
                                     to_string(st) + ").");

        const int nF = data.num_facilities();
        const int nS = data.num_scenarios();
        sol.open.assign(nF, 0);
        for (int i = 0; i < nF; ++i)
            sol.open[i] = (cplex.getValue(open[i]) > 0.5) ? 1 : 0;
        sol.theta.assign(nS, 0.0);
        for (int s = 0; s < nS; ++s)
            sol.theta[s] = cplex.getValue(theta[s]);
        sol.incumbent = cplex.getObjValue();
        sol.objective = cplex.getBestObjValue();
    }
    catch (const IloException &e)
    {
        throw SolverFailureError(std::string("CPLEX exception in master: ") + e.getMessage());
    }
    return sol;
}
