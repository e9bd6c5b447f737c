// subproblem.cpp
// Second-stage transportation LP of one scenario

#include <algorithm>
#include <map>
#include <string>

#include "cplex_status.h"
#include "subproblem.h"

ILOSTLBEGIN

double ScenarioSubproblem::_certificate_value(const std::vector<double> &u,
                                              const std::vector<double> &v,
                                              const std::vector<int> &open) const
{
    double val = dot(u, data.scenarios[scenario].demand);
    for (int i = 0; i < data.num_facilities(); ++i)
        val += v[i] * data.facilities[i].capacity * static_cast<double>(open[i]);
    return val;
}

SubproblemResult ScenarioSubproblem::solve(const std::vector<int> &open, double time_limit) const
{
    const int nF = data.num_facilities();
    const int nC = data.num_customers();

    if (time_limit == 0.0)
        throw SolverTimeoutError("Scenario " + data.scenarios[scenario].id + ": no time left.");

    SubproblemResult res;
    res.dual_demand.assign(nC, 0.0);
    res.dual_capacity.assign(nF, 0.0);

    IloEnv env;
    try
    {
        IloModel m(env);
        IloCplex cplex(m);
        set_output(cplex, env, log_output);
        set_time_limit(cplex, time_limit);
        cplex.setParam(IloCplex::Param::Threads, 1);
        // dual simplex without presolve keeps a Farkas proof available
        cplex.setParam(IloCplex::Param::RootAlgorithm, IloCplex::Dual);
        cplex.setParam(IloCplex::Param::Preprocessing::Presolve, IloFalse);

        IloNumVarArray x(env, nF * nC, 0.0, IloInfinity, ILOFLOAT);
        for (int i = 0; i < nF; ++i)
            for (int j = 0; j < nC; ++j)
                if (!data.allowed(i, j))
                    x[idx2(i, j, nC)].setUB(0.0);
        m.add(x);

        // demand: sum_i x_ij >= d_js
        IloRangeArray demand(env);
        for (int j = 0; j < nC; ++j)
        {
            IloExpr e(env);
            for (int i = 0; i < nF; ++i)
                e += x[idx2(i, j, nC)];
            demand.add(IloRange(env, data.demand(j, scenario), e, IloInfinity,
                                ("dem_" + std::to_string(j)).c_str()));
            e.end();
        }
        m.add(demand);

        // capacity: sum_j x_ij <= cap_i open_i
        IloRangeArray capacity(env);
        for (int i = 0; i < nF; ++i)
        {
            IloExpr e(env);
            for (int j = 0; j < nC; ++j)
                e += x[idx2(i, j, nC)];
            capacity.add(IloRange(env, -IloInfinity, e,
                                  data.facilities[i].capacity * static_cast<double>(open[i]),
                                  ("cap_" + std::to_string(i)).c_str()));
            e.end();
        }
        m.add(capacity);

        IloExpr obj(env);
        for (int i = 0; i < nF; ++i)
            for (int j = 0; j < nC; ++j)
                obj += data.cost(i, j) * x[idx2(i, j, nC)];
        m.add(IloMinimize(env, obj));
        obj.end();

        const IloBool solved = cplex.solve();
        res.status = classify(cplex);
        if (res.status == SolveStatus::Optimal && !solved)
            res.status = SolveStatus::Error;

        if (res.status == SolveStatus::Optimal)
        {
            res.feasible = true;
            res.objective = cplex.getObjValue();

            IloNumArray vals(env);
            cplex.getDuals(vals, demand);
            for (int j = 0; j < nC; ++j)
                res.dual_demand[j] = vals[j];
            cplex.getDuals(vals, capacity);
            for (int i = 0; i < nF; ++i)
                res.dual_capacity[i] = vals[i];
            cplex.getValues(vals, x);
            res.production.assign(static_cast<size_t>(nF) * static_cast<size_t>(nC), 0.0);
            for (size_t t = 0; t < res.production.size(); ++t)
                res.production[t] = vals[static_cast<IloInt>(t)];
            vals.end();

            res.dual_objective = _certificate_value(res.dual_demand, res.dual_capacity, open);
        }
        else if (res.status == SolveStatus::Infeasible)
        {
            // dualFarkas returns the constraints in its own order; map them back by id
            IloConstraintArray cons(env);
            IloNumArray ray(env);
            cplex.dualFarkas(cons, ray);

            std::map<IloInt, double> by_id;
            for (IloInt c = 0; c < cons.getSize(); ++c)
                by_id[cons[c].getId()] = ray[c];
            for (int j = 0; j < nC; ++j)
            {
                auto it = by_id.find(demand[j].getId());
                res.dual_demand[j] = (it != by_id.end()) ? it->second : 0.0;
            }
            for (int i = 0; i < nF; ++i)
            {
                auto it = by_id.find(capacity[i].getId());
                res.dual_capacity[i] = (it != by_id.end()) ? it->second : 0.0;
            }
            ray.end();
            cons.end();

            // orient the ray so that it certifies sum u d + sum v cap open > 0
            double cert = _certificate_value(res.dual_demand, res.dual_capacity, open);
            if (cert < 0.0)
            {
                for (double &u : res.dual_demand)
                    u = -u;
                for (double &v : res.dual_capacity)
                    v = -v;
                cert = -cert;
            }
            if (!(cert > 1e-9))
                throw SolverFailureError("Scenario " + data.scenarios[scenario].id +
                                         ": infeasibility certificate is degenerate.");
            res.dual_objective = cert;
        }
        else if (res.status == SolveStatus::Timeout)
        {
            throw SolverTimeoutError("Scenario " + data.scenarios[scenario].id + ": time limit reached.");
        }
        else
        {
            throw SolverFailureError("Scenario " + data.scenarios[scenario].id +
                                     ": unexpected solver status (" + to_string(res.status) + ").");
        }
    }
    catch (const IloException &e)
    {
        const std::string msg = e.getMessage();
        env.end();
        throw SolverFailureError("CPLEX exception in scenario " + data.scenarios[scenario].id + ": " + msg);
    }
    catch (...)
    {
        env.end();
        throw;
    }
    env.end();
    return res;
}
