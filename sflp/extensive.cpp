// extensive.cpp
// Extensive form (deterministic equivalent) of the stochastic facility location

#include <string>

#include "cplex_status.h"
#include "extensive.h"

ILOSTLBEGIN

ExtensiveResult ExtensiveForm::solve() const
{
    const int nF = data.num_facilities();
    const int nC = data.num_customers();
    const int nS = data.num_scenarios();
    const size_t nFC = static_cast<size_t>(nF) * static_cast<size_t>(nC);

    ExtensiveResult res;
    IloEnv env;
    try
    {
        IloModel mdl(env);

        // VARIABLES
        IloBoolVarArray open(env, nF);
        for (int i = 0; i < nF; ++i)
            open[i] = IloBoolVar(env, ("open_" + data.facilities[i].id).c_str());

        IloArray<IloNumVarArray> x(env, nS); // shipments per scenario
        for (int s = 0; s < nS; ++s)
        {
            x[s] = IloNumVarArray(env, nF * nC, 0.0, IloInfinity, ILOFLOAT);
            for (int i = 0; i < nF; ++i)
                for (int j = 0; j < nC; ++j)
                    if (!data.allowed(i, j))
                        x[s][idx2(i, j, nC)].setUB(0.0);
            mdl.add(x[s]);
        }

        // CONSTRAINTS
        for (int s = 0; s < nS; ++s)
        {
            // demand
            for (int j = 0; j < nC; ++j)
            {
                IloExpr lhs(env);
                for (int i = 0; i < nF; ++i)
                    lhs += x[s][idx2(i, j, nC)];
                mdl.add(lhs >= data.demand(j, s));
                lhs.end();
            }
            // capacity
            for (int i = 0; i < nF; ++i)
            {
                IloExpr lhs(env);
                for (int j = 0; j < nC; ++j)
                    lhs += x[s][idx2(i, j, nC)];
                mdl.add(lhs <= data.facilities[i].capacity * open[i]);
                lhs.end();
            }
        }

        // OBJECTIVE
        {
            IloExpr obj(env);
            for (int i = 0; i < nF; ++i)
                obj += data.facilities[i].fixed_cost * open[i];
            for (int s = 0; s < nS; ++s)
                for (int i = 0; i < nF; ++i)
                    for (int j = 0; j < nC; ++j)
                        obj += data.scenarios[s].probability * data.cost(i, j) * x[s][idx2(i, j, nC)];
            mdl.add(IloMinimize(env, obj));
            obj.end();
        }

        IloCplex cplex(mdl);
        set_output(cplex, env, log_output);
        set_time_limit(cplex, time_limit > 0 ? time_limit : NO_TIME_LIMIT);
        cplex.setParam(IloCplex::Param::Threads, threads);
        cplex.setParam(IloCplex::Param::Parallel, IloCplex::Deterministic);
        cplex.setParam(IloCplex::Param::MIP::Tolerances::MIPGap, 0.0);

        const IloBool solved = cplex.solve();
        res.status = classify(cplex);
        res.time_sec = cplex.getTime();

        if (solved && (res.status == SolveStatus::Optimal || res.status == SolveStatus::Timeout))
        {
            res.open.assign(nF, 0);
            for (int i = 0; i < nF; ++i)
                res.open[i] = (cplex.getValue(open[i]) > 0.5) ? 1 : 0;
            res.objective = cplex.getObjValue();
            res.best_bound = cplex.getBestObjValue();

            res.allocation.assign(nS, std::vector<double>(nFC, 0.0));
            IloNumArray vals(env);
            for (int s = 0; s < nS; ++s)
            {
                cplex.getValues(vals, x[s]);
                for (size_t t = 0; t < nFC; ++t)
                    res.allocation[s][t] = vals[static_cast<IloInt>(t)];
            }
            vals.end();
        }
        else if (res.status != SolveStatus::Infeasible && res.status != SolveStatus::Timeout)
        {
            throw SolverFailureError(std::string("Extensive form: unexpected solver status (") +
                                     to_string(res.status) + ").");
        }
    }
    catch (const IloException &e)
    {
        const std::string msg = e.getMessage();
        env.end();
        throw SolverFailureError("CPLEX exception in extensive form: " + msg);
    }
    catch (...)
    {
        env.end();
        throw;
    }
    env.end();
    return res;
}
