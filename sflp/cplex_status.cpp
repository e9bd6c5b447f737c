// cplex_status.cpp
// Glue between Concert status codes and SolveStatus

#include <iostream>

#include "cplex_status.h"

ILOSTLBEGIN

const char *to_string(SolveStatus status)
{
    switch (status)
    {
    case SolveStatus::Optimal:
        return "optimal";
    case SolveStatus::Infeasible:
        return "infeasible";
    case SolveStatus::Unbounded:
        return "unbounded";
    case SolveStatus::Timeout:
        return "timeout";
    case SolveStatus::Error:
        return "error";
    }
    return "unknown";
}

SolveStatus classify(const IloCplex &cplex)
{
    const IloCplex::CplexStatus cs = cplex.getCplexStatus();
    if (cs == IloCplex::AbortTimeLim || cs == IloCplex::AbortDetTimeLim)
        return SolveStatus::Timeout;

    switch (cplex.getStatus())
    {
    case IloAlgorithm::Optimal:
        return SolveStatus::Optimal;
    case IloAlgorithm::Infeasible:
    case IloAlgorithm::InfeasibleOrUnbounded:
        return SolveStatus::Infeasible;
    case IloAlgorithm::Unbounded:
        return SolveStatus::Unbounded;
    default:
        return SolveStatus::Error;
    }
}

void set_output(IloCplex &cplex, IloEnv &env, bool log_output)
{
    if (log_output)
    {
        cplex.setOut(std::cout);
        cplex.setWarning(std::cerr);
    }
    else
    {
        cplex.setOut(env.getNullStream());
        cplex.setWarning(env.getNullStream());
    }
}

void set_time_limit(IloCplex &cplex, double time_limit)
{
    // 1e75 is the CPLEX default (no limit)
    cplex.setParam(IloCplex::Param::TimeLimit, time_limit >= 0.0 ? time_limit : 1e75);
}
