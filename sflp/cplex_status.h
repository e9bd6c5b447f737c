// cplex_status.h
// Glue between Concert status codes and SolveStatus

#ifndef SFLP_CPLEX_STATUS_H
#define SFLP_CPLEX_STATUS_H

#include <ilcplex/ilocplex.h>

#include "errors.h"

// Maps the status of the last IloCplex::solve() call.
// InfeasibleOrUnbounded is reported as Infeasible: every model built here has
// a non-negative objective over non-negative variables, so it cannot be unbounded.
SolveStatus classify(const IloCplex &cplex);

// Sends CPLEX output to the null stream unless logging is requested.
void set_output(IloCplex &cplex, IloEnv &env, bool log_output);

// Negative time_limit means "no limit".
void set_time_limit(IloCplex &cplex, double time_limit);

#endif // SFLP_CPLEX_STATUS_H
