// errors.h
// Error kinds raised by the Benders engine and the solver status seen by it

#ifndef SFLP_ERRORS_H
#define SFLP_ERRORS_H

#include <stdexcept>
#include <string>

//
// Outcome of a single CPLEX call, independent of the Concert enums
//
enum class SolveStatus
{
    Optimal,
    Infeasible,
    Unbounded,
    Timeout,
    Error
};

const char *to_string(SolveStatus status);

// Time limits passed to the solve calls are remaining budgets in seconds:
// negative means unlimited, 0 means the budget is already spent.
constexpr double NO_TIME_LIMIT = -1.0;

class BendersError : public std::runtime_error
{
public:
    explicit BendersError(const std::string &what) : std::runtime_error(what) {}
};

// Input data violates non-negativity, probability or dimension rules.
class InvalidModelError : public BendersError
{
public:
    explicit InvalidModelError(const std::string &what) : BendersError(what) {}
};

// No open-set can satisfy the first-stage constraints (fatal, not retried).
class ModelInfeasibleError : public BendersError
{
public:
    explicit ModelInfeasibleError(const std::string &what) : BendersError(what) {}
};

// Solver crashed or rejected the request. Callers retry once.
class SolverFailureError : public BendersError
{
public:
    explicit SolverFailureError(const std::string &what) : BendersError(what) {}
};

// Time budget ran out inside a solve. Recoverable: the loop keeps its incumbent.
class SolverTimeoutError : public BendersError
{
public:
    explicit SolverTimeoutError(const std::string &what) : BendersError(what) {}
};

#endif // SFLP_ERRORS_H
