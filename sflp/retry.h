// retry.h
// Retry-once policy for solver calls

#ifndef SFLP_RETRY_H
#define SFLP_RETRY_H

#include <iostream>
#include <string>

#include "errors.h"

// Runs fn, and once more if it throws SolverFailureError. A second failure
// propagates; timeouts and the other errors are never retried.
template <typename Fn>
auto with_retry(const std::string &what, Fn &&fn) -> decltype(fn())
{
    try
    {
        return fn();
    }
    catch (const SolverFailureError &e)
    {
        std::cerr << "[Benders] warning: " << what << " failed (" << e.what() << "), retrying once\n";
    }
    return fn();
}

#endif // SFLP_RETRY_H
