// benders.cpp
// Benders decomposition loop for the two-stage stochastic facility location

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <future>
#include <iomanip>
#include <iostream>
#include <set>
#include <thread>

#include "benders.h"
#include "errors.h"
#include "retry.h"

// =====================================================================
//  UTILS
// =====================================================================

namespace
{

using clock_type = std::chrono::high_resolution_clock;

const double INF = std::numeric_limits<double>::infinity();

} // namespace

const char *to_string(LoopState state)
{
    switch (state)
    {
    case LoopState::Init:
        return "init";
    case LoopState::Iterating:
        return "iterating";
    case LoopState::Converged:
        return "converged";
    case LoopState::MaxIterReached:
        return "max_iterations_reached";
    case LoopState::TimeLimitReached:
        return "time_limit_reached";
    case LoopState::InfeasibleModel:
        return "infeasible_model";
    }
    return "unknown";
}

double BendersResult::relative_gap() const
{
    if (!std::isfinite(objective) || !std::isfinite(lower_bound))
        return INF;
    return (objective - lower_bound) / std::max(std::abs(objective), 1e-10);
}

// =====================================================================
//  LOOP
// =====================================================================

int BendersLoop::_num_workers() const
{
    int w = opt.threads;
    if (w <= 0)
        w = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    return std::max(1, std::min(w, data.num_scenarios()));
}

bool BendersLoop::_converged(double ub, double lb) const
{
    if (!std::isfinite(ub))
        return false;
    const double g = ub - lb;
    return g <= opt.tol_abs || g / std::max(std::abs(ub), 1e-10) <= opt.tol_rel;
}

void BendersLoop::_warn(BendersResult &res, const std::string &msg) const
{
    ++res.numeric_warnings;
    std::cerr << "[Benders] warning: " << msg << "\n";
}

std::vector<SubproblemResult> BendersLoop::solve_scenarios(const std::vector<int> &open, double time_limit) const
{
    const int nS = data.num_scenarios();
    std::vector<SubproblemResult> results(nS);
    std::atomic<int> next{0};

    // every solve, retries included, gets what is left of time_limit
    const auto t0 = clock_type::now();
    auto left = [&]()
    {
        if (time_limit < 0)
            return NO_TIME_LIMIT;
        return std::max(0.0, time_limit - std::chrono::duration<double>(clock_type::now() - t0).count());
    };

    // each worker pulls scenario indices until none are left
    auto work = [&]()
    {
        for (int s = next++; s < nS; s = next++)
        {
            ScenarioSubproblem sub(data, s);
            results[s] = with_retry("scenario " + data.scenarios[s].id,
                                    [&]()
                                    { return sub.solve(open, left()); });
        }
    };

    const int workers = _num_workers();
    if (workers == 1)
    {
        work();
        return results;
    }

    std::vector<std::future<void>> futs;
    futs.reserve(workers);
    for (int w = 0; w < workers; ++w)
        futs.emplace_back(std::async(std::launch::async, work));

    // barrier: wait for every worker, then surface the first failure
    std::exception_ptr first_error;
    for (auto &f : futs)
    {
        try
        {
            f.get();
        }
        catch (...)
        {
            if (!first_error)
                first_error = std::current_exception();
        }
    }
    if (first_error)
        std::rethrow_exception(first_error);
    return results;
}

BendersResult BendersLoop::run()
{
    const auto t0 = clock_type::now();
    auto elapsed = [&]()
    { return std::chrono::duration<double>(clock_type::now() - t0).count(); };
    // remaining budget for the next solve: NO_TIME_LIMIT, or >= 0 seconds (0 = spent)
    auto remaining = [&]()
    {
        if (opt.time_limit <= 0)
            return NO_TIME_LIMIT;
        return std::max(0.0, opt.time_limit - elapsed());
    };
    auto out_of_time = [&]()
    { return remaining() == 0.0; };

    BendersResult res;
    state = LoopState::Init;

    data.validate();

    const int nS = data.num_scenarios();

    if (!data.aggregate_capacity_sufficient())
    {
        std::cerr << "[Benders] total capacity " << data.total_capacity()
                  << " < max scenario demand " << data.max_total_demand() << ": model infeasible\n";
        state = LoopState::InfeasibleModel;
        res.state = state;
        res.time_sec = elapsed();
        return res;
    }

    MasterProblem master(data, opt.threads, opt.solver_log);
    CutGenerator gen(data);

    double LB = -INF, UB = INF;
    std::vector<int> best_open;
    std::set<std::vector<int>> evaluated; // open-sets already priced with all scenarios feasible

    state = LoopState::Iterating;
    int k = 0;
    for (;; ++k)
    {
        if (out_of_time())
        {
            state = LoopState::TimeLimitReached;
            break;
        }

        // (1) master; the budget is read again for the retry
        MasterSolution ms;
        try
        {
            ms = with_retry("master", [&]()
                            { return master.solve(remaining()); });
        }
        catch (const ModelInfeasibleError &e)
        {
            std::cerr << "[Benders] " << e.what() << "\n";
            state = LoopState::InfeasibleModel;
            break;
        }
        catch (const SolverTimeoutError &)
        {
            state = LoopState::TimeLimitReached;
            break;
        }
        LB = std::max(LB, ms.objective);

        // (2) scenarios
        if (out_of_time())
        {
            state = LoopState::TimeLimitReached;
            break;
        }
        std::vector<SubproblemResult> sub;
        try
        {
            sub = solve_scenarios(ms.open, remaining());
        }
        catch (const SolverTimeoutError &)
        {
            state = LoopState::TimeLimitReached;
            break;
        }

        int n_opt = 0, n_feas = 0;
        const bool all_feasible = std::all_of(sub.begin(), sub.end(),
                                              [](const SubproblemResult &r)
                                              { return r.feasible; });

        if (!all_feasible)
        {
            // (3) this open-set is infeasible for some scenario: exclude it, no UB update
            for (int s = 0; s < nS; ++s)
            {
                if (sub[s].feasible)
                    continue;
                master.add_cut(gen(s, sub[s], k));
                ++n_feas;
            }
        }
        else
        {
            // (4) price the open-set, update incumbent, add violated optimality cuts
            double true_cost = data.fixed_cost(ms.open);
            for (int s = 0; s < nS; ++s)
                true_cost += data.scenarios[s].probability * sub[s].objective;

            if (true_cost < UB)
            {
                UB = true_cost;
                best_open = ms.open;
                res.incumbent_iteration = k;
                res.scenario_costs.assign(nS, 0.0);
                res.allocation.assign(nS, {});
                for (int s = 0; s < nS; ++s)
                {
                    res.scenario_costs[s] = sub[s].objective;
                    res.allocation[s] = sub[s].production;
                }
            }

            const bool repeated = !evaluated.insert(ms.open).second;
            for (int s = 0; s < nS; ++s)
            {
                const SubproblemResult &r = sub[s];
                if (std::abs(r.dual_objective - r.objective) > opt.numeric_tol * std::max(1.0, std::abs(r.objective)))
                    _warn(res, "scenario " + data.scenarios[s].id + ": dual objective " +
                                   std::to_string(r.dual_objective) + " differs from primal " +
                                   std::to_string(r.objective));

                if (ms.theta[s] >= r.objective - opt.eps)
                    continue;
                if (repeated)
                    _warn(res, "scenario " + data.scenarios[s].id +
                                   ": cut from an already priced open-set did not bind theta");
                master.add_cut(gen(s, r, k));
                ++n_opt;
            }
        }

        res.optimality_cuts += n_opt;
        res.feasibility_cuts += n_feas;

        IterationLog it;
        it.iteration = k;
        it.lower_bound = LB;
        it.upper_bound = UB;
        it.gap = UB - LB;
        it.optimality_cuts = n_opt;
        it.feasibility_cuts = n_feas;
        it.time_sec = elapsed();
        res.history.push_back(it);

        if (opt.log_output)
        {
            std::cout << "[Benders] it=" << std::setw(5) << k
                      << "  time=" << std::setw(6) << std::fixed << std::setprecision(2) << it.time_sec << "s  "
                      << "LB=" << std::setw(12) << std::setprecision(4) << LB << "  "
                      << "UB=" << std::setw(12) << UB << "  "
                      << "gap=" << std::setw(10) << it.gap << "  "
                      << "opt=" << n_opt << "  feas=" << n_feas
                      << "  pool=" << master.num_cuts()
                      << std::endl;
        }

        // (5) convergence
        if (all_feasible && (_converged(UB, LB) || n_opt == 0))
        {
            state = LoopState::Converged;
            break;
        }

        // (6) iteration budget
        if (k + 1 >= opt.max_iterations)
        {
            state = LoopState::MaxIterReached;
            break;
        }
    }

    res.state = state;
    res.iterations = static_cast<int>(res.history.size());
    res.lower_bound = LB;
    res.objective = UB;
    res.gap = UB - LB;
    res.cuts = master.cuts();

    if (state == LoopState::MaxIterReached)
        std::cerr << "[Benders] warning: iteration limit " << opt.max_iterations
                  << " reached, UB=" << UB << " gap=" << res.gap << "\n";
    if (state == LoopState::TimeLimitReached)
        std::cerr << "[Benders] warning: time limit reached, UB=" << UB << " gap=" << res.gap << "\n";

    if (state != LoopState::InfeasibleModel && !best_open.empty())
    {
        res.has_incumbent = true;
        res.open = best_open;

        // the incumbent must reproduce UB when priced again; skipped once the budget is spent
        if (!out_of_time())
        {
            try
            {
                const std::vector<SubproblemResult> sub = solve_scenarios(best_open, remaining());
                double cost = data.fixed_cost(best_open);
                for (int s = 0; s < nS; ++s)
                {
                    if (!sub[s].feasible)
                        throw SolverFailureError("Scenario " + data.scenarios[s].id +
                                                 " became infeasible at the incumbent.");
                    cost += data.scenarios[s].probability * sub[s].objective;
                }
                if (std::abs(cost - UB) > opt.numeric_tol * std::max(1.0, std::abs(UB)))
                    _warn(res, "incumbent re-solve gives " + std::to_string(cost) + " instead of " + std::to_string(UB));
            }
            catch (const SolverTimeoutError &)
            {
                std::cerr << "[Benders] time limit reached before the incumbent check\n";
            }
        }
    }

    res.time_sec = elapsed();
    return res;
}
