#include <vector>

#include "gtest/gtest.h"
#include "sflp/subproblem.h"
#include "test_instances.h"

namespace
{

const double TOL = 1e-6;

TEST(ScenarioSubproblemTest, FeasibleOpenSetGivesDuals)
{
    const ModelData data = sflp_test::two_facility_instance();
    const SubproblemResult res = ScenarioSubproblem(data, 0).solve({1, 1});

    ASSERT_TRUE(res.feasible);
    EXPECT_EQ(res.status, SolveStatus::Optimal);
    EXPECT_NEAR(res.objective, 16.0, TOL);

    for (double u : res.dual_demand)
        EXPECT_GE(u, -TOL);
    for (double v : res.dual_capacity)
        EXPECT_LE(v, TOL);

    // strong duality
    EXPECT_NEAR(res.dual_objective, res.objective, 1e-5);

    // the shipments serve every customer within capacity
    ASSERT_EQ(res.production.size(), 4u);
    for (int j = 0; j < data.num_customers(); ++j)
    {
        double served = 0.0;
        for (int i = 0; i < data.num_facilities(); ++i)
            served += res.production[idx2(i, j, data.num_customers())];
        EXPECT_GE(served, data.demand(j, 0) - TOL);
    }
    for (int i = 0; i < data.num_facilities(); ++i)
    {
        double sent = 0.0;
        for (int j = 0; j < data.num_customers(); ++j)
            sent += res.production[idx2(i, j, data.num_customers())];
        EXPECT_LE(sent, data.facilities[i].capacity + TOL);
    }
}

TEST(ScenarioSubproblemTest, InfeasibleOpenSetGivesFarkasRay)
{
    const ModelData data = sflp_test::two_facility_instance();
    const std::vector<int> open = {1, 0};
    const SubproblemResult res = ScenarioSubproblem(data, 0).solve(open);

    ASSERT_FALSE(res.feasible);
    EXPECT_EQ(res.status, SolveStatus::Infeasible);
    EXPECT_TRUE(res.production.empty());
    EXPECT_GT(res.dual_objective, 0.0);

    for (double u : res.dual_demand)
        EXPECT_GE(u, -TOL);
    for (double v : res.dual_capacity)
        EXPECT_LE(v, TOL);
    // dual feasible direction: u_j + v_i <= 0 on every arc
    for (int i = 0; i < data.num_facilities(); ++i)
        for (int j = 0; j < data.num_customers(); ++j)
            EXPECT_LE(res.dual_demand[j] + res.dual_capacity[i], TOL);

    double cert = 0.0;
    for (int j = 0; j < data.num_customers(); ++j)
        cert += res.dual_demand[j] * data.demand(j, 0);
    for (int i = 0; i < data.num_facilities(); ++i)
        cert += res.dual_capacity[i] * data.facilities[i].capacity * open[i];
    EXPECT_NEAR(cert, res.dual_objective, 1e-6);
}

TEST(ScenarioSubproblemTest, NothingOpenIsInfeasible)
{
    const ModelData data = sflp_test::two_facility_instance();
    const SubproblemResult res = ScenarioSubproblem(data, 0).solve({0, 0});
    EXPECT_FALSE(res.feasible);
    EXPECT_GT(res.dual_objective, 0.0);
}

TEST(ScenarioSubproblemTest, ZeroDemandCostsNothing)
{
    const ModelData data = sflp_test::eligibility_instance();
    const SubproblemResult res = ScenarioSubproblem(data, 0).solve({1, 1, 0});
    ASSERT_TRUE(res.feasible);
    EXPECT_NEAR(res.objective, 20.0, TOL);
}

TEST(ScenarioSubproblemTest, IneligibleArcsCarryNoFlow)
{
    const ModelData data = sflp_test::eligibility_instance();

    // S1 needs F2 for C2
    const SubproblemResult bad = ScenarioSubproblem(data, 1).solve({1, 1, 0});
    EXPECT_FALSE(bad.feasible);

    const SubproblemResult res = ScenarioSubproblem(data, 1).solve({1, 1, 1});
    ASSERT_TRUE(res.feasible);
    EXPECT_NEAR(res.objective, 25.0, TOL);
    const int nC = data.num_customers();
    EXPECT_NEAR(res.production[idx2(0, 2, nC)], 0.0, TOL);
    EXPECT_NEAR(res.production[idx2(1, 2, nC)], 0.0, TOL);
    EXPECT_NEAR(res.production[idx2(2, 2, nC)], 5.0, TOL);
}

TEST(ScenarioSubproblemTest, SpentBudgetThrowsTimeout)
{
    const ModelData data = sflp_test::two_facility_instance();
    EXPECT_THROW(ScenarioSubproblem(data, 0).solve({1, 1}, 0.0), SolverTimeoutError);
    EXPECT_NO_THROW(ScenarioSubproblem(data, 0).solve({1, 1}, 60.0));
}

} // namespace
