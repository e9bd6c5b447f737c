#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include "gtest/gtest.h"
#include "sflp/errors.h"
#include "sflp/instance.h"
#include "test_instances.h"

namespace
{

TEST(ModelDataTest, ParsesTextFormat)
{
    std::istringstream in(
        "2 2 1\n"
        "10 5\n"
        "10 5\n"
        "1 1\n"
        "1 1\n"
        "1.0 8 8\n");
    const ModelData data = ModelData::parse(in);

    ASSERT_EQ(data.num_facilities(), 2);
    ASSERT_EQ(data.num_customers(), 2);
    ASSERT_EQ(data.num_scenarios(), 1);
    EXPECT_EQ(data.facilities[1].id, "F1");
    EXPECT_DOUBLE_EQ(data.facilities[0].capacity, 10.0);
    EXPECT_DOUBLE_EQ(data.facilities[0].fixed_cost, 5.0);
    EXPECT_DOUBLE_EQ(data.cost(1, 0), 1.0);
    EXPECT_DOUBLE_EQ(data.scenarios[0].probability, 1.0);
    EXPECT_DOUBLE_EQ(data.demand(1, 0), 8.0);
    EXPECT_TRUE(data.eligible.empty());
    EXPECT_TRUE(data.allowed(1, 1));
    EXPECT_NO_THROW(data.validate());
}

TEST(ModelDataTest, ParsesOptionalEligibilityBlock)
{
    std::istringstream in(
        "2 2 1\n"
        "10 5  10 5\n"
        "1 2  3 4\n"
        "1.0 8 8\n"
        "1 0\n"
        "1 1\n");
    const ModelData data = ModelData::parse(in);

    ASSERT_EQ(data.eligible.size(), 4u);
    EXPECT_TRUE(data.allowed(0, 0));
    EXPECT_FALSE(data.allowed(0, 1));
    EXPECT_TRUE(data.allowed(1, 1));
    EXPECT_DOUBLE_EQ(data.cost(1, 0), 3.0);
}

TEST(ModelDataTest, RejectsMalformedFiles)
{
    std::istringstream short_header("2 2");
    EXPECT_THROW(ModelData::parse(short_header), std::runtime_error);

    std::istringstream missing_scenarios("1 1 2\n10 5\n1\n0.5 3\n");
    EXPECT_THROW(ModelData::parse(missing_scenarios), std::runtime_error);

    std::istringstream bad_eligibility("1 2 1\n10 5\n1 1\n1.0 3 3\n1\n");
    EXPECT_THROW(ModelData::parse(bad_eligibility), std::runtime_error);

    std::istringstream text_token("1 1 1\n10 five\n1\n1.0 3\n");
    EXPECT_THROW(ModelData::parse(text_token), std::runtime_error);
}

TEST(ModelDataTest, RejectsHeaderSizesThatAreNotCounts)
{
    std::istringstream fractional("1.5 1 1\n10 5\n1\n1.0 3\n");
    EXPECT_THROW(ModelData::parse(fractional), std::runtime_error);

    std::istringstream negative("1 -1 1\n10 5\n1.0\n");
    EXPECT_THROW(ModelData::parse(negative), std::runtime_error);

    std::istringstream huge("1e300 1 1\n10 5\n1\n1.0 3\n");
    EXPECT_THROW(ModelData::parse(huge), std::runtime_error);

    std::istringstream too_many("2000000 2000000 1\n");
    EXPECT_THROW(ModelData::parse(too_many), std::runtime_error);
}

TEST(ModelDataTest, LoadsInstanceFile)
{
    const ModelData data = ModelData::from_txt(std::string(SFLP_INSTANCE_DIR) + "/sflp_4_6_3.txt");
    EXPECT_EQ(data.num_facilities(), 4);
    EXPECT_EQ(data.num_customers(), 6);
    EXPECT_EQ(data.num_scenarios(), 3);
    EXPECT_NO_THROW(data.validate());

    const ModelData elig = ModelData::from_txt(std::string(SFLP_INSTANCE_DIR) + "/sflp_3_3_2_elig.txt");
    EXPECT_FALSE(elig.allowed(0, 2));
    EXPECT_TRUE(elig.allowed(2, 2));
    EXPECT_NO_THROW(elig.validate());

    EXPECT_THROW(ModelData::from_txt(std::string(SFLP_INSTANCE_DIR) + "/does_not_exist.txt"),
                 std::runtime_error);
}

TEST(ModelDataTest, AggregateQuantities)
{
    const ModelData data = sflp_test::medium_instance();
    EXPECT_DOUBLE_EQ(data.total_capacity(), 215.0);
    EXPECT_DOUBLE_EQ(data.total_demand(0), 65.0);
    EXPECT_DOUBLE_EQ(data.max_total_demand(), 107.0);
    EXPECT_DOUBLE_EQ(data.fixed_cost({1, 0, 1, 0}), 270.0);
    EXPECT_TRUE(data.aggregate_capacity_sufficient());

    EXPECT_FALSE(sflp_test::short_capacity_instance().aggregate_capacity_sufficient());
}

TEST(ModelDataTest, ValidationRejectsNegativeData)
{
    ModelData data = sflp_test::two_facility_instance();
    data.facilities[0].capacity = -1.0;
    EXPECT_THROW(data.validate(), InvalidModelError);

    data = sflp_test::two_facility_instance();
    data.facilities[1].fixed_cost = -5.0;
    EXPECT_THROW(data.validate(), InvalidModelError);

    data = sflp_test::two_facility_instance();
    data.variable_cost[3] = -0.5;
    EXPECT_THROW(data.validate(), InvalidModelError);

    data = sflp_test::two_facility_instance();
    data.scenarios[0].demand[0] = -8.0;
    EXPECT_THROW(data.validate(), InvalidModelError);
}

TEST(ModelDataTest, ValidationRejectsNonFiniteData)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    ModelData data = sflp_test::two_facility_instance();
    data.facilities[0].capacity = nan;
    EXPECT_THROW(data.validate(), InvalidModelError);

    data = sflp_test::two_facility_instance();
    data.facilities[1].capacity = inf;
    EXPECT_THROW(data.validate(), InvalidModelError);

    data = sflp_test::two_facility_instance();
    data.facilities[0].fixed_cost = nan;
    EXPECT_THROW(data.validate(), InvalidModelError);

    data = sflp_test::two_facility_instance();
    data.variable_cost[1] = nan;
    EXPECT_THROW(data.validate(), InvalidModelError);

    data = sflp_test::two_facility_instance();
    data.scenarios[0].demand[1] = nan;
    EXPECT_THROW(data.validate(), InvalidModelError);

    data = sflp_test::two_facility_instance();
    data.scenarios[0].probability = nan;
    EXPECT_THROW(data.validate(), InvalidModelError);
}

TEST(ModelDataTest, ValidationChecksProbabilities)
{
    ModelData data = sflp_test::medium_instance();
    data.scenarios[2].probability = 0.1; // sums to 0.9
    EXPECT_THROW(data.validate(), InvalidModelError);

    data = sflp_test::medium_instance();
    data.scenarios[0].probability = 0.0;
    data.scenarios[1].probability = 0.8;
    EXPECT_THROW(data.validate(), InvalidModelError);

    // within the 1e-6 tolerance
    data = sflp_test::medium_instance();
    data.scenarios[0].probability += 5e-7;
    EXPECT_NO_THROW(data.validate());
}

TEST(ModelDataTest, ValidationChecksDimensionsAndReachability)
{
    ModelData data = sflp_test::two_facility_instance();
    data.variable_cost.pop_back();
    EXPECT_THROW(data.validate(), InvalidModelError);

    data = sflp_test::two_facility_instance();
    data.scenarios[0].demand.push_back(1.0);
    EXPECT_THROW(data.validate(), InvalidModelError);

    // C1 has demand but no eligible facility
    data = sflp_test::two_facility_instance();
    data.eligible = {1, 0, 1, 0};
    EXPECT_THROW(data.validate(), InvalidModelError);

    EXPECT_NO_THROW(sflp_test::eligibility_instance().validate());
}

} // namespace
