#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "smbopp/detail/smbo.hpp"
#include "test_surrogates.hpp"

namespace smbopp {
namespace {

using test::BowlSurrogate;
using test::CallLog;
using Opts = Options<BowlSurrogate>;

// Records every point it is asked about.
struct RecordingObjective {
    std::vector<Point> calls;

    double operator()(const Point& x) {
        calls.push_back(x);
        const double a = std::get<double>(x[0]);
        const double b = std::get<std::string>(x[1]) == "a" ? 0.0 : 1.0;
        return (a - 0.3) * (a - 0.3) + b;
    }
};

ParameterSpace MakeSpace() {
    ParameterSpace space(Encoding::Normalize);
    space.AddRealParameter(-2.0, 2.0);
    space.AddCategoricalParameter({"a", "b"});
    return space;
}

BowlSurrogate MakeBowl(const std::shared_ptr<CallLog>& log) {
    // encoded centre: a = 0.3, category "a"
    Eigen::VectorXd target(3);
    target << 0.575, 1.0, 0.0;
    return BowlSurrogate(target, 0.05, log);
}

Opts MakeOptions(const int n_calls, const int n_random_starts) {
    Opts options;
    options.n_calls = n_calls;
    options.n_random_starts = n_random_starts;
    options.n_points = 200;
    options.random_state = 1234;
    return options;
}

TEST(SmboOptimizerTest, RandomWarmupThenGuided) {
    auto log = std::make_shared<CallLog>();
    RecordingObjective objective;

    SmboOptimizer<BowlSurrogate> optimizer(MakeSpace(), MakeBowl(log), MakeOptions(15, 5));
    const auto result = optimizer.Minimize(objective);

    ASSERT_EQ(result.size(), 15U);
    EXPECT_EQ(objective.calls.size(), 15U);
    EXPECT_EQ(objective.calls, result.x_iters);
    EXPECT_EQ(optimizer.phase(), Phase::Done);

    for (size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(result.phases[i], Phase::RandomWarmup);
    }
    for (size_t i = 5; i < 15; ++i) {
        EXPECT_EQ(result.phases[i], Phase::Guided);
    }

    // one fit per guided entry, on the whole trace so far
    EXPECT_EQ(log->fits, 10);
    EXPECT_EQ(log->predicts, 10);
    ASSERT_EQ(log->fit_sizes.size(), 10U);
    for (size_t i = 0; i < 10; ++i) {
        EXPECT_EQ(log->fit_sizes[i], static_cast<Eigen::Index>(5 + i));
    }

    ASSERT_EQ(result.models.size(), 10U);
    EXPECT_EQ(result.models.front().num_observations(), 5);
    EXPECT_EQ(result.models.back().num_observations(), 14);

    EXPECT_EQ(result.info.n_random, 5U);
    EXPECT_EQ(result.info.n_guided, 10U);
    EXPECT_EQ(result.info.n_fits, 10U);
    EXPECT_EQ(result.info.random_start_index, 0U);
    EXPECT_EQ(result.info.guided_start_index, 5U);
}

TEST(SmboOptimizerTest, PreEvaluatedSeedsSkipTheObjective) {
    auto log = std::make_shared<CallLog>();
    RecordingObjective objective;

    Opts options = MakeOptions(10, 3);
    options.x0 = {Point{1.0, std::string("a")}};
    options.y0 = std::vector<double>{3.2};

    const auto result = Minimize(objective, MakeSpace(), MakeBowl(log), options);

    ASSERT_EQ(result.size(), 11U);
    EXPECT_EQ(objective.calls.size(), 10U);
    EXPECT_EQ(result.x_iters[0], (Point{1.0, std::string("a")}));
    EXPECT_EQ(result.func_vals[0], 3.2);
    EXPECT_EQ(result.phases[0], Phase::Seeding);

    for (size_t i = 1; i <= 3; ++i) {
        EXPECT_EQ(result.phases[i], Phase::RandomWarmup);
    }
    for (size_t i = 4; i <= 10; ++i) {
        EXPECT_EQ(result.phases[i], Phase::Guided);
    }

    EXPECT_EQ(log->fits, 7);
    EXPECT_EQ(log->fit_sizes.front(), 4);
    EXPECT_EQ(result.info.n_pre_evaluated, 1U);
    EXPECT_EQ(result.info.n_seeded, 0U);
    EXPECT_EQ(result.info.n_evaluations(), 10U);
    EXPECT_EQ(result.info.random_start_index, 1U);
    EXPECT_EQ(result.info.guided_start_index, 4U);
}

TEST(SmboOptimizerTest, ScalarInitialValueForASingleSeed) {
    auto log = std::make_shared<CallLog>();
    RecordingObjective objective;

    Opts options = MakeOptions(4, 1);
    options.x0 = {Point{-1.0, std::string("b")}};
    options.y0 = 7.5;

    const auto result = Minimize(objective, MakeSpace(), MakeBowl(log), options);

    ASSERT_EQ(result.size(), 5U);
    EXPECT_EQ(result.func_vals[0], 7.5);
    EXPECT_EQ(objective.calls.size(), 4U);
}

TEST(SmboOptimizerTest, SeedPointsAreEvaluatedFirst) {
    auto log = std::make_shared<CallLog>();
    RecordingObjective objective;

    Opts options = MakeOptions(8, 2);
    options.x0 = {Point{0.0, std::string("b")}, Point{1.5, std::string("a")}};

    const auto result = Minimize(objective, MakeSpace(), MakeBowl(log), options);

    ASSERT_EQ(result.size(), 8U);
    ASSERT_EQ(objective.calls.size(), 8U);
    EXPECT_EQ(objective.calls[0], options.x0[0]);
    EXPECT_EQ(objective.calls[1], options.x0[1]);
    EXPECT_DOUBLE_EQ(result.func_vals[0], 1.09);
    EXPECT_EQ(result.phases[0], Phase::Seeding);
    EXPECT_EQ(result.phases[1], Phase::Seeding);
    EXPECT_EQ(result.phases[2], Phase::RandomWarmup);
    EXPECT_EQ(result.phases[3], Phase::RandomWarmup);
    EXPECT_EQ(result.phases[4], Phase::Guided);

    // the seeds count towards the first fit
    EXPECT_EQ(log->fits, 4);
    EXPECT_EQ(log->fit_sizes.front(), 4);
    EXPECT_EQ(result.info.n_seeded, 2U);
    EXPECT_EQ(result.info.guided_start_index, 4U);
}

TEST(SmboOptimizerTest, SeedsAloneCanStartTheGuidedPhase) {
    auto log = std::make_shared<CallLog>();
    RecordingObjective objective;

    Opts options = MakeOptions(3, 0);
    options.x0 = {Point{0.5, std::string("a")}};

    const auto result = Minimize(objective, MakeSpace(), MakeBowl(log), options);

    ASSERT_EQ(result.size(), 3U);
    EXPECT_EQ(result.phases[1], Phase::Guided);
    EXPECT_EQ(log->fit_sizes.front(), 1);
}

TEST(SmboOptimizerTest, NoFitWhenTheBudgetIsAllRandom) {
    auto log = std::make_shared<CallLog>();
    RecordingObjective objective;

    const auto result = Minimize(objective, MakeSpace(), MakeBowl(log), MakeOptions(6, 6));

    EXPECT_EQ(result.size(), 6U);
    EXPECT_EQ(log->fits, 0);
    EXPECT_TRUE(result.models.empty());
}

TEST(SmboOptimizerTest, RejectsInvalidConfigurationsBeforeEvaluating) {
    auto log = std::make_shared<CallLog>();
    RecordingObjective objective;
    const ParameterSpace space = MakeSpace();

    auto expect_config_error = [&](const Opts& options) {
        EXPECT_THROW(static_cast<void>(Minimize(objective, space, MakeBowl(log), options)), ConfigurationError);
    };

    expect_config_error(MakeOptions(0, 0));
    expect_config_error(MakeOptions(5, -1));
    expect_config_error(MakeOptions(4, 5));
    expect_config_error(MakeOptions(5, 0));

    Opts few_points = MakeOptions(5, 2);
    few_points.n_points = 0;
    expect_config_error(few_points);

    Opts seeded = MakeOptions(3, 2);
    seeded.x0 = {Point{0.0, std::string("a")}, Point{1.0, std::string("b")}};
    expect_config_error(seeded);

    Opts mismatch = MakeOptions(10, 2);
    mismatch.x0 = {Point{0.0, std::string("a")}, Point{1.0, std::string("b")}};
    mismatch.y0 = std::vector<double>{1.0};
    expect_config_error(mismatch);

    Opts scalar_for_two = mismatch;
    scalar_for_two.y0 = 1.0;
    expect_config_error(scalar_for_two);

    Opts too_many_random = MakeOptions(2, 3);
    too_many_random.x0 = {Point{0.0, std::string("a")}};
    too_many_random.y0 = 1.0;
    expect_config_error(too_many_random);

    Opts y0_only = MakeOptions(5, 2);
    y0_only.y0 = 1.0;
    expect_config_error(y0_only);

    Opts nan_seed = MakeOptions(5, 2);
    nan_seed.x0 = {Point{0.0, std::string("a")}};
    nan_seed.y0 = std::nan("");
    expect_config_error(nan_seed);

    Opts bad_kappa = MakeOptions(5, 2);
    bad_kappa.kappa = std::numeric_limits<double>::infinity();
    expect_config_error(bad_kappa);

    EXPECT_THROW(static_cast<void>(Minimize(objective, ParameterSpace(), MakeBowl(log), MakeOptions(5, 2))),
                 ConfigurationError);

    EXPECT_TRUE(objective.calls.empty());
    EXPECT_EQ(log->fits, 0);
}

TEST(SmboOptimizerTest, RejectsSeedsOutsideTheSpace) {
    auto log = std::make_shared<CallLog>();
    RecordingObjective objective;

    Opts options = MakeOptions(5, 2);
    options.x0 = {Point{0.0, std::string("a")}, Point{3.0, std::string("a")}};

    EXPECT_THROW(static_cast<void>(Minimize(objective, MakeSpace(), MakeBowl(log), options)), InvalidPointError);
    EXPECT_TRUE(objective.calls.empty());
}

TEST(SmboOptimizerTest, NonFiniteObjectiveAbortsWithoutRecording) {
    auto log = std::make_shared<CallLog>();
    int n_calls = 0;
    auto objective = [&n_calls](const Point&) {
        return ++n_calls == 3 ? std::numeric_limits<double>::quiet_NaN() : 1.0;
    };

    std::vector<size_t> seen;
    Opts options = MakeOptions(10, 5);
    options.callback = [&seen](const OptimizeResult<BowlSurrogate>& partial) { seen.push_back(partial.size()); };

    EXPECT_THROW(static_cast<void>(Minimize(objective, MakeSpace(), MakeBowl(log), options)), InvalidObjectiveValueError);
    EXPECT_EQ(n_calls, 3);
    EXPECT_EQ(seen, (std::vector<size_t>{1, 2}));
}

TEST(SmboOptimizerTest, ObjectiveExceptionsPropagate) {
    auto log = std::make_shared<CallLog>();
    auto objective = [](const Point& x) -> double {
        if (std::get<std::string>(x[1]) == "b") {
            throw std::runtime_error("simulation diverged");
        }
        return 0.0;
    };

    Opts options = MakeOptions(5, 1);
    options.x0 = {Point{0.0, std::string("a")}, Point{0.0, std::string("b")}};

    EXPECT_THROW(static_cast<void>(Minimize(objective, MakeSpace(), MakeBowl(log), options)), std::runtime_error);
}

TEST(SmboOptimizerTest, CallbackObservesEveryEvaluation) {
    auto log = std::make_shared<CallLog>();
    RecordingObjective objective;

    std::vector<size_t> sizes;
    std::vector<double> minima;
    Opts options = MakeOptions(6, 2);
    options.x0 = {Point{0.0, std::string("a")}};
    options.y0 = 5.0;
    options.callback = [&](const OptimizeResult<BowlSurrogate>& partial) {
        sizes.push_back(partial.size());
        minima.push_back(partial.fun);
        EXPECT_EQ(partial.fun, *std::min_element(partial.func_vals.begin(), partial.func_vals.end()));
    };

    const auto result = Minimize(objective, MakeSpace(), MakeBowl(log), options);

    // not for the pre-evaluated seed
    EXPECT_EQ(sizes, (std::vector<size_t>{2, 3, 4, 5, 6, 7}));
    EXPECT_TRUE(std::is_sorted(minima.rbegin(), minima.rend()));
    EXPECT_EQ(minima.back(), result.fun);
}

TEST(SmboOptimizerTest, BestIsTheEarliestMinimum) {
    auto log = std::make_shared<CallLog>();
    const std::vector<double> values{5.0, 1.0, 4.0, 1.0, 2.0, 1.0};
    size_t call = 0;
    auto objective = [&](const Point&) { return values[call++]; };

    const auto result = Minimize(objective, MakeSpace(), MakeBowl(log), MakeOptions(6, 3));

    EXPECT_EQ(result.fun, 1.0);
    EXPECT_EQ(result.best_index, 1U);
    EXPECT_EQ(result.x, result.x_iters[1]);
    EXPECT_EQ(result.fun, *std::min_element(result.func_vals.begin(), result.func_vals.end()));
}

TEST(SmboOptimizerTest, SameSeedSameRun) {
    auto log = std::make_shared<CallLog>();
    RecordingObjective first_objective;
    RecordingObjective second_objective;

    const auto first = Minimize(first_objective, MakeSpace(), MakeBowl(log), MakeOptions(12, 4));
    const auto second = Minimize(second_objective, MakeSpace(), MakeBowl(log), MakeOptions(12, 4));

    EXPECT_EQ(first.x_iters, second.x_iters);
    EXPECT_EQ(first.func_vals, second.func_vals);
    EXPECT_EQ(first.x, second.x);
    EXPECT_EQ(first.info.random_state, second.info.random_state);

    Opts other_seed = MakeOptions(12, 4);
    other_seed.random_state = 4321;
    RecordingObjective third_objective;
    const auto third = Minimize(third_objective, MakeSpace(), MakeBowl(log), other_seed);
    EXPECT_NE(first.x_iters, third.x_iters);
}

TEST(SmboOptimizerTest, ExplicitGeneratorIsAdvancedAndRecorded) {
    auto log = std::make_shared<CallLog>();
    RecordingObjective objective;
    std::mt19937 generator(77);
    const std::mt19937 initial = generator;

    const auto result = Minimize(objective, MakeSpace(), MakeBowl(log), MakeOptions(7, 3), generator);

    EXPECT_NE(generator, initial);
    EXPECT_EQ(result.info.random_state, generator);
}

TEST(SmboOptimizerTest, ResumesFromAResult) {
    auto log = std::make_shared<CallLog>();
    RecordingObjective objective;
    const Opts options = MakeOptions(8, 4);

    const auto first = Minimize(objective, MakeSpace(), MakeBowl(log), options);

    std::mt19937 generator = first.info.random_state;
    RecordingObjective resumed_objective;
    const auto resumed = Minimize(resumed_objective, MakeSpace(), MakeBowl(log),
                                  MakeResumeOptions(options, first, 4), generator);

    ASSERT_EQ(resumed.size(), 12U);
    EXPECT_EQ(resumed_objective.calls.size(), 4U);
    EXPECT_TRUE(std::equal(first.x_iters.begin(), first.x_iters.end(), resumed.x_iters.begin()));
    EXPECT_TRUE(std::equal(first.func_vals.begin(), first.func_vals.end(), resumed.func_vals.begin()));
    EXPECT_EQ(resumed.info.n_pre_evaluated, 8U);
    EXPECT_EQ(resumed.info.n_random, 0U);
    EXPECT_EQ(resumed.info.n_guided, 4U);
    EXPECT_LE(resumed.fun, first.fun);
}

TEST(SmboOptimizerTest, GuidedPhaseFollowsTheSurrogate) {
    auto log = std::make_shared<CallLog>();
    RecordingObjective objective;

    Opts options = MakeOptions(10, 2);
    options.acq_func = AcquisitionFunction::LCB;
    options.n_points = 2000;

    const auto result = Minimize(objective, MakeSpace(), MakeBowl(log), options);

    // the bowl is centred on the true minimum (0.3, "a")
    for (size_t i = result.info.guided_start_index; i < result.size(); ++i) {
        EXPECT_EQ(std::get<std::string>(result.x_iters[i][1]), "a");
        EXPECT_NEAR(std::get<double>(result.x_iters[i][0]), 0.3, 0.2);
    }
    EXPECT_LT(result.fun, 0.04);
}

TEST(SmboOptimizerTest, ResultCarriesTheRunSpecification) {
    auto log = std::make_shared<CallLog>();
    RecordingObjective objective;
    Opts options = MakeOptions(5, 2);
    options.acq_func = AcquisitionFunction::PI;
    options.xi = 0.2;

    const auto result = Minimize(objective, MakeSpace(), MakeBowl(log), options);

    EXPECT_EQ(result.specs.n_calls, 5);
    EXPECT_EQ(result.specs.acq_func, AcquisitionFunction::PI);
    EXPECT_EQ(result.specs.xi, 0.2);
    EXPECT_EQ(result.space.num_parameters(), 2U);
}

TEST(SmboOptimizerTest, AcquisitionOptimizerResolvesToSampling) {
    EXPECT_EQ(Resolve(ParseAcquisitionOptimizer("auto")), AcquisitionOptimizer::Sampling);
    EXPECT_EQ(Resolve(ParseAcquisitionOptimizer("sampling")), AcquisitionOptimizer::Sampling);
    EXPECT_THROW(static_cast<void>(ParseAcquisitionOptimizer("lbfgs")), ConfigurationError);
}

}  // namespace
}  // namespace smbopp
