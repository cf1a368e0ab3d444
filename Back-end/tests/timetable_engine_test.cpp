#include "timetable_engine.hpp"
#include "constraint_matcher.hpp"
#include "local_improver.hpp"
#include "validator.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <set>
#include <stdexcept>

namespace smart_timetable {
namespace {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;

class MockSolver : public ScheduleSolver {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(std::optional<Grid>, solve, (const SolveContext&, SolverResult&), (override));
};

Course make_course(int id, const std::string& name, int credits = 1) {
    Course course;
    course.id = id;
    course.course_name = name;
    course.credits = credits;
    return course;
}

Constraint make_constraint(const std::string& course, const std::string& day, const std::string& range,
                           ConstraintKind kind = ConstraintKind::Hard) {
    Constraint constraint;
    constraint.course_name = course;
    constraint.day = day;
    constraint.period_range = range;
    constraint.kind = kind;
    return constraint;
}

SolveRequest math_english_request() {
    SolveRequest request;
    request.courses = {make_course(1, "Math", 2), make_course(2, "English")};
    request.constraints = {make_constraint("Math", "Monday", "P1-P2", ConstraintKind::Exact)};
    request.periods = 4;
    request.lunch = 3;
    request.time_limit = 5.0;
    return request;
}

void expect_shape(const Grid& grid, int periods) {
    ASSERT_EQ(grid.size(), kWeekDays.size());
    for (const auto& day : kWeekDays) {
        ASSERT_EQ(grid.count(day), 1u) << day;
        EXPECT_EQ(static_cast<int>(grid.at(day).size()), periods);
    }
}

TEST(TimetableEngineTest, ExactBlockFallsBackToGreedy) {
    const TimetableEngine engine;
    const EngineResult result = engine.generate(math_english_request());

    expect_shape(result.grid, 4);
    const auto& monday = result.grid.at("Monday");
    EXPECT_EQ(monday[0], "Math");
    EXPECT_EQ(monday[1], "Math");
    EXPECT_EQ(monday[2], kLunchLabel);
    EXPECT_FALSE(monday[3].empty());
    for (const auto& day : kWeekDays) {
        EXPECT_EQ(result.grid.at(day)[2], kLunchLabel) << day;
    }

    EXPECT_TRUE(result.diagnostics.success);
    EXPECT_TRUE(result.diagnostics.valid);
    EXPECT_EQ(result.diagnostics.path, SolvePath::Fallback);
    EXPECT_EQ(result.diagnostics.fallback_reason, "infeasible");
    EXPECT_GE(result.diagnostics.diversity_after, result.diagnostics.diversity_before);
}

TEST(TimetableEngineTest, UnknownCourseIsPlacedLiterally) {
    EngineOptions options;
    options.exact_solver = false;
    options.synthesize_unmatched = false;
    const TimetableEngine engine(options);

    SolveRequest request;
    request.courses = {make_course(1, "Math"), make_course(2, "English")};
    request.constraints = {make_constraint("Chemistry", "Wednesday", "P2")};
    request.periods = 4;

    const EngineResult result = engine.generate(request);
    EXPECT_EQ(result.grid.at("Wednesday")[1], "Chemistry");
    EXPECT_TRUE(result.diagnostics.valid);
    EXPECT_EQ(result.diagnostics.fallback_reason, "unavailable");
}

TEST(TimetableEngineTest, UnknownCourseIsSynthesizedForExactPath) {
    const TimetableEngine engine;

    SolveRequest request;
    request.courses = {make_course(1, "Math"), make_course(2, "English")};
    request.constraints = {make_constraint("Chemistry", "Wednesday", "P2"),
                           make_constraint(" chemistry ", "Thursday", "P1")};
    request.periods = 4;

    const EngineResult result = engine.generate(request);
    EXPECT_EQ(result.diagnostics.synthetic_courses, 1);
    EXPECT_EQ(result.diagnostics.path, SolvePath::Exact);
    EXPECT_TRUE(result.diagnostics.valid);
    EXPECT_EQ(result.grid.at("Wednesday")[1], "Chemistry");
}

TEST(TimetableEngineTest, CourseCodeResolvesToDisplayLabel) {
    const TimetableEngine engine;

    Course ds = make_course(1, "Data Structures");
    ds.course_code = "CS201";
    SolveRequest request;
    request.courses = {ds, make_course(2, "Math")};
    request.constraints = {make_constraint("cs201", "Monday", "P1")};
    request.periods = 3;

    const EngineResult result = engine.generate(request);
    EXPECT_EQ(result.grid.at("Monday")[0], "Data Structures");
    EXPECT_TRUE(result.diagnostics.valid);
    EXPECT_EQ(result.diagnostics.synthetic_courses, 0);
}

TEST(TimetableEngineTest, ExactPathNeverRepeatsCourseWithinDay) {
    const TimetableEngine engine;

    SolveRequest request;
    request.courses = {make_course(1, "Math"), make_course(2, "English"), make_course(3, "Physics"),
                       make_course(4, "History")};
    request.constraints = {make_constraint("Physics", "Tuesday", "P1-P3")};
    request.periods = 6;
    request.lunch = 4;

    const EngineResult result = engine.generate(request);
    ASSERT_EQ(result.diagnostics.path, SolvePath::Exact);
    expect_shape(result.grid, 6);
    for (const auto& day : kWeekDays) {
        const auto& row = result.grid.at(day);
        EXPECT_EQ(row[3], kLunchLabel);
        std::set<std::string> seen;
        for (const auto& cell : row) {
            if (cell.empty() || cell == kLunchLabel) continue;
            EXPECT_TRUE(seen.insert(cell).second) << cell << " twice on " << day;
        }
    }
}

TEST(TimetableEngineTest, OutputValidatesIdempotently) {
    const TimetableEngine engine;
    const SolveRequest request = math_english_request();
    const EngineResult result = engine.generate(request);

    const auto first = validate_grid(result.grid, request.constraints, 2);
    const auto second = validate_grid(result.grid, request.constraints, 2);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.ok, result.diagnostics.valid);
}

TEST(TimetableEngineTest, SameSeedSameGrid) {
    EngineOptions options;
    options.exact_solver = false;
    const TimetableEngine engine(options);

    SolveRequest request = math_english_request();
    request.courses.push_back(make_course(3, "Physics"));
    request.seed = 99;

    EXPECT_EQ(engine.generate(request).grid, engine.generate(request).grid);
}

TEST(TimetableEngineTest, RejectsUnsolvableRequests) {
    const TimetableEngine engine;

    SolveRequest no_courses;
    EXPECT_THROW(engine.generate(no_courses), InvalidRequestError);

    SolveRequest no_periods = math_english_request();
    no_periods.periods = 0;
    EXPECT_THROW(engine.generate(no_periods), InvalidRequestError);

    SolveRequest negative_budget = math_english_request();
    negative_budget.time_limit = -1.0;
    EXPECT_THROW(engine.generate(negative_budget), InvalidRequestError);
}

TEST(TimetableEngineTest, WarnsOnDuplicateIdsAndBadLunch) {
    EngineOptions options;
    options.exact_solver = false;
    const TimetableEngine engine(options);

    SolveRequest request;
    request.courses = {make_course(1, "Math"), make_course(1, "Math again")};
    request.periods = 3;
    request.lunch = 7;

    const EngineResult result = engine.generate(request);
    EXPECT_THAT(result.diagnostics.warnings, ::testing::Contains(HasSubstr("Duplicate course id 1")));
    EXPECT_THAT(result.diagnostics.warnings, ::testing::Contains(HasSubstr("Lunch period 7")));
    for (const auto& day : kWeekDays) {
        for (const auto& cell : result.grid.at(day)) EXPECT_EQ(cell, "Math");
    }
}

TEST(TimetableEngineTest, ExactSolverErrorUsesFallback) {
    auto exact = std::make_unique<MockSolver>();
    auto fallback = std::make_unique<MockSolver>();
    EXPECT_CALL(*exact, name()).WillRepeatedly(Return("mock-exact"));
    EXPECT_CALL(*exact, solve(_, _)).WillOnce(Throw(std::runtime_error("boom")));

    Grid canned;
    for (const auto& day : kWeekDays) canned[day] = {"English", "English"};
    EXPECT_CALL(*fallback, solve(_, _)).WillOnce(Return(std::optional<Grid>(canned)));

    EngineOptions options;
    options.local_improvement = false;
    const TimetableEngine engine(options, std::move(exact), std::move(fallback));

    SolveRequest request;
    request.courses = {make_course(1, "English")};
    request.periods = 2;

    const EngineResult result = engine.generate(request);
    EXPECT_EQ(result.grid, canned);
    EXPECT_EQ(result.diagnostics.path, SolvePath::Fallback);
    EXPECT_EQ(result.diagnostics.fallback_reason, "error");
    EXPECT_THAT(result.diagnostics.warnings, ::testing::Contains(HasSubstr("boom")));
}

TEST(TimetableEngineTest, BothSolversFailingYieldsPlaceholder) {
    auto exact = std::make_unique<MockSolver>();
    auto fallback = std::make_unique<MockSolver>();
    EXPECT_CALL(*exact, solve(_, _)).WillOnce(Return(std::optional<Grid>()));
    EXPECT_CALL(*fallback, name()).WillRepeatedly(Return("mock-greedy"));
    EXPECT_CALL(*fallback, solve(_, _)).WillOnce(Throw(std::runtime_error("no grid")));

    EngineOptions options;
    options.local_improvement = false;
    const TimetableEngine engine(options, std::move(exact), std::move(fallback));

    SolveRequest request;
    request.courses = {make_course(1, "Math"), make_course(2, "English")};
    request.periods = 3;
    request.lunch = 2;

    const EngineResult result = engine.generate(request);
    EXPECT_EQ(result.grid.at("Monday"), (std::vector<std::string>{"Math", "LUNCH", "English"}));
    EXPECT_TRUE(result.diagnostics.has_errors());
    EXPECT_TRUE(result.diagnostics.success);
}

TEST(TimetableEngineTest, PrepareAddsSyntheticCourseWithBlockCredits) {
    const TimetableEngine engine;

    SolveRequest request;
    request.courses = {make_course(-1, "Math")};
    request.constraints = {make_constraint("Robotics Lab", "Friday", "P2-P4", ConstraintKind::Exact)};

    SolverResult result;
    const SolveContext ctx = engine.prepare(request, result);
    ASSERT_EQ(ctx.courses.size(), 2u);
    const Course& synthetic = ctx.courses.back();
    EXPECT_TRUE(synthetic.synthetic);
    EXPECT_EQ(synthetic.id, -2);
    EXPECT_EQ(synthetic.course_code, "Robotics Lab");
    EXPECT_EQ(synthetic.credits, 3);
    EXPECT_EQ(synthetic.section, kAllSections);
    EXPECT_EQ(ctx.seed, 1u);
}

TEST(TimetableEngineTest, CodeConstraintKeepsMatchingToItsCourse) {
    const TimetableEngine engine;

    Course first = make_course(1, "Math");
    first.course_code = "MA1";
    first.section = "A";
    Course second = make_course(2, "Math");
    second.course_code = "MA2";
    second.section = "B";

    SolveRequest request;
    request.courses = {first, second};
    request.constraints = {make_constraint("MA2", "Monday", "P1")};

    SolverResult result;
    const SolveContext ctx = engine.prepare(request, result);
    ASSERT_EQ(ctx.constraints.size(), 1u);
    EXPECT_EQ(ctx.constraints[0].course_name, "MA2");
    EXPECT_EQ(match_constraint(ctx.constraints[0], ctx.courses).course_ids, (std::vector<int>{2}));

    // Grid cells only carry the display label.
    ASSERT_EQ(ctx.check_constraints.size(), 1u);
    EXPECT_EQ(ctx.check_constraints[0].course_name, "Math");
    EXPECT_EQ(result.synthetic_courses, 0);
}

TEST(TimetableEngineTest, MalformedSolverGridsAreDiscarded) {
    auto exact = std::make_unique<MockSolver>();
    auto fallback = std::make_unique<MockSolver>();
    EXPECT_CALL(*exact, name()).WillRepeatedly(Return("mock-exact"));
    EXPECT_CALL(*fallback, name()).WillRepeatedly(Return("mock-greedy"));

    Grid short_rows;
    for (const auto& day : kWeekDays) short_rows[day] = {"Math"};
    Grid missing_day = short_rows;
    missing_day.erase("Friday");
    EXPECT_CALL(*exact, solve(_, _)).WillOnce(Return(std::optional<Grid>(short_rows)));
    EXPECT_CALL(*fallback, solve(_, _)).WillOnce(Return(std::optional<Grid>(missing_day)));

    EngineOptions options;
    options.local_improvement = false;
    const TimetableEngine engine(options, std::move(exact), std::move(fallback));

    SolveRequest request;
    request.courses = {make_course(1, "Math"), make_course(2, "English")};
    request.periods = 4;
    request.lunch = 3;

    const EngineResult result = engine.generate(request);
    expect_shape(result.grid, 4);
    EXPECT_EQ(result.grid.at("Monday"), (std::vector<std::string>{"Math", "English", "LUNCH", "Math"}));
    EXPECT_EQ(result.diagnostics.path, SolvePath::Fallback);
    EXPECT_EQ(result.diagnostics.fallback_reason, "error");
    EXPECT_THAT(result.diagnostics.warnings, ::testing::Contains(HasSubstr("malformed grid")));
    EXPECT_THAT(result.diagnostics.errors, ::testing::Contains(HasSubstr("mock-greedy")));
}

}  // namespace
}  // namespace smart_timetable
