#include "validator.hpp"

#include <gtest/gtest.h>

namespace smart_timetable {
namespace {

Grid sample_grid() {
    Grid grid;
    grid["Monday"] = {"Math", "Math", "LUNCH", "English"};
    grid["Tuesday"] = {"English - Dr. Smith", "Physics", "LUNCH", "Math"};
    grid["Wednesday"] = {"Chemistry", "Math", "LUNCH", "English"};
    grid["Thursday"] = {"Physics", "English", "LUNCH", "Math"};
    grid["Friday"] = {"Math", "Physics", "LUNCH", "English"};
    return grid;
}

Constraint make_constraint(const std::string& course, const std::string& day, const std::string& range,
                           ConstraintKind kind = ConstraintKind::Hard, const std::string& section = kAllSections) {
    Constraint constraint;
    constraint.course_name = course;
    constraint.day = day;
    constraint.period_range = range;
    constraint.kind = kind;
    constraint.section = section;
    return constraint;
}

TEST(ValidatorTest, ExactConstraintSatisfied) {
    const auto report =
        validate_grid(sample_grid(), {make_constraint("Math", "Monday", "P1-P2", ConstraintKind::Exact)}, 2);
    EXPECT_TRUE(report.ok);
    EXPECT_TRUE(report.violations.empty());
}

TEST(ValidatorTest, ExactWindowSkipsLunch) {
    const auto report =
        validate_grid(sample_grid(), {make_constraint("math", "monday", "P1-P3", ConstraintKind::Exact)}, 2);
    EXPECT_TRUE(report.ok);
}

TEST(ValidatorTest, ExactConstraintViolated) {
    const auto report =
        validate_grid(sample_grid(), {make_constraint("English", "Monday", "P1-P2", ConstraintKind::Exact)}, 2);
    EXPECT_FALSE(report.ok);
    ASSERT_EQ(report.violations.size(), 1u);
    EXPECT_EQ(report.violations[0].rfind("Exact constraint violated: 'English'", 0), 0u);
}

TEST(ValidatorTest, HardConstraintNeedsOneMatch) {
    Grid grid = sample_grid();
    EXPECT_TRUE(validate_grid(grid, {make_constraint("math", "Monday", "P2-P4")}, 2).ok);

    const auto report = validate_grid(grid, {make_constraint("Physics", "Monday", "P1-P4")}, 2);
    EXPECT_FALSE(report.ok);
    ASSERT_EQ(report.violations.size(), 1u);
    EXPECT_EQ(report.violations[0].rfind("Hard constraint violated: 'Physics'", 0), 0u);
}

TEST(ValidatorTest, ComparesSubjectBeforeTeacherSuffix) {
    EXPECT_EQ(cell_subject("English - Dr. Smith"), "english");
    EXPECT_TRUE(cell_matches("English - Dr. Smith", "english"));
    EXPECT_TRUE(cell_matches("Intro to Physics", "Physics"));
    EXPECT_FALSE(cell_matches("", "Physics"));
    EXPECT_TRUE(validate_grid(sample_grid(), {make_constraint("English", "Tuesday", "P1")}).ok);
}

TEST(ValidatorTest, MissingDayIsViolation) {
    Grid grid = sample_grid();
    grid.erase("Friday");
    const auto report = validate_grid(grid, {make_constraint("Math", "Friday", "P1")});
    EXPECT_FALSE(report.ok);
    ASSERT_EQ(report.violations.size(), 1u);
    EXPECT_NE(report.violations[0].find("day missing"), std::string::npos);
}

TEST(ValidatorTest, MalformedConstraintIsSkipped) {
    const auto report = validate_grid(sample_grid(), {make_constraint("Math", "Caturday", "P1"),
                                                      make_constraint("Math", "Monday", "late")});
    EXPECT_TRUE(report.ok);
    EXPECT_EQ(report.skipped.size(), 2u);
}

TEST(ValidatorTest, SectionFilter) {
    const std::vector<Constraint> constraints = {
        make_constraint("History", "Monday", "P1", ConstraintKind::Hard, "B")};

    EXPECT_TRUE(validate_grid(sample_grid(), constraints, 2, "A").ok);
    EXPECT_FALSE(validate_grid(sample_grid(), constraints, 2, "B").ok);
    EXPECT_FALSE(validate_grid(sample_grid(), constraints, 2).ok);
}

TEST(ValidatorTest, LowerCaseDayKeys) {
    Grid grid;
    grid["monday"] = {"Math", "English"};
    EXPECT_TRUE(validate_grid(grid, {make_constraint("English", "Monday", "P2")}).ok);
}

TEST(ValidatorTest, Idempotent) {
    const Grid grid = sample_grid();
    const std::vector<Constraint> constraints = {
        make_constraint("Physics", "Monday", "P1-P4"),
        make_constraint("Math", "Monday", "P1-P2", ConstraintKind::Exact),
        make_constraint("Math", "Someday", "P1")};

    const auto first = validate_grid(grid, constraints, 2);
    const auto second = validate_grid(grid, constraints, 2);
    EXPECT_EQ(first, second);
    EXPECT_EQ(grid, sample_grid());
}

}  // namespace
}  // namespace smart_timetable
