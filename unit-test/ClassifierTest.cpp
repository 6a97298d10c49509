#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "judge/classifier.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace oj;

class ClassifierTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    // 比较 $0 (输出) 和 $1 (答案)，相同时输出 Accepted
    static vector<string> equal_verifier() {
        return {"/bin/sh", "-c",
                R"sh(if [ "$(cat "$0")" = "$(cat "$1")" ]; then printf 'Accepted\nsame\n'; else printf 'Wrong Answer\n\ndiffer\n'; fi)sh",
                "%OUTPUT%", "%ANSWER%"};
    }
};

TEST_F(ClassifierTest, StandardCompareTest) {
    EXPECT_TRUE(compare_standard("a\nb\n", "a \nb"));
    EXPECT_TRUE(compare_standard("1 2\n3\n", "  1 2\t\n3\n\n\n"));
    EXPECT_TRUE(compare_standard("", "\n\n"));
    EXPECT_FALSE(compare_standard("a\nb", "a\nb\nc"));
    EXPECT_FALSE(compare_standard("1 2", "1  2"));
    EXPECT_FALSE(compare_standard("a\n\nb", "a\nb"));
}

TEST_F(ClassifierTest, StandardCompareCarriageReturnTest) {
    EXPECT_TRUE(compare_standard("3\r\n4\r\n", "3\n4\n"));
}

TEST_F(ClassifierTest, StrictCompareTest) {
    EXPECT_TRUE(compare_strict("a\nb\n", "a\nb\n"));
    EXPECT_FALSE(compare_strict("a\nb\n", "a\nb"));
    EXPECT_FALSE(compare_strict("a\nb\n", "a \nb\n"));
}

TEST_F(ClassifierTest, ParseVerifierOutputTest) {
    verdict v = parse_verifier_output("Accepted\nwell done\n");
    EXPECT_EQ(v.result, oj_result::ACCEPTED);
    EXPECT_EQ(v.info, "well done");

    v = parse_verifier_output("\nWrong Answer\n\n  line 3 differs \n\n");
    EXPECT_EQ(v.result, oj_result::WRONG_ANSWER);
    EXPECT_EQ(v.info, "line 3 differs");
}

TEST_F(ClassifierTest, ParseInvalidVerifierOutputTest) {
    for (const string &output : {"", "Accepted\n", "Accepted\na\nb\n", "Unknown\ninfo\n", "accepted\ninfo\n"}) {
        verdict v = parse_verifier_output(output);
        EXPECT_EQ(v.result, oj_result::SPJ_ERROR) << output;
        EXPECT_EQ(v.info, "Invalid special judge output.") << output;
    }
}

TEST_F(ClassifierTest, RunVerifierTest) {
    auto answer = write_test_file("ClassifierTest/verifier.ans", "42\n");
    auto same = write_test_file("ClassifierTest/verifier-same.out", "42\n");
    auto differ = write_test_file("ClassifierTest/verifier-differ.out", "24\n");
    vector<string> command = equal_verifier();

    verdict v = run_verifier(&command, answer, same);
    EXPECT_EQ(v.result, oj_result::ACCEPTED);
    EXPECT_EQ(v.info, "same");

    v = run_verifier(&command, answer, differ);
    EXPECT_EQ(v.result, oj_result::WRONG_ANSWER);
    EXPECT_EQ(v.info, "differ");
}

TEST_F(ClassifierTest, VerifierNotConfiguredTest) {
    auto answer = write_test_file("ClassifierTest/missing.ans", "1\n");
    vector<string> empty;

    verdict v = run_verifier(nullptr, answer, answer);
    EXPECT_EQ(v.result, oj_result::SPJ_ERROR);
    EXPECT_EQ(v.info, "Special judge command not found");

    v = run_verifier(&empty, answer, answer);
    EXPECT_EQ(v.result, oj_result::SPJ_ERROR);
    EXPECT_EQ(v.info, "Special judge command not found");
}

TEST_F(ClassifierTest, VerifierFailureTest) {
    auto answer = write_test_file("ClassifierTest/failure.ans", "1\n");
    vector<string> failing = {"/bin/sh", "-c", "printf 'Accepted\\nok\\n'; exit 2"};
    vector<string> nonexistent = {"/nonexistent/oj-judger-verifier", "%OUTPUT%", "%ANSWER%"};

    verdict v = run_verifier(&failing, answer, answer);
    EXPECT_EQ(v.result, oj_result::SPJ_ERROR);
    EXPECT_EQ(v.info, "Error occurred while calling the special judger");

    v = run_verifier(&nonexistent, answer, answer);
    EXPECT_EQ(v.result, oj_result::SPJ_ERROR);
    EXPECT_EQ(v.info, "Error occurred while calling the special judger");
}

TEST_F(ClassifierTest, VerifierCanceledTest) {
    auto answer = write_test_file("ClassifierTest/canceled.ans", "1\n");
    vector<string> command = equal_verifier();
    cancellation_token token;
    token.cancel();

    EXPECT_THROW(run_verifier(&command, answer, answer, &token), judge_canceled);
}

TEST_F(ClassifierTest, ClassifyByProblemTypeTest) {
    test_case tc = make_test_case("ClassifierTest/classify", 10, "", "hello\n");
    auto loose = write_test_file("ClassifierTest/classify-loose.out", "hello  \n\n");

    problem standard = make_problem(1, problem_type::STANDARD, {tc});
    EXPECT_EQ(classify(standard, tc, loose).result, oj_result::ACCEPTED);

    problem ranking = make_problem(2, problem_type::DYNAMIC_RANKING, {tc});
    ranking.misc.dynamic_ranking_ratio = 0.5;
    EXPECT_EQ(classify(ranking, tc, loose).result, oj_result::ACCEPTED);

    problem strict = make_problem(3, problem_type::STRICT, {tc});
    EXPECT_EQ(classify(strict, tc, loose).result, oj_result::WRONG_ANSWER);
    EXPECT_EQ(classify(strict, tc, tc.answer_file).result, oj_result::ACCEPTED);

    problem spj = make_problem(4, problem_type::SPJ, {tc});
    spj.misc.special_judge = equal_verifier();
    EXPECT_EQ(classify(spj, tc, tc.answer_file).result, oj_result::ACCEPTED);
    EXPECT_EQ(classify(spj, tc, loose).result, oj_result::WRONG_ANSWER);

    problem no_verifier = make_problem(5, problem_type::SPJ, {tc});
    EXPECT_EQ(classify(no_verifier, tc, loose).result, oj_result::SPJ_ERROR);
}

TEST_F(ClassifierTest, ClassifyMissingAnswerTest) {
    test_case tc = make_test_case("ClassifierTest/unreadable", 10, "", "1\n");
    tc.answer_file = "/nonexistent/testdata.ans";
    auto output = write_test_file("ClassifierTest/unreadable.out", "1\n");

    problem standard = make_problem(1, problem_type::STANDARD, {tc});
    EXPECT_THROW(classify(standard, tc, output), execution_error);
}

TEST_F(ClassifierTest, ClassifyKeepsOutputTest) {
    test_case tc = make_test_case("ClassifierTest/keep", 10, "", "hello\n");
    auto wrong = write_test_file("ClassifierTest/keep-wrong.out", "world\n");
    problem standard = make_problem(1, problem_type::STANDARD, {tc});

    verdict v = classify(standard, tc, wrong);
    EXPECT_EQ(v.result, oj_result::WRONG_ANSWER);
    EXPECT_EQ(v.info, "world\n");

    problem strict = make_problem(2, problem_type::STRICT, {tc});
    v = classify(strict, tc, tc.answer_file);
    EXPECT_EQ(v.result, oj_result::ACCEPTED);
    EXPECT_EQ(v.info, "hello\n");

    size_t capture_size = MAX_CAPTURE_SIZE;
    MAX_CAPTURE_SIZE = 4;
    v = classify(standard, tc, wrong);
    MAX_CAPTURE_SIZE = capture_size;
    EXPECT_EQ(v.info, "worl");
}
