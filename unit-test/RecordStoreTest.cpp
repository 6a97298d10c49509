#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "store/record_store.hpp"
#include "test/assertions.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace oj;
using namespace nlohmann;

class RecordStoreTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    static configuration make_configuration() {
        configuration config;
        config.problems.push_back(make_problem(1, problem_type::STANDARD, {}));
        config.problems.push_back(make_problem(2, problem_type::STANDARD, {}));
        return config;
    }

    static job make_job(uint32_t user_id, uint32_t contest_id, uint32_t problem_id, const string &time,
                        job_state state = job_state::FINISHED, oj_result result = oj_result::ACCEPTED) {
        job record;
        record.submit.source_code = "echo 1";
        record.submit.language = "sh";
        record.submit.user_id = user_id;
        record.submit.contest_id = contest_id;
        record.submit.problem_id = problem_id;
        record.created_time = record.updated_time = parse_time(time);
        record.state = state;
        record.result = result;
        record.score = result == oj_result::ACCEPTED ? 100 : 0;
        return record;
    }

    static vector<uint32_t> ids(const vector<job> &jobs) {
        vector<uint32_t> result;
        for (auto &record : jobs) result.push_back(record.id);
        return result;
    }
};

TEST_F(RecordStoreTest, RootUserTest) {
    record_store store;
    auto root = store.users().select_by_id(0);
    ASSERT_TRUE(root);
    EXPECT_EQ(root->name, "root");
    EXPECT_EQ(store.users().count(), 1u);
    EXPECT_EQ(store.jobs().count(), 0u);
}

TEST_F(RecordStoreTest, CreateUserTest) {
    record_store store;
    user alice = store.create_user("alice");
    user bob = store.create_user("bob");
    EXPECT_EQ(alice.id, 1u);
    EXPECT_EQ(bob.id, 2u);

    try {
        store.create_user("alice");
        FAIL() << "duplicate user name should be rejected";
    } catch (validation_error &ex) {
        EXPECT_EQ(ex.reason(), error_reason::INVALID_ARGUMENT);
    }

    auto found = store.find_user_by_name("bob");
    ASSERT_TRUE(found);
    EXPECT_EQ(found->id, 2u);
    EXPECT_FALSE(store.find_user_by_name("carol"));
}

TEST_F(RecordStoreTest, RenameUserTest) {
    record_store store;
    user alice = store.create_user("alice");
    store.create_user("bob");

    EXPECT_EQ(store.rename_user(alice.id, "alice").name, "alice");
    EXPECT_EQ(store.rename_user(alice.id, "carol").name, "carol");
    EXPECT_EQ(store.users().select_by_id(alice.id)->name, "carol");

    try {
        store.rename_user(alice.id, "bob");
        FAIL() << "duplicate user name should be rejected";
    } catch (validation_error &ex) {
        EXPECT_EQ(ex.reason(), error_reason::INVALID_ARGUMENT);
    }

    try {
        store.rename_user(100, "dave");
        FAIL() << "unknown user should be rejected";
    } catch (validation_error &ex) {
        EXPECT_EQ(ex.reason(), error_reason::NOT_FOUND);
    }
}

TEST_F(RecordStoreTest, SaveContestTest) {
    record_store store;
    configuration config = make_configuration();
    user alice = store.create_user("alice");

    contest c;
    c.name = "warmup";
    c.from = parse_time("2022-08-27T02:05:29.000Z");
    c.to = parse_time("2022-08-28T02:05:29.000Z");
    c.problem_ids = {1, 2};
    c.user_ids = {0, alice.id};
    c.submission_limit = 3;

    contest created = store.save_contest(c, config);
    EXPECT_EQ(created.id, 1u);

    created.name = "final";
    store.save_contest(created, config);
    EXPECT_EQ(store.contests().select_by_id(1)->name, "final");
    EXPECT_EQ(store.contests().count(), 1u);

    contest missing = created;
    missing.id = 42;
    EXPECT_THROW(store.save_contest(missing, config), validation_error);

    contest bad_problem = c;
    bad_problem.problem_ids = {3};
    try {
        store.save_contest(bad_problem, config);
        FAIL() << "unknown problem should be rejected";
    } catch (validation_error &ex) {
        EXPECT_EQ(ex.reason(), error_reason::NOT_FOUND);
    }

    contest bad_user = c;
    bad_user.user_ids = {7};
    try {
        store.save_contest(bad_user, config);
        FAIL() << "unknown user should be rejected";
    } catch (validation_error &ex) {
        EXPECT_EQ(ex.reason(), error_reason::NOT_FOUND);
    }
}

TEST_F(RecordStoreTest, SelectJobsTest) {
    record_store store;
    user alice = store.create_user("alice");
    store.jobs().insert(make_job(0, 0, 1, "2022-08-27T02:05:29.000Z"));
    store.jobs().insert(make_job(alice.id, 0, 2, "2022-08-27T02:06:29.000Z", job_state::FINISHED, oj_result::WRONG_ANSWER));
    store.jobs().insert(make_job(alice.id, 1, 1, "2022-08-27T02:07:29.000Z", job_state::QUEUEING, oj_result::WAITING));

    EXPECT_EQ(ids(store.select_jobs({})), (vector<uint32_t>{0, 1, 2}));

    job_filter by_user;
    by_user.user_id = alice.id;
    EXPECT_EQ(ids(store.select_jobs(by_user)), (vector<uint32_t>{1, 2}));

    job_filter by_name;
    by_name.user_name = "root";
    EXPECT_EQ(ids(store.select_jobs(by_name)), (vector<uint32_t>{0}));

    job_filter unknown_name;
    unknown_name.user_name = "nobody";
    EXPECT_TRUE(store.select_jobs(unknown_name).empty());

    job_filter by_contest;
    by_contest.contest_id = 0;
    EXPECT_EQ(ids(store.select_jobs(by_contest)), (vector<uint32_t>{0, 1}));

    job_filter by_time;
    by_time.from = parse_time("2022-08-27T02:06:00.000Z");
    by_time.to = parse_time("2022-08-27T02:06:29.000Z");
    EXPECT_EQ(ids(store.select_jobs(by_time)), (vector<uint32_t>{1}));

    job_filter by_result = json::parse(R"({"state": "Finished", "result": "Wrong Answer"})").get<job_filter>();
    EXPECT_EQ(ids(store.select_jobs(by_result)), (vector<uint32_t>{1}));

    job_filter by_problem = json::parse(R"({"problem_id": 1, "language": "sh"})").get<job_filter>();
    EXPECT_EQ(ids(store.select_jobs(by_problem)), (vector<uint32_t>{0, 2}));
}

TEST_F(RecordStoreTest, MalformedFilterTest) {
    EXPECT_THROW(json::parse(R"({"result": "Great"})").get<job_filter>(), validation_error);
    EXPECT_THROW(json::parse(R"({"from": "yesterday"})").get<job_filter>(), validation_error);
}

TEST_F(RecordStoreTest, SaveAndLoadTest) {
    auto path = write_test_file("RecordStoreTest/data.json", "");
    configuration config = make_configuration();

    record_store store;
    user alice = store.create_user("alice");
    job record = make_job(alice.id, 0, 1, "2022-08-27T02:05:29.123Z");
    record.cases = {{0, oj_result::COMPILATION_SUCCESS, 1000, 0, ""}, {1, oj_result::ACCEPTED, 2000, 0, ""}};
    store.jobs().insert(record);
    contest c;
    c.name = "warmup";
    c.from = parse_time("2022-08-27T02:05:29.000Z");
    c.to = parse_time("2022-08-28T02:05:29.000Z");
    c.problem_ids = {1};
    c.user_ids = {alice.id};
    store.save_contest(c, config);
    store.save(path);

    record_store loaded;
    loaded.load(path);
    EXPECT_JSON_EQ(json(loaded.jobs().select_all()), json(store.jobs().select_all()));
    EXPECT_JSON_EQ(json(loaded.users().select_all()), json(store.users().select_all()));
    EXPECT_JSON_EQ(json(loaded.contests().select_all()), json(store.contests().select_all()));

    // 新的记录编号接在已有记录之后
    EXPECT_EQ(loaded.jobs().insert(record), 1u);
    EXPECT_EQ(loaded.create_user("bob").id, 2u);
}

TEST_F(RecordStoreTest, LoadWithoutRootTest) {
    auto path = write_test_file("RecordStoreTest/no-root.json", R"({
        "jobs": [],
        "users": [{"id": 1, "name": "alice"}],
        "contests": []
    })");

    record_store store;
    store.load(path);
    EXPECT_EQ(store.users().count(), 2u);
    EXPECT_EQ(store.users().select_by_id(0)->name, "root");
}

TEST_F(RecordStoreTest, LoadMalformedTest) {
    auto path = write_test_file("RecordStoreTest/malformed.json", R"({"jobs": [{"id": 0}]})");
    record_store store;
    EXPECT_THROW(store.load(path), database_error);
    EXPECT_THROW(store.load("/nonexistent/data.json"), execution_error);
}

TEST_F(RecordStoreTest, ClearTest) {
    record_store store;
    store.create_user("alice");
    store.jobs().insert(make_job(0, 0, 1, "2022-08-27T02:05:29.000Z"));
    store.clear();
    EXPECT_EQ(store.users().count(), 1u);
    EXPECT_EQ(store.jobs().count(), 0u);
    EXPECT_EQ(store.create_user("alice").id, 1u);
}
