#include <glog/logging.h>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/judger.hpp"
#include "judge/problem.hpp"
#include "judge_service.hpp"
#include "rank/ranking.hpp"
#include "store/record_store.hpp"
using namespace std;
using nlohmann::json;

static json error_body(const oj::validation_error &ex) {
    return {{"code", ex.code()},
            {"reason", oj::get_display_message(ex.reason())},
            {"message", ex.what()}};
}

/**
 * @brief 读取 JSON 数组文件并逐个解析为 T
 */
template <typename T>
static vector<T> read_json_array(const filesystem::path &path) {
    CHECK(filesystem::is_regular_file(path))
        << "File " << path << " does not exist";
    try {
        return json::parse(oj::read_file_content(path)).get<vector<T>>();
    } catch (std::exception &e) {
        LOG(FATAL) << "File " << path << " is malformed: " << e.what();
    }
    return {};
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("oj-judger options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config,c", po::value<string>()->required(), "set the configuration file with problems and languages")
        ("data", po::value<string>(), "set the file to load records from at startup and to save records to at exit")
        ("flush-data", "discard records stored in the data file at startup")
        ("users", po::value<string>(), "create users listed in the given JSON file, an array of {\"name\": ...}")
        ("contests", po::value<string>(), "create or update contests listed in the given JSON file")
        ("submit", po::value<string>(), "judge submissions listed in the given JSON file")
        ("workers", po::value<size_t>(), "set the number of submissions judged concurrently, default to the number of cores")
        ("run-dir", po::value<string>(), "set the directory to compile and run user programs. You can either pass it from environ RUNDIR")
        ("ranklist", po::value<uint32_t>(), "print the ranklist of the given contest, 0 for the global ranklist")
        ("scoring-rule", po::value<string>()->default_value("latest"), "latest or highest")
        ("tie-breaker", po::value<string>(), "submission_time, submission_count or user_id")
        ("debug", "turn on the debug mode to keep the working directories of submissions")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "oj-judger: judge submissions and compute ranklists" << endl
                 << "Usage: " << argv[0] << " [options]" << endl;
            cout << desc << endl;
            return EXIT_SUCCESS;
        }
        if (vm.count("version")) {
            cout << "oj-judger 1.0" << endl;
            return EXIT_SUCCESS;
        }
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("debug") || getenv("DEBUG"))
        oj::DEBUG = true;

    if (vm.count("run-dir")) {
        oj::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        oj::RUN_DIR = filesystem::path(oj::get_env("RUNDIR", ""));
    }
    filesystem::create_directories(oj::RUN_DIR);
    CHECK(filesystem::is_directory(oj::RUN_DIR))
        << "Run directory " << oj::RUN_DIR << " does not exist";

    oj::ranking_rule rule;
    {
        auto scoring = oj::parse_scoring_rule(vm.at("scoring-rule").as<string>());
        CHECK(scoring) << "Unrecognized scoring rule " << vm.at("scoring-rule").as<string>();
        rule.scoring = *scoring;
        if (vm.count("tie-breaker")) {
            rule.tie = oj::parse_tie_breaker(vm.at("tie-breaker").as<string>());
            CHECK(rule.tie) << "Unrecognized tie breaker " << vm.at("tie-breaker").as<string>();
        }
    }

    oj::configuration config;
    try {
        config = oj::load_configuration(vm.at("config").as<string>());
    } catch (oj::oj_exception& e) {
        LOG(FATAL) << "Configuration file " << vm.at("config").as<string>() << " is malformed: " << e.what();
    }
    LOG(INFO) << "Loaded " << config.problems.size() << " problems and " << config.languages.size() << " languages";

    oj::record_store store;
    if (vm.count("data") && !vm.count("flush-data") && filesystem::exists(vm.at("data").as<string>())) {
        try {
            store.load(vm.at("data").as<string>());
        } catch (oj::oj_exception& e) {
            LOG(FATAL) << "Unable to load records: " << e;
        }
    }

    json errors = json::array();

    if (vm.count("users")) {
        for (auto& u : read_json_array<oj::user>(vm.at("users").as<string>())) {
            try {
                if (u.id == 0 && u.name != "root")
                    store.create_user(u.name);
                else
                    store.rename_user(u.id, u.name);
            } catch (oj::validation_error& e) {
                LOG(WARNING) << "Unable to save user " << u.name << ": " << e.what();
                errors.push_back(error_body(e));
            }
        }
    }

    if (vm.count("contests")) {
        for (auto& c : read_json_array<oj::contest>(vm.at("contests").as<string>())) {
            try {
                store.save_contest(c, config);
            } catch (oj::validation_error& e) {
                LOG(WARNING) << "Unable to save contest " << c.name << ": " << e.what();
                errors.push_back(error_body(e));
            }
        }
    }

    size_t workers = vm.count("workers") ? vm.at("workers").as<size_t>() : thread::hardware_concurrency();
    oj::programming_judger judger;
    oj::judge_service service(config, store, judger, workers);

    json accepted = json::array();
    if (vm.count("submit")) {
        for (auto& submit : read_json_array<oj::submission>(vm.at("submit").as<string>())) {
            try {
                accepted.push_back(service.submit(submit).id);
            } catch (oj::validation_error& e) {
                LOG(WARNING) << "Submission rejected: " << e.what();
                errors.push_back(error_body(e));
            }
        }
    }

    service.wait_idle();

    json output = {{"errors", errors}, {"jobs", json::array()}};
    for (auto& id : accepted)
        output["jobs"].push_back(*service.find_job(id.get<uint32_t>()));

    if (vm.count("ranklist")) {
        try {
            output["ranklist"] = service.ranklist(vm.at("ranklist").as<uint32_t>(), rule);
        } catch (oj::validation_error& e) {
            LOG(WARNING) << "Unable to compute ranklist: " << e.what();
            output["errors"].push_back(error_body(e));
        }
    }

    service.stop();
    cout << output.dump(2) << endl;

    if (vm.count("data")) {
        try {
            store.save(vm.at("data").as<string>());
        } catch (oj::oj_exception& e) {
            LOG(ERROR) << "Unable to save records: " << e.what();
            return EXIT_FAILURE;
        }
    }

    return EXIT_SUCCESS;
}
