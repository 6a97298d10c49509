#include "common/utils.hpp"
#include <time.h>
#include <cstdio>
#include "common/exceptions.hpp"

namespace oj {
using namespace std;

vector<string> substitute_arguments(const vector<string> &command, const map<string, string> &variables) {
    vector<string> args;
    args.reserve(command.size());
    for (auto &arg : command) {
        auto it = variables.find(arg);
        args.push_back(it == variables.end() ? arg : it->second);
    }
    return args;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string format_time(chrono::system_clock::time_point time) {
    auto millis = chrono::duration_cast<chrono::milliseconds>(time.time_since_epoch()).count();
    time_t seconds = millis / 1000;
    millis %= 1000;
    if (millis < 0) {
        millis += 1000;
        --seconds;
    }
    struct tm tm;
    gmtime_r(&seconds, &tm);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
}

chrono::system_clock::time_point parse_time(const string &text) {
    struct tm tm = {};
    int millis = 0, consumed = 0;
    if (sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3dZ%n",
               &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
               &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &millis, &consumed) != 7 ||
        consumed != (int)text.size())
        throw validation_error(error_reason::INVALID_ARGUMENT, "Malformed time " + text);
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    time_t seconds = timegm(&tm);
    return chrono::system_clock::time_point(chrono::seconds(seconds) + chrono::milliseconds(millis));
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace oj
