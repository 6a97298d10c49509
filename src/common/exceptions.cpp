#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace oj {
using namespace std;

oj_exception::oj_exception()
    : oj_exception("") {}

oj_exception::oj_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *oj_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const oj_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : oj_exception() {}

internal_error::internal_error(const string &message)
    : oj_exception(message) {}

execution_error::execution_error()
    : oj_exception() {}

execution_error::execution_error(const string &message)
    : oj_exception(message) {}

database_error::database_error()
    : oj_exception() {}

database_error::database_error(const string &message)
    : oj_exception(message) {}

judge_canceled::judge_canceled()
    : oj_exception() {}

judge_canceled::judge_canceled(const string &message)
    : oj_exception(message) {}

const char *get_display_message(error_reason reason) {
    switch (reason) {
        case error_reason::INVALID_ARGUMENT: return "ERR_INVALID_ARGUMENT";
        case error_reason::INVALID_STATE: return "ERR_INVALID_STATE";
        case error_reason::NOT_FOUND: return "ERR_NOT_FOUND";
        case error_reason::RATE_LIMIT: return "ERR_RATE_LIMIT";
        case error_reason::EXTERNAL: return "ERR_EXTERNAL";
        case error_reason::INTERNAL: return "ERR_INTERNAL";
    }
    return "ERR_INTERNAL";
}

validation_error::validation_error(error_reason reason, const string &message)
    : oj_exception(message), why(reason) {}

error_reason validation_error::reason() const {
    return why;
}

int validation_error::code() const {
    return static_cast<int>(why);
}

}  // namespace oj
