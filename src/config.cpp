#include "config.hpp"

namespace oj {
using namespace std;

filesystem::path RUN_DIR = "/tmp/oj-judger";
bool DEBUG = false;
size_t MAX_CAPTURE_SIZE = 1 << 20;  // 1M

}  // namespace oj
