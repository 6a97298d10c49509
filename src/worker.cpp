#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"

namespace oj {
using namespace std;

static void worker_loop(size_t worker_id, concurrent_queue<judge_task> &task_queue, const function<void(const judge_task &)> &handler) {
    LOG(INFO) << "Worker " << worker_id << " started";

    judge_task task;
    while (task_queue.pop(task)) {
        try {
            handler(task);
        } catch (oj_exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when judging job " << task.job_id << ", " << ex;
        } catch (exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when judging job " << task.job_id << ", " << ex.what() << endl
                       << boost::diagnostic_information(ex);
        }
    }

    LOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_worker(size_t worker_id, concurrent_queue<judge_task> &task_queue, function<void(const judge_task &)> handler) {
    return thread([worker_id, &task_queue, handler = move(handler)] {
        worker_loop(worker_id, task_queue, handler);
    });
}

}  // namespace oj
