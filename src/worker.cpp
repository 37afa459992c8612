#include "polyrun/worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "polyrun/common/json_utils.hpp"

namespace polyrun {
using namespace std;
using namespace nlohmann;

// 停止 worker 的标记，同时用来取消正在运行的程序
static cancellation_token shutdown_token;

void stop_workers() {
    shutdown_token.cancel();
}

bool workers_stopped() {
    return shutdown_token.is_cancelled();
}

result_writer::result_writer(ostream &os) : os(os) {}

void result_writer::write(const json &j) {
    lock_guard<mutex> guard(mut);
    os << dump_line(j) << endl;
}

static json make_error_result(const string &id, status stat, const string &message) {
    execution_result result;
    result.id = id;
    result.stat = stat;
    result.message = message;
    return result;
}

json process_job(executor &exec, const batch_job &job, const cancellation_token *cancel) {
    submission sub;
    try {
        json j = json::parse(job.request);
        if (!j.is_object())
            return make_error_result("", status::INVALID_SUBMISSION, "Submission must be a JSON object");
        sub = j.get<submission>();
    } catch (json::exception &ex) {
        LOG(WARNING) << "submission #" << job.seq << " is malformed: " << ex.what();
        return make_error_result("", status::INVALID_SUBMISSION, string("Malformed submission: ") + ex.what());
    } catch (invalid_argument &ex) {
        LOG(WARNING) << "submission #" << job.seq << " is malformed: " << ex.what();
        return make_error_result("", status::INVALID_SUBMISSION, string("Malformed submission: ") + ex.what());
    }

    if (sub.tests.empty())
        return exec.execute(sub, cancel);
    else
        return exec.execute_tests(sub, cancel);
}

/**
 * @brief worker 循环
 * 从队列中取出提交并执行，直到队列关闭且为空
 */
static void worker_loop(size_t worker_id, executor &exec, concurrent_queue<batch_job> &queue, result_writer &writer) {
    LOG(INFO) << "Worker " << worker_id << " started";

    batch_job job;
    while (queue.pop(job)) {
        json result;
        if (workers_stopped()) {
            // 停止后不再执行新的提交，但每个提交都要有结果
            result = make_error_result("", status::REJECTED, "Execution engine is shutting down");
            try {
                json request = json::parse(job.request);
                string id = request.is_object() ? get_value_def<string>(request, "", "id") : "";
                if (!id.empty()) result["id"] = id;
            } catch (std::exception &ex) {
                LOG(WARNING) << "submission #" << job.seq << " is malformed: " << ex.what();
            }
        } else {
            try {
                result = process_job(exec, job, &shutdown_token);
            } catch (std::exception &ex) {
                LOG(ERROR) << "Worker " << worker_id << " has crashed when processing submission #" << job.seq
                           << ", " << ex.what() << endl
                           << boost::diagnostic_information(ex);
                result = make_error_result("", status::INTERNAL_ERROR, ex.what());
            }
        }
        writer.write(result);
    }

    LOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_worker(size_t worker_id, executor &exec, concurrent_queue<batch_job> &queue, result_writer &writer) {
    return thread([worker_id, &exec, &queue, &writer] {
        worker_loop(worker_id, exec, queue, writer);
    });
}

}  // namespace polyrun
