#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "taskengine/v1.hpp"

using namespace taskengine::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  taskctl <addr> submit <x> <y>\n"
            << "  taskctl <addr> progress <task_id>\n"
            << "  taskctl <addr> cancel <task_id>\n"
            << "  taskctl <addr> watch <task_id> [poll_ms]\n"
            << "  taskctl <addr> stats\n";
}

static TaskID MakeID(const std::string& s) {
  TaskID id;
  id.set_value(s);
  return id;
}

static const char* StatusName(TaskStatus status) {
  switch (status) {
    case TASK_STATUS_CREATED:
      return "CREATED";
    case TASK_STATUS_RUNNING:
      return "RUNNING";
    case TASK_STATUS_COMPLETED:
      return "COMPLETED";
    case TASK_STATUS_CANCELLED:
      return "CANCELLED";
    case TASK_STATUS_FAILED:
      return "FAILED";
    default:
      return "UNSPECIFIED";
  }
}

static const char* OutcomeName(CancelOutcome outcome) {
  switch (outcome) {
    case CANCEL_OUTCOME_SIGNALLED:
      return "signalled";
    case CANCEL_OUTCOME_CANCELLED:
      return "cancelled";
    case CANCEL_OUTCOME_ALREADY_TERMINAL:
      return "already_terminal";
    case CANCEL_OUTCOME_ALREADY_DELETED:
      return "already_deleted";
    default:
      return "unspecified";
  }
}

static void PrintProgress(const TaskProgress& progress) {
  std::cout << "id=" << progress.id().value() << " status=" << StatusName(progress.status()) << " current=" << progress.current()
            << " range=[" << progress.x() << "," << progress.y() << "]"
            << " percentage=" << std::fixed << std::setprecision(1) << progress.percentage();
  if (!progress.error_message().empty()) {
    std::cout << " error=\"" << progress.error_message() << "\"";
  }
  std::cout << "\n";
}

static bool IsTerminal(TaskStatus status) {
  return status == TASK_STATUS_COMPLETED || status == TASK_STATUS_CANCELLED || status == TASK_STATUS_FAILED;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = TaskService::NewStub(channel);

  // ------------------------------------------------------------

  if (cmd == "submit") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    SubmitRequest req;
    try {
      req.set_x(std::stoll(argv[3]));
      req.set_y(std::stoll(argv[4]));
    } catch (const std::exception&) {
      std::cerr << "x and y must be integers\n";
      return 1;
    }

    SubmitResponse      resp;
    grpc::ClientContext ctx;

    auto status = stub->Submit(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << resp.id().value() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "progress") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetProgressRequest req;
    *req.mutable_id() = MakeID(argv[3]);

    TaskProgress        resp;
    grpc::ClientContext ctx;

    auto status = stub->GetProgress(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    PrintProgress(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    CancelRequest req;
    *req.mutable_id() = MakeID(argv[3]);

    CancelResponse      resp;
    grpc::ClientContext ctx;

    auto status = stub->Cancel(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << OutcomeName(resp.outcome()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    const auto poll = std::chrono::milliseconds(argc >= 5 ? std::stoull(argv[4]) : 1000);

    GetProgressRequest req;
    *req.mutable_id() = MakeID(argv[3]);

    for (;;) {
      TaskProgress        resp;
      grpc::ClientContext ctx;

      auto status = stub->GetProgress(&ctx, req, &resp);
      if (!status.ok()) {
        std::cerr << status.error_message() << "\n";
        return 2;
      }

      PrintProgress(resp);
      if (IsTerminal(resp.status())) {
        return resp.status() == TASK_STATUS_COMPLETED ? 0 : 3;
      }
      std::this_thread::sleep_for(poll);
    }
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest        req;
    StatsResponse       resp;
    grpc::ClientContext ctx;

    auto status = stub->Stats(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "created=" << resp.tasks_created() << "\n";
    std::cout << "running=" << resp.tasks_running() << "\n";
    std::cout << "completed=" << resp.tasks_completed() << "\n";
    std::cout << "cancelled=" << resp.tasks_cancelled() << "\n";
    std::cout << "failed=" << resp.tasks_failed() << "\n";
    std::cout << "in_flight=" << resp.in_flight() << "\n";
    std::cout << "queued=" << resp.queued() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
