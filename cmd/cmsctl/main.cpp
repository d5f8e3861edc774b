#include <grpcpp/grpcpp.h>

#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

#include "cms/admin/v1.hpp"

using namespace cms::admin::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  cmsctl <addr> proxy <service> <shard> <method> [json-arguments]\n"
            << "  cmsctl <addr> add-testcase <task_id> <input-file> <output-file> [public]\n"
            << "  cmsctl <addr> add-statement <task_id> <file.pdf>\n"
            << "  cmsctl <addr> add-attachment <task_id> <file>\n"
            << "  cmsctl <addr> add-manager <task_id> <file>\n"
            << "  cmsctl <addr> get-file <digest> [output-file]\n"
            << "  cmsctl <addr> reevaluate <submission|user|task> <id>\n"
            << "  cmsctl <addr> resources\n"
            << "  cmsctl <addr> poll [last_notification]\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "cannot read " << path << "\n";
    std::exit(1);
  }
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// Strips directories; the front end stores the bare filename.
static std::string BaseName(const std::string& path) {
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

static std::optional<ReevaluateScope> ParseScope(const std::string& value) {
  if (value == "submission") return REEVALUATE_SCOPE_SUBMISSION;
  if (value == "user") return REEVALUATE_SCOPE_USER;
  if (value == "task") return REEVALUATE_SCOPE_TASK;
  return std::nullopt;
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = AdminFrontendService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "proxy") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    ProxyCallRequest req;
    req.set_service(argv[3]);
    req.set_shard(static_cast<uint32_t>(std::stoul(argv[4])));
    req.set_method(argv[5]);
    if (argc >= 7) {
      auto parsed = google::protobuf::util::JsonStringToMessage(argv[6], req.mutable_arguments());
      if (!parsed.ok()) {
        std::cerr << "invalid json arguments: " << parsed.ToString() << "\n";
        return 1;
      }
    }

    ProxyCallResponse resp;
    auto              status = stub->ProxyCall(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::string json;
    auto        printed = google::protobuf::util::MessageToJsonString(resp.result(), &json);
    if (!printed.ok()) {
      std::cerr << "cannot print result: " << printed.ToString() << "\n";
      return 2;
    }
    std::cout << json << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "add-testcase") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    AddTestcaseRequest req;
    req.set_task_id(std::stoull(argv[3]));
    req.set_input(ReadFile(argv[4]));
    req.set_output(ReadFile(argv[5]));
    req.set_is_public(argc >= 7 && std::string(argv[6]) == "public");

    AddTestcaseResponse resp;
    auto                status = stub->AddTestcase(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "num=" << resp.num() << "\n";
    std::cout << "input=" << resp.input_digest() << "\n";
    std::cout << "output=" << resp.output_digest() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "add-statement" || cmd == "add-attachment" || cmd == "add-manager") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    const uint64_t    task_id  = std::stoull(argv[3]);
    const std::string filename = BaseName(argv[4]);
    const std::string data     = ReadFile(argv[4]);

    grpc::Status status;
    std::string  digest;
    if (cmd == "add-statement") {
      AddStatementRequest req;
      req.set_task_id(task_id);
      req.set_filename(filename);
      req.set_data(data);
      AddStatementResponse resp;
      status = stub->AddStatement(&ctx, req, &resp);
      digest = resp.digest();
    } else if (cmd == "add-attachment") {
      AddAttachmentRequest req;
      req.set_task_id(task_id);
      req.set_filename(filename);
      req.set_data(data);
      AddAttachmentResponse resp;
      status = stub->AddAttachment(&ctx, req, &resp);
      digest = resp.digest();
    } else {
      AddManagerRequest req;
      req.set_task_id(task_id);
      req.set_filename(filename);
      req.set_data(data);
      AddManagerResponse resp;
      status = stub->AddManager(&ctx, req, &resp);
      digest = resp.digest();
    }
    if (!status.ok()) return Fail(status);

    std::cout << "digest=" << digest << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get-file") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetFileRequest req;
    req.set_digest(argv[3]);

    GetFileResponse resp;
    auto            status = stub->GetFile(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (argc >= 5) {
      std::ofstream out(argv[4], std::ios::binary);
      out << resp.data();
      if (!out) {
        std::cerr << "cannot write " << argv[4] << "\n";
        return 2;
      }
    } else {
      std::cout << resp.data();
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reevaluate") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    auto scope = ParseScope(argv[3]);
    if (!scope) {
      std::cerr << "unsupported scope: " << argv[3] << "\n";
      return 1;
    }

    ReevaluateRequest req;
    req.set_scope(*scope);
    req.set_id(std::stoull(argv[4]));

    ReevaluateResponse resp;
    auto               status = stub->Reevaluate(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "submissions=" << resp.submissions() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "resources") {
    ListResourcesRequest  req;
    ListResourcesResponse resp;

    auto status = stub->ListResources(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "shards=" << resp.shard_count() << "\n";
    for (const auto& shard : resp.shards()) {
      std::cout << shard.shard() << " " << shard.host() << ":" << shard.port() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "poll") {
    PollNotificationsRequest req;
    if (argc >= 4) req.set_last_notification(std::stoll(argv[3]));

    PollNotificationsResponse resp;
    auto                      status = stub->PollNotifications(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.entries()) {
      std::cout << entry.timestamp() << " [" << entry.type() << "] " << entry.subject() << ": " << entry.text() << "\n";
    }
    std::cout << "unanswered=" << resp.unanswered() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
