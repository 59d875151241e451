#include <grpcpp/grpcpp.h>

#include <iostream>
#include <memory>
#include <string>

#include "pageforge/convert/v1.hpp"

using namespace pageforge::convert::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  pageforgectl <addr> convert <pdf> <normal_path> <small_path> <large_path>\n"
            << "  pageforgectl <addr> form <name=value>...\n"
            << "\n"
            << "Paths are object keys; every template must contain %d once.\n";
}

static void AddField(ConvertRequest* req, const std::string& name, const std::string& value) {
  auto* field = req->add_fields();
  field->set_name(name);
  field->set_value(value);
}

static const char* PhaseName(Phase phase) {
  switch (phase) {
    case PHASE_CONVERSION:
      return "conversion";
    case PHASE_UPLOAD:
      return "upload";
    default:
      return "unknown";
  }
}

static void PrintResponse(const ConvertResponse& resp) {
  std::cout << "pages:     " << resp.page_count() << "\n"
            << "converted: " << resp.converted_pages() << "\n"
            << "uploaded:  " << resp.uploaded_objects() << "\n"
            << "complete:  " << (resp.complete() ? "yes" : "no") << "\n";

  for (const auto& failure : resp.failures()) {
    std::cout << "failed " << PhaseName(failure.phase()) << " worker [" << failure.first_page() << "," << failure.last_page() << "] at page "
              << failure.failed_page();
    if (!failure.variant().empty()) {
      std::cout << " (" << failure.variant() << ")";
    }
    std::cout << " after " << failure.completed() << ": " << failure.error() << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  ConvertRequest req;
  if (cmd == "convert") {
    if (argc != 7) {
      Usage();
      return 1;
    }
    AddField(&req, "pdf", argv[3]);
    AddField(&req, "normal_path", argv[4]);
    AddField(&req, "small_path", argv[5]);
    AddField(&req, "large_path", argv[6]);
  } else if (cmd == "form") {
    for (int i = 3; i < argc; ++i) {
      std::string arg = argv[i];
      auto        eq  = arg.find('=');
      if (eq == std::string::npos) {
        std::cerr << "invalid form field '" << arg << "', expected name=value\n";
        return 1;
      }
      AddField(&req, arg.substr(0, eq), arg.substr(eq + 1));
    }
  } else {
    Usage();
    return 1;
  }

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = ConversionService::NewStub(channel);

  grpc::ClientContext ctx;
  ConvertResponse     resp;
  auto                status = stub->Convert(&ctx, req, &resp);
  if (!status.ok()) {
    std::cerr << "convert failed: " << status.error_message() << "\n";
    return 2;
  }

  PrintResponse(resp);
  return resp.complete() ? 0 : 3;
}
