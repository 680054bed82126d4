#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

#include "longform/editor/v1.hpp"

using namespace longform::editor::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  longformctl <addr> transcribe <asset_url> [deliverable_id]\n"
            << "  longformctl <addr> transcript <id>\n"
            << "  longformctl <addr> compile <instructions> <transcript_text> [deliverable_id] [transcript_id]\n"
            << "  longformctl <addr> extend <base_recipe_id> <instructions> <transcript_text>\n"
            << "  longformctl <addr> recipe <id>\n"
            << "  longformctl <addr> recipes <deliverable_id>\n"
            << "  longformctl <addr> execute <recipe_id> <transcript_id>\n"
            << "  longformctl <addr> render <recipe_id> <transcript_id> <task_id> [quality=preview|final] [aspect_ratio]\n"
            << "  longformctl <addr> render-timeline <timeline.json> <task_id> [quality=preview|final] [aspect_ratio]\n"
            << "  longformctl <addr> render-script <script_text> <task_id> [quality=preview|final] [aspect_ratio]\n"
            << "  longformctl <addr> status <render_id>\n"
            << "  longformctl <addr> renders [deliverable_id] [quality=preview|final]\n"
            << "  longformctl <addr> voice <command> <transcript_id> [task_id]\n"
            << "  longformctl <addr> health\n";
}

static std::optional<RenderQuality> ParseQuality(const std::string& value) {
  if (value == "preview") {
    return RENDER_QUALITY_PREVIEW;
  }
  if (value == "final") {
    return RENDER_QUALITY_FINAL;
  }
  return std::nullopt;
}

static int Print(const grpc::Status& status, const google::protobuf::Message& message) {
  if (!status.ok()) {
    std::cerr << status.error_details() << ": " << status.error_message() << "\n";
    return 2;
  }

  std::string                                json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  auto print_status                     = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!print_status.ok()) {
    std::cerr << "failed to print response: " << print_status.message() << "\n";
    return 2;
  }
  std::cout << json << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = LongformEditingService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "transcribe") {
    if (argc < 4) return 1;

    CreateTranscriptRequest req;
    req.set_asset_url(argv[3]);
    if (argc >= 5) req.set_deliverable_id(argv[4]);

    CreateTranscriptResponse resp;
    return Print(stub->CreateTranscript(&ctx, req, &resp), resp);
  }

  if (cmd == "transcript") {
    if (argc < 4) return 1;

    GetTranscriptRequest req;
    req.set_id(argv[3]);

    GetTranscriptResponse resp;
    return Print(stub->GetTranscript(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "compile") {
    if (argc < 5) return 1;

    CompileRecipeRequest req;
    req.set_instructions(argv[3]);
    req.set_transcript_text(argv[4]);
    if (argc >= 6) req.set_deliverable_id(argv[5]);
    if (argc >= 7) req.set_transcript_id(argv[6]);

    CompileRecipeResponse resp;
    return Print(stub->CompileRecipe(&ctx, req, &resp), resp);
  }

  if (cmd == "extend") {
    if (argc < 6) return 1;

    ExtendRecipeRequest req;
    req.set_base_recipe_id(argv[3]);
    req.set_instructions(argv[4]);
    req.set_transcript_text(argv[5]);

    CompileRecipeResponse resp;
    return Print(stub->ExtendRecipe(&ctx, req, &resp), resp);
  }

  if (cmd == "recipe") {
    if (argc < 4) return 1;

    GetRecipeRequest req;
    req.set_id(argv[3]);

    GetRecipeResponse resp;
    return Print(stub->GetRecipe(&ctx, req, &resp), resp);
  }

  if (cmd == "recipes") {
    if (argc < 4) return 1;

    ListRecipesRequest req;
    req.set_deliverable_id(argv[3]);

    ListRecipesResponse resp;
    return Print(stub->ListRecipes(&ctx, req, &resp), resp);
  }

  if (cmd == "execute") {
    if (argc < 5) return 1;

    ExecuteRecipeRequest req;
    req.set_recipe_id(argv[3]);
    req.set_transcript_id(argv[4]);

    ExecuteRecipeResponse resp;
    return Print(stub->ExecuteRecipe(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "render") {
    if (argc < 6) return 1;

    ExecuteAndRenderRequest req;
    req.set_recipe_id(argv[3]);
    req.set_transcript_id(argv[4]);
    req.set_task_id(argv[5]);
    if (argc >= 7) {
      auto quality = ParseQuality(argv[6]);
      if (!quality) {
        std::cerr << "unsupported quality: " << argv[6] << "\n";
        return 1;
      }
      req.set_quality(*quality);
    }
    if (argc >= 8) req.set_aspect_ratio(argv[7]);

    RenderResponse resp;
    return Print(stub->ExecuteAndRender(&ctx, req, &resp), resp);
  }

  if (cmd == "render-timeline") {
    if (argc < 5) return 1;

    std::ifstream in(argv[3]);
    if (!in) {
      std::cerr << "cannot open timeline file: " << argv[3] << "\n";
      return 1;
    }
    std::string json((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    RenderTimelineRequest req;
    auto parse_status = google::protobuf::util::JsonStringToMessage(json, req.mutable_timeline());
    if (!parse_status.ok()) {
      std::cerr << "invalid timeline json: " << parse_status.message() << "\n";
      return 1;
    }
    req.set_recipe_id(req.timeline().recipe_id());
    req.set_task_id(argv[4]);
    if (argc >= 6) {
      auto quality = ParseQuality(argv[5]);
      if (!quality) {
        std::cerr << "unsupported quality: " << argv[5] << "\n";
        return 1;
      }
      req.set_quality(*quality);
    }
    if (argc >= 7) req.set_aspect_ratio(argv[6]);

    RenderResponse resp;
    return Print(stub->RenderTimeline(&ctx, req, &resp), resp);
  }

  if (cmd == "render-script") {
    if (argc < 5) return 1;

    RenderScriptRequest req;
    req.set_script_text(argv[3]);
    req.set_task_id(argv[4]);
    if (argc >= 6) {
      auto quality = ParseQuality(argv[5]);
      if (!quality) {
        std::cerr << "unsupported quality: " << argv[5] << "\n";
        return 1;
      }
      req.set_quality(*quality);
    }
    if (argc >= 7) req.set_aspect_ratio(argv[6]);

    RenderResponse resp;
    return Print(stub->RenderScript(&ctx, req, &resp), resp);
  }

  if (cmd == "status") {
    if (argc < 4) return 1;

    GetRenderRequest req;
    req.set_id(argv[3]);

    RenderResponse resp;
    return Print(stub->GetRender(&ctx, req, &resp), resp);
  }

  if (cmd == "renders") {
    ListRendersRequest req;
    if (argc >= 4) req.set_deliverable_id(argv[3]);
    if (argc >= 5) {
      auto quality = ParseQuality(argv[4]);
      if (!quality) {
        std::cerr << "unsupported quality: " << argv[4] << "\n";
        return 1;
      }
      req.set_kind(*quality);
    }

    ListRendersResponse resp;
    return Print(stub->ListRenders(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "voice") {
    if (argc < 5) return 1;

    ProcessVoiceCommandRequest req;
    req.set_command(argv[3]);
    req.set_transcript_id(argv[4]);
    if (argc >= 6) {
      req.set_task_id(argv[5]);
      req.set_auto_render(true);
    }

    ProcessVoiceCommandResponse resp;
    return Print(stub->ProcessVoiceCommand(&ctx, req, &resp), resp);
  }

  if (cmd == "health") {
    HealthRequest  req;
    HealthResponse resp;
    return Print(stub->Health(&ctx, req, &resp), resp);
  }

  Usage();
  return 1;
}
