#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/core/instruction_parser.hpp"
#include "internal/core/recipe_compiler.hpp"
#include "internal/core/render_orchestrator.hpp"

namespace longform::config {

using longform::runtime::config::RenderProfileConfig;
using longform::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig Parse(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(&config);
  return config;
}

static void FillProfile(RenderProfileConfig* profile, longform::editor::v1::RenderQuality quality) {
  const auto defaults = core::RenderSettings::DefaultProfile(quality);
  if (profile->width() == 0 || profile->height() == 0) {
    profile->set_width(defaults.width());
    profile->set_height(defaults.height());
  }
  if (profile->bitrate_kbps() == 0) {
    profile->set_bitrate_kbps(defaults.bitrate_kbps());
  }
  if (profile->frame_rate() <= 0) {
    profile->set_frame_rate(defaults.frame_rate());
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return Parse(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return Parse(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address("0.0.0.0:50051");
  }

  auto* transcription = config->mutable_transcription();
  if (transcription->timeout_ms() == 0) {
    transcription->set_timeout_ms(120000);
  }

  auto* render = config->mutable_render();
  if (render->submit_timeout_ms() == 0) {
    render->set_submit_timeout_ms(10000);
  }
  if (render->poll_timeout_ms() == 0) {
    render->set_poll_timeout_ms(5000);
  }
  if (render->submit_attempts() == 0) {
    render->set_submit_attempts(3);
  }
  FillProfile(render->mutable_preview_profile(), longform::editor::v1::RENDER_QUALITY_PREVIEW);
  FillProfile(render->mutable_final_profile(), longform::editor::v1::RENDER_QUALITY_FINAL);

  auto* compiler = config->mutable_compiler();
  if (compiler->revision().empty()) {
    compiler->set_revision(core::RecipeCompiler::kDefaultRevision);
  }
  if (compiler->filler_words().empty()) {
    for (const auto& word : core::InstructionParser::DefaultFillerWords()) {
      compiler->add_filler_words(word);
    }
  }
  const core::ParserOptions parser_defaults;
  if (compiler->default_silence_gap_seconds() <= 0) {
    compiler->set_default_silence_gap_seconds(parser_defaults.default_silence_gap_seconds);
  }
  if (compiler->default_overlay_seconds() <= 0) {
    compiler->set_default_overlay_seconds(parser_defaults.default_overlay_seconds);
  }
  if (compiler->max_instruction_bytes() == 0) {
    compiler->set_max_instruction_bytes(static_cast<uint32_t>(parser_defaults.max_instruction_bytes));
  }

  auto* voice = config->mutable_voice();
  if (voice->auto_render_quality().empty()) {
    voice->set_auto_render_quality("preview");
  }
  if (voice->auto_render_quality() != "preview" && voice->auto_render_quality() != "final") {
    throw std::runtime_error("Invalid configuration: voice.auto_render_quality must be preview or final");
  }

  if (!config->database().has_memory() && !config->database().has_sqlite() && !config->database().has_postgres()) {
    config->mutable_database()->mutable_memory();
  }
}

} // namespace longform::config
