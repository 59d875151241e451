#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace pageforge::config {

using pageforge::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultBindAddress  = "0.0.0.0:8000";
constexpr unsigned    kDefaultConvWorkers  = 2;
constexpr unsigned    kDefaultUpWorkers    = 10;
constexpr unsigned    kDefaultDpi          = 300;
constexpr unsigned    kDefaultJpegQuality  = 90;
constexpr const char* kDefaultRasterizer   = "gs";
constexpr const char* kDefaultResizer      = "convert";
constexpr const char* kDefaultContentType  = "image/jpeg";

// Upper bounds keep a typo from spawning thousands of threads per request.
constexpr unsigned kMaxWorkers = 256;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = std::strtod(scalar.c_str(), &endptr);
  if (!scalar.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
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
      throw util::ValidationFailure("unsupported YAML node");
  }
}

RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ValidationFailure("failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::ValidationFailure("invalid configuration: " + std::string(status.message()));
  }
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::ValidationFailure("failed to load YAML config " + path + ": " + e.what());
  }

  auto config = ParseYamlNode(yaml);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw util::ValidationFailure("failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = ParseYamlNode(yaml);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address(kDefaultBindAddress);

  auto* conversion = config.mutable_conversion();
  if (conversion->workers() == 0) conversion->set_workers(kDefaultConvWorkers);
  if (conversion->resolution_dpi() == 0) conversion->set_resolution_dpi(kDefaultDpi);
  if (conversion->jpeg_quality() == 0) conversion->set_jpeg_quality(kDefaultJpegQuality);
  if (conversion->rasterizer_binary().empty()) conversion->set_rasterizer_binary(kDefaultRasterizer);
  if (conversion->resizer_binary().empty()) conversion->set_resizer_binary(kDefaultResizer);
  if (conversion->scratch_root().empty()) {
    conversion->set_scratch_root(std::filesystem::temp_directory_path().string());
  }

  auto* upload = config.mutable_upload();
  if (upload->workers() == 0) upload->set_workers(kDefaultUpWorkers);
  if (upload->content_type().empty()) upload->set_content_type(kDefaultContentType);
  if (!upload->has_public_read()) upload->set_public_read(true);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& conversion = config.conversion();
  if (conversion.workers() < 1 || conversion.workers() > kMaxWorkers) {
    throw util::ValidationFailure("conversion.workers must be in [1, " + std::to_string(kMaxWorkers) + "]");
  }
  if (conversion.resolution_dpi() < 36 || conversion.resolution_dpi() > 1200) {
    throw util::ValidationFailure("conversion.resolution_dpi must be in [36, 1200]");
  }
  if (conversion.jpeg_quality() < 1 || conversion.jpeg_quality() > 100) {
    throw util::ValidationFailure("conversion.jpeg_quality must be in [1, 100]");
  }
  // page image paths are templates under the scratch root and gs reads '%' in
  // -sOutputFile as a format directive
  if (conversion.scratch_root().find('%') != std::string::npos) {
    throw util::ValidationFailure("conversion.scratch_root must not contain '%': " + conversion.scratch_root());
  }

  const auto& upload = config.upload();
  if (upload.workers() < 1 || upload.workers() > kMaxWorkers) {
    throw util::ValidationFailure("upload.workers must be in [1, " + std::to_string(kMaxWorkers) + "]");
  }
}

} // namespace pageforge::config
