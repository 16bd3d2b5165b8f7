#include "transfer_command.hpp"

#include <algorithm>
#include <fstream>

#include "settings_manager.hpp"
#include "transfer_error.hpp"

namespace {

constexpr int64_t kDefaultThreshold = 200 * 1024 * 1024;

StageInfo parse_stage_info(const nlohmann::json& doc) {
  StageInfo stage;
  if(doc.is_null()) return stage;
  stage.location_type = doc.value("locationType", "");
  stage.location = doc.value("location", "");
  stage.path = doc.value("path", "");
  stage.region = doc.value("region", "");
  stage.end_point = doc.value("endPoint", "");
  stage.storage_account = doc.value("storageAccount", "");
  stage.presigned_url = doc.value("presignedUrl", "");
  if(doc.contains("creds") && doc.at("creds").is_object()) {
    for(const auto& item : doc.at("creds").items()) {
      stage.credentials[item.key()] = item.value().is_string()
        ? item.value().get<std::string>()
        : item.value().dump();
    }
  }
  return stage;
}

nlohmann::json stage_to_json(const StageInfo& stage) {
  nlohmann::json creds = nlohmann::json::object();
  for(const auto& entry : stage.credentials) creds[entry.first] = entry.second;
  return {
    {"locationType", stage.location_type},
    {"location", stage.location},
    {"path", stage.path},
    {"region", stage.region},
    {"endPoint", stage.end_point},
    {"storageAccount", stage.storage_account},
    {"creds", creds},
    {"presignedUrl", stage.presigned_url}
  };
}

std::optional<EncryptionMaterial> parse_material(const nlohmann::json& doc) {
  if(doc.is_null()) return std::nullopt;
  EncryptionMaterial material;
  material.query_stage_master_key = doc.at("queryStageMasterKey").get<std::string>();
  material.query_id = doc.value("queryId", "");
  material.smk_id = doc.value("smkId", int64_t{0});
  return material;
}

nlohmann::json material_to_json(const std::optional<EncryptionMaterial>& material) {
  if(!material) return nullptr;
  return {
    {"queryStageMasterKey", material->query_stage_master_key},
    {"queryId", material->query_id},
    {"smkId", material->smk_id}
  };
}

CommandKind parse_kind(const std::string& text) {
  std::string lowered = SettingsManager::to_lower(text);
  if(lowered == "upload") return CommandKind::Upload;
  if(lowered == "download") return CommandKind::Download;
  throw TransferError(TransferErrorCode::InvalidInput, "unknown command type '" + text + "'");
}

} // namespace

TransferCommand parse_transfer_command(const nlohmann::json& doc) {
  if(!doc.is_object()) {
    throw TransferError(TransferErrorCode::InvalidInput, "transfer command must be a JSON object");
  }
  TransferCommand command;
  try {
    command.kind = parse_kind(doc.at("command").get<std::string>());
    command.src_locations = doc.at("src_locations").get<std::vector<std::string>>();
    command.stage_info = parse_stage_info(doc.value("stageInfo", nlohmann::json()));
    command.threshold = doc.value("threshold", kDefaultThreshold);
    command.parallel = std::max(1, doc.value("parallel", 1));
    command.auto_compress = doc.value("autoCompress", true);
    command.source_compression = doc.value("sourceCompression", compression::kAutoDetect);
    command.overwrite = doc.value("overwrite", false);
    command.local_location = doc.value("localLocation", "");
    command.presigned_urls = doc.value("presignedUrls", std::vector<std::string>{});
    command.src_file_sizes = doc.value("srcFileSizes", std::vector<int64_t>{});

    if(doc.contains("encryptionMaterial")) {
      const auto& materials = doc.at("encryptionMaterial");
      if(materials.is_array()) {
        for(const auto& entry : materials) command.encryption_materials.push_back(parse_material(entry));
      } else if(!materials.is_null()) {
        command.encryption_materials.push_back(parse_material(materials));
      }
    }
  } catch(const nlohmann::json::exception& e) {
    throw TransferError(TransferErrorCode::InvalidInput, std::string("malformed transfer command: ") + e.what());
  }
  return command;
}

nlohmann::json to_json(const TransferCommand& command) {
  nlohmann::json materials = nlohmann::json::array();
  for(const auto& material : command.encryption_materials) materials.push_back(material_to_json(material));
  return {
    {"command", to_string(command.kind)},
    {"src_locations", command.src_locations},
    {"stageInfo", stage_to_json(command.stage_info)},
    {"threshold", command.threshold},
    {"parallel", command.parallel},
    {"autoCompress", command.auto_compress},
    {"sourceCompression", command.source_compression},
    {"overwrite", command.overwrite},
    {"encryptionMaterial", materials},
    {"localLocation", command.local_location},
    {"presignedUrls", command.presigned_urls},
    {"srcFileSizes", command.src_file_sizes}
  };
}

TransferCommand load_transfer_command(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) {
    throw TransferError(TransferErrorCode::InvalidInput, "cannot open command file " + path.string());
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw TransferError(TransferErrorCode::InvalidInput,
                        "cannot parse " + path.string() + ": " + e.what());
  }
  return parse_transfer_command(doc);
}
