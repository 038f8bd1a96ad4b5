#include "unchessful/engine/remote/wire_codec.hpp"

#include <json/json.h>

#include <memory>

namespace unchessful::engine {

const char* toString(EngineFailure f) {
  switch (f) {
    case EngineFailure::NetworkError:
      return "NetworkError";
    case EngineFailure::ProtocolError:
      return "ProtocolError";
    case EngineFailure::IllegalEngineMove:
      return "IllegalEngineMove";
  }
  return "Unknown";
}

namespace wire {

namespace {

bool parseJson(const std::string& body, Json::Value& root, std::string* outError) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errs;
  bool parsed = false;
  try {
    parsed = reader->parse(body.data(), body.data() + body.size(), &root, &errs);
  } catch (const Json::Exception& e) {
    // nesting limit and similar reader failures are thrown, not returned
    errs = e.what();
  }
  if (!parsed) {
    if (outError) *outError = "invalid JSON: " + errs;
    return false;
  }
  if (!root.isObject()) {
    if (outError) *outError = "expected a JSON object";
    return false;
  }
  return true;
}

bool fail(std::string* outError, std::string msg) {
  if (outError) *outError = std::move(msg);
  return false;
}

// Non-empty string member, or nothing.
std::optional<std::string> stringMember(const Json::Value& obj, const char* key) {
  const Json::Value& v = obj[key];
  if (!v.isString() || v.asString().empty()) return std::nullopt;
  return v.asString();
}

bool decodeVariant(const Json::Value& v, EngineVariant& out, std::string* outError) {
  if (!v.isObject()) return fail(outError, "variant is not an object");
  auto name = stringMember(v, "name");
  auto url = stringMember(v, "game_url");
  if (!name || !url) return fail(outError, "variant needs 'name' and 'game_url'");
  out.name = std::move(*name);
  out.gameUrl = std::move(*url);
  return true;
}

}  // namespace

std::string encodeMoveRequest(const std::string& fen) {
  Json::Value root(Json::objectValue);
  root["fen"] = fen;
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  return Json::writeString(writer, root);
}

std::optional<std::string> decodeMoveText(const std::string& body, std::string* outError) {
  Json::Value root;
  if (!parseJson(body, root, outError)) return std::nullopt;
  for (const char* key : {"move_san", "move_uci", "move"}) {
    if (auto text = stringMember(root, key)) return text;
  }
  fail(outError, "response has no 'move_san' or 'move_uci'");
  return std::nullopt;
}

std::optional<EngineDirectory> decodeDirectory(const std::string& body, std::string* outError) {
  Json::Value root;
  if (!parseJson(body, root, outError)) return std::nullopt;
  const Json::Value& engines = root["engines"];
  if (!engines.isArray()) {
    fail(outError, "directory has no 'engines' array");
    return std::nullopt;
  }

  EngineDirectory dir;
  for (const auto& e : engines) {
    if (!e.isObject()) continue;
    EngineRef ref;
    ref.engineId = stringMember(e, "engine_id").value_or(stringMember(e, "id").value_or(""));
    ref.name = stringMember(e, "name").value_or(ref.engineId);
    ref.entrypointUrl = stringMember(e, "entrypoint_url").value_or("");
    if (ref.entrypointUrl.empty()) continue;
    if (ref.engineId.empty()) ref.engineId = ref.name;
    dir.engines.push_back(std::move(ref));
  }
  return dir;
}

std::optional<EngineDescription> decodeDescription(const std::string& body,
                                                   std::string* outError) {
  Json::Value root;
  if (!parseJson(body, root, outError)) return std::nullopt;

  EngineDescription desc;
  desc.name = stringMember(root, "name").value_or("");
  desc.textDescription = stringMember(root, "text_description").value_or("");

  const Json::Value& variants = root["variants"];
  if (variants.isArray()) {
    for (const auto& v : variants) {
      EngineVariant variant;
      if (decodeVariant(v, variant, nullptr)) desc.variants.push_back(std::move(variant));
    }
  }
  if (root.isMember("best_available_variant")) {
    EngineVariant best;
    if (decodeVariant(root["best_available_variant"], best, nullptr))
      desc.bestAvailableVariant = std::move(best);
  }
  if (desc.variants.empty() && !desc.bestAvailableVariant) {
    fail(outError, "engine description lists no usable variant");
    return std::nullopt;
  }
  return desc;
}

std::string describeErrorBody(const std::string& body) {
  Json::Value root;
  if (parseJson(body, root, nullptr)) {
    for (const char* key : {"error", "detail", "message"}) {
      if (auto text = stringMember(root, key)) return *text;
    }
  }
  constexpr std::size_t MAX_LEN = 160;
  if (body.size() <= MAX_LEN) return body;
  return body.substr(0, MAX_LEN) + "...";
}

}  // namespace wire

}  // namespace unchessful::engine
