#include "jose/header.hpp"

#include <algorithm>
#include <array>

#include "jose/error.hpp"
#include "jose/logging.hpp"

namespace jose {

namespace {

constexpr std::array<std::string_view, 11> kJwsRegistered = {
    "alg", "jku", "jwk", "x5u", "x5t", "x5t#S256", "x5c", "kid", "typ", "cty",
    "crit"};

constexpr std::array<std::string_view, 11> kJweOnlyRegistered = {
    "enc", "zip", "epk", "apu", "apv", "p2s", "p2c", "iv", "tag", "epu", "epv"};

template <size_t N>
bool listed(const std::array<std::string_view, N>& names,
            std::string_view param) {
  return std::find(names.begin(), names.end(), param) != names.end();
}

std::optional<Base64Url> base64Param(const Header& header,
                                     std::string_view param) {
  auto value = header.stringParam(param);
  if (!value) return std::nullopt;
  return Base64Url(std::move(*value));
}

const std::string& requireString(const ordered_json& json,
                                  const char* param) {
  auto it = json.find(param);
  if (it == json.end()) {
    throw MalformedInputError(std::string("missing \"") + param +
                              "\" header parameter");
  }
  if (!it->is_string()) {
    throw ParseError(std::string("\"") + param + "\" must be a string");
  }
  return it->get_ref<const std::string&>();
}

void checkStringTyped(const ordered_json& json,
                      std::initializer_list<const char*> params) {
  for (const char* param : params) {
    auto it = json.find(param);
    if (it != json.end() && !it->is_string()) {
      throw ParseError(std::string("\"") + param + "\" must be a string");
    }
  }
}

ordered_json parseText(std::string_view json_text) {
  ordered_json json;
  try {
    json = ordered_json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ParseError(e.what());
  }
  if (!json.is_object()) {
    throw ParseError("header is not a JSON object");
  }
  return json;
}

}  // namespace

bool Header::contains(std::string_view param) const {
  return json_.contains(std::string(param));
}

const ordered_json* Header::param(std::string_view param) const {
  auto it = json_.find(std::string(param));
  return it == json_.end() ? nullptr : &*it;
}

std::optional<std::string> Header::stringParam(std::string_view param) const {
  const auto* value = this->param(param);
  if (!value || !value->is_string()) return std::nullopt;
  return value->get<std::string>();
}

std::vector<std::string> Header::x509CertChain() const {
  std::vector<std::string> chain;
  const auto* value = param("x5c");
  if (!value || !value->is_array()) return chain;
  for (const auto& cert : *value) {
    if (cert.is_string()) chain.push_back(cert.get<std::string>());
  }
  return chain;
}

std::set<std::string> Header::criticalParams() const {
  std::set<std::string> names;
  const auto* value = param("crit");
  if (!value || !value->is_array()) return names;
  for (const auto& item : *value) {
    names.insert(item.get<std::string>());
  }
  return names;
}

ordered_json Header::customParams() const {
  ordered_json custom = ordered_json::object();
  for (const auto& [key, value] : json_.items()) {
    if (!isRegistered(key)) custom[key] = value;
  }
  return custom;
}

std::set<std::string> Header::includedParams() const {
  std::set<std::string> names;
  for (const auto& [key, value] : json_.items()) names.insert(key);
  return names;
}

ordered_json Header::decodeSegment(const Base64Url& segment) {
  return parseText(segment.decodeToString());
}

// RFC 7515 section 4.1.11: a non-empty array of strings
void Header::validateCritical(const ordered_json& json) {
  auto it = json.find("crit");
  if (it == json.end()) return;
  if (!it->is_array() || it->empty()) {
    throw ParseError("\"crit\" must be a non-empty array");
  }
  for (const auto& item : *it) {
    if (!item.is_string()) {
      throw ParseError("\"crit\" entries must be strings");
    }
  }
}

// JweHeader

JweHeader::JweHeader(ordered_json json, Base64Url encoded)
    : Header(std::move(json), std::move(encoded)) {
  const auto& alg_name = requireString(json_, "alg");
  auto alg = jweAlgorithmFromName(alg_name);
  if (!alg) {
    throw UnsupportedAlgorithmError("Unsupported JWE algorithm " + alg_name);
  }
  alg_ = *alg;

  const auto& enc_name = requireString(json_, "enc");
  auto enc = encryptionMethodFromName(enc_name);
  if (!enc) {
    throw UnsupportedAlgorithmError("Unsupported JWE encryption method " +
                                    enc_name);
  }
  enc_ = *enc;

  auto zip = json_.find("zip");
  if (zip != json_.end()) {
    if (!zip->is_string() || !compressionFromName(zip->get<std::string>())) {
      throw UnsupportedAlgorithmError(
          "Unsupported JWE compression algorithm " + zip->dump() +
          ", must be " + std::string(name(CompressionAlgorithm::DEF)));
    }
  }

  checkStringTyped(json_, {"typ", "cty", "kid", "jku", "x5u", "x5t", "iv",
                           "tag", "p2s", "apu", "apv", "epu", "epv"});
  auto p2c = json_.find("p2c");
  if (p2c != json_.end() && !p2c->is_number_unsigned()) {
    throw ParseError("\"p2c\" must be a positive integer");
  }
  auto epk = json_.find("epk");
  if (epk != json_.end() && !epk->is_object()) {
    throw ParseError("\"epk\" must be a JSON object");
  }
  validateCritical(json_);
}

std::optional<CompressionAlgorithm> JweHeader::compression() const {
  auto zip = stringParam("zip");
  if (!zip) return std::nullopt;
  return compressionFromName(*zip);
}

std::optional<Base64Url> JweHeader::iv() const {
  return base64Param(*this, "iv");
}

std::optional<Base64Url> JweHeader::authTag() const {
  return base64Param(*this, "tag");
}

std::optional<Base64Url> JweHeader::pbes2Salt() const {
  return base64Param(*this, "p2s");
}

std::optional<uint32_t> JweHeader::pbes2Count() const {
  const auto* value = param("p2c");
  if (!value || !value->is_number_unsigned()) return std::nullopt;
  auto count = value->get<uint64_t>();
  if (count > UINT32_MAX) {
    throw ParseError("\"p2c\" is out of range");
  }
  return static_cast<uint32_t>(count);
}

std::optional<Base64Url> JweHeader::agreementPartyUInfo() const {
  return base64Param(*this, "apu");
}

std::optional<Base64Url> JweHeader::agreementPartyVInfo() const {
  return base64Param(*this, "apv");
}

std::optional<Base64Url> JweHeader::encryptionPartyUInfo() const {
  return base64Param(*this, "epu");
}

std::optional<Base64Url> JweHeader::encryptionPartyVInfo() const {
  return base64Param(*this, "epv");
}

JweHeader JweHeader::parse(const Base64Url& segment) {
  auto json = decodeSegment(segment);
  JOSE_LOG_TRACE("Parsed JWE header {}", json.dump());
  return JweHeader(std::move(json), segment);
}

JweHeader JweHeader::parseJson(std::string_view json_text) {
  auto json = parseText(json_text);
  auto encoded = Base64Url::encode(json_text);
  return JweHeader(std::move(json), std::move(encoded));
}

JweHeader::Builder::Builder(JweAlgorithm alg, EncryptionMethod enc) {
  json_["alg"] = std::string(name(alg));
  json_["enc"] = std::string(name(enc));
}

JweHeader::Builder::Builder(const JweHeader& header)
    : HeaderBuilderBase(header.toJson()) {}

JweHeader JweHeader::Builder::build() const {
  auto encoded = Base64Url::encode(json_.dump());
  return JweHeader(json_, std::move(encoded));
}

bool JweHeader::Builder::isRegistered(std::string_view param) {
  return listed(kJwsRegistered, param) || listed(kJweOnlyRegistered, param);
}

// JwsHeader

JwsHeader::JwsHeader(ordered_json json, Base64Url encoded)
    : Header(std::move(json), std::move(encoded)) {
  const auto& alg_name = requireString(json_, "alg");
  auto alg = jwsAlgorithmFromName(alg_name);
  if (!alg) {
    throw UnsupportedAlgorithmError("Unsupported JWS algorithm " + alg_name);
  }
  alg_ = *alg;
  checkStringTyped(json_, {"typ", "cty", "kid", "jku", "x5u", "x5t"});
  validateCritical(json_);
}

JwsHeader JwsHeader::parse(const Base64Url& segment) {
  auto json = decodeSegment(segment);
  JOSE_LOG_TRACE("Parsed JWS header {}", json.dump());
  return JwsHeader(std::move(json), segment);
}

JwsHeader JwsHeader::parseJson(std::string_view json_text) {
  auto json = parseText(json_text);
  auto encoded = Base64Url::encode(json_text);
  return JwsHeader(std::move(json), std::move(encoded));
}

JwsHeader::Builder::Builder(JwsAlgorithm alg) {
  json_["alg"] = std::string(name(alg));
}

JwsHeader::Builder::Builder(const JwsHeader& header)
    : HeaderBuilderBase(header.toJson()) {}

JwsHeader JwsHeader::Builder::build() const {
  auto encoded = Base64Url::encode(json_.dump());
  return JwsHeader(json_, std::move(encoded));
}

bool JwsHeader::Builder::isRegistered(std::string_view param) {
  return listed(kJwsRegistered, param);
}

}  // namespace jose
