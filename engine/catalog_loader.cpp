#include "engine/catalog_loader.h"

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <string>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "common/digest.h"
#include "common/logging.h"
#include "common/macros.h"
#include "common/string_utils.h"

namespace Shield {

using Common::copyBounded;

namespace {

constexpr const char* ROOT_KEYS[] = {"schema", "rules"};
constexpr const char* RULE_KEYS[] = {"id", "category", "severity", "title", "guidance", "indicators"};
constexpr const char* INDICATOR_KEYS[] = {
    "id", "kind", "role", "factor", "tokens", "with", "without", "case_sensitive",
    "window", "lookahead", "literal_rhs", "confidence", "description"
};

constexpr const char* ERROR_NAMES[] = {
    "none",
    "io_error",
    "parse_error",
    "schema_mismatch",
    "unknown_key",
    "missing_field",
    "invalid_value",
    "missing_category",
    "duplicate_category",
    "duplicate_id",
    "no_signal_indicator",
    "capacity_exceeded"
};

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
auto fail(CatalogError* error, CatalogErrorCode code, const char* format, ...) noexcept -> bool {
    error->code = code;
    va_list args;
    va_start(args, format);
    std::vsnprintf(error->message, sizeof(error->message), format, args);
    va_end(args);
    return false;
}
#pragma GCC diagnostic pop

template <size_t N>
auto checkKeys(const rapidjson::Value& obj, const char* const (&allowed)[N], const char* where,
               CatalogError* error) noexcept -> bool {
    for (auto it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) {
        const char* name = it->name.GetString();
        bool known = false;
        for (const char* key : allowed) {
            if (std::strcmp(key, name) == 0) {
                known = true;
                break;
            }
        }
        if (!known) {
            return fail(error, CatalogErrorCode::UNKNOWN_KEY, "%s: unknown key '%s'", where, name);
        }
        for (auto other = obj.MemberBegin(); other != it; ++other) {
            if (std::strcmp(other->name.GetString(), name) == 0) {
                return fail(error, CatalogErrorCode::UNKNOWN_KEY, "%s: key '%s' repeated", where, name);
            }
        }
    }
    return true;
}

auto requireString(const rapidjson::Value& obj, const char* key, const char* where,
                   char* out, size_t out_size, bool mandatory, CatalogError* error) noexcept -> bool {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) {
        if (mandatory) {
            return fail(error, CatalogErrorCode::MISSING_FIELD, "%s: missing '%s'", where, key);
        }
        out[0] = '\0';
        return true;
    }
    if (!it->value.IsString()) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: '%s' must be a string", where, key);
    }
    const size_t len = it->value.GetStringLength();
    if (len >= out_size) {
        return fail(error, CatalogErrorCode::CAPACITY_EXCEEDED, "%s: '%s' longer than %zu bytes",
                    where, key, out_size - 1);
    }
    if (mandatory && len == 0) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: '%s' is empty", where, key);
    }
    copyBounded(out, out_size, std::string_view(it->value.GetString(), len));
    return true;
}

auto readTokens(const rapidjson::Value& obj, const char* key, const char* where, bool mandatory,
                TokenList* out, CatalogError* error) noexcept -> bool {
    out->count = 0;
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) {
        if (mandatory) {
            return fail(error, CatalogErrorCode::MISSING_FIELD, "%s: missing '%s'", where, key);
        }
        return true;
    }
    if (!it->value.IsArray()) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: '%s' must be an array", where, key);
    }
    const auto& arr = it->value;
    if (arr.Size() > MAX_TOKENS) {
        return fail(error, CatalogErrorCode::CAPACITY_EXCEEDED, "%s: '%s' holds more than %zu tokens",
                    where, key, MAX_TOKENS);
    }
    for (rapidjson::SizeType i = 0; i < arr.Size(); ++i) {
        if (!arr[i].IsString() || arr[i].GetStringLength() == 0) {
            return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: '%s'[%u] must be a non-empty string",
                        where, key, i);
        }
        if (arr[i].GetStringLength() >= MAX_TOKEN_LEN) {
            return fail(error, CatalogErrorCode::CAPACITY_EXCEEDED, "%s: '%s'[%u] longer than %zu bytes",
                        where, key, i, MAX_TOKEN_LEN - 1);
        }
        copyBounded(out->items[out->count], MAX_TOKEN_LEN,
                    std::string_view(arr[i].GetString(), arr[i].GetStringLength()));
        ++out->count;
    }
    if (mandatory && out->count == 0) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: '%s' is empty", where, key);
    }
    return true;
}

auto readBool(const rapidjson::Value& obj, const char* key, const char* where, bool* out,
              CatalogError* error) noexcept -> bool {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) {
        return true;
    }
    if (!it->value.IsBool()) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: '%s' must be true or false", where, key);
    }
    *out = it->value.GetBool();
    return true;
}

auto readLines(const rapidjson::Value& obj, const char* key, const char* where, uint32_t max,
               uint8_t* out, CatalogError* error) noexcept -> bool {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) {
        return true;
    }
    if (!it->value.IsUint()) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: '%s' must be a non-negative integer",
                    where, key);
    }
    const unsigned value = it->value.GetUint();
    if (value > max) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: '%s' exceeds %u lines", where, key, max);
    }
    *out = static_cast<uint8_t>(value);
    return true;
}

auto readEnumName(const rapidjson::Value& obj, const char* key, const char* where, bool mandatory,
                  const char** out, CatalogError* error) noexcept -> bool {
    *out = nullptr;
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) {
        if (mandatory) {
            return fail(error, CatalogErrorCode::MISSING_FIELD, "%s: missing '%s'", where, key);
        }
        return true;
    }
    if (!it->value.IsString()) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: '%s' must be a string", where, key);
    }
    *out = it->value.GetString();
    return true;
}

auto parseIndicator(const rapidjson::Value& obj, const char* rule_id, uint32_t index,
                    Indicator* ind, CatalogError* error) noexcept -> bool {
    char where[128];
    std::snprintf(where, sizeof(where), "rule '%s' indicator %u", rule_id, index);

    if (!obj.IsObject()) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: must be an object", where);
    }
    if (!checkKeys(obj, INDICATOR_KEYS, where, error)) return false;
    if (!requireString(obj, "id", where, ind->id, sizeof(ind->id), true, error)) return false;
    std::snprintf(where, sizeof(where), "rule '%s' indicator '%s'", rule_id, ind->id);

    const char* name = nullptr;
    if (!readEnumName(obj, "kind", where, true, &name, error)) return false;
    if (!parseKind(name, &ind->kind)) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: unknown kind '%s'", where, name);
    }

    ind->role = IndicatorRole::SIGNAL;
    if (!readEnumName(obj, "role", where, false, &name, error)) return false;
    if (name && !parseRole(name, &ind->role)) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: unknown role '%s'", where, name);
    }

    if (!readEnumName(obj, "factor", where, true, &name, error)) return false;
    if (!parseFactor(name, &ind->factor)) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: unknown factor '%s'", where, name);
    }

    if (!readTokens(obj, "tokens", where, true, &ind->tokens, error)) return false;
    if (!readTokens(obj, "with", where, false, &ind->with, error)) return false;
    if (!readTokens(obj, "without", where, false, &ind->without, error)) return false;

    if (ind->kind == IndicatorKind::COOCCURRENCE && ind->with.empty()) {
        return fail(error, CatalogErrorCode::MISSING_FIELD, "%s: cooccurrence needs 'with' tokens", where);
    }

    // Literals compare exact source text; identifiers do not
    ind->case_sensitive = ind->kind == IndicatorKind::LITERAL;
    ind->literal_rhs = false;
    ind->window = 0;
    ind->lookahead = 0;
    if (!readBool(obj, "case_sensitive", where, &ind->case_sensitive, error)) return false;
    if (!readBool(obj, "literal_rhs", where, &ind->literal_rhs, error)) return false;
    if (!readLines(obj, "window", where, MAX_WINDOW, &ind->window, error)) return false;
    if (!readLines(obj, "lookahead", where, MAX_LOOKAHEAD, &ind->lookahead, error)) return false;

    if (ind->literal_rhs && ind->kind != IndicatorKind::ASSIGNMENT) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: literal_rhs requires kind assignment", where);
    }

    auto conf = obj.FindMember("confidence");
    if (conf == obj.MemberEnd()) {
        return fail(error, CatalogErrorCode::MISSING_FIELD, "%s: missing 'confidence'", where);
    }
    if (!conf->value.IsNumber()) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: 'confidence' must be a number", where);
    }
    ind->confidence = conf->value.GetDouble();
    if (!(ind->confidence > 0.0 && ind->confidence <= 1.0)) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: confidence %.3f outside (0, 1]",
                    where, ind->confidence);
    }

    return requireString(obj, "description", where, ind->description, sizeof(ind->description), false, error);
}

auto parseRule(const rapidjson::Value& obj, uint32_t index, Rule* rule, CatalogError* error) noexcept -> bool {
    char where[96];
    std::snprintf(where, sizeof(where), "rule %u", index);

    if (!obj.IsObject()) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: must be an object", where);
    }
    if (!checkKeys(obj, RULE_KEYS, where, error)) return false;
    if (!requireString(obj, "id", where, rule->id, sizeof(rule->id), true, error)) return false;
    std::snprintf(where, sizeof(where), "rule '%s'", rule->id);

    const char* name = nullptr;
    if (!readEnumName(obj, "category", where, true, &name, error)) return false;
    if (!parseCategory(name, &rule->category)) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: unknown category '%s'", where, name);
    }
    if (!readEnumName(obj, "severity", where, true, &name, error)) return false;
    if (!parseTier(name, &rule->tier)) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: unknown severity '%s'", where, name);
    }
    if (!requireString(obj, "title", where, rule->title, sizeof(rule->title), false, error)) return false;

    rule->guidance_count = 0;
    auto guidance = obj.FindMember("guidance");
    if (guidance != obj.MemberEnd()) {
        if (!guidance->value.IsArray()) {
            return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: 'guidance' must be an array", where);
        }
        const auto& arr = guidance->value;
        if (arr.Size() > MAX_GUIDANCE) {
            return fail(error, CatalogErrorCode::CAPACITY_EXCEEDED, "%s: more than %zu guidance entries",
                        where, MAX_GUIDANCE);
        }
        for (rapidjson::SizeType i = 0; i < arr.Size(); ++i) {
            if (!arr[i].IsString()) {
                return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: guidance[%u] must be a string", where, i);
            }
            if (arr[i].GetStringLength() >= sizeof(rule->guidance[0])) {
                return fail(error, CatalogErrorCode::CAPACITY_EXCEEDED, "%s: guidance[%u] too long", where, i);
            }
            copyBounded(rule->guidance[rule->guidance_count], sizeof(rule->guidance[0]),
                        std::string_view(arr[i].GetString(), arr[i].GetStringLength()));
            ++rule->guidance_count;
        }
    }

    auto indicators = obj.FindMember("indicators");
    if (indicators == obj.MemberEnd()) {
        return fail(error, CatalogErrorCode::MISSING_FIELD, "%s: missing 'indicators'", where);
    }
    if (!indicators->value.IsArray()) {
        return fail(error, CatalogErrorCode::INVALID_VALUE, "%s: 'indicators' must be an array", where);
    }
    const auto& arr = indicators->value;
    if (arr.Size() > MAX_INDICATORS_PER_RULE) {
        return fail(error, CatalogErrorCode::CAPACITY_EXCEEDED, "%s: more than %zu indicators",
                    where, MAX_INDICATORS_PER_RULE);
    }

    rule->indicator_count = 0;
    for (rapidjson::SizeType i = 0; i < arr.Size(); ++i) {
        Indicator& ind = rule->indicators[i];
        if (!parseIndicator(arr[i], rule->id, i, &ind, error)) {
            return false;
        }
        for (uint32_t j = 0; j < rule->indicator_count; ++j) {
            if (std::strcmp(rule->indicators[j].id, ind.id) == 0) {
                return fail(error, CatalogErrorCode::DUPLICATE_ID, "%s: indicator id '%s' repeated",
                            where, ind.id);
            }
        }
        ++rule->indicator_count;
    }

    if (rule->signalCount() == 0) {
        return fail(error, CatalogErrorCode::NO_SIGNAL_INDICATOR, "%s: no signal indicator", where);
    }
    return true;
}

} // namespace

auto catalogErrorName(CatalogErrorCode code) noexcept -> const char* {
    const auto idx = static_cast<size_t>(code);
    return idx < Common::arraySize(ERROR_NAMES) ? ERROR_NAMES[idx] : "unknown";
}

auto CatalogLoader::loadString(std::string_view source, std::unique_ptr<const RuleCatalog>* catalog,
                               CatalogError* error) noexcept -> bool {
    catalog->reset();
    *error = CatalogError{};

    rapidjson::Document doc;
    doc.Parse(source.data(), source.size());
    if (doc.HasParseError()) {
        fail(error, CatalogErrorCode::PARSE_ERROR, "JSON parse error at offset %zu: %s",
             doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError()));
        LOG_ERROR("Catalog rejected: %s", error->message);
        return false;
    }

    auto reject = [error]() {
        LOG_ERROR("Catalog rejected (%s): %s", catalogErrorName(error->code), error->message);
        return false;
    };

    if (!doc.IsObject()) {
        fail(error, CatalogErrorCode::SCHEMA_MISMATCH, "catalog root must be an object");
        return reject();
    }
    if (!checkKeys(doc, ROOT_KEYS, "catalog", error)) {
        return reject();
    }
    auto schema = doc.FindMember("schema");
    if (schema == doc.MemberEnd() || !schema->value.IsString() ||
        std::strcmp(schema->value.GetString(), CATALOG_SCHEMA) != 0) {
        fail(error, CatalogErrorCode::SCHEMA_MISMATCH, "catalog 'schema' must be \"%s\"", CATALOG_SCHEMA);
        return reject();
    }
    auto rules = doc.FindMember("rules");
    if (rules == doc.MemberEnd() || !rules->value.IsArray()) {
        fail(error, CatalogErrorCode::MISSING_FIELD, "catalog 'rules' must be an array");
        return reject();
    }

    std::unique_ptr<RuleCatalog> built(new RuleCatalog());
    std::array<bool, CATEGORY_COUNT> seen{};

    const auto& arr = rules->value;
    for (rapidjson::SizeType i = 0; i < arr.Size(); ++i) {
        // Parse into a scratch rule first so a duplicate cannot clobber a valid slot
        auto rule = std::make_unique<Rule>();
        if (!parseRule(arr[i], i, rule.get(), error)) {
            return reject();
        }
        const size_t slot = categoryIndex(rule->category);
        if (seen[slot]) {
            fail(error, CatalogErrorCode::DUPLICATE_CATEGORY, "category %s defined more than once",
                 categoryName(rule->category));
            return reject();
        }
        if (built->findRule(rule->id) != nullptr) {
            fail(error, CatalogErrorCode::DUPLICATE_ID, "rule id '%s' repeated", rule->id);
            return reject();
        }
        seen[slot] = true;
        built->rules_[slot] = *rule;
    }

    for (size_t c = 0; c < CATEGORY_COUNT; ++c) {
        if (!seen[c]) {
            fail(error, CatalogErrorCode::MISSING_CATEGORY, "category %s has no rule",
                 categoryName(static_cast<Category>(c)));
            return reject();
        }
    }

    if (!Common::sha256Hex(source, built->digest_, sizeof(built->digest_))) {
        fail(error, CatalogErrorCode::IO_ERROR, "failed to digest catalog source");
        return reject();
    }

    LOG_INFO("Catalog loaded: %u indicators across %zu rules, digest %.16s",
             built->indicatorCount(), CATEGORY_COUNT, built->digest_);
    *catalog = std::move(built);
    return true;
}

auto CatalogLoader::loadFile(const char* path, std::unique_ptr<const RuleCatalog>* catalog,
                             CatalogError* error) noexcept -> bool {
    catalog->reset();
    *error = CatalogError{};

    FILE* file = std::fopen(path, "rb");
    if (!file) {
        fail(error, CatalogErrorCode::IO_ERROR, "cannot open catalog file %s", path);
        LOG_ERROR("%s", error->message);
        return false;
    }

    std::string source;
    char chunk[4096];
    size_t n;
    while ((n = std::fread(chunk, 1, sizeof(chunk), file)) > 0) {
        source.append(chunk, n);
    }
    const bool read_error = std::ferror(file) != 0;
    std::fclose(file);

    if (read_error) {
        fail(error, CatalogErrorCode::IO_ERROR, "read error on catalog file %s", path);
        LOG_ERROR("%s", error->message);
        return false;
    }

    LOG_INFO("Loading catalog from %s (%zu bytes)", path, source.size());
    return loadString(source, catalog, error);
}

} // namespace Shield
