#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#include "engine/rule_catalog.h"

namespace Shield {

constexpr const char* CATALOG_SCHEMA = "shield-catalog/1";

enum class CatalogErrorCode : uint8_t {
    NONE = 0,
    IO_ERROR,
    PARSE_ERROR,          // not a JSON document
    SCHEMA_MISMATCH,      // wrong or missing schema tag
    UNKNOWN_KEY,          // key outside the schema
    MISSING_FIELD,
    INVALID_VALUE,        // wrong type, unknown enum name, out of range
    MISSING_CATEGORY,
    DUPLICATE_CATEGORY,
    DUPLICATE_ID,
    NO_SIGNAL_INDICATOR,
    CAPACITY_EXCEEDED
};

/// Why a catalog source was rejected
struct CatalogError {
    CatalogErrorCode code{CatalogErrorCode::NONE};
    char message[256]{};
};

[[nodiscard]] auto catalogErrorName(CatalogErrorCode code) noexcept -> const char*;

/// Parses catalog JSON into a RuleCatalog. On failure *catalog is left empty
/// and *error describes the first violation found.
class CatalogLoader {
public:
    [[nodiscard]] static auto loadString(std::string_view source,
                                         std::unique_ptr<const RuleCatalog>* catalog,
                                         CatalogError* error) noexcept -> bool;

    [[nodiscard]] static auto loadFile(const char* path,
                                       std::unique_ptr<const RuleCatalog>* catalog,
                                       CatalogError* error) noexcept -> bool;
};

} // namespace Shield
