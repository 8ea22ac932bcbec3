#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace stock_sync {

/// Strip every non-printable character from a raw SKU.
/// The input is decoded as UTF-8. Control and format characters, private-use
/// code points, separators other than ASCII space and ill-formed byte
/// sequences are dropped. Never throws.
std::string normalizeSku(const std::string& raw);

/// Normalize a JSON value: strings as above, anything else yields "".
std::string normalizeSkuValue(const nlohmann::json& raw);

/// True if @p codePoint would survive normalizeSku().
bool isPrintableCodePoint(char32_t codePoint);

} // namespace stock_sync
