#pragma once

#include "core/null_uuid.hpp"
#include "core/uuid.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace uuidpp {

// A column value as handed over by a relational driver
using SqlValue = std::variant<std::monostate,        // NULL
                              std::vector<uint8_t>,  // BLOB
                              std::string,           // TEXT
                              int64_t,               // INTEGER
                              double,                // REAL
                              bool>;

// Name of the value's type for diagnostics ("null", "blob", ...)
const char* sql_type_name(const SqlValue& value);

// Bound parameter for a UUID: its canonical text form
SqlValue to_sql_value(const Uuid& uuid);

// Bound parameter for an optional UUID: NULL when invalid
SqlValue to_sql_value(const NullUuid& value);

/**
 * @brief Reads a UUID from a column value.
 *
 * A 16-byte BLOB is taken as the raw binary form; any other BLOB and any
 * TEXT go through the text parser (FormatError on failure). NULL, numbers
 * and booleans throw UnsupportedSourceTypeError.
 */
void scan(const SqlValue& src, Uuid& out);

// NULL yields an invalid value; anything else marks it valid and delegates
void scan(const SqlValue& src, NullUuid& out);

} // namespace uuidpp
