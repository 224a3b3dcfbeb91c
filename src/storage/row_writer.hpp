#pragma once

#include "core/result.hpp"
#include "core/row.hpp"
#include "storage/database.hpp"
#include <string>

namespace studysync::storage {

/**
 * INSERT every column of `row` into `table`.
 */
[[nodiscard]] Result<void, Error> insert_row(Database& db, const std::string& table, const Row& row);

/**
 * UPDATE every non-id column of `row` on the record whose id matches.
 * Fails with a validation error when no such record exists.
 */
[[nodiscard]] Result<void, Error> update_row(Database& db, const std::string& table, const Row& row);

} // namespace studysync::storage
