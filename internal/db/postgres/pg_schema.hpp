#pragma once

#include <memory>

#include "pg_pool.hpp"

namespace relay::db::postgres {

// Creates the stream_* tables if missing and probes their columns.
void BootstrapSchema(const std::shared_ptr<PgPool>& pool);

} // namespace relay::db::postgres
