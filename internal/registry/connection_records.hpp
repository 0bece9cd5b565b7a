#pragma once

#include "internal/db/model/connection_record.hpp"
#include "internal/model/connection.hpp"

namespace relay::registry {

db::model::ConnectionRecord ToRecord(const model::Connection& connection);

// Throws std::runtime_error on an unreadable status or options document.
model::Connection FromRecord(const db::model::ConnectionRecord& record);

} // namespace relay::registry
