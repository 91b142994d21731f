#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"

namespace notify::db::postgres {

// Reads go to the primary, so both consistency levels are Strong.
class PgRepository final : public db::NotificationRepository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::vector<model::NotificationRecord> RangeQuery(const db::RangeQuery& query) override;
  Result InsertIfAbsent(const model::NotificationRecord& record) override;

private:
  std::shared_ptr<PgPool> pool_;
};

}
