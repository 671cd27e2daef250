#include "pg_tx.hpp"

#include "internal/util/errors.hpp"

namespace weave::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

// pqxx::work aborts on destruction when neither committed nor aborted
PgTransaction::~PgTransaction() {
  tx_.reset();
}

void PgTransaction::Commit() {
  if (finished_) throw weave::util::InvalidState("transaction already finished");
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw weave::util::ConcurrencyConflict(e.what());
  } catch (const pqxx::unique_violation& e) {
    throw weave::util::AlreadyExists(e.what());
  } catch (const pqxx::broken_connection& e) {
    throw weave::util::StoreUnavailable(e.what());
  }
  committed_ = true;
  finished_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

}
