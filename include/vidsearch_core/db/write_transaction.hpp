#pragma once

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "vidsearch_core/db/sqlite_error_utils.hpp"

namespace vidsearch_core {

/*
Write lock taken up front with BEGIN IMMEDIATE, so a competing writer surfaces as SQLITE_BUSY
at the start of the batch instead of halfway through it. Rolls back on destruction unless
commit() or rollback() already ended it.
*/
class WriteTransaction {
 public:
  explicit WriteTransaction(sqlite::database &db) : db_(db) {
    db_ << "BEGIN IMMEDIATE;";
    open_ = true;
  }

  WriteTransaction(const WriteTransaction &) = delete;
  WriteTransaction &operator=(const WriteTransaction &) = delete;

  ~WriteTransaction() noexcept {
    if (open_) {
      try {
        db_ << "ROLLBACK;";
      } catch (const sqlite::sqlite_exception &e) {
        std::cerr << "Warning: " << describe_db_error("rollback", e) << std::endl;
      }
    }
  }

  void commit() {
    db_ << "COMMIT;";
    open_ = false;
  }

  void rollback() {
    db_ << "ROLLBACK;";
    open_ = false;
  }

  bool is_open() const {
    return open_;
  }

 private:
  sqlite::database &db_;
  bool open_ = false;
};

constexpr auto WRITE_BUSY_BACKOFF = std::chrono::milliseconds(50);

/*
Runs body(WriteTransaction&) and commits unless the body rolled back itself. A busy or locked
database reruns the whole body, up to busy_retries more times with a growing backoff; any
other sqlite error, and the last busy one, propagate to the caller.
*/
template <typename Body>
auto run_write_transaction(sqlite::database &db, int busy_retries, const std::string &operation,
                           Body &&body) {
  for (int attempt = 0;; ++attempt) {
    try {
      WriteTransaction tx(db);
      auto result = body(tx);
      if (tx.is_open()) {
        tx.commit();
      }
      return result;
    } catch (const sqlite::sqlite_exception &e) {
      if (!is_transient(e) || attempt >= busy_retries) {
        throw;
      }
      std::cerr << "Warning: database busy during " << operation << ", retrying ("
                << (attempt + 1) << "/" << busy_retries << ")" << std::endl;
      std::this_thread::sleep_for(WRITE_BUSY_BACKOFF * (attempt + 1));
    }
  }
}

}  // namespace vidsearch_core
