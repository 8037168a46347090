#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

#include "vidsearch_core/result.hpp"

namespace vidsearch_core {

// SQLITE_BUSY and SQLITE_LOCKED clear once the competing writer finishes
inline bool is_transient(const sqlite::sqlite_exception &e) {
  const int code = e.get_code();
  return code == SQLITE_BUSY || code == SQLITE_LOCKED;
}

// "<operation> failed: <message> [<sqlite code name>, xcode=<n>]"
inline std::string describe_db_error(const std::string &operation,
                                     const sqlite::sqlite_exception &e) {
  return operation + " failed: " + e.what() + " [" + sqlite3_errstr(e.get_code()) +
         ", xcode=" + std::to_string(e.get_extended_code()) + "]";
}

inline Failure to_failure(ErrorKind kind, const std::string &operation,
                          const sqlite::sqlite_exception &e, std::string context) {
  return Failure{kind, describe_db_error(operation, e), std::move(context)};
}

}  // namespace vidsearch_core
