/*
 * 설명: MariaDB 연결과 조회 재시도 정책을 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, sql/schema.sql
 * 테스트: tests/it/match_store_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace matrank {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  // 재시도 가능한 오류면 새 연결로 work를 다시 실행한다. work는 멱등이어야 한다.
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  // sql을 실행하고 결과 행마다 on_row를 호출한다.
  void Query(MYSQL* conn, const std::string& sql, const std::string& ctx,
             const std::function<void(MYSQL_ROW, unsigned long*)>& on_row) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  MYSQL* Connect() const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 5;
  unsigned int query_timeout_seconds_ = 30;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace matrank
