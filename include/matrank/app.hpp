/*
 * 설명: 시즌 로딩부터 리더보드 출력까지 한 번의 레이팅 실행을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/it/match_store_it_test.cpp
 */
#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "matrank/config.hpp"
#include "matrank/db_client.hpp"
#include "matrank/match_store.hpp"
#include "matrank/observability.hpp"
#include "matrank/rating_period.hpp"

namespace matrank {

class LeaderboardApp {
 public:
  explicit LeaderboardApp(const AppConfig& config, std::ostream& out = std::cout);

  // 입력이 비어 있으면 로그만 남기고 정상 종료한다. 저장소/설정 오류는 예외로 전달된다.
  void Run();

 private:
  std::vector<SeasonRecord> LoadSeasons() const;
  void Stop(const std::string& trace_id, const std::string& reason) const;

  AppConfig config_;
  std::ostream& out_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<MatchStore> match_store_;
};

}  // namespace matrank
