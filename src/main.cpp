/*
 * 설명: 리더보드 실행 진입점으로 환경설정을 로드해 한 번 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include <exception>

#include "matrank/app.hpp"

int main() {
  using namespace matrank;
  try {
    AppConfig config = LoadConfigFromEnv();
    LeaderboardApp app(config);
    app.Run();
  } catch (const std::exception& ex) {
    Observability fallback(LogLevel::kError);
    fallback.Log(LogLevel::kError, "run_failed", {{"message", ex.what()}});
    return 1;
  }
  return 0;
}
