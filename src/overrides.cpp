/*
 * 설명: 오버라이드 JSON 파일을 읽고 항목별로 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/overrides_test.cpp
 */
#include "matrank/overrides.hpp"

#include <fstream>

namespace matrank {
namespace {
void WarnSkipped(const std::shared_ptr<Observability>& observability, const std::string& athlete_id,
                 const std::string& field, const std::string& reason) {
  if (!observability) {
    return;
  }
  observability->AddSkipped();
  observability->Log(LogLevel::kWarn, "override_skipped",
                     {{"wrestlerId", athlete_id}, {"field", field}, {"reason", reason}});
}

bool IsTruthy(const nlohmann::json& value) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number()) {
    return value.get<double>() != 0.0;
  }
  if (value.is_string()) {
    return !value.get<std::string>().empty();
  }
  if (value.is_array() || value.is_object()) {
    return !value.empty();
  }
  return false;
}
}  // namespace

std::set<std::string> AthleteOverrides::ManualIds() const {
  std::set<std::string> ids;
  for (const auto& entry : weights) {
    ids.insert(entry.first);
  }
  for (const auto& entry : grad_years) {
    ids.insert(entry.first);
  }
  for (const auto& entry : teams) {
    ids.insert(entry.first);
  }
  return ids;
}

AthleteOverrides ParseOverrides(const nlohmann::json& doc, const std::shared_ptr<Observability>& observability) {
  AthleteOverrides overrides;
  if (!doc.is_object()) {
    if (observability) {
      observability->Log(LogLevel::kWarn, "overrides_invalid", {{"reason", "wrestler_id 키를 가진 객체여야 함"}});
    }
    return overrides;
  }

  for (const auto& [athlete_id, value] : doc.items()) {
    if (value.is_string()) {
      overrides.weights[athlete_id] = value.get<std::string>();
      continue;
    }
    if (!value.is_object()) {
      WarnSkipped(observability, athlete_id, "*", "문자열 또는 객체가 아님");
      continue;
    }

    if (auto it = value.find("weight"); it != value.end()) {
      if (it->is_string()) {
        overrides.weights[athlete_id] = it->get<std::string>();
      } else {
        WarnSkipped(observability, athlete_id, "weight", "문자열이 아님");
      }
    }
    if (auto it = value.find("exclude"); it != value.end() && IsTruthy(*it)) {
      overrides.exclude.insert(athlete_id);
    }
    if (auto it = value.find("gradYear"); it != value.end() && !it->is_null()) {
      if (it->is_number_integer()) {
        overrides.grad_years[athlete_id] = it->get<int>();
      } else {
        WarnSkipped(observability, athlete_id, "gradYear", "정수가 아님");
      }
    }
    if (auto it = value.find("teamId"); it != value.end() && !it->is_null()) {
      if (it->is_string()) {
        overrides.teams[athlete_id] = it->get<std::string>();
      } else {
        WarnSkipped(observability, athlete_id, "teamId", "문자열이 아님");
      }
    }
  }
  return overrides;
}

AthleteOverrides LoadOverrides(const std::optional<std::string>& path,
                               const std::shared_ptr<Observability>& observability) {
  if (!path) {
    return AthleteOverrides{};
  }
  std::ifstream in(*path);
  if (!in) {
    if (observability) {
      observability->Log(LogLevel::kWarn, "overrides_missing", {{"path", *path}});
    }
    return AthleteOverrides{};
  }
  nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
  if (doc.is_discarded()) {
    if (observability) {
      observability->Log(LogLevel::kWarn, "overrides_invalid", {{"path", *path}, {"reason", "JSON 파싱 실패"}});
    }
    return AthleteOverrides{};
  }
  return ParseOverrides(doc, observability);
}

}  // namespace matrank
