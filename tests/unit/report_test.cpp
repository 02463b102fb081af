#include <filesystem>
#include <fstream>
#include <sstream>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "matrank/report.hpp"

namespace {

matrank::Leaderboard BuildBoard() {
  matrank::Leaderboard board;
  board.rankings = {{"120", {"a", "b"}}, {"126", {"c"}}, {"132", {}}};
  board.athletes.emplace("a", matrank::LeaderboardEntry{"a", "Zed", std::string("t1"), 2027, 1600.5, 60.0, 0.06, 4, 1});
  board.athletes.emplace("b", matrank::LeaderboardEntry{"b", "Abe", std::nullopt, std::nullopt, 1550.0, 70.0, 0.06, 2, 2});
  board.athletes.emplace("c", matrank::LeaderboardEntry{"c", "Moe", std::string("t1"), 2026, 1600.5, 65.0, 0.0601, 3, 0});
  return board;
}

matrank::RosterContext BuildContext() {
  matrank::RosterContext context;
  context.sections = {"S2", "S1"};
  context.divisions = {3, 1};
  return context;
}

std::vector<matrank::TeamRoster> BuildTeams() {
  return {matrank::TeamRoster{"t1", std::string("Alpha HS"), 1, std::string("S1"), {{"120", {"a"}}, {"126", {"c"}}}}};
}

}  // namespace

TEST(ReportPayloadTest, MatchesLeaderboardDocumentShape) {
  const matrank::ReportSummary summary{0.3, 250, 4, std::nullopt};
  auto payload = matrank::BuildReportPayload(summary, matrank::AthleteOverrides{}, BuildContext(), BuildBoard(),
                                             BuildTeams());

  EXPECT_DOUBLE_EQ(payload["tau"].get<double>(), 0.3);
  EXPECT_EQ(payload["matches"], 250);
  EXPECT_EQ(payload["periods"], 4);
  EXPECT_TRUE(payload["gradYear"].is_null());
  EXPECT_TRUE(payload["overrides"]["weights"].is_null());
  EXPECT_TRUE(payload["overrides"]["exclude"].is_null());
  EXPECT_TRUE(payload["overrides"]["gradYears"].is_null());
  EXPECT_TRUE(payload["overrides"]["teams"].is_null());
  EXPECT_EQ(payload["sectionDivisionData"]["sections"], nlohmann::json({"S1", "S2"}));
  EXPECT_EQ(payload["sectionDivisionData"]["divisions"], nlohmann::json({1, 3}));

  EXPECT_EQ(payload["weights"]["120"], nlohmann::json({"a", "b"}));
  EXPECT_EQ(payload["weights"]["132"], nlohmann::json::array());

  ASSERT_EQ(payload["teams"].size(), 1u);
  EXPECT_EQ(payload["teams"][0]["id"], "t1");
  EXPECT_EQ(payload["teams"][0]["name"], "Alpha HS");
  EXPECT_EQ(payload["teams"][0]["division"], 1);
  EXPECT_EQ(payload["teams"][0]["weights"]["126"], nlohmann::json({"c"}));
}

TEST(ReportPayloadTest, SortsWrestlersByRatingThenName) {
  const matrank::ReportSummary summary{0.5, 10, 2, 2027};
  auto payload = matrank::BuildReportPayload(summary, matrank::AthleteOverrides{}, BuildContext(), BuildBoard(), {});

  const auto& wrestlers = payload["wrestlers"];
  ASSERT_EQ(wrestlers.size(), 3u);
  EXPECT_EQ(wrestlers[0]["id"], "c");
  EXPECT_EQ(wrestlers[1]["id"], "a");
  EXPECT_EQ(wrestlers[2]["id"], "b");
  EXPECT_TRUE(wrestlers[2]["teamId"].is_null());
  EXPECT_TRUE(wrestlers[2]["gradYear"].is_null());
  EXPECT_EQ(wrestlers[0]["wins"], 3);
  EXPECT_EQ(wrestlers[0]["losses"], 0);
  EXPECT_EQ(payload["gradYear"], 2027);
  EXPECT_TRUE(payload["teams"].empty());
}

TEST(ReportPayloadTest, IncludesNonEmptyOverrides) {
  matrank::AthleteOverrides overrides;
  overrides.weights["a"] = "126";
  overrides.exclude = {"q", "p"};

  auto payload = matrank::BuildReportPayload(matrank::ReportSummary{0.5, 1, 1, std::nullopt}, overrides,
                                             BuildContext(), BuildBoard(), {});

  EXPECT_EQ(payload["overrides"]["weights"]["a"], "126");
  EXPECT_EQ(payload["overrides"]["exclude"], nlohmann::json({"p", "q"}));
  EXPECT_TRUE(payload["overrides"]["gradYears"].is_null());
}

TEST(ReportOutputTest, WritesJsonFileCreatingParentDirectory) {
  const auto dir = std::filesystem::temp_directory_path() / "matrank_report_test";
  std::filesystem::remove_all(dir);
  const auto path = dir / "nested" / "leaderboard.json";

  nlohmann::json payload{{"tau", 0.4}, {"wrestlers", nlohmann::json::array()}};
  matrank::WriteReportFile(path.string(), payload);

  std::ifstream in(path);
  ASSERT_TRUE(in.good());
  EXPECT_EQ(nlohmann::json::parse(in), payload);
  std::filesystem::remove_all(dir);
}

TEST(ReportOutputTest, PrintsTablePerNonEmptyWeightClass) {
  std::ostringstream out;
  matrank::WriteTextReport(out, matrank::ReportSummary{0.5, 12, 3, std::nullopt}, BuildBoard());

  const std::string text = out.str();
  EXPECT_NE(text.find("Processed 12 matches across 3 monthly periods."), std::string::npos);
  EXPECT_NE(text.find("Weight 120"), std::string::npos);
  EXPECT_NE(text.find(" 1. Zed (a) - R: 1600.5 RD: 60 sigma: 0.06"), std::string::npos);
  EXPECT_NE(text.find(" 2. Abe (b)"), std::string::npos);
  EXPECT_EQ(text.find("Weight 132"), std::string::npos);
}
