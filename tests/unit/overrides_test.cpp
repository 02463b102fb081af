#include <filesystem>
#include <fstream>
#include <sstream>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "matrank/overrides.hpp"

namespace {

std::filesystem::path WriteTempFile(const std::string& name, const std::string& content) {
  auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path;
}

}  // namespace

TEST(OverridesTest, ParsesStringAndObjectEntries) {
  nlohmann::json doc{{"w1", "120"},
                     {"w2", {{"weight", "126"}, {"gradYear", 2026}, {"teamId", "t9"}}},
                     {"w3", {{"exclude", true}}},
                     {"w4", {{"exclude", 0}, {"gradYear", nullptr}}}};

  auto overrides = matrank::ParseOverrides(doc, nullptr);

  EXPECT_EQ(overrides.weights.at("w1"), "120");
  EXPECT_EQ(overrides.weights.at("w2"), "126");
  EXPECT_EQ(overrides.grad_years.at("w2"), 2026);
  EXPECT_EQ(overrides.teams.at("w2"), "t9");
  EXPECT_EQ(overrides.exclude, (std::set<std::string>{"w3"}));
  EXPECT_EQ(overrides.grad_years.count("w4"), 0u);
  EXPECT_EQ(overrides.ManualIds(), (std::set<std::string>{"w1", "w2"}));
  EXPECT_FALSE(overrides.Empty());
}

TEST(OverridesTest, SkipsMalformedEntriesWithWarning) {
  std::ostringstream sink;
  auto observability = std::make_shared<matrank::Observability>(matrank::LogLevel::kInfo, sink);
  nlohmann::json doc{{"bad1", 5},
                     {"bad2", {{"gradYear", "2026"}, {"weight", 120}}},
                     {"ok", {{"teamId", "t1"}}}};

  auto overrides = matrank::ParseOverrides(doc, observability);

  EXPECT_TRUE(overrides.weights.empty());
  EXPECT_TRUE(overrides.grad_years.empty());
  EXPECT_EQ(overrides.teams.at("ok"), "t1");
  EXPECT_EQ(observability->Snapshot().records_skipped, 3u);
  EXPECT_NE(sink.str().find("override_skipped"), std::string::npos);
}

TEST(OverridesTest, NonObjectRootYieldsEmptyOverrides) {
  auto overrides = matrank::ParseOverrides(nlohmann::json::array({"w1"}), nullptr);
  EXPECT_TRUE(overrides.Empty());
}

TEST(OverridesTest, LoadsFromFileAndToleratesMissingOrBrokenFiles) {
  EXPECT_TRUE(matrank::LoadOverrides(std::nullopt, nullptr).Empty());
  EXPECT_TRUE(matrank::LoadOverrides(std::string("/nonexistent/matrank/overrides.json"), nullptr).Empty());

  auto broken = WriteTempFile("matrank_overrides_broken.json", "{not json");
  EXPECT_TRUE(matrank::LoadOverrides(broken.string(), nullptr).Empty());

  auto valid = WriteTempFile("matrank_overrides_valid.json", R"({"w1": {"weight": "138", "exclude": false}})");
  auto overrides = matrank::LoadOverrides(valid.string(), nullptr);
  EXPECT_EQ(overrides.weights.at("w1"), "138");
  EXPECT_TRUE(overrides.exclude.empty());

  std::filesystem::remove(broken);
  std::filesystem::remove(valid);
}
