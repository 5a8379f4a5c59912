#include <shotimport/core/import_state.hpp>
#include <gtest/gtest.h>
#include <array>

namespace nc = shotimport::core;
using S = nc::ImportState;

TEST(ImportState, HappyPathIsAllowed) {
  EXPECT_TRUE(nc::is_allowed_transition(S::Idle, S::AnalyzingRoi));
  EXPECT_TRUE(nc::is_allowed_transition(S::AnalyzingRoi, S::MappingGrid));
  EXPECT_TRUE(nc::is_allowed_transition(S::MappingGrid, S::ExtractingRegions));
  EXPECT_TRUE(nc::is_allowed_transition(S::ExtractingRegions, S::Recognizing));
  EXPECT_TRUE(nc::is_allowed_transition(S::Recognizing, S::Complete));
  EXPECT_TRUE(nc::is_allowed_transition(S::Recognizing, S::Reviewing));
  EXPECT_TRUE(nc::is_allowed_transition(S::Reviewing, S::Complete));
}

TEST(ImportState, ManualPaths) {
  EXPECT_TRUE(nc::is_allowed_transition(S::Idle, S::AwaitingManualCrop));
  EXPECT_TRUE(nc::is_allowed_transition(S::AnalyzingRoi, S::AwaitingManualCrop));
  EXPECT_TRUE(nc::is_allowed_transition(S::AwaitingManualCrop, S::MappingGrid));
  EXPECT_TRUE(nc::is_allowed_transition(S::Reviewing, S::AwaitingManualCrop));
  EXPECT_FALSE(nc::is_allowed_transition(S::AwaitingManualCrop, S::AnalyzingRoi));
  EXPECT_FALSE(nc::is_allowed_transition(S::Recognizing, S::AwaitingManualCrop));
}

TEST(ImportState, TerminalStatesOnlyLeadToIdle) {
  for (S terminal : {S::Complete, S::Error}) {
    EXPECT_TRUE(nc::is_terminal(terminal));
    const auto next = nc::allowed_successors(terminal);
    ASSERT_EQ(next.size(), 1u);
    EXPECT_EQ(next[0], S::Idle);
  }
}

TEST(ImportState, EveryNonTerminalStateCanFail) {
  constexpr std::array states{S::Idle,        S::AnalyzingRoi,      S::AwaitingManualCrop,
                              S::MappingGrid, S::ExtractingRegions, S::Recognizing,
                              S::Reviewing};
  for (S s : states) {
    EXPECT_FALSE(nc::is_terminal(s)) << nc::to_string(s);
    EXPECT_TRUE(nc::is_allowed_transition(s, S::Error)) << nc::to_string(s);
  }
}

TEST(ImportState, SkippingStagesIsRejected) {
  EXPECT_FALSE(nc::is_allowed_transition(S::Idle, S::Complete));
  EXPECT_FALSE(nc::is_allowed_transition(S::AnalyzingRoi, S::Recognizing));
  EXPECT_FALSE(nc::is_allowed_transition(S::MappingGrid, S::MappingGrid));
  EXPECT_FALSE(nc::is_allowed_transition(S::Complete, S::AnalyzingRoi));
}

TEST(ImportState, StageStatesAndNames) {
  EXPECT_EQ(nc::state_for(nc::PipelineStage::RoiDetection), S::AnalyzingRoi);
  EXPECT_EQ(nc::state_for(nc::PipelineStage::Recognition), S::Recognizing);
  EXPECT_EQ(nc::to_string(S::AwaitingManualCrop), "awaiting-manual-crop");
  EXPECT_EQ(nc::to_string(nc::PipelineStage::GridMapping), "grid-mapping");
  EXPECT_TRUE(nc::is_manual(S::Reviewing));
  EXPECT_FALSE(nc::is_manual(S::Recognizing));
}
