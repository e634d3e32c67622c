#include <gtest/gtest.h>

#include "poz/core/action_selector.hpp"
#include "test_helpers.hpp"

using namespace poz::core;
using namespace poz::test;
using poz::ErrorCode;

class ActionSelectorTest : public ::testing::Test {
protected:
  poz::config::Config basic_ = makeConfig(false);
  poz::config::Config advanced_ = makeConfig(true);
};

TEST_F(ActionSelectorTest, NoFlagsCreatesNote) {
  auto action = ActionSelector::select(ActionFlags{}, basic_);
  ASSERT_OK(action);
  EXPECT_TRUE(std::holds_alternative<CreateNote>(*action));
}

TEST_F(ActionSelectorTest, ClipboardFlagPostsFromClipboard) {
  ActionFlags flags;
  flags.clipboard = true;
  auto action = ActionSelector::select(flags, basic_);
  ASSERT_OK(action);
  EXPECT_TRUE(std::holds_alternative<PostFromClipboard>(*action));
}

TEST_F(ActionSelectorTest, BurnIsNotAdvanced) {
  ActionFlags flags;
  flags.burn = true;
  flags.clipboard = true;
  auto action = ActionSelector::select(flags, basic_);
  ASSERT_OK(action);
  EXPECT_TRUE(std::holds_alternative<Burn>(*action));
}

TEST_F(ActionSelectorTest, AdvancedActionsRequireCapability) {
  ActionFlags last;
  last.last = true;
  ActionFlags search;
  search.search = "foo";
  ActionFlags update;
  update.update_id = "42";
  ActionFlags remove;
  remove.delete_id = "42";

  for (const auto& flags : {last, search, update, remove}) {
    EXPECT_ERROR(ActionSelector::select(flags, basic_), ErrorCode::kAdvancedFeaturesDisabled);
    EXPECT_OK(ActionSelector::select(flags, advanced_));
  }
}

TEST_F(ActionSelectorTest, DisabledMessageNamesConfigFile) {
  ActionFlags flags;
  flags.last = true;
  auto action = ActionSelector::select(flags, basic_);
  ASSERT_FALSE(action.has_value());
  EXPECT_EQ(action.error().message(), "Advanced features are disabled in /home/alice/.poznote.conf");
}

TEST_F(ActionSelectorTest, PriorityOrder) {
  ActionFlags flags;
  flags.clipboard = true;
  flags.last = true;
  flags.search = "foo";
  flags.update_id = "1";
  flags.delete_id = "2";
  flags.burn = true;

  auto pick = [&]() { return ActionSelector::select(flags, advanced_).value(); };

  EXPECT_EQ(pick(), Action(Burn{}));
  flags.burn = false;
  EXPECT_EQ(pick(), Action(Delete{"2"}));
  flags.delete_id.reset();
  EXPECT_EQ(pick(), Action(Update{"1"}));
  flags.update_id.reset();
  EXPECT_EQ(pick(), Action(Search{"foo"}));
  flags.search.reset();
  EXPECT_EQ(pick(), Action(ListLast{}));
  flags.last = false;
  EXPECT_EQ(pick(), Action(PostFromClipboard{}));
  flags.clipboard = false;
  EXPECT_EQ(pick(), Action(CreateNote{}));
}

TEST_F(ActionSelectorTest, BurnWinsEvenWhenAdvancedFlagIsDisabled) {
  ActionFlags flags;
  flags.burn = true;
  flags.delete_id = "5";
  auto action = ActionSelector::select(flags, basic_);
  ASSERT_OK(action);
  EXPECT_TRUE(std::holds_alternative<Burn>(*action));
}

TEST_F(ActionSelectorTest, RejectsNonNumericNoteIds) {
  ActionFlags flags;
  flags.delete_id = "../etc";
  EXPECT_ERROR(ActionSelector::select(flags, advanced_), ErrorCode::kInvalidArgument);

  flags.delete_id.reset();
  flags.update_id = "";
  EXPECT_ERROR(ActionSelector::select(flags, advanced_), ErrorCode::kInvalidArgument);
}

TEST_F(ActionSelectorTest, RejectsEmptySearch) {
  ActionFlags flags;
  flags.search = "";
  EXPECT_ERROR(ActionSelector::select(flags, advanced_), ErrorCode::kInvalidArgument);
}

TEST(ActionTest, BodyRequirements) {
  EXPECT_TRUE(requiresBody(CreateNote{}));
  EXPECT_TRUE(requiresBody(PostFromClipboard{}));
  EXPECT_TRUE(requiresBody(Burn{}));
  EXPECT_TRUE(requiresBody(Update{"1"}));
  EXPECT_FALSE(requiresBody(ListLast{}));
  EXPECT_FALSE(requiresBody(Search{"q"}));
  EXPECT_FALSE(requiresBody(Delete{"1"}));
}

TEST(ActionTest, AdvancedSet) {
  EXPECT_FALSE(isAdvanced(CreateNote{}));
  EXPECT_FALSE(isAdvanced(PostFromClipboard{}));
  EXPECT_FALSE(isAdvanced(Burn{}));
  EXPECT_TRUE(isAdvanced(ListLast{}));
  EXPECT_TRUE(isAdvanced(Search{"q"}));
  EXPECT_TRUE(isAdvanced(Update{"1"}));
  EXPECT_TRUE(isAdvanced(Delete{"1"}));
}
