#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <type_traits>
#include <unordered_map>

#include "sgc/foundation/error_code.hpp"
#include "sgc/foundation/game_error.hpp"
#include "sgc/foundation/game_result.hpp"
#include "sgc/foundation/types.hpp"

using namespace sgc::foundation;

// ═══════════════════════════════════════════════════════════════════════════
// ErrorCode
// ═══════════════════════════════════════════════════════════════════════════

TEST(ErrorCodeTest, HighByteNamesSubsystem) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidConfigValue), "Rules");
    EXPECT_EQ(errorSubsystem(ErrorCode::ScriptParseFailed), "Replay");
    EXPECT_EQ(errorSubsystem(ErrorCode::UnknownAction), "Replay");
    EXPECT_EQ(errorSubsystem(static_cast<ErrorCode>(0x4200)), "Unknown");
}

// ═══════════════════════════════════════════════════════════════════════════
// GameError
// ═══════════════════════════════════════════════════════════════════════════

TEST(GameErrorTest, DefaultIsUnknownWithoutContext) {
    GameError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
    EXPECT_FALSE(err.isSuccess());
    EXPECT_TRUE(GameError(ErrorCode::Success).isSuccess());
}

TEST(GameErrorTest, ContextKeepsOffendingValue) {
    GameError badKey(ErrorCode::ConfigTypeMismatch, "wrong value type for minion.health",
                     std::string("minion.health"));
    ASSERT_NE(badKey.context<std::string>(), nullptr);
    EXPECT_EQ(*badKey.context<std::string>(), "minion.health");
    EXPECT_EQ(badKey.context<int>(), nullptr);

    GameError badStep(ErrorCode::UnknownAction, "unknown action 'jump'", std::size_t{3});
    ASSERT_NE(badStep.context<std::size_t>(), nullptr);
    EXPECT_EQ(*badStep.context<std::size_t>(), 3u);
    EXPECT_EQ(badStep.subsystem(), "Replay");
}

TEST(GameErrorTest, DescribeJoinsSubsystemCodeAndMessage) {
    EXPECT_EQ(GameError(ErrorCode::UnknownAction, "unknown action 'jump'").describe(),
              "Replay 0x0401: unknown action 'jump'");
    EXPECT_EQ(GameError(ErrorCode::ConfigLoadFailed, "cannot open rules file x.yaml").describe(),
              "Config 0x0100: cannot open rules file x.yaml");
    EXPECT_EQ(GameError(ErrorCode::LoggerFlushFailed).describe(), "Logger 0x0202");
}

// ═══════════════════════════════════════════════════════════════════════════
// GameResult
// ═══════════════════════════════════════════════════════════════════════════

TEST(GameResultTest, CarriesValueOrGameError) {
    auto size = GameResult<int32_t>::ok(20);
    ASSERT_TRUE(size);
    EXPECT_EQ(size.value(), 20);

    auto rejected = GameResult<int32_t>::err(
        GameError(ErrorCode::InvalidConfigValue, "grid.size must be positive"));
    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().subsystem(), "Rules");
}

TEST(GameResultTest, VoidForm) {
    EXPECT_TRUE(GameResult<void>::ok().hasValue());
    auto failed = GameResult<void>::err(GameError(ErrorCode::ConfigLoadFailed, "no file"));
    EXPECT_EQ(failed.error().code(), ErrorCode::ConfigLoadFailed);
}

// ═══════════════════════════════════════════════════════════════════════════
// StrongId
// ═══════════════════════════════════════════════════════════════════════════

TEST(StrongIdTest, ZeroIsInvalid) {
    EXPECT_FALSE(EnemyId().isValid());
    EXPECT_EQ(EnemyId().value(), 0u);
    EXPECT_TRUE(EnemyId(100).isValid());
}

TEST(StrongIdTest, ComparesByValue) {
    ItemId a(1), b(1), c(2);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_LT(a, c);
}

TEST(StrongIdTest, TagsKeepIdKindsApart) {
    static_assert(!std::is_same_v<EnemyId, MinionId>);
    static_assert(!std::is_same_v<MinionId, ItemId>);
    static_assert(!std::is_convertible_v<EnemyId, MinionId>);
    EXPECT_EQ(EnemyId(7).value(), MinionId(7).value());
}

TEST(StrongIdTest, UsableAsHashKey) {
    std::unordered_map<EnemyId, std::string> names;
    names[EnemyId(101)] = "ogre";
    EXPECT_EQ(names.at(EnemyId(101)), "ogre");
    EXPECT_EQ(names.count(EnemyId(102)), 0u);
}
