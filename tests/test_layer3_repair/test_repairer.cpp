// tests/test_layer3_repair/test_repairer.cpp
/**
 * @file test_repairer.cpp
 * @brief Duplicate-id renaming and empty-attribute stripping.
 */

#include "sfx_repair.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <chrono>
#include <set>

using namespace scenefix::repair;
using ::testing::ElementsAre;

namespace
{

SceneRecord scene(std::string id, std::string name, EntityMap entities = {})
{
    SceneRecord rec;
    rec.id = std::move(id);
    rec.name = std::move(name);
    rec.entities = std::move(entities);
    return rec;
}

std::vector<std::string> ids_of(const SceneDocument &doc)
{
    std::vector<std::string> ids;
    for (const auto &rec : doc)
        ids.push_back(rec.id);
    return ids;
}

Repairer fixed_clock(int64_t value)
{
    return Repairer([value] { return value; });
}

} // namespace

TEST(RepairerTest, LaterHoldersOfAnIdAreRenamed)
{
    const SceneDocument doc{scene("x", "first"), scene("y", "other"), scene("x", "second"),
                            scene("x", "third")};
    const SceneDocument fixed = fixed_clock(1000).resolve_duplicate_ids(doc);

    EXPECT_THAT(ids_of(fixed), ElementsAre("x", "y", "x_1000", "x_1001"));
    EXPECT_EQ(fixed[2].name, "second");
    EXPECT_TRUE(find_duplicate_ids(fixed).empty());
}

TEST(RepairerTest, CandidateCollidingWithExistingIdIsSkipped)
{
    const SceneDocument doc{scene("x", "a"), scene("x_1000", "b"), scene("x", "c")};
    const SceneDocument fixed = fixed_clock(1000).resolve_duplicate_ids(doc);
    EXPECT_THAT(ids_of(fixed), ElementsAre("x", "x_1000", "x_1001"));
}

TEST(RepairerTest, ClockIsReadOncePerPass)
{
    int calls = 0;
    Repairer repairer(
        [&calls]
        {
            ++calls;
            return int64_t{7};
        });
    const SceneDocument doc{scene("a", "1"), scene("a", "2"), scene("b", "3"), scene("b", "4")};
    const SceneDocument fixed = repairer.resolve_duplicate_ids(doc);
    EXPECT_EQ(calls, 1);
    EXPECT_THAT(ids_of(fixed), ElementsAre("a", "a_7", "b", "b_7"));
}

TEST(RepairerTest, RenamedPlainLiteralIdIsWrittenAsText)
{
    SceneRecord a = scene("1700000000001", "a");
    a.id_plain_literal = true;
    SceneRecord b = a;
    b.name = "b";
    const SceneDocument fixed = fixed_clock(5).resolve_duplicate_ids(SceneDocument{a, b});
    EXPECT_TRUE(fixed[0].id_plain_literal);
    EXPECT_FALSE(fixed[1].id_plain_literal);
    EXPECT_EQ(fixed[1].id, "1700000000001_5");
}

TEST(RepairerTest, MissingIdsGetAnIdWhenRenamed)
{
    SceneRecord a = scene("", "no id");
    a.has_id = false;
    SceneRecord b = a;
    const SceneDocument fixed = fixed_clock(3).resolve_duplicate_ids(SceneDocument{a, b});
    EXPECT_FALSE(fixed[0].has_id);
    EXPECT_TRUE(fixed[1].has_id);
    EXPECT_EQ(fixed[1].id, "_3");
}

TEST(RepairerTest, DuplicateRepairIsIdempotentAndLeavesInputAlone)
{
    const SceneDocument doc{scene("x", "a"), scene("x", "b")};
    const SceneDocument copy = doc;
    const Repairer repairer = fixed_clock(42);

    const SceneDocument once = repairer.resolve_duplicate_ids(doc);
    EXPECT_EQ(doc, copy);
    EXPECT_EQ(repairer.resolve_duplicate_ids(once), once);
}

TEST(RepairerTest, DefaultClockProducesUniqueIds)
{
    const SceneDocument doc{scene("x", "a"), scene("x", "b"), scene("x", "c")};
    const SceneDocument fixed = Repairer{}.resolve_duplicate_ids(doc);
    const auto ids = ids_of(fixed);
    EXPECT_EQ(std::set<std::string>(ids.begin(), ids.end()).size(), 3u);
    EXPECT_EQ(fixed[0].id, "x");
}

TEST(RepairerTest, DefaultClockCountsMilliseconds)
{
    const auto before = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    const SceneDocument fixed =
        Repairer{}.resolve_duplicate_ids(SceneDocument{scene("x", "a"), scene("x", "b")});
    ASSERT_EQ(fixed[1].id.rfind("x_", 0), 0u) << fixed[1].id;
    EXPECT_GE(std::stoll(fixed[1].id.substr(2)), before);
}

TEST(RepairerTest, StripRemovesOnlyPlaceholdersAndKeepsEntities)
{
    const SceneDocument doc{scene("a", "A",
                                  {{"light.a", {{"state", "on"}, {"effect", nullptr}, {"color", ""}}},
                                   {"light.b", {{"effect", nullptr}}},
                                   {"light.c", {{"brightness", 0}, {"flag", false}}}})};
    const SceneDocument stripped = Repairer::strip_empty_attributes(doc);

    ASSERT_EQ(stripped[0].entities.size(), 3u);
    const auto &a = stripped[0].entities[0].second;
    ASSERT_EQ(a.size(), 1u);
    EXPECT_EQ(a[0].first, "state");
    EXPECT_TRUE(stripped[0].entities[1].second.empty());
    EXPECT_EQ(stripped[0].entities[2].second.size(), 2u);

    EXPECT_TRUE(find_empty_attributes(stripped).empty());
    EXPECT_EQ(Repairer::strip_empty_attributes(stripped), stripped);
    EXPECT_EQ(count_empty_attributes(doc[0]), 3u);
}

TEST(RepairerTest, RepairDispatchesOnDefectClass)
{
    const SceneDocument doc{scene("x", "a", {{"light.a", {{"effect", nullptr}}}}),
                            scene("x", "b")};
    const Repairer repairer = fixed_clock(9);

    const SceneDocument ids_fixed = repairer.repair(doc, DefectClass::DuplicateIds);
    EXPECT_THAT(ids_of(ids_fixed), ElementsAre("x", "x_9"));
    EXPECT_EQ(count_empty_attributes(ids_fixed[0]), 1u);

    const SceneDocument attrs_fixed = repairer.repair(doc, DefectClass::EmptyAttributes);
    EXPECT_THAT(ids_of(attrs_fixed), ElementsAre("x", "x"));
    EXPECT_EQ(count_empty_attributes(attrs_fixed[0]), 0u);
}

TEST(RepairerDeathTest, InvalidDefectClassPanics)
{
    const Repairer repairer;
    EXPECT_DEATH((void)repairer.repair(SceneDocument{}, static_cast<DefectClass>(7)),
                 ::testing::AllOf(::testing::HasSubstr("invalid DefectClass 7"),
                                  ::testing::HasSubstr("Stack Trace")));
}
