// tests/test_layer3_repair/test_document_store.cpp
/**
 * @file test_document_store.cpp
 * @brief Scalar resolution, parsing, serialization and durable writes of scene documents.
 */

#include "sfx_repair.hpp"
#include "shared_test_helpers.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <cmath>
#include <limits>

namespace fs = std::filesystem;
using namespace scenefix::repair;
using namespace scenefix::tests::helper;
using scenefix::utils::Logger;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace
{

constexpr const char *kMovieNight = R"(- id: "1700000000001"
  name: Movie night
  icon: mdi:movie
  entities:
    light.sofa:
      state: "on"
      brightness: 120
      transition: 1.5
      effect: ~
      color_name: ''
      rgb_color: [255, 0, 0]
    media_player.tv:
      state: playing
      muted: off
)";

const AttributeValue &attr(const SceneRecord &rec, const std::string &entity,
                           const std::string &key)
{
    const AttributeMap *attrs = rec.find_entity(entity);
    if (attrs == nullptr)
        throw std::runtime_error("no entity " + entity);
    const AttributeValue *v = find_value(*attrs, key);
    if (v == nullptr)
        throw std::runtime_error("no attribute " + key);
    return *v;
}

} // namespace

// ============================================================================
// Plain scalar resolution
// ============================================================================

TEST(ScalarResolutionTest, NullsAndBooleans)
{
    for (const char *text : {"", "~", "null", "Null", "NULL"})
        EXPECT_TRUE(resolve_plain_scalar(text).is_null()) << text;

    EXPECT_EQ(resolve_plain_scalar("yes"), AttributeValue(true));
    EXPECT_EQ(resolve_plain_scalar("On"), AttributeValue(true));
    EXPECT_EQ(resolve_plain_scalar("TRUE"), AttributeValue(true));
    EXPECT_EQ(resolve_plain_scalar("off"), AttributeValue(false));
    EXPECT_EQ(resolve_plain_scalar("No"), AttributeValue(false));
    EXPECT_EQ(resolve_plain_scalar("oN"), AttributeValue("oN"));
}

TEST(ScalarResolutionTest, Numbers)
{
    EXPECT_EQ(resolve_plain_scalar("42"), AttributeValue(42));
    EXPECT_EQ(resolve_plain_scalar("-7"), AttributeValue(-7));
    EXPECT_EQ(resolve_plain_scalar("+3"), AttributeValue(3));
    EXPECT_EQ(resolve_plain_scalar("0"), AttributeValue(0));
    EXPECT_EQ(resolve_plain_scalar("1700000000001"), AttributeValue(int64_t{1700000000001}));
    EXPECT_EQ(resolve_plain_scalar("3.5"), AttributeValue(3.5));
    EXPECT_EQ(resolve_plain_scalar("-.5"), AttributeValue(-0.5));
    EXPECT_EQ(resolve_plain_scalar("2.5e+3"), AttributeValue(2500.0));
    EXPECT_EQ(resolve_plain_scalar(".inf"),
              AttributeValue(std::numeric_limits<double>::infinity()));
    EXPECT_EQ(resolve_plain_scalar("-.Inf"),
              AttributeValue(-std::numeric_limits<double>::infinity()));

    const AttributeValue nan = resolve_plain_scalar(".NaN");
    ASSERT_TRUE(std::holds_alternative<double>(nan.value));
    EXPECT_TRUE(std::isnan(std::get<double>(nan.value)));
}

TEST(ScalarResolutionTest, TextThatOnlyLooksNumericStaysText)
{
    EXPECT_EQ(resolve_plain_scalar("0123"), AttributeValue("0123"));
    EXPECT_EQ(resolve_plain_scalar("1e5"), AttributeValue("1e5"));
    EXPECT_EQ(resolve_plain_scalar("99999999999999999999"), AttributeValue("99999999999999999999"));
    EXPECT_EQ(resolve_plain_scalar("1.2.3"), AttributeValue("1.2.3"));
    EXPECT_EQ(resolve_plain_scalar("light.sofa"), AttributeValue("light.sofa"));
    EXPECT_EQ(resolve_plain_scalar("."), AttributeValue("."));
}

TEST(ScalarResolutionTest, NeedsQuotingExactlyWhenTypeWouldChange)
{
    for (const char *text : {"", "on", "No", "123", "-4", "1.5", "null", "~", ".inf"})
        EXPECT_TRUE(needs_quoting(text)) << text;
    for (const char *text : {"hello", "Movie night", "light.sofa", "0123", "mdi:movie"})
        EXPECT_FALSE(needs_quoting(text)) << text;
}

TEST(ScalarResolutionTest, FormatFloatAlwaysReadsBackAsFloat)
{
    EXPECT_EQ(format_float(1.0), "1.0");
    EXPECT_EQ(format_float(2.5), "2.5");
    EXPECT_EQ(format_float(-3.0), "-3.0");
    EXPECT_EQ(format_float(std::numeric_limits<double>::infinity()), ".inf");
    EXPECT_EQ(format_float(-std::numeric_limits<double>::infinity()), "-.inf");
    EXPECT_EQ(format_float(std::numeric_limits<double>::quiet_NaN()), ".nan");

    for (double v : {1.0, 0.1, 1e20, 1.5e-7, -42.0, 123456.789})
    {
        const AttributeValue back = resolve_plain_scalar(format_float(v));
        EXPECT_EQ(back, AttributeValue(v)) << format_float(v);
    }
}

// ============================================================================
// Parsing
// ============================================================================

TEST(DocumentParseTest, ReadsTypedValuesInDocumentOrder)
{
    auto parsed = DocumentStore::parse(kMovieNight);
    ASSERT_TRUE(parsed.is_ok()) << parsed.detail();
    const SceneDocument &doc = parsed.content();
    ASSERT_EQ(doc.size(), 1u);

    const SceneRecord &rec = doc[0];
    EXPECT_EQ(rec.id, "1700000000001");
    EXPECT_FALSE(rec.id_plain_literal);
    EXPECT_EQ(rec.name, "Movie night");
    EXPECT_THAT(rec.key_order, ElementsAre("id", "name", "icon", "entities"));
    ASSERT_EQ(rec.extra.size(), 1u);
    EXPECT_EQ(rec.extra[0].first, "icon");
    EXPECT_EQ(rec.extra[0].second, AttributeValue("mdi:movie"));

    ASSERT_EQ(rec.entities.size(), 2u);
    EXPECT_EQ(rec.entities[0].first, "light.sofa");
    EXPECT_EQ(rec.entities[1].first, "media_player.tv");

    EXPECT_EQ(attr(rec, "light.sofa", "state"), AttributeValue("on"));
    EXPECT_EQ(attr(rec, "light.sofa", "brightness"), AttributeValue(120));
    EXPECT_EQ(attr(rec, "light.sofa", "transition"), AttributeValue(1.5));
    EXPECT_TRUE(attr(rec, "light.sofa", "effect").is_null());
    EXPECT_EQ(attr(rec, "light.sofa", "color_name"), AttributeValue(""));
    EXPECT_EQ(attr(rec, "light.sofa", "rgb_color"), AttributeValue(AttributeList{255, 0, 0}));
    EXPECT_EQ(attr(rec, "media_player.tv", "muted"), AttributeValue(false));
}

TEST(DocumentParseTest, PlainNumericIdIsKeptAsText)
{
    auto parsed = DocumentStore::parse("- id: 1700000000001\n  name: yes\n  entities: {}\n");
    ASSERT_TRUE(parsed.is_ok()) << parsed.detail();
    const SceneRecord &rec = parsed.content()[0];
    EXPECT_EQ(rec.id, "1700000000001");
    EXPECT_TRUE(rec.id_plain_literal);
    EXPECT_EQ(rec.name, "yes");
    EXPECT_TRUE(rec.name_plain_literal);

    const std::string text = DocumentStore::serialize(parsed.content());
    EXPECT_THAT(text, HasSubstr("id: 1700000000001"));
    EXPECT_THAT(text, HasSubstr("name: yes"));
}

TEST(DocumentParseTest, MissingKeysAreRecordedNotInvented)
{
    auto parsed = DocumentStore::parse("- entities:\n    light.a:\n      state: 'off'\n");
    ASSERT_TRUE(parsed.is_ok()) << parsed.detail();
    const SceneRecord &rec = parsed.content()[0];
    EXPECT_FALSE(rec.has_id);
    EXPECT_FALSE(rec.has_name);
    EXPECT_TRUE(rec.has_entities);
    EXPECT_EQ(rec.id, "");
    EXPECT_EQ(rec.display_name(), "Unknown");

    const std::string text = DocumentStore::serialize(parsed.content());
    EXPECT_THAT(text, ::testing::Not(HasSubstr("id:")));
    EXPECT_THAT(text, ::testing::Not(HasSubstr("name:")));
}

TEST(DocumentParseTest, NullEntitiesAndNullAttributeMapsLoadEmpty)
{
    auto parsed = DocumentStore::parse("- id: a\n  entities:\n- id: b\n  entities:\n    light.a:\n");
    ASSERT_TRUE(parsed.is_ok()) << parsed.detail();
    const SceneDocument &doc = parsed.content();
    ASSERT_EQ(doc.size(), 2u);
    EXPECT_TRUE(doc[0].has_entities);
    EXPECT_TRUE(doc[0].entities.empty());
    ASSERT_EQ(doc[1].entities.size(), 1u);
    EXPECT_TRUE(doc[1].entities[0].second.empty());
}

TEST(DocumentParseTest, EmptyTextIsAnEmptyDocument)
{
    auto parsed = DocumentStore::parse("");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(parsed.content().empty());

    auto listed = DocumentStore::parse("[]\n");
    ASSERT_TRUE(listed.is_ok());
    EXPECT_TRUE(listed.content().empty());
}

TEST(DocumentParseTest, ExplicitStringTagIsAccepted)
{
    auto parsed = DocumentStore::parse("- id: !!str 42\n  entities:\n    light.a:\n      level: !!str 7\n");
    ASSERT_TRUE(parsed.is_ok()) << parsed.detail();
    const SceneRecord &rec = parsed.content()[0];
    EXPECT_EQ(rec.id, "42");
    EXPECT_FALSE(rec.id_plain_literal);
    EXPECT_EQ(attr(rec, "light.a", "level"), AttributeValue("7"));
}

TEST(DocumentParseTest, MalformedDocumentsAreParseErrors)
{
    const char *bad[] = {
        "- id: [unclosed\n",
        "id: not-a-list\n",
        "- just a string\n",
        "- id: a\n  id: b\n",
        "- id: a\n  entities: [light.a]\n",
        "- id: a\n  entities:\n    light.a: 5\n",
        "- id: a\n  entities:\n    light.a:\n      level: !custom 7\n",
        "- id: [1, 2]\n",
    };
    for (const char *text : bad)
    {
        auto parsed = DocumentStore::parse(text);
        ASSERT_TRUE(parsed.is_error()) << text;
        EXPECT_EQ(parsed.error(), RepairErrc::Parse) << text;
        EXPECT_FALSE(parsed.detail().empty()) << text;
    }
}

// ============================================================================
// Serialization
// ============================================================================

TEST(DocumentSerializeTest, TypeAmbiguousStringsSurviveRoundTrip)
{
    SceneRecord rec;
    rec.id = "123";
    rec.name = "on";
    rec.entities = {
        {"light.a",
         {{"state", "on"},
          {"level", "007"},
          {"blank", ""},
          {"text_null", "null"},
          {"number_text", "1.5"},
          {"colon", "a: b"},
          {"hash", "#ff0000"},
          {"multi", "first\nsecond"},
          {"real_null", nullptr},
          {"big", int64_t{-9000000000}},
          {"nan", std::numeric_limits<double>::quiet_NaN()},
          {"inf", std::numeric_limits<double>::infinity()},
          {"whole", 2.0},
          {"nested", AttributeMapping{{"xy", AttributeList{0.5, 0.25}}, {"flag", true}}}}},
        {"switch.empty", {}},
    };
    rec.extra = {{"icon", "mdi:sofa"}, {"metadata", AttributeMapping{}}};
    const SceneDocument doc{rec};

    const std::string text = DocumentStore::serialize(doc);
    auto back = DocumentStore::parse(text);
    ASSERT_TRUE(back.is_ok()) << back.detail() << "\n" << text;
    EXPECT_EQ(back.content(), doc) << text;
}

TEST(DocumentSerializeTest, LoadedKeyOrderIsPreserved)
{
    const std::string input = "- name: Reading\n  entities: {}\n  icon: mdi:book\n  id: r1\n";
    auto parsed = DocumentStore::parse(input);
    ASSERT_TRUE(parsed.is_ok()) << parsed.detail();

    const std::string text = DocumentStore::serialize(parsed.content());
    const auto name_pos = text.find("name:");
    const auto entities_pos = text.find("entities:");
    const auto icon_pos = text.find("icon:");
    const auto id_pos = text.find("id: r1");
    ASSERT_NE(id_pos, std::string::npos) << text;
    EXPECT_LT(name_pos, entities_pos);
    EXPECT_LT(entities_pos, icon_pos);
    EXPECT_LT(icon_pos, id_pos);
}

TEST(DocumentSerializeTest, OutputEndsWithNewline)
{
    SceneRecord rec;
    rec.id = "a";
    rec.name = "A";
    const std::string text = DocumentStore::serialize(SceneDocument{rec});
    ASSERT_FALSE(text.empty());
    EXPECT_EQ(text.back(), '\n');
}

// ============================================================================
// Load / write
// ============================================================================

class DocumentStoreTest : public ::testing::Test
{
  protected:
    TempDir dir_{"scenefix_store"};
    Logger logger_;
    DocumentStore store_{logger_};
};

TEST_F(DocumentStoreTest, LoadMissingFileIsNotFound)
{
    auto loaded = store_.load(dir_ / "scenes.yaml");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error(), RepairErrc::NotFound);
}

TEST_F(DocumentStoreTest, LoadDirectoryIsIo)
{
    auto loaded = store_.load(dir_.path());
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error(), RepairErrc::Io);
}

TEST_F(DocumentStoreTest, LoadReportsParseErrorsWithPath)
{
    const auto path = dir_ / "scenes.yaml";
    ASSERT_TRUE(write_file_contents(path, "- id: [broken\n"));
    auto loaded = store_.load(path);
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error(), RepairErrc::Parse);
    EXPECT_THAT(loaded.detail(), HasSubstr(path.string()));
}

TEST_F(DocumentStoreTest, WriteThenLoadGivesSameDocument)
{
    const auto path = dir_ / "scenes.yaml";
    ASSERT_TRUE(write_file_contents(path, kMovieNight));
    auto loaded = store_.load(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.detail();

    auto written = store_.write(path, loaded.content());
    ASSERT_TRUE(written.is_ok()) << written.detail();
    EXPECT_THAT(dir_.file_names(), ElementsAre("scenes.yaml"));

    auto reloaded = store_.load(path);
    ASSERT_TRUE(reloaded.is_ok()) << reloaded.detail();
    EXPECT_EQ(reloaded.content(), loaded.content());
}

TEST_F(DocumentStoreTest, WriteIntoMissingDirectoryIsIo)
{
    SceneRecord rec;
    rec.id = "a";
    auto written = store_.write(dir_ / "missing" / "scenes.yaml", SceneDocument{rec});
    ASSERT_TRUE(written.is_error());
    EXPECT_EQ(written.error(), RepairErrc::Io);
    EXPECT_NE(written.error_code(), 0);
}
