/**
 * @file json_helpers_test.cpp
 * @brief Tests for JSON helpers.
 */

#include "core/json_helpers.h"

#include <gtest/gtest.h>

#include <limits>
#include <sstream>

namespace dynamix {
namespace json {
namespace {

// ============================================================================
// escape() tests
// ============================================================================

TEST(JsonEscapeTest, PlainString) {
  EXPECT_EQ(escape("track01"), "track01");
  EXPECT_EQ(escape(""), "");
}

TEST(JsonEscapeTest, QuoteAndBackslash) {
  EXPECT_EQ(escape("say \"hi\""), "say \\\"hi\\\"");
  EXPECT_EQ(escape("C:\\music\\a.json"), "C:\\\\music\\\\a.json");
}

TEST(JsonEscapeTest, ControlCharacters) {
  EXPECT_EQ(escape("line1\nline2"), "line1\\nline2");
  EXPECT_EQ(escape("a\tb\r"), "a\\tb\\r");
}

// ============================================================================
// Writer tests
// ============================================================================

TEST(JsonWriterTest, EmptyObjectAndArray) {
  std::ostringstream obj;
  Writer w1(obj);
  w1.beginObject().endObject();
  EXPECT_EQ(obj.str(), "{}");

  std::ostringstream arr;
  Writer w2(arr);
  w2.beginArray().endArray();
  EXPECT_EQ(arr.str(), "[]");
}

TEST(JsonWriterTest, ObjectWithAllTypes) {
  std::ostringstream oss;
  Writer w(oss);
  w.beginObject()
      .write("id", "a.json")
      .write("count", 42)
      .write("tempo", 128.5)
      .write("ok", true)
      .write("label", std::string("Intro"))
      .endObject();
  EXPECT_EQ(oss.str(), R"({"id":"a.json","count":42,"tempo":128.5,"ok":true,"label":"Intro"})");
}

TEST(JsonWriterTest, NestedObjectAndArray) {
  std::ostringstream oss;
  Writer w(oss);
  w.beginObject()
      .beginObject("tempo")
      .write("bpm", 120)
      .endObject()
      .beginArray("drops")
      .value(61.5)
      .value(122)
      .endArray()
      .endObject();
  EXPECT_EQ(oss.str(), R"({"tempo":{"bpm":120},"drops":[61.5,122]})");
}

TEST(JsonWriterTest, ArrayOfObjects) {
  std::ostringstream oss;
  Writer w(oss);
  w.beginArray();
  w.beginObject().write("t", 1).endObject();
  w.beginObject().write("t", 2).endObject();
  w.endArray();
  EXPECT_EQ(oss.str(), R"([{"t":1},{"t":2}])");
}

TEST(JsonWriterTest, NonFiniteWrittenAsNull) {
  std::ostringstream oss;
  Writer w(oss);
  w.beginObject()
      .write("inf", std::numeric_limits<double>::infinity())
      .write("nan", std::numeric_limits<double>::quiet_NaN())
      .endObject();
  EXPECT_EQ(oss.str(), R"({"inf":null,"nan":null})");
}

TEST(JsonWriterTest, StringEscaping) {
  std::ostringstream oss;
  Writer w(oss);
  w.beginObject().write("label", "Verse \"A\"").endObject();
  EXPECT_EQ(oss.str(), R"({"label":"Verse \"A\""})");
}

TEST(JsonWriterPrettyTest, NestedObject) {
  std::ostringstream oss;
  Writer w(oss, true);
  w.beginObject()
      .write("id", "x")
      .beginObject("key")
      .write("name", "A minor")
      .endObject()
      .endObject();

  std::string expected = R"({
  "id": "x",
  "key": {
    "name": "A minor"
  }
})";
  EXPECT_EQ(oss.str(), expected);
}

TEST(JsonWriterPrettyTest, ArrayInObject) {
  std::ostringstream oss;
  Writer w(oss, true);
  w.beginObject().beginArray("times").value(1).value(2).endArray().endObject();

  std::string expected = R"({
  "times": [
    1,
    2
  ]
})";
  EXPECT_EQ(oss.str(), expected);
}

TEST(JsonScopeTest, NestedScopes) {
  std::ostringstream oss;
  Writer w(oss);
  {
    ObjectScope obj(w);
    w.write("id", "t");
    {
      ArrayScope arr(w, "beats");
      w.value(0.5).value(1);
    }
  }
  EXPECT_EQ(oss.str(), R"({"id":"t","beats":[0.5,1]})");
}

// ============================================================================
// Parser tests
// ============================================================================

TEST(JsonParserTest, EmptyObject) {
  Parser p("{}");
  EXPECT_TRUE(p.valid());
  EXPECT_FALSE(p.has("anything"));
}

TEST(JsonParserTest, ScalarValues) {
  Parser p(R"({"id":"track","count":42,"enabled":true,"tempo":127.5,"neg":-3})");
  EXPECT_TRUE(p.valid());
  EXPECT_EQ(p.getString("id"), "track");
  EXPECT_EQ(p.getInt("count"), 42);
  EXPECT_EQ(p.getUint("count"), 42u);
  EXPECT_TRUE(p.getBool("enabled"));
  EXPECT_DOUBLE_EQ(p.getDouble("tempo"), 127.5);
  EXPECT_EQ(p.getInt("neg"), -3);
}

TEST(JsonParserTest, DefaultValues) {
  Parser p("{}");
  EXPECT_EQ(p.getInt("missing", 99), 99);
  EXPECT_EQ(p.getUint("missing", 7u), 7u);
  EXPECT_TRUE(p.getBool("missing", true));
  EXPECT_EQ(p.getString("missing", "fallback"), "fallback");
  EXPECT_DOUBLE_EQ(p.getDouble("missing", 0.7), 0.7);
}

TEST(JsonParserTest, StringWithEscapes) {
  Parser p(R"({"text":"say \"hi\"\nbye"})");
  EXPECT_EQ(p.getString("text"), "say \"hi\"\nbye");
}

TEST(JsonParserTest, UnicodeEscapesDecodeToUtf8) {
  Parser p("{\"a\":\"Caf\\u00e9\",\"b\":\"\\u20AC5\",\"c\":\"\\ud83c\\udfb5\","
           "\"d\":\"\\u0041\"}");
  EXPECT_EQ(p.getString("a"), "Caf\xC3\xA9");
  EXPECT_EQ(p.getString("b"), "\xE2\x82\xAC" "5");
  EXPECT_EQ(p.getString("c"), "\xF0\x9F\x8E\xB5");
  EXPECT_EQ(p.getString("d"), "A");
}

TEST(JsonParserTest, MalformedUnicodeEscape) {
  Parser p("{\"lone\":\"x\\ud83cy\",\"bad\":\"\\uZZ\"}");
  EXPECT_EQ(p.getString("lone"), "x\xEF\xBF\xBDy");
  EXPECT_EQ(p.getString("bad"), "\xEF\xBF\xBDZZ");
}

TEST(JsonParserTest, KindQueries) {
  Parser p(R"({"n":1.5,"s":"x","o":{"a":1},"a":[1,2]})");
  EXPECT_TRUE(p.isNumber("n"));
  EXPECT_FALSE(p.isNumber("s"));
  EXPECT_TRUE(p.isObject("o"));
  EXPECT_FALSE(p.isObject("a"));
  EXPECT_TRUE(p.isArray("a"));
  EXPECT_FALSE(p.isArray("o"));
  EXPECT_FALSE(p.isNumber("missing"));
}

TEST(JsonParserTest, NestedObject) {
  Parser p(R"({"tempo": {"bpm": 128, "confidence": 0.9}, "after": 1})");
  Parser tempo = p.getObject("tempo");
  EXPECT_TRUE(tempo.valid());
  EXPECT_DOUBLE_EQ(tempo.getDouble("bpm"), 128.0);
  EXPECT_DOUBLE_EQ(tempo.getDouble("confidence"), 0.9);
  EXPECT_EQ(p.getInt("after"), 1);
}

TEST(JsonParserTest, MissingObjectIsEmpty) {
  Parser p(R"({"x":1})");
  Parser missing = p.getObject("tempo");
  EXPECT_TRUE(missing.valid());
  EXPECT_FALSE(missing.has("bpm"));
}

TEST(JsonParserTest, NumberArray) {
  Parser p(R"({"times": [0.0, 0.5, 1.25, -2e1], "empty": []})");
  std::vector<double> times;
  ASSERT_TRUE(p.getNumberArray("times", times));
  ASSERT_EQ(times.size(), 4u);
  EXPECT_DOUBLE_EQ(times[0], 0.0);
  EXPECT_DOUBLE_EQ(times[2], 1.25);
  EXPECT_DOUBLE_EQ(times[3], -20.0);

  std::vector<double> empty;
  EXPECT_TRUE(p.getNumberArray("empty", empty));
  EXPECT_TRUE(empty.empty());
}

TEST(JsonParserTest, NumberArrayRejectsNonNumbers) {
  Parser p(R"({"mixed": [1, "two", 3], "scalar": 4})");
  std::vector<double> out;
  EXPECT_FALSE(p.getNumberArray("mixed", out));
  EXPECT_FALSE(p.getNumberArray("scalar", out));
  EXPECT_FALSE(p.getNumberArray("missing", out));
}

TEST(JsonParserTest, ObjectArray) {
  Parser p(R"({"sections": [{"label": "Intro", "start": 0, "end": 16},
                            {"label": "Drop, main", "start": 16, "end": 48}]})");
  std::vector<Parser> sections;
  ASSERT_TRUE(p.getObjectArray("sections", sections));
  ASSERT_EQ(sections.size(), 2u);
  EXPECT_EQ(sections[0].getString("label"), "Intro");
  EXPECT_EQ(sections[1].getString("label"), "Drop, main");
  EXPECT_DOUBLE_EQ(sections[1].getDouble("end"), 48.0);
}

TEST(JsonParserTest, ObjectArrayRejectsScalars) {
  Parser p(R"({"sections": [1, 2]})");
  std::vector<Parser> out;
  EXPECT_FALSE(p.getObjectArray("sections", out));
}

TEST(JsonParserTest, InvalidJson) {
  Parser p1("not json");
  EXPECT_FALSE(p1.valid());
  EXPECT_FALSE(p1.has("key"));

  Parser p2("{broken");
  EXPECT_FALSE(p2.valid());

  Parser p3("");
  EXPECT_FALSE(p3.valid());
}

// ============================================================================
// Visitor tests
// ============================================================================

enum class Mode : uint8_t { A, B, C };

struct Sample {
  uint32_t count = 1;
  bool flag = false;
  double ratio = 0.5;
  Mode mode = Mode::A;

  template <typename Self, typename V>
  static void visitFields(Self&& self, V&& v) {
    v("count", self.count);
    v("flag", self.flag);
    v("ratio", self.ratio);
    v("mode", self.mode);
  }

  void writeTo(Writer& w) const {
    WriteVisitor v{w};
    visitFields(*this, v);
  }

  void readFrom(const Parser& p) {
    ReadVisitor v{p};
    visitFields(*this, v);
  }
};

TEST(JsonVisitorTest, WriteThenRead) {
  Sample in;
  in.count = 12;
  in.flag = true;
  in.ratio = 0.25;
  in.mode = Mode::C;

  std::ostringstream oss;
  Writer w(oss);
  w.beginObject();
  in.writeTo(w);
  w.endObject();

  Sample out;
  out.readFrom(Parser(oss.str()));
  EXPECT_EQ(out.count, 12u);
  EXPECT_TRUE(out.flag);
  EXPECT_DOUBLE_EQ(out.ratio, 0.25);
  EXPECT_EQ(out.mode, Mode::C);
}

TEST(JsonVisitorTest, MissingFieldsKeepDefaults) {
  Sample out;
  out.readFrom(Parser(R"({"ratio": 0.75})"));
  EXPECT_EQ(out.count, 1u);
  EXPECT_FALSE(out.flag);
  EXPECT_DOUBLE_EQ(out.ratio, 0.75);
  EXPECT_EQ(out.mode, Mode::A);
}

}  // namespace
}  // namespace json
}  // namespace dynamix
