/// @file test_conformance.cpp
/// @brief JSON_checker-style conformance: documents that must parse, documents
/// that must be rejected, and the deliberate leniencies.
///
/// The grammar accepts a scalar at the top level and passes unknown escapes
/// through, so a few classic "fail" documents are expected to succeed here.

#include <bourne/bourne.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <string>

using namespace bourne;

namespace {

errc error_of(std::string_view input, const ParseOptions& opts = {}) {
    auto r = try_parse(input, opts);
    return r ? errc::ok : static_cast<errc>(r.ec.value());
}

const char* const kPass1 = R"json([
    "JSON Test Pattern pass1",
    {"object with 1 member":["array with 1 element"]},
    {},
    [],
    -42,
    true,
    false,
    null,
    {
        "integer": 1234567890,
        "real": -9876.543210,
        "e": 0.123456789e-12,
        "E": 1.234567890E+34,
        "":  23456789012E66,
        "zero": 0,
        "one": 1,
        "space": " ",
        "quote": "\"",
        "backslash": "\\",
        "controls": "\b\f\n\r\t",
        "slash": "/ & \/",
        "alpha": "abcdefghijklmnopqrstuvwyz",
        "ALPHA": "ABCDEFGHIJKLMNOPQRSTUVWYZ",
        "digit": "0123456789",
        "0123456789": "digit",
        "special": "`1~!@#$%^&*()_+-={':[,]}|;.</>?",
        "hex": "\u0123\u4567\u89AB\uCDEF\uabcd\uef4A",
        "true": true,
        "false": false,
        "null": null,
        "array":[  ],
        "object":{  },
        "address": "50 St. James Street",
        "url": "http://www.JSON.org/",
        "comment": "// /* <!-- --",
        "# -- --> */": " ",
        " s p a c e d " :[1,2 , 3

,

4 , 5        ,          6           ,7        ],"compact":[1,2,3,4,5,6,7],
        "jsontext": "{\"object with 1 member\":[\"array with 1 element\"]}",
        "quotes": "&#34; \u0022 %22 0x22 034 &#x22;",
        "\/\\\"\uCAFE\uBABE\uAB98\uFCDE\ubcda\uef4A\b\f\n\r\t`1~!@#$%^&*()_+-=[]{}|;:',./<>?"
: "A key can be any string"
    },
    0.5 ,98.6
,
99.44
,

1066,
1e1,
0.1e1,
1e-1,
1e00,2e+00,2e-00
,"rosebud"])json";

const char* const kPass2 = R"([[[[[[[[[[[[[[[[[[["Not too deep"]]]]]]]]]]]]]]]]]]])";

const char* const kPass3 = R"({
    "JSON Test Pattern pass3": {
        "The outermost value": "must be an object or array.",
        "In this test": "It is an object."
    }
}
)";

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Documents that must parse
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConformancePass, Pass1) {
    auto r = try_parse(kPass1);
    ASSERT_TRUE(r) << r.ec.message() << " at offset " << r.location.offset;

    const Value& doc = r.value;
    ASSERT_TRUE(doc.is_array());
    EXPECT_EQ(doc.size(), 20u);
    EXPECT_EQ(doc.get(0)->as_string(), "JSON Test Pattern pass1");
    EXPECT_EQ(doc.get(4)->as_int(), -42);
    EXPECT_EQ(doc.get(19)->as_string(), "rosebud");

    const Value* obj = doc.get(8);
    ASSERT_NE(obj, nullptr);
    EXPECT_EQ(obj->get("integer")->as_int(), 1234567890);
    EXPECT_DOUBLE_EQ(obj->get("real")->as_float(), -9876.543210);
    EXPECT_DOUBLE_EQ(obj->get("E")->as_float(), 1.234567890E+34);
    EXPECT_TRUE(obj->get("")->is_float());
    EXPECT_EQ(obj->get("controls")->as_string(), "\b\f\n\r\t");
    EXPECT_EQ(obj->get("slash")->as_string(), "/ & /");
    EXPECT_EQ(obj->get("quotes")->as_string(), "&#34; \" %22 0x22 034 &#x22;");
    EXPECT_EQ(obj->get(" s p a c e d ")->size(), 7u);
    EXPECT_EQ(*obj->get(" s p a c e d "), *obj->get("compact"));
    EXPECT_TRUE(obj->get("null")->is_null());
    EXPECT_TRUE(obj->get("array")->as_array().empty());
    EXPECT_TRUE(obj->get("object")->as_object().empty());
    EXPECT_EQ(obj->get("hex")->size(), 6u);

    EXPECT_DOUBLE_EQ(doc.get(13)->as_float(), 10.0);  // 1e1
    EXPECT_DOUBLE_EQ(doc.get(14)->as_float(), 1.0);   // 0.1e1
    EXPECT_DOUBLE_EQ(doc.get(18)->as_float(), 2.0);   // 2e-00
}

TEST(ConformancePass, Pass2NotTooDeep) {
    auto v = parse(kPass2);
    const Value* cur = &v;
    for (int i = 0; i < 19; ++i) {
        ASSERT_TRUE(cur->is_array());
        cur = cur->get(0);
        ASSERT_NE(cur, nullptr);
    }
    EXPECT_EQ(cur->as_string(), "Not too deep");
}

TEST(ConformancePass, Pass3) {
    auto v = parse(kPass3);
    const Value* inner = v.get("JSON Test Pattern pass3");
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(inner->size(), 2u);
    EXPECT_EQ(inner->get("In this test")->as_string(), "It is an object.");
}

TEST(ConformancePass, IntAndFloatObject) {
    auto v = parse(R"({"int":9223372036854775807,"float":3.14159265358979})");
    EXPECT_TRUE(v.get("int")->is_int());
    EXPECT_TRUE(v.get("float")->is_float());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Deliberate leniencies
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConformanceLenient, TopLevelString) {
    auto v = parse(R"("A JSON payload should be an object or array, not a string.")");
    EXPECT_TRUE(v.is_string());
}

TEST(ConformanceLenient, UnknownEscapesPassThrough) {
    EXPECT_EQ(parse(R"(["Illegal backslash escape: \x15"])").get(0)->as_string(),
              "Illegal backslash escape: x15");
    EXPECT_EQ(parse(R"(["Illegal backslash escape: \017"])").get(0)->as_string(),
              "Illegal backslash escape: 017");
}

TEST(ConformanceLenient, RawTabInString) {
    auto v = parse("[\"\ttab\tcharacter\tin\tstring\t\"]");
    EXPECT_EQ(v.get(0)->as_string(), "\ttab\tcharacter\tin\tstring\t");
}

TEST(ConformanceLenient, EscapedSpaceInString) {
    auto v = parse(R"(["tab\   character\   in\  string\  "])");
    EXPECT_EQ(v.get(0)->as_string(), "tab   character   in  string  ");
}

TEST(ConformanceLenient, DepthLimitIsConfigurable) {
    const std::string too_deep = R"([[[[[[[[[[[[[[[[[[[["Too deep"]]]]]]]]]]]]]]]]]]]])";
    EXPECT_EQ(error_of(too_deep), errc::ok);
    EXPECT_EQ(error_of(too_deep, ParseOptions::with_max_depth(19)), errc::max_depth_exceeded);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Documents that must be rejected
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConformanceFail, UnclosedArray) {
    EXPECT_EQ(error_of(R"(["Unclosed array")"), errc::unexpected_eof);
}

TEST(ConformanceFail, UnquotedKey) {
    EXPECT_EQ(error_of(R"({unquoted_key: "keys must be quoted"})"), errc::invalid_character);
}

TEST(ConformanceFail, ExtraComma) {
    EXPECT_EQ(error_of(R"(["extra comma",])"), errc::unexpected_comma);
    EXPECT_EQ(error_of(R"(["double extra comma",,])"), errc::unexpected_comma);
    EXPECT_EQ(error_of(R"([   , "<-- missing value"])"), errc::unexpected_comma);
    EXPECT_EQ(error_of(R"({"Extra comma": true,})"), errc::unexpected_comma);
}

TEST(ConformanceFail, ContentAfterClose) {
    EXPECT_EQ(error_of(R"(["Comma after the close"],)"), errc::invalid_character);
    EXPECT_EQ(error_of(R"(["Extra close"]])"), errc::invalid_character);
    EXPECT_EQ(error_of(R"({"Extra value after close": true} "misplaced quoted value")"),
              errc::invalid_character);
}

TEST(ConformanceFail, IllegalExpressions) {
    EXPECT_EQ(error_of(R"({"Illegal expression": 1 + 2})"), errc::invalid_character);
    EXPECT_EQ(error_of(R"({"Illegal invocation": alert()})"), errc::invalid_character);
    EXPECT_EQ(error_of(R"([\naked])"), errc::invalid_character);
    EXPECT_EQ(error_of(R"(["Bad value", truth])"), errc::invalid_character);
    EXPECT_EQ(error_of(R"(['single quote'])"), errc::invalid_character);
}

TEST(ConformanceFail, BadNumbers) {
    EXPECT_EQ(error_of(R"({"Numbers cannot have leading zeroes": 013})"), errc::invalid_character);
    EXPECT_EQ(error_of(R"({"Numbers cannot be hex": 0x14})"), errc::invalid_character);
    EXPECT_EQ(error_of("[0e]"), errc::invalid_character);
    EXPECT_EQ(error_of("[0e+]"), errc::invalid_character);
    EXPECT_EQ(error_of("[0e+-1]"), errc::invalid_character);
}

TEST(ConformanceFail, ColonsAndCommas) {
    EXPECT_EQ(error_of(R"({"Missing colon" null})"), errc::invalid_character);
    EXPECT_EQ(error_of(R"({"Double colon":: null})"), errc::invalid_character);
    EXPECT_EQ(error_of(R"({"Comma instead of colon", null})"), errc::invalid_character);
    EXPECT_EQ(error_of(R"(["Colon instead of comma": false])"), errc::invalid_character);
}

TEST(ConformanceFail, RawLineBreakInString) {
    EXPECT_EQ(error_of("[\"line\nbreak\"]"), errc::line_break_in_string);
}

TEST(ConformanceLenient, EscapedLineBreakInString) {
    EXPECT_EQ(parse("[\"line\\\nbreak\"]").get(0)->as_string(), "line\nbreak");
}

TEST(ConformanceFail, BadClosers) {
    EXPECT_EQ(error_of(R"({"Comma instead if closing brace": true,)"), errc::unexpected_eof);
    EXPECT_EQ(error_of(R"(["mismatch"})"), errc::invalid_character);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Numbers at the edges
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConformanceNumbers, SmallAndLargeFloats) {
    EXPECT_DOUBLE_EQ(parse("1e-308").as_float(), 1e-308);
    EXPECT_DOUBLE_EQ(parse("1e308").as_float(), 1e308);
}

TEST(ConformanceNumbers, FloatOutOfRangeSaturates) {
    auto v = parse("[1e400, -1e400, 1e-400, -1e-400]");
    ASSERT_EQ(v.size(), 4u);
    EXPECT_TRUE(std::isinf(v.get(0)->as_float()));
    EXPECT_GT(v.get(0)->as_float(), 0.0);
    EXPECT_TRUE(std::isinf(v.get(1)->as_float()));
    EXPECT_LT(v.get(1)->as_float(), 0.0);
    EXPECT_EQ(v.get(2)->as_float(), 0.0);
    EXPECT_EQ(v.get(3)->as_float(), 0.0);
    EXPECT_TRUE(std::signbit(v.get(3)->as_float()));
}

TEST(ConformanceNumbers, MinusZero) {
    auto v = parse("-0.0");
    EXPECT_TRUE(std::signbit(v.as_float()));
    EXPECT_EQ(parse("-0").as_int(), 0);
}
