#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

#include "nbtcodec/snbt.hpp"
#include "test_helpers.hpp"

using namespace nbtcodec;

namespace {

std::string render(const NBTTag& tag, SnbtConfig config = {}) {
    TypeRegistry registry;
    return to_snbt(tag, registry, config);
}

NBTTag parse(std::string_view text, std::size_t max_depth = DEFAULT_MAX_DEPTH) {
    TypeRegistry registry;
    return from_snbt(text, registry, max_depth);
}

NBTTag root_with(const std::string& key, NBTTag value) {
    NBTTag root = make_compound("");
    root.get<Compound>().put(key, std::move(value));
    return root;
}

}

// ============================================================================
// Rendering
// ============================================================================

TEST(SnbtRenderTest, RendersScenario) {
    EXPECT_EQ(render(test::scenario_tree()), "{a:42,list:[1,2,3]}");
}

TEST(SnbtRenderTest, RendersEmptyContainers) {
    EXPECT_EQ(render(make_compound("")), "{}");
    EXPECT_EQ(render(root_with("l", make_list())), "{l:[]}");
    // the declared element type of an empty list is not representable
    EXPECT_EQ(render(root_with("l", make_list(TAG_INT))), "{l:[]}");
    EXPECT_EQ(render(root_with("a", make_int_array({}))), "{a:[I;]}");
}

TEST(SnbtRenderTest, ScalarSuffixes) {
    NBTTag root = make_compound("");
    Compound& c = root.get<Compound>();
    c.put("b", make_byte(-1));
    c.put("s", make_short(2));
    c.put("i", make_int(3));
    c.put("l", make_long(4));
    c.put("f", make_float(1.5f));
    c.put("d", make_double(2.5));
    c.put("w", make_double(1.0));
    EXPECT_EQ(render(root), "{b:-1b,s:2s,i:3,l:4l,f:1.5f,d:2.5,w:1d}");
}

TEST(SnbtRenderTest, Arrays) {
    NBTTag root = make_compound("");
    Compound& c = root.get<Compound>();
    c.put("b", make_byte_array({1, -2}));
    c.put("i", make_int_array({1, 2}));
    c.put("l", make_long_array({3}));
    EXPECT_EQ(render(root), "{b:[B;1b,-2b],i:[I;1,2],l:[L;3l]}");
}

TEST(SnbtRenderTest, NonFiniteFloats) {
    NBTTag root = make_compound("");
    Compound& c = root.get<Compound>();
    c.put("n", make_double(std::numeric_limits<double>::quiet_NaN()));
    c.put("p", make_float(std::numeric_limits<float>::infinity()));
    c.put("m", make_double(-std::numeric_limits<double>::infinity()));
    EXPECT_EQ(render(root), "{n:NaNd,p:Infinityf,m:-Infinityd}");
}

TEST(SnbtRenderTest, KeyQuoting) {
    NBTTag root = make_compound("");
    Compound& c = root.get<Compound>();
    c.put("a.b-c_d+1", make_int(1));
    c.put("hello world", make_int(2));
    c.put("", make_int(3));
    EXPECT_EQ(render(root), "{a.b-c_d+1:1,\"hello world\":2,\"\":3}");

    SnbtConfig config;
    config.force_quote_keys = true;
    EXPECT_EQ(render(test::scenario_tree(), config), "{\"a\":42,\"list\":[1,2,3]}");
}

TEST(SnbtRenderTest, StringEscaping) {
    NBTTag root = root_with("s", make_string("say \"hi\" \\ now"));
    EXPECT_EQ(render(root), "{s:\"say \\\"hi\\\" \\\\ now\"}");
}

TEST(SnbtRenderTest, PrettyPrint) {
    SnbtConfig config;
    config.pretty_print = true;
    NBTTag root = test::scenario_tree();
    root.get<Compound>().put("c", make_compound());
    EXPECT_EQ(render(root, config), "{\n    a: 42,\n    list: [1, 2, 3],\n    c: {}\n}");

    NBTTag inner = make_compound();
    inner.get<Compound>().put("x", make_byte(1));
    EXPECT_EQ(render(root_with("n", std::move(inner)), config), "{\n    n: {\n        x: 1b\n    }\n}");
    EXPECT_EQ(render(root_with("a", make_int_array({1, 2})), config), "{\n    a: [I; 1, 2]\n}");
}

TEST(SnbtRenderTest, PrettyPrintBreaksLongSequences) {
    SnbtConfig config;
    config.pretty_print = true;
    config.inline_threshold = 2;
    EXPECT_EQ(render(test::scenario_tree(), config),
              "{\n    a: 42,\n    list: [\n        1,\n        2,\n        3\n    ]\n}");
}

TEST(SnbtRenderTest, RenderingIsDeterministic) {
    NBTTag root = test::sample_tree();
    EXPECT_EQ(render(root), render(root));
}

TEST(SnbtRenderTest, DepthLimit) {
    TypeRegistry registry;
    EXPECT_NO_THROW(to_snbt(test::nested_compounds(8), registry, {}, 8));
    EXPECT_NBT_ERROR(to_snbt(test::nested_compounds(9), registry, {}, 8), errc::nesting_too_deep);
}

// ============================================================================
// Parsing
// ============================================================================

TEST(SnbtParseTest, ParsesScenario) {
    NBTTag root = parse("{a:42,list:[1,2,3]}");
    EXPECT_EQ(root, test::scenario_tree());
    EXPECT_EQ(root.name(), "");
}

TEST(SnbtParseTest, ParsesEmptyRoot) {
    EXPECT_EQ(parse("{}"), make_compound(""));
}

TEST(SnbtParseTest, IgnoresWhitespace) {
    EXPECT_EQ(parse("  {\n\ta : 42 ,\r\n list : [ 1 , 2 , 3 ] }  "), test::scenario_tree());
}

TEST(SnbtParseTest, NumericLiterals) {
    NBTTag root = parse("{a:1,b:1.0,c:1e3,d:1b,e:1S,f:1L,g:2f,h:3D,i:.5,j:-7,k:+8,l:true,m:false}");
    EXPECT_EQ(root.at("a").get<int_t>(), 1);
    EXPECT_EQ(root.at("b").get<double>(), 1.0);
    EXPECT_EQ(root.at("c").get<double>(), 1000.0);
    EXPECT_EQ(root.at("d").get<byte_t>(), 1);
    EXPECT_EQ(root.at("e").get<short_t>(), 1);
    EXPECT_EQ(root.at("f").get<long_t>(), 1);
    EXPECT_EQ(root.at("g").get<float>(), 2.0f);
    EXPECT_EQ(root.at("h").get<double>(), 3.0);
    EXPECT_EQ(root.at("i").get<double>(), 0.5);
    EXPECT_EQ(root.at("j").get<int_t>(), -7);
    EXPECT_EQ(root.at("k").get<int_t>(), 8);
    EXPECT_EQ(root.at("l").get<byte_t>(), 1);
    EXPECT_EQ(root.at("m").get<byte_t>(), 0);
}

TEST(SnbtParseTest, Strings) {
    NBTTag root = parse("{a:abc,b:\"x y\",c:'it\\'s',d:\"q\\\"t\",e:'say \"hi\"',f:\"tab\\tend\"}");
    EXPECT_EQ(root.at("a").get<std::string>(), "abc");
    EXPECT_EQ(root.at("b").get<std::string>(), "x y");
    EXPECT_EQ(root.at("c").get<std::string>(), "it's");
    EXPECT_EQ(root.at("d").get<std::string>(), "q\"t");
    EXPECT_EQ(root.at("e").get<std::string>(), "say \"hi\"");
    EXPECT_EQ(root.at("f").get<std::string>(), "tab\tend");
}

TEST(SnbtParseTest, QuotedKeys) {
    NBTTag root = parse("{\"hello world\":1,'':2}");
    EXPECT_EQ(root.at("hello world").get<int_t>(), 1);
    EXPECT_EQ(root.at("").get<int_t>(), 2);
}

TEST(SnbtParseTest, Arrays) {
    NBTTag root = parse("{b:[B;1b,-2b],i:[I; 1, 2 ],l:[L;3l],e:[I;]}");
    EXPECT_EQ(root.at("b").get<std::vector<byte_t>>(), (std::vector<byte_t>{1, -2}));
    EXPECT_EQ(root.at("i").get<std::vector<int_t>>(), (std::vector<int_t>{1, 2}));
    EXPECT_EQ(root.at("l").get<std::vector<long_t>>(), (std::vector<long_t>{3}));
    EXPECT_TRUE(root.at("e").get<std::vector<int_t>>().empty());
}

TEST(SnbtParseTest, NonFiniteFloats) {
    NBTTag root = parse("{n:NaNd,p:Infinityf,m:-Infinityd,s:NaN}");
    EXPECT_TRUE(std::isnan(root.at("n").get<double>()));
    EXPECT_EQ(root.at("p").get<float>(), std::numeric_limits<float>::infinity());
    EXPECT_EQ(root.at("m").get<double>(), -std::numeric_limits<double>::infinity());
    // without a suffix it is just a word
    EXPECT_EQ(root.at("s").get<std::string>(), "NaN");
}

TEST(SnbtParseTest, DuplicateKeysKeepLastValue) {
    NBTTag root = parse("{k:1,k:2}");
    EXPECT_EQ(root.size(), 1u);
    EXPECT_EQ(root.at("k").get<int_t>(), 2);
}

TEST(SnbtParseTest, RoundTripsEveryType) {
    NBTTag root = test::sample_tree();
    EXPECT_EQ(parse(render(root)), root);
    SnbtConfig config;
    config.pretty_print = true;
    config.force_quote_keys = true;
    EXPECT_EQ(parse(render(root, config)), root);
}

TEST(SnbtParseTest, UnterminatedString) {
    EXPECT_NBT_ERROR(parse("{a:\"abc}"), errc::unterminated_string);
    EXPECT_NBT_ERROR(parse("{a:'abc\\"), errc::unterminated_string);
}

TEST(SnbtParseTest, InvalidNumbers) {
    EXPECT_NBT_ERROR(parse("{a:12abc}"), errc::invalid_number);
    EXPECT_NBT_ERROR(parse("{a:3000000000}"), errc::invalid_number);
    EXPECT_NBT_ERROR(parse("{a:300b}"), errc::invalid_number);
    EXPECT_NBT_ERROR(parse("{a:1.5b}"), errc::invalid_number);
    EXPECT_NBT_ERROR(parse("{a:1e}"), errc::invalid_number);
}

TEST(SnbtParseTest, UnexpectedTokens) {
    EXPECT_NBT_ERROR(parse(""), errc::unexpected_token);
    EXPECT_NBT_ERROR(parse("{a:1"), errc::unexpected_token);
    EXPECT_NBT_ERROR(parse("{a 1}"), errc::unexpected_token);
    EXPECT_NBT_ERROR(parse("{a:1} x"), errc::unexpected_token);
    EXPECT_NBT_ERROR(parse("{a:[Q;1]}"), errc::unexpected_token);
    EXPECT_NBT_ERROR(parse("{a:\"\\q\"}"), errc::unexpected_token);
    EXPECT_NBT_ERROR(parse("{a:1,}"), errc::unexpected_token);
}

TEST(SnbtParseTest, RootMustBeCompound) {
    EXPECT_NBT_ERROR(parse("[1,2]"), errc::type_mismatch);
    EXPECT_NBT_ERROR(parse("5"), errc::type_mismatch);
}

TEST(SnbtParseTest, MixedElementTypes) {
    EXPECT_NBT_ERROR(parse("{a:[1,2b]}"), errc::type_mismatch);
    EXPECT_NBT_ERROR(parse("{a:[I;1,2b]}"), errc::type_mismatch);
}

TEST(SnbtParseTest, ErrorsReportPosition) {
    try {
        parse("{a:1,\n b:?}");
        FAIL() << "expected unexpected_token";
    } catch (const nbt_error& e) {
        EXPECT_EQ(e.code(), errc::unexpected_token);
        EXPECT_EQ(e.offset(), 9u);
        EXPECT_NE(std::string(e.what()).find("line 2, column 4"), std::string::npos) << e.what();
    }
}

TEST(SnbtParseTest, DepthLimit) {
    EXPECT_EQ(parse(test::nested_snbt(8), 8), test::nested_compounds(8));
    EXPECT_NBT_ERROR(parse(test::nested_snbt(9), 8), errc::nesting_too_deep);
    // root(1) > list(2) > list(3)
    EXPECT_NO_THROW(parse("{l:[[1]]}", 3));
    EXPECT_NBT_ERROR(parse("{l:[[1]]}", 2), errc::nesting_too_deep);
}

TEST(SnbtParseTest, DefaultLimitRejectsHostileNesting) {
    std::string text = "{l:" + std::string(1000, '[') + std::string(1000, ']') + "}";
    EXPECT_NBT_ERROR(parse(text), errc::nesting_too_deep);
}

TEST(SnbtParseTest, ArraysHoldOnlyNumbers) {
    std::string text = "{a:";
    for (int i = 0; i < 200000; ++i)
        text += "[B;";
    text += "}";
    EXPECT_NBT_ERROR(parse(text), errc::unexpected_token);
    EXPECT_NBT_ERROR(parse("{a:[I;[I;1]]}"), errc::unexpected_token);
    EXPECT_NBT_ERROR(parse("{a:[L;{}]}"), errc::unexpected_token);
    EXPECT_NBT_ERROR(parse("{a:[B;\"1\"]}"), errc::unexpected_token);
}

TEST(SnbtParseTest, SubnormalFloatsRoundTrip) {
    NBTTag root = make_compound("");
    root.get<Compound>().put("f", make_float(std::numeric_limits<float>::denorm_min()));
    root.get<Compound>().put("d", make_double(std::numeric_limits<double>::denorm_min()));
    root.get<Compound>().put("g", make_double(2.2250738585072e-310));
    EXPECT_EQ(parse(render(root)), root);
    // overflow is still rejected
    EXPECT_NBT_ERROR(parse("{f:1e39f}"), errc::invalid_number);
    EXPECT_NBT_ERROR(parse("{d:1e400}"), errc::invalid_number);
}

TEST(SnbtParseTest, TypedEmptyListComesBackUntyped) {
    NBTTag root = test::scenario_tree();
    root.get<Compound>().put("empty", make_list(TAG_INT));
    NBTTag parsed = parse(render(root));
    EXPECT_NE(parsed, root);
    EXPECT_EQ(parsed.at("empty").get<List>().element_type(), TAG_END);
    EXPECT_TRUE(parsed.at("empty").get<List>().empty());
    parsed.get<Compound>().put("empty", make_list(TAG_INT));
    EXPECT_EQ(parsed, root);
}

// ============================================================================
// Custom types
// ============================================================================

TEST(SnbtCustomTypeTest, UsesRegisteredPrefix) {
    TypeRegistry registry = test::registry_with_uuid();
    NBTTag root = root_with("id", test::make_uuid(1, 2));
    std::string text = to_snbt(root, registry);
    EXPECT_EQ(text, "{id:[U;1l,2l]}");
    EXPECT_EQ(from_snbt(text, registry), root);
}

TEST(SnbtCustomTypeTest, OtherRegistriesDoNotKnowIt) {
    TypeRegistry plain;
    EXPECT_NBT_ERROR(from_snbt("{id:[U;1l,2l]}", plain), errc::unexpected_token);
    EXPECT_NBT_ERROR(to_snbt(root_with("id", test::make_uuid(1, 2)), plain), errc::unknown_type_id);
}
