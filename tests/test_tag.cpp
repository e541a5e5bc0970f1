#include <gtest/gtest.h>

#include <cmath>
#include <iterator>
#include <limits>
#include <stdexcept>

#include "nbtcodec/tag.hpp"
#include "test_helpers.hpp"

using namespace nbtcodec;

// ============================================================================
// List
// ============================================================================

TEST(ListTest, EmptyListAdoptsFirstElementType) {
    List list;
    EXPECT_EQ(list.element_type(), TAG_END);
    list.add(make_short(4));
    EXPECT_EQ(list.element_type(), TAG_SHORT);
    EXPECT_EQ(list.size(), 1u);
}

TEST(ListTest, RejectsMismatchedElement) {
    List list(TAG_INT);
    list.add(make_int(1));
    EXPECT_NBT_ERROR(list.add(make_string("x")), errc::type_mismatch);
    EXPECT_NBT_ERROR(list.set(0, make_long(1)), errc::type_mismatch);
    EXPECT_EQ(list.size(), 1u);
    EXPECT_EQ(list.at(0).get<int_t>(), 1);
}

TEST(ListTest, DeclaredTypeSurvivesEmptying) {
    List list(TAG_INT);
    list.add(make_int(1));
    list.remove(0);
    EXPECT_TRUE(list.empty());
    EXPECT_NBT_ERROR(list.add(make_byte(1)), errc::type_mismatch);
}

TEST(ListTest, ElementsLoseTheirNames) {
    List list;
    NBTTag child = make_compound("named");
    list.add(std::move(child));
    EXPECT_FALSE(list.at(0).name().has_value());
}

TEST(ListTest, IndexOutOfRangeThrows) {
    List list(TAG_INT);
    EXPECT_THROW(list.at(0), std::out_of_range);
    EXPECT_THROW(list.remove(3), std::out_of_range);
}

TEST(ListTest, EqualityIncludesElementType) {
    EXPECT_EQ(List(TAG_INT), List(TAG_INT));
    EXPECT_NE(List(TAG_INT), List(TAG_END));
}

// ============================================================================
// Compound
// ============================================================================

TEST(CompoundTest, PutOverwritesInPlace) {
    Compound compound;
    compound.put("a", make_int(1));
    compound.put("b", make_int(2));
    compound.put("a", make_string("again"));

    ASSERT_EQ(compound.size(), 2u);
    auto it = compound.begin();
    EXPECT_EQ(it->name(), "a");
    EXPECT_EQ(it->get<std::string>(), "again");
    ++it;
    EXPECT_EQ(it->name(), "b");
}

TEST(CompoundTest, RemoveKeepsOrderAndLookup) {
    Compound compound;
    compound.put("a", make_int(1));
    compound.put("b", make_int(2));
    compound.put("c", make_int(3));

    EXPECT_TRUE(compound.remove("b"));
    EXPECT_FALSE(compound.remove("b"));
    ASSERT_EQ(compound.size(), 2u);
    EXPECT_EQ(compound.at("c").get<int_t>(), 3);
    EXPECT_EQ(compound.begin()->name(), "a");
    EXPECT_EQ(std::next(compound.begin())->name(), "c");
    EXPECT_EQ(compound.find("b"), nullptr);
}

TEST(CompoundTest, MembersCarryTheirKey) {
    Compound compound;
    compound.put("key", make_byte(1));
    EXPECT_EQ(compound.at("key").name(), "key");
}

TEST(CompoundTest, MissingKeyThrows) {
    Compound compound;
    EXPECT_THROW(compound.at("nope"), std::runtime_error);
    EXPECT_FALSE(compound.contains("nope"));
}

TEST(CompoundTest, EqualityIsOrderSensitive) {
    Compound first;
    first.put("a", make_int(1));
    first.put("b", make_int(2));
    Compound second;
    second.put("b", make_int(2));
    second.put("a", make_int(1));
    EXPECT_NE(first, second);
}

// ============================================================================
// NBTTag
// ============================================================================

TEST(NBTTagTest, GetWithWrongTypeThrows) {
    NBTTag tag = make_int(3);
    EXPECT_EQ(tag.get<int_t>(), 3);
    EXPECT_TRUE(tag.holds<int_t>());
    EXPECT_FALSE(tag.holds<long_t>());
    EXPECT_NBT_ERROR(tag.get<long_t>(), errc::type_mismatch);
}

TEST(NBTTagTest, ConstructorRejectsMismatchedPayload) {
    EXPECT_NBT_ERROR((void)NBTTag(TAG_INT, std::string("x")), errc::type_mismatch);
}

TEST(NBTTagTest, ContainerAccessors) {
    NBTTag root = test::scenario_tree();
    EXPECT_EQ(root.size(), 2u);
    EXPECT_TRUE(root.contains("list"));
    EXPECT_EQ(root.at("list")[2].get<int_t>(), 3);
    EXPECT_EQ(root.at("list").size(), 3u);
    EXPECT_THROW(root.at("a").at("x"), std::runtime_error);
    EXPECT_THROW(root.at("a")[0], std::runtime_error);
    EXPECT_THROW(root.at("a").size(), std::runtime_error);
}

TEST(NBTTagTest, FloatEqualityComparesBitPatterns) {
    EXPECT_EQ(make_float(std::numeric_limits<float>::quiet_NaN()), make_float(std::numeric_limits<float>::quiet_NaN()));
    EXPECT_EQ(make_double(std::nan("1")), make_double(std::nan("2")));
    EXPECT_NE(make_float(0.0f), make_float(-0.0f));
    EXPECT_NE(make_double(0.0), make_double(-0.0));
    EXPECT_EQ(make_double(1.5), make_double(1.5));
}

TEST(NBTTagTest, EqualityIncludesNameAndType) {
    EXPECT_NE(make_compound(), make_compound(""));
    EXPECT_NE(make_int(1), make_long(1));
    EXPECT_EQ(test::sample_tree(), test::sample_tree());
}

TEST(NBTTagTest, ExtensionPayloads) {
    NBTTag id = test::make_uuid(1, 2);
    EXPECT_EQ(id.type(), test::TAG_UUID);
    EXPECT_EQ(id, test::make_uuid(1, 2));
    EXPECT_NE(id, test::make_uuid(1, 3));
    EXPECT_EQ(extension_cast<test::Uuid>(id).least, 2u);
    EXPECT_NBT_ERROR(extension_cast<int>(id), errc::type_mismatch);
    EXPECT_NBT_ERROR(make_extension(TAG_INT, test::Uuid{}), errc::type_mismatch);
}
