/**
 * @file test_emptiness.cpp
 * @brief Tests for the emptiness predicate and category deduction (GoogleTest)
 */

#include <gtest/gtest.h>
#include "structmerge/Merge.hpp"
#include "records.hpp"
#include <array>
#include <cmath>
#include <limits>
#include <set>

using namespace structmerge;
using namespace fixtures;

// ============================================================================
// is_empty by category
// ============================================================================

TEST(IsEmpty, Boolean) {
    EXPECT_TRUE(is_empty(false));
    EXPECT_FALSE(is_empty(true));
}

TEST(IsEmpty, SignedIntegers) {
    EXPECT_TRUE(is_empty(0));
    EXPECT_FALSE(is_empty(-1));
    EXPECT_TRUE(is_empty(std::int64_t{0}));
    EXPECT_FALSE(is_empty(std::int8_t{3}));
}

TEST(IsEmpty, UnsignedIntegers) {
    EXPECT_TRUE(is_empty(0u));
    EXPECT_FALSE(is_empty(5u));
    EXPECT_FALSE(is_empty(std::numeric_limits<std::uint64_t>::max()));
}

TEST(IsEmpty, FloatingPoint) {
    EXPECT_TRUE(is_empty(0.0));
    EXPECT_TRUE(is_empty(-0.0));
    EXPECT_TRUE(is_empty(0.0f));
    EXPECT_FALSE(is_empty(1e-300));
    EXPECT_FALSE(is_empty(std::nan("")));
}

TEST(IsEmpty, Text) {
    EXPECT_TRUE(is_empty(std::string()));
    EXPECT_FALSE(is_empty(std::string(" ")));
    EXPECT_TRUE(is_empty(std::string_view()));
}

TEST(IsEmpty, Collections) {
    EXPECT_TRUE(is_empty(std::vector<int>{}));
    EXPECT_FALSE(is_empty(std::vector<int>{0}));
    EXPECT_TRUE(is_empty(std::map<std::string, int>{}));
    EXPECT_FALSE(is_empty(std::set<int>{1}));
    EXPECT_FALSE(is_empty(std::array<int, 2>{}));
}

TEST(IsEmpty, FixedArraysNeverEmpty) {
    int zeros[3] = {0, 0, 0};
    char blank[4] = {};
    EXPECT_FALSE(is_empty(zeros));
    EXPECT_FALSE(is_empty(blank));
    EXPECT_EQ((descriptor_of<int[3]>().category), Category::Collection);
}

TEST(IsEmpty, Indirections) {
    EXPECT_TRUE(is_empty(std::optional<int>{}));
    EXPECT_FALSE(is_empty(std::optional<int>{0}));
    EXPECT_TRUE(is_empty(std::shared_ptr<int>{}));
    EXPECT_FALSE(is_empty(std::make_shared<int>(0)));
    EXPECT_TRUE(is_empty(std::unique_ptr<int>{}));
    EXPECT_TRUE(is_empty(std::any{}));
    EXPECT_FALSE(is_empty(std::any{0}));

    int value = 0;
    int* ptr = &value;
    int* null_ptr = nullptr;
    EXPECT_FALSE(is_empty(ptr));
    EXPECT_TRUE(is_empty(null_ptr));
}

TEST(IsEmpty, Enums) {
    EXPECT_TRUE(is_empty(Color::None));
    EXPECT_FALSE(is_empty(Color::Red));
}

TEST(IsEmpty, RecordsAndOpaqueNeverEmpty) {
    EXPECT_FALSE(is_empty(Address{}));
    EXPECT_FALSE(is_empty(Blob{}));
    EXPECT_FALSE(is_empty(std::chrono::system_clock::time_point{}));
}

// ============================================================================
// Category deduction
// ============================================================================

TEST(Category, Deduced) {
    EXPECT_EQ(descriptor_of<bool>().category, Category::Boolean);
    EXPECT_EQ(descriptor_of<signed char>().category, Category::SignedInteger);
    EXPECT_EQ(descriptor_of<long>().category, Category::SignedInteger);
    EXPECT_EQ(descriptor_of<unsigned short>().category, Category::UnsignedInteger);
    EXPECT_EQ(descriptor_of<Color>().category, Category::UnsignedInteger);
    EXPECT_EQ(descriptor_of<float>().category, Category::FloatingPoint);
    EXPECT_EQ(descriptor_of<std::string>().category, Category::Text);
    EXPECT_EQ(descriptor_of<std::vector<int>>().category, Category::Collection);
    EXPECT_EQ((descriptor_of<std::map<int, int>>().category), Category::Collection);
    EXPECT_EQ(descriptor_of<std::optional<Address>>().category, Category::Indirection);
    EXPECT_EQ(descriptor_of<std::unique_ptr<Address>>().category, Category::Indirection);
    EXPECT_EQ(descriptor_of<Address*>().category, Category::Indirection);
    EXPECT_EQ(descriptor_of<std::any>().category, Category::Indirection);
    EXPECT_EQ(descriptor_of<Address>().category, Category::Record);
    EXPECT_EQ(descriptor_of<Date>().category, Category::Record);
    EXPECT_EQ(descriptor_of<std::chrono::steady_clock::time_point>().category, Category::Record);
    EXPECT_EQ(descriptor_of<Blob>().category, Category::Opaque);
}

TEST(Category, Names) {
    EXPECT_STREQ(category_name(Category::Record), "record");
    EXPECT_STREQ(category_name(Category::UnsignedInteger), "unsigned-integer");
    EXPECT_STREQ(category_name(Category::Opaque), "opaque");
}

// ============================================================================
// Every category under each policy
// ============================================================================

namespace {
    Everything filled() {
        Everything e;
        e.flag = true;
        e.number = -4;
        e.unsigned_number = 9;
        e.ratio = 0.5;
        e.text = "text";
        e.items = {1, 2};
        e.table = {{"k", 1}};
        e.maybe = 0;
        e.shared = std::make_shared<int>(7);
        e.anything = std::string("any");
        e.color = Color::Blue;
        e.blob.bytes = 12;
        return e;
    }
}

TEST(EmptinessPolicy, ExcludeEmptyKeepsEveryFilledField) {
    Everything dst = filled();
    Everything src;

    MergeOptions opts;
    opts.policy = MergePolicy::ExcludeEmpty;
    merge(&dst, src, opts);

    EXPECT_TRUE(dst.flag);
    EXPECT_EQ(dst.number, -4);
    EXPECT_EQ(dst.unsigned_number, 9u);
    EXPECT_DOUBLE_EQ(dst.ratio, 0.5);
    EXPECT_EQ(dst.text, "text");
    EXPECT_EQ(dst.items.size(), 2u);
    EXPECT_EQ(dst.table.size(), 1u);
    EXPECT_TRUE(dst.maybe.has_value());
    EXPECT_NE(dst.shared, nullptr);
    EXPECT_TRUE(dst.anything.has_value());
    EXPECT_EQ(dst.color, Color::Blue);
    // Opaque values are never empty, so the source's blob wins.
    EXPECT_EQ(dst.blob.bytes, 0);
}

TEST(EmptinessPolicy, OverwriteEmptyFillsEveryEmptyField) {
    Everything dst;
    dst.blob.bytes = 3;
    Everything src = filled();

    MergeOptions opts;
    opts.policy = MergePolicy::OverwriteEmpty;
    merge(&dst, src, opts);

    EXPECT_TRUE(dst.flag);
    EXPECT_EQ(dst.number, -4);
    EXPECT_EQ(dst.unsigned_number, 9u);
    EXPECT_DOUBLE_EQ(dst.ratio, 0.5);
    EXPECT_EQ(dst.text, "text");
    EXPECT_EQ(dst.items, (std::vector<int>{1, 2}));
    EXPECT_EQ(dst.table.at("k"), 1);
    ASSERT_TRUE(dst.maybe.has_value());
    EXPECT_EQ(*dst.maybe, 0);
    EXPECT_EQ(dst.shared, src.shared);
    EXPECT_EQ(std::any_cast<std::string>(dst.anything), "any");
    EXPECT_EQ(dst.color, Color::Blue);
    // Opaque destination counts as present.
    EXPECT_EQ(dst.blob.bytes, 3);
}

TEST(EmptinessPolicy, EngagedOptionalZeroIsNotEmpty) {
    Everything dst;
    dst.maybe = 0;
    Everything src;
    src.maybe = 5;

    MergeOptions opts;
    opts.policy = MergePolicy::OverwriteEmpty;
    merge(&dst, src, opts);

    EXPECT_EQ(*dst.maybe, 0);
}
