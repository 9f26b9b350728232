/**
 * @file test_walker.cpp
 * @brief Tests for the path walker and its primitives (GoogleTest)
 */

#include <gtest/gtest.h>
#include "arbor/Walker.hpp"
#include "arbor/Factory.hpp"

using namespace arbor;

namespace {
    MatchHandler read_child() {
        return [](Value& container, const Key& key) { return container.child(key); };
    }
}

// ============================================================================
// on_match_at_path - read mode
// ============================================================================

class WalkerReadTest : public ::testing::Test {
protected:
    Value data = Value::mapping({
        {"nested", Value::mapping({
            {"key", 42},
            {"zero", 0},
            {"list", Value::sequence({"a", Value::mapping({{"deep", true}})})}
        })}
    });
};

TEST_F(WalkerReadTest, ReachesTerminal) {
    EXPECT_EQ(on_match_at_path(Path{"nested", "key"}, data, read_child(), false), Value(42));
    EXPECT_EQ(on_match_at_path(Path{"nested", "list", 1, "deep"}, data, read_child(), false),
              Value(true));
}

TEST_F(WalkerReadTest, MissingIntermediateGivesNoMatch) {
    Value result = on_match_at_path(Path{"missing", "key"}, data, read_child(), false, Value("none"));
    EXPECT_EQ(result, Value("none"));
}

TEST_F(WalkerReadTest, DoesNotDescendIntoFalsyValues) {
    bool called = false;
    MatchHandler spy = [&called](Value& container, const Key& key) {
        called = true;
        return container.child(key);
    };
    Value result = on_match_at_path(Path{"nested", "zero", "x"}, data, spy, false, Value("none"));
    EXPECT_EQ(result, Value("none"));
    EXPECT_FALSE(called);
}

TEST_F(WalkerReadTest, AbsentRootGivesNoMatch) {
    Value result = on_match_at_path(Path{"a", "b"}, Value(), read_child(), false, Value(false));
    EXPECT_EQ(result, Value(false));
}

// ============================================================================
// on_match_at_path - write mode
// ============================================================================

TEST(WalkerWrite, ClonesAncestorsAndSharesSiblings) {
    Value sibling = Value::mapping({{"d", 2}});
    Value root = Value::mapping({{"a", Value::mapping({{"b", 1}})}, {"c", sibling}});

    Value top = shallow_clone(root);
    Value result = on_match_at_path(Path{"a", "b"}, top, [](Value& container, const Key& key) {
        assign_child(container, key, 99);
        return Value();
    }, true);

    EXPECT_TRUE(Value::identical(result, top));
    EXPECT_EQ(result.child("a").child("b"), Value(99));
    EXPECT_TRUE(Value::identical(result.child("c"), sibling));
    EXPECT_EQ(root.child("a").child("b"), Value(1));
}

TEST(WalkerWrite, CreatesMissingContainersByNextKeyKind) {
    Value top = Value::mapping();
    Value result = on_match_at_path(Path{"x", 1, "y"}, top, [](Value& container, const Key& key) {
        assign_child(container, key, "v");
        return Value();
    }, true);

    Value x = result.child("x");
    ASSERT_TRUE(x.is_sequence());
    ASSERT_EQ(x.size(), 2u);
    EXPECT_TRUE(x.child(0).is_undefined());
    EXPECT_EQ(x.child(1).child("y"), Value("v"));
}

// ============================================================================
// get_nested_property / get_nested_property_or / has_nested_property
// ============================================================================

TEST(GetNestedProperty, SingleSegmentBypassesWalker) {
    Value root = Value::mapping({{"a", 0}});
    EXPECT_EQ(get_nested_property(Path{"a"}, root), Value(0));
    EXPECT_TRUE(get_nested_property(Path{"a"}, Value()).is_undefined());
}

TEST(GetNestedProperty, EmptyPathIsRoot) {
    Value root = Value::sequence({1});
    EXPECT_TRUE(Value::identical(get_nested_property(Path{}, root), root));
}

TEST(GetNestedProperty, MissingGivesUndefined) {
    Value root = Value::mapping({{"a", Value::mapping()}});
    EXPECT_TRUE(get_nested_property(Path{"a", "b", "c"}, root).is_undefined());
}

TEST(GetNestedPropertyOr, FallbackOnlyForUndefined) {
    Value root = Value::mapping({{"a", Value::mapping({{"n", nullptr}})}});
    EXPECT_EQ(get_nested_property_or(Path{"a", "missing"}, root, Value(5)), Value(5));
    EXPECT_EQ(get_nested_property_or(Path{"x", "y"}, root, Value(5)), Value(5));
    EXPECT_TRUE(get_nested_property_or(Path{"a", "n"}, root, Value(5)).is_null());
}

TEST(HasNestedProperty, NullIsPresentUndefinedIsNot) {
    Value root = Value::mapping({
        {"a", Value::mapping({{"n", nullptr}, {"u", Value()}})},
        {"top", nullptr}
    });
    EXPECT_TRUE(has_nested_property(Path{"a", "n"}, root));
    EXPECT_FALSE(has_nested_property(Path{"a", "u"}, root));
    EXPECT_FALSE(has_nested_property(Path{"a", "x"}, root));
    EXPECT_TRUE(has_nested_property(Path{"top"}, root));
    EXPECT_FALSE(has_nested_property(Path{"top", "x"}, root));
}

// ============================================================================
// get_deep_clone
// ============================================================================

TEST(GetDeepClone, NeverMutatesRoot) {
    Value root = Value::mapping({{"a", Value::mapping({{"b", 1}})}});
    Value original_a = root.child("a");

    Value result = get_deep_clone(Path{"a", "b"}, root, [](Value& container, const Key& key) {
        assign_child(container, key, 2);
    });

    EXPECT_EQ(result.child("a").child("b"), Value(2));
    EXPECT_EQ(root.child("a").child("b"), Value(1));
    EXPECT_TRUE(Value::identical(root.child("a"), original_a));
}

TEST(GetDeepClone, LeafRootReplacedByContainerForFirstKey) {
    Value result = get_deep_clone(Path{0}, Value("leaf"), [](Value& container, const Key& key) {
        assign_child(container, key, "x");
    });
    ASSERT_TRUE(result.is_sequence());
    EXPECT_EQ(result.child(0), Value("x"));

    result = get_deep_clone(Path{"k"}, Value(), [](Value& container, const Key& key) {
        assign_child(container, key, 1);
    });
    ASSERT_TRUE(result.is_mapping());
    EXPECT_EQ(result.child("k"), Value(1));
}

TEST(GetDeepClone, HandlerSeesClonedParentAndLastKey) {
    Value root = Value::mapping({{"a", Value::sequence({1, 2})}});
    Value seen_parent;
    Key seen_key("unset");

    get_deep_clone(Path{"a", 1}, root, [&](Value& container, const Key& key) {
        seen_parent = container;
        seen_key = key;
    });

    EXPECT_EQ(seen_key, Key(1));
    EXPECT_EQ(seen_parent, root.child("a"));
    EXPECT_FALSE(Value::identical(seen_parent, root.child("a")));
}

TEST(GetDeepClone, SequenceRootAddressedByNameBecomesMapping) {
    Value root = Value::sequence({1, 2});
    Value next = get_deep_clone(Path{"x"}, root, [](Value& container, const Key& key) {
        assign_child(container, key, "v");
    });
    EXPECT_EQ(next, Value::mapping({{"x", "v"}}));
    EXPECT_EQ(root, Value::sequence({1, 2}));
}

// ============================================================================
// Terminal edits
// ============================================================================

TEST(AssignChild, PadsSequenceWithHoles) {
    Value seq = empty_container_for_key(Key(0));
    assign_child(seq, Key(2), "c");
    ASSERT_EQ(seq.size(), 3u);
    EXPECT_TRUE(seq.child(0).is_undefined());
    EXPECT_EQ(seq.child(2), Value("c"));
}

TEST(AssignChild, NonIndexNameOnSequenceIsIgnored) {
    Value seq = shallow_clone(Value::sequence({1}));
    assign_child(seq, Key("x"), 2);
    EXPECT_EQ(seq, Value::sequence({1}));

    assign_child(seq, Key("0"), 5);
    EXPECT_EQ(seq, Value::sequence({5}));
}

TEST(AssignChild, IndexOnMappingUsesDecimalName) {
    Value m = empty_container_for_key(Key("a"));
    assign_child(m, Key(0), "zero");
    EXPECT_EQ(m.child("0"), Value("zero"));
}

TEST(EraseChild, SplicesSequence) {
    Value seq = shallow_clone(Value::sequence({"a", "b", "c"}));
    EXPECT_TRUE(erase_child(seq, Key(1)));
    EXPECT_EQ(seq, Value::sequence({"a", "c"}));
    EXPECT_FALSE(erase_child(seq, Key(5)));
}

TEST(EraseChild, RemovesMappingField) {
    Value m = shallow_clone(Value::mapping({{"a", 1}, {"b", 2}}));
    EXPECT_TRUE(erase_child(m, Key("a")));
    EXPECT_FALSE(erase_child(m, Key("a")));
    EXPECT_EQ(m, Value::mapping({{"b", 2}}));
}

TEST(HasChild, CountsUndefinedFields) {
    Value m = Value::mapping({{"a", Value()}});
    EXPECT_TRUE(has_child(m, Key("a")));
    EXPECT_FALSE(has_child(m, Key("b")));

    Value seq = Value::sequence({Value()});
    EXPECT_TRUE(has_child(seq, Key(0)));
    EXPECT_TRUE(has_child(seq, Key("0")));
    EXPECT_FALSE(has_child(seq, Key(1)));
    EXPECT_FALSE(has_child(Value(3), Key(0)));
}
