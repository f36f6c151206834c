#include <gtest/gtest.h>

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>
#include <vector>

#include "core/diff_sink.hpp"
#include "core/diff_stats.hpp"
#include "core/errors.hpp"
#include "core/rules.hpp"
#include "core/traversal.hpp"
#include "model/adapters.hpp"
#include "test_types.hpp"

using fixtures::parse_json;
using model::Value;

namespace {

struct Blob {
    std::vector<unsigned char> bytes;
};

// Dynamic node whose content has no structural payload.
class OpaqueAdapter final : public model::TypeAdapter {
public:
    model::Kind kind() const noexcept override { return model::Kind::Dynamic; }
    std::type_index type() const noexcept override { return typeid(Blob); }
    std::string_view name() const noexcept override { return {}; }
    std::string render(const void* obj) const override {
        return "<blob " + std::to_string(static_cast<const Blob*>(obj)->bytes.size()) + " bytes>";
    }
    model::Value payload(const void*) const override { return model::Value{}; }
};

class TraversalTest : public ::testing::Test {
protected:
    template <typename T>
    void run(const T& a, const T& b) {
        const Value va = Value::of(a);
        core::walk(va, Value::of(b), core::root_path(va), 0, rules_, sink_, stats_);
    }

    // Runs the walk and returns the error it raised.
    template <typename A, typename B>
    core::DiffError run_expecting_error(const A& a, const B& b) {
        const Value va = Value::of(a);
        try {
            core::walk(va, Value::of(b), core::root_path(va), 0, rules_, sink_, stats_);
        } catch (const core::DiffError& e) {
            return e;
        }
        ADD_FAILURE() << "walk did not throw";
        return core::DiffError(core::ErrorCode::InvalidValue, "", "no error");
    }

    const core::DiffRecord& at(const std::string& path) {
        const auto* rec = sink_.find(path);
        if (rec == nullptr) {
            ADD_FAILURE() << "no record at " << path;
            static const core::DiffRecord missing{};
            return missing;
        }
        return *rec;
    }

    core::TraversalRules rules_{};
    core::DiffSink sink_{};
    core::DiffStats stats_{};
};

TEST_F(TraversalTest, RootPathNaming) {
    const fixtures::Person p{};
    const fixtures::Person* pp = &p;
    const fixtures::Note n{};
    const std::vector<int> v{};
    const int i = 0;

    EXPECT_EQ(core::root_path(Value::of(p)), "Person");
    EXPECT_EQ(core::root_path(Value::of(pp)), "Person");
    EXPECT_EQ(core::root_path(Value::of(n)), "$");
    EXPECT_EQ(core::root_path(Value::of(v)), "$");
    EXPECT_EQ(core::root_path(Value::of(i)), "int32");
    EXPECT_EQ(core::root_path(Value{}), "$");
}

TEST_F(TraversalTest, EqualScalarsRecordNothing) {
    run(5, 5);
    run(std::string("x"), std::string("x"));
    EXPECT_TRUE(sink_.empty());
    EXPECT_EQ(stats_.leaves_compared, 2u);
}

TEST_F(TraversalTest, ScalarDifferenceAtRoot) {
    run(1.5, 2.0);
    ASSERT_EQ(sink_.size(), 1u);
    EXPECT_EQ(at("float64"), (core::DiffRecord{"float64", "1.5", "2"}));
}

TEST_F(TraversalTest, RecordFieldDifference) {
    run(fixtures::Person{"Alice", 30}, fixtures::Person{"Bob", 30});
    ASSERT_EQ(sink_.size(), 1u);
    EXPECT_EQ(at("Person.Name"), (core::DiffRecord{"Person.Name", "Alice", "Bob"}));
    EXPECT_EQ(stats_.positions_visited, 3u);
    EXPECT_EQ(stats_.leaves_compared, 2u);
}

TEST_F(TraversalTest, NestedRecordPaths) {
    fixtures::Order a = fixtures::make_order();
    fixtures::Order b = fixtures::make_order();
    b.owner->age = 31;
    b.items[1].qty = 5;

    run(a, b);
    ASSERT_EQ(sink_.size(), 2u);
    EXPECT_EQ(at("Order.Items[1].Qty"), (core::DiffRecord{"Order.Items[1].Qty", "1", "5"}));
    EXPECT_EQ(at("Order.Owner.Age"), (core::DiffRecord{"Order.Owner.Age", "30", "31"}));
}

// Length is recorded, then the common prefix is compared
TEST_F(TraversalTest, SequenceLengthMismatch) {
    run(std::vector<int>{1, 2, 3}, std::vector<int>{1, 2});
    ASSERT_EQ(sink_.size(), 1u);
    EXPECT_EQ(at("$[Length]"), (core::DiffRecord{"$[Length]", "3", "2"}));
}

TEST_F(TraversalTest, SequenceLengthAndElementMismatch) {
    run(std::vector<int>{1, 2, 3}, std::vector<int>{1, 5});
    ASSERT_EQ(sink_.size(), 2u);
    EXPECT_EQ(sink_.records()[0].path, "$[Length]");
    EXPECT_EQ(at("$[1]"), (core::DiffRecord{"$[1]", "2", "5"}));
}

// Identical storage means identical content
TEST_F(TraversalTest, SameSequenceShortCircuits) {
    const std::vector<int> v{1, 2, 3};
    run(v, v);
    EXPECT_TRUE(sink_.empty());
    EXPECT_EQ(stats_.positions_visited, 1u);
    EXPECT_EQ(stats_.leaves_compared, 0u);
}

TEST_F(TraversalTest, SorterAlignsElementsWithoutTouchingOriginals) {
    rules_.sorters.push_back(core::make_typed_sorter<int>("^\\$$", [](int x, int y) { return x < y; }));
    const std::vector<int> a{3, 1, 2};
    const std::vector<int> b{2, 3, 1};

    run(a, b);
    EXPECT_TRUE(sink_.empty());
    EXPECT_EQ(a, (std::vector<int>{3, 1, 2}));
    EXPECT_EQ(b, (std::vector<int>{2, 3, 1}));
}

TEST_F(TraversalTest, SorterOnlyAppliesToMatchingPaths) {
    rules_.sorters.push_back(core::make_typed_sorter<int>(R"(\.Other$)", [](int x, int y) { return x < y; }));
    run(std::vector<int>{2, 1}, std::vector<int>{1, 2});
    EXPECT_EQ(sink_.size(), 2u);
    EXPECT_EQ(at("$[0]"), (core::DiffRecord{"$[0]", "2", "1"}));
}

// Typed sorter errors pick up the path of the sorted sequence
TEST_F(TraversalTest, TypedSorterMismatchCarriesPath) {
    rules_.sorters.push_back(core::make_typed_sorter<long>("^\\$$", [](long x, long y) { return x < y; }));
    const auto e = run_expecting_error(std::vector<int>{2, 1}, std::vector<int>{1, 2});
    EXPECT_EQ(e.code(), core::ErrorCode::TypeMismatch);
    EXPECT_EQ(e.path(), "$");
    EXPECT_NE(std::string(e.what()).find("int64"), std::string::npos);
}

TEST_F(TraversalTest, SortedRecordsCompareByPosition) {
    rules_.sorters.push_back(core::make_typed_sorter<fixtures::Item>(
        R"(\.Items$)", [](const fixtures::Item& x, const fixtures::Item& y) { return x.sku < y.sku; }));
    fixtures::Order a = fixtures::make_order();
    fixtures::Order b = fixtures::make_order();
    std::swap(b.items[0], b.items[1]);
    b.items[0].qty = 9; // B-7 moved to the front

    run(a, b);
    ASSERT_EQ(sink_.size(), 1u);
    EXPECT_EQ(at("Order.Items[1].Qty"), (core::DiffRecord{"Order.Items[1].Qty", "1", "9"}));
    EXPECT_EQ(a.items[0].sku, "A-1");
    EXPECT_EQ(b.items[0].sku, "B-7");
}

TEST_F(TraversalTest, FixedArrayIndexSegments) {
    run(std::array<int, 3>{1, 2, 3}, std::array<int, 3>{1, 9, 3});
    ASSERT_EQ(sink_.size(), 1u);
    EXPECT_EQ(at("$[1]"), (core::DiffRecord{"$[1]", "2", "9"}));
}

TEST_F(TraversalTest, MapLengthAndValueDifference) {
    run(std::map<std::string, int>{{"x", 1}}, std::map<std::string, int>{{"x", 2}, {"y", 3}});
    ASSERT_EQ(sink_.size(), 2u);
    EXPECT_EQ(at("$[Length]"), (core::DiffRecord{"$[Length]", "1", "2"}));
    EXPECT_EQ(at("$[x]"), (core::DiffRecord{"$[x]", "1", "2"}));
    EXPECT_EQ(sink_.find("$[y]"), nullptr);
}

// A key missing from B compares against a zero value; keys only in B are not visited
TEST_F(TraversalTest, MapKeyAbsentFromB) {
    run(std::map<std::string, int>{{"x", 1}, {"z", 5}}, std::map<std::string, int>{{"x", 1}, {"w", 0}});
    ASSERT_EQ(sink_.size(), 1u);
    EXPECT_EQ(at("$[z]"), (core::DiffRecord{"$[z]", "5", "0"}));
}

TEST_F(TraversalTest, MapOfRecordsAbsentKeyDescendsIntoZeroRecord) {
    using People = std::map<std::string, fixtures::Person>;
    run(People{{"p", fixtures::Person{"Al", 3}}}, People{{"q", fixtures::Person{}}});
    ASSERT_EQ(sink_.size(), 2u);
    EXPECT_EQ(at("$[p].Name"), (core::DiffRecord{"$[p].Name", "Al", ""}));
    EXPECT_EQ(at("$[p].Age"), (core::DiffRecord{"$[p].Age", "3", "0"}));
}

TEST_F(TraversalTest, IntegerMapKeysRenderPlain) {
    run(std::map<int, std::string>{{7, "a"}}, std::map<int, std::string>{{7, "b"}});
    EXPECT_EQ(at("$[7]"), (core::DiffRecord{"$[7]", "a", "b"}));
}

TEST_F(TraversalTest, NullablePresenceMismatch) {
    const fixtures::Person p{"Alice", 30};
    const fixtures::Person* set = &p;
    const fixtures::Person* unset = nullptr;

    run(unset, set);
    ASSERT_EQ(sink_.size(), 1u);
    EXPECT_EQ(at("Person"), (core::DiffRecord{"Person", "<nil>", "<not nil>"}));
}

TEST_F(TraversalTest, NullableDescendsWithoutExtraSegment) {
    const fixtures::Person pa{"Alice", 30};
    const fixtures::Person pb{"Alice", 31};
    const fixtures::Person* a = &pa;
    const fixtures::Person* b = &pb;

    run(a, b);
    ASSERT_EQ(sink_.size(), 1u);
    EXPECT_EQ(at("Person.Age"), (core::DiffRecord{"Person.Age", "30", "31"}));
}

TEST_F(TraversalTest, SameReferentShortCircuits) {
    const fixtures::Person p{"Alice", 30};
    const fixtures::Person* a = &p;
    const fixtures::Person* b = &p;
    run(a, b);
    EXPECT_TRUE(sink_.empty());
    EXPECT_EQ(stats_.positions_visited, 1u);
}

TEST_F(TraversalTest, BothNullRecordsNothing) {
    const fixtures::Person* a = nullptr;
    const fixtures::Person* b = nullptr;
    run(a, b);
    run(std::optional<int>{}, std::optional<int>{});
    EXPECT_TRUE(sink_.empty());
}

TEST_F(TraversalTest, OptionalPresence) {
    run(std::optional<int>{}, std::optional<int>{5});
    EXPECT_EQ(at("int32"), (core::DiffRecord{"int32", "<nil>", "<not nil>"}));
}

TEST_F(TraversalTest, OptionalFieldInRecord) {
    fixtures::Order a = fixtures::make_order();
    fixtures::Order b = fixtures::make_order();
    b.memo.reset();
    b.owner.reset();

    run(a, b);
    ASSERT_EQ(sink_.size(), 2u);
    EXPECT_EQ(at("Order.Memo"), (core::DiffRecord{"Order.Memo", "<not nil>", "<nil>"}));
    EXPECT_EQ(at("Order.Owner"), (core::DiffRecord{"Order.Owner", "<not nil>", "<nil>"}));
}

TEST_F(TraversalTest, DynamicObjectDifference) {
    const Json::Value a = parse_json(R"({"a": 1, "b": "x"})");
    const Json::Value b = parse_json(R"({"a": 2, "b": "x"})");
    run(a, b);
    ASSERT_EQ(sink_.size(), 1u);
    EXPECT_EQ(at("$[a]"), (core::DiffRecord{"$[a]", "1", "2"}));
}

// Integer and real encodings of the same number agree
TEST_F(TraversalTest, DynamicNumbersCompareAsDouble) {
    run(parse_json(R"({"n": 1, "m": [2]})"), parse_json(R"({"n": 1.0, "m": [2.0]})"));
    EXPECT_TRUE(sink_.empty());
}

TEST_F(TraversalTest, DynamicArrayLengthDifference) {
    run(parse_json("[1, 2, 3]"), parse_json("[1, 2]"));
    ASSERT_EQ(sink_.size(), 1u);
    EXPECT_EQ(at("$[Length]"), (core::DiffRecord{"$[Length]", "3", "2"}));
}

TEST_F(TraversalTest, DynamicNullPresence) {
    run(parse_json(R"({"k": null, "m": 1})"), parse_json(R"({"k": "v", "m": 1})"));
    ASSERT_EQ(sink_.size(), 1u);
    EXPECT_EQ(at("$[k]"), (core::DiffRecord{"$[k]", "<nil>", "<not nil>"}));
}

// Missing object member on B reads as a null node
TEST_F(TraversalTest, DynamicMemberAbsentFromB) {
    run(parse_json(R"({"k": 1})"), parse_json(R"({"j": 1})"));
    ASSERT_EQ(sink_.size(), 1u);
    EXPECT_EQ(at("$[k]"), (core::DiffRecord{"$[k]", "<not nil>", "<nil>"}));
}

TEST_F(TraversalTest, DynamicBothNullRecordsNothing) {
    run(Json::Value{}, Json::Value{});
    run(parse_json(R"({"k": null})"), parse_json(R"({"k": null})"));
    EXPECT_TRUE(sink_.empty());
}

TEST_F(TraversalTest, DynamicConcreteKindMismatch) {
    const auto e = run_expecting_error(parse_json(R"({"a": "1"})"), parse_json(R"({"a": 1})"));
    EXPECT_EQ(e.code(), core::ErrorCode::TypeMismatch);
    EXPECT_EQ(e.path(), "$[a]");
    EXPECT_NE(std::string(e.what()).find("float64"), std::string::npos);
}

// A dynamic node with nothing comparable behind it cannot be diffed
TEST_F(TraversalTest, DynamicWithoutPayloadIsUnsupported) {
    const OpaqueAdapter adapter;
    const Blob a{{1, 2}};
    const Blob b{{1, 2}};
    try {
        core::walk(Value(&adapter, &a), Value(&adapter, &b), "$", 0, rules_, sink_, stats_);
        FAIL() << "expected DiffError";
    } catch (const core::DiffError& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::UnsupportedValue);
        EXPECT_EQ(e.path(), "$");
        EXPECT_NE(std::string(e.what()).find("<blob 2 bytes>"), std::string::npos);
    }
}

TEST_F(TraversalTest, DynamicFieldInRecord) {
    fixtures::Order a = fixtures::make_order();
    fixtures::Order b = fixtures::make_order();
    b.extra["flags"][1] = "y";

    run(a, b);
    ASSERT_EQ(sink_.size(), 1u);
    EXPECT_EQ(at("Order.Extra[flags][1]"), (core::DiffRecord{"Order.Extra[flags][1]", "x", "y"}));
}

TEST_F(TraversalTest, CStringComparesWholeText) {
    run(fixtures::Tag{"abc"}, fixtures::Tag{"axy"});
    ASSERT_EQ(sink_.size(), 1u);
    EXPECT_EQ(at("Tag.Label"), (core::DiffRecord{"Tag.Label", "abc", "axy"}));
}

// Equal text in distinct buffers is equal
TEST_F(TraversalTest, CStringEqualTextInDistinctBuffers) {
    const std::string a = "same";
    const std::string b = "same";
    run(fixtures::Tag{a.c_str()}, fixtures::Tag{b.c_str()});
    EXPECT_TRUE(sink_.empty());
    EXPECT_EQ(stats_.leaves_compared, 1u);
}

TEST_F(TraversalTest, CStringNullPresence) {
    run(fixtures::Tag{nullptr}, fixtures::Tag{"abc"});
    run(fixtures::Tag{nullptr}, fixtures::Tag{nullptr});
    ASSERT_EQ(sink_.size(), 1u);
    EXPECT_EQ(at("Tag.Label"), (core::DiffRecord{"Tag.Label", "<nil>", "<not nil>"}));
}

TEST_F(TraversalTest, CStringTrimRulesApply) {
    rules_.trim_spaces.push_back(core::PathPattern(R"(\.Label$)"));
    run(fixtures::Tag{" abc\t"}, fixtures::Tag{"abc"});
    EXPECT_TRUE(sink_.empty());
}

TEST_F(TraversalTest, TypeMismatch) {
    const auto e = run_expecting_error(1, std::string("1"));
    EXPECT_EQ(e.code(), core::ErrorCode::TypeMismatch);
    EXPECT_EQ(e.path(), "int32");
}

TEST_F(TraversalTest, InvalidValue) {
    const int one = 1;
    try {
        core::walk(Value{}, Value::of(one), "$", 0, rules_, sink_, stats_);
        FAIL() << "expected DiffError";
    } catch (const core::DiffError& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::InvalidValue);
        EXPECT_EQ(e.path(), "$");
    }
}

// Self-referencing chains stop at the depth limit
TEST_F(TraversalTest, DepthExceededOnCycle) {
    fixtures::Node a{1, nullptr};
    fixtures::Node b{1, nullptr};
    a.next = &a;
    b.next = &b;

    rules_.max_depth = 1;
    const auto e = run_expecting_error(a, b);
    EXPECT_EQ(e.code(), core::ErrorCode::DepthExceeded);
    EXPECT_EQ(e.path(), "Node.Next.Value");
}

TEST_F(TraversalTest, DepthExceededAtDefaultLimit) {
    fixtures::Node a{1, nullptr};
    fixtures::Node b{1, nullptr};
    a.next = &a;
    b.next = &b;

    const auto e = run_expecting_error(a, b);
    EXPECT_EQ(e.code(), core::ErrorCode::DepthExceeded);
}

TEST_F(TraversalTest, DepthLimitIsInclusive) {
    rules_.max_depth = 1;
    run(fixtures::Person{"A", 1}, fixtures::Person{"B", 1});
    EXPECT_EQ(sink_.size(), 1u);

    rules_.max_depth = 0;
    const auto e = run_expecting_error(fixtures::Person{"A", 1}, fixtures::Person{"B", 1});
    EXPECT_EQ(e.code(), core::ErrorCode::DepthExceeded);
    EXPECT_EQ(e.path(), "Person.Name");
}

// Sequences and maps do not add depth; dynamic objects do
TEST_F(TraversalTest, DynamicObjectsCountTowardDepth) {
    const Json::Value a = parse_json(R"({"a": {"b": 1}})");
    const Json::Value b = parse_json(R"({"a": {"b": 2}})");

    rules_.max_depth = 2;
    run(a, b);
    EXPECT_EQ(at("$[a][b]"), (core::DiffRecord{"$[a][b]", "1", "2"}));

    rules_.max_depth = 1;
    const auto e = run_expecting_error(a, b);
    EXPECT_EQ(e.code(), core::ErrorCode::DepthExceeded);
    EXPECT_EQ(e.path(), "$[a]");
}

TEST_F(TraversalTest, ComparatorElemDiff) {
    rules_.comparators.push_back(core::make_typed_comparator<std::string>(
        R"(\.Name$)", [](const std::string& a, const std::string& b) {
            if (a.size() == b.size()) {
                return core::CompareOutcome{};
            }
            return core::CompareOutcome{core::DiffKind::ElemDiff, "len " + std::to_string(a.size()),
                                        "len " + std::to_string(b.size())};
        }));

    run(fixtures::Person{"Alice", 30}, fixtures::Person{"Bruce", 30});
    EXPECT_TRUE(sink_.empty());

    run(fixtures::Person{"Alice", 30}, fixtures::Person{"Bo", 30});
    ASSERT_EQ(sink_.size(), 1u);
    EXPECT_EQ(at("Person.Name.$[customized]"),
              (core::DiffRecord{"Person.Name.$[customized]", "len 5", "len 2"}));
}

// A matched comparator replaces descent, including for records
TEST_F(TraversalTest, ComparatorNoDiffStopsDescent) {
    rules_.comparators.push_back(core::make_comparator("^Person$", [](const Value&, const Value&) {
        return core::CompareOutcome{};
    }));
    run(fixtures::Person{"Alice", 30}, fixtures::Person{"Bob", 40});
    EXPECT_TRUE(sink_.empty());
    EXPECT_EQ(stats_.positions_visited, 1u);
}

TEST_F(TraversalTest, ComparatorFirstMatchWins) {
    rules_.comparators.push_back(core::make_comparator("Name", [](const Value&, const Value&) {
        return core::CompareOutcome{core::DiffKind::ElemDiff, "first", "first"};
    }));
    rules_.comparators.push_back(core::make_comparator("Name", [](const Value&, const Value&) {
        return core::CompareOutcome{core::DiffKind::ElemDiff, "second", "second"};
    }));
    run(fixtures::Person{"A", 1}, fixtures::Person{"A", 1});
    EXPECT_EQ(at("Person.Name.$[customized]").a, "first");
}

TEST_F(TraversalTest, ComparatorLengthDiff) {
    rules_.comparators.push_back(core::make_comparator(R"(^\$$)", [](const Value&, const Value&) {
        return core::CompareOutcome{core::DiffKind::LengthDiff};
    }));
    run(std::vector<int>{1, 2, 3}, std::vector<int>{1});
    EXPECT_EQ(at("$.$[customized][Length]"), (core::DiffRecord{"$.$[customized][Length]", "3", "1"}));
}

TEST_F(TraversalTest, ComparatorNilDiff) {
    rules_.comparators.push_back(core::make_comparator("^Person$", [](const Value&, const Value&) {
        return core::CompareOutcome{core::DiffKind::NilDiff};
    }));
    const fixtures::Person p{};
    const fixtures::Person* a = &p;
    const fixtures::Person* b = nullptr;
    run(a, b);
    EXPECT_EQ(at("Person.$[customized]"), (core::DiffRecord{"Person.$[customized]", "<not nil>", "<nil>"}));
}

TEST_F(TraversalTest, ComparatorLengthDiffOnUnsizedValueIsProtocolViolation) {
    rules_.comparators.push_back(core::make_comparator("Age", [](const Value&, const Value&) {
        return core::CompareOutcome{core::DiffKind::LengthDiff};
    }));
    const auto e = run_expecting_error(fixtures::Person{}, fixtures::Person{});
    EXPECT_EQ(e.code(), core::ErrorCode::ProtocolViolation);
    EXPECT_EQ(e.path(), "Person.Age.$[customized]");
}

TEST_F(TraversalTest, ComparatorNilDiffOnRecordIsProtocolViolation) {
    rules_.comparators.push_back(core::make_comparator("^Person$", [](const Value&, const Value&) {
        return core::CompareOutcome{core::DiffKind::NilDiff};
    }));
    const auto e = run_expecting_error(fixtures::Person{}, fixtures::Person{});
    EXPECT_EQ(e.code(), core::ErrorCode::ProtocolViolation);
}

TEST_F(TraversalTest, ComparatorUnknownOutcomeIsProtocolViolation) {
    rules_.comparators.push_back(core::make_comparator("Name", [](const Value&, const Value&) {
        return core::CompareOutcome{static_cast<core::DiffKind>(42)};
    }));
    const auto e = run_expecting_error(fixtures::Person{}, fixtures::Person{});
    EXPECT_EQ(e.code(), core::ErrorCode::ProtocolViolation);
    EXPECT_EQ(e.path(), "Person.Name.$[customized]");
}

// Typed comparator errors pick up the path of the position
TEST_F(TraversalTest, TypedComparatorMismatchCarriesPath) {
    rules_.comparators.push_back(core::make_typed_comparator<int>("Name", [](int, int) {
        return core::CompareOutcome{};
    }));
    const auto e = run_expecting_error(fixtures::Person{}, fixtures::Person{});
    EXPECT_EQ(e.code(), core::ErrorCode::TypeMismatch);
    EXPECT_EQ(e.path(), "Person.Name");
}

TEST_F(TraversalTest, TrimSpaceOnMatchingPathOnly) {
    rules_.trim_spaces.push_back(core::PathPattern(R"(\.Comment$)"));
    run(fixtures::Note{"hi ", "hi "}, fixtures::Note{"hi", "hi"});
    ASSERT_EQ(sink_.size(), 1u);
    // Renderings are untrimmed
    EXPECT_EQ(at("$.Title"), (core::DiffRecord{"$.Title", "hi ", "hi"}));
}

TEST_F(TraversalTest, TrimCutset) {
    rules_.trims.push_back(core::TrimRule{core::PathPattern(R"(\.Comment$)"), "*"});
    run(fixtures::Note{"**bold**", "t"}, fixtures::Note{"bold", "t"});
    EXPECT_TRUE(sink_.empty());
}

// A matching cutset rule takes precedence over trim-space
TEST_F(TraversalTest, CutsetRuleConsultedBeforeTrimSpace) {
    rules_.trims.push_back(core::TrimRule{core::PathPattern(R"(\.Comment$)"), "*"});
    rules_.trim_spaces.push_back(core::PathPattern(R"(\.Comment$)"));
    run(fixtures::Note{" x ", "t"}, fixtures::Note{"x", "t"});
    ASSERT_EQ(sink_.size(), 1u);
    EXPECT_EQ(at("$.Comment"), (core::DiffRecord{"$.Comment", " x ", "x"}));
}

} // namespace
