// =============================================================================
// OOC - Query Plan Tests
// =============================================================================
//
// Plan construction: eager validation, schema propagation, pushdown flags
// and base column requirements. Nothing here executes a plan.
//
// =============================================================================

#include "test.hpp"

#include "ooc/core/error.hpp"
#include "ooc/query/plan.hpp"

using namespace ooc;
using namespace ooc::query;

namespace {

struct Fixture {
    test::TempDir dir;
    Dataset numbers;
    Dataset left;
    Dataset right;

    Fixture() {
        test::Random rng;
        ReadOptions opts;
        opts.column_types["score"] = ColumnType::Float;
        numbers = test::make_dataset(dir, "numbers", test::numbered_csv(20, rng), 8, opts);
        left = test::make_dataset(dir, "left", test::keyed_csv("x", {{1, "a"}, {2, "b"}}), 8);
        right = test::make_dataset(dir, "right", test::keyed_csv("y", {{2, "q"}, {3, "r"}}), 8);
    }
};

} // namespace

OOC_TEST_BEGIN

// =============================================================================
// Schema Propagation
// =============================================================================

OOC_TEST_UNIT(scan_exposes_base_schema) {
    Fixture f;
    QueryPlan plan = QueryPlan::scan(f.numbers);
    OOC_ASSERT_TRUE(plan.schema() == f.numbers.schema());
    OOC_ASSERT_TRUE(plan.operations().empty());
    OOC_ASSERT_THROWS((void)QueryPlan::scan(Dataset()), ValueError);
}

OOC_TEST_UNIT(builders_do_not_modify_the_source_plan) {
    Fixture f;
    QueryPlan base = QueryPlan::scan(f.numbers);
    QueryPlan filtered = base.filter("id > 3");
    QueryPlan narrowed = filtered.select({"grade"});

    OOC_ASSERT_TRUE(base.operations().empty());
    OOC_ASSERT_EQ(filtered.operations().size(), std::size_t{1});
    OOC_ASSERT_EQ(filtered.schema().size(), std::size_t{4});
    OOC_ASSERT_EQ(narrowed.operations().size(), std::size_t{2});
    OOC_ASSERT_STR_EQ("grade:string", narrowed.schema().to_string());
}

OOC_TEST_UNIT(select_is_idempotent) {
    Fixture f;
    QueryPlan once = QueryPlan::scan(f.numbers).select({"day", "id"});
    QueryPlan twice = once.select({"day", "id"});
    OOC_ASSERT_TRUE(once.schema() == twice.schema());
    OOC_ASSERT_STR_EQ("day:date, id:integer", twice.schema().to_string());
}

OOC_TEST_UNIT(select_errors) {
    Fixture f;
    QueryPlan plan = QueryPlan::scan(f.numbers);
    OOC_ASSERT_THROWS((void)plan.select({}), ValueError);
    OOC_ASSERT_THROWS((void)plan.select({"id", "id"}), DuplicateNameError);
    OOC_ASSERT_THROWS((void)plan.select({"price"}), UnknownColumnError);
    OOC_ASSERT_THROWS((void)plan.select({"grade"}).select({"id"}), UnknownColumnError);
}

OOC_TEST_UNIT(filter_validates_eagerly) {
    Fixture f;
    QueryPlan plan = QueryPlan::scan(f.numbers);
    OOC_ASSERT_THROWS((void)plan.filter("price > 1"), UnknownColumnError);
    OOC_ASSERT_THROWS((void)plan.filter("grade > 1"), TypeMismatchError);
    OOC_ASSERT_THROWS((void)plan.filter("score + 1"), TypeMismatchError);
    OOC_ASSERT_THROWS((void)plan.filter("score >"), ParseError);
    OOC_ASSERT_THROWS((void)plan.select({"grade"}).filter("id > 1"), UnknownColumnError);
    OOC_ASSERT_NO_THROW((void)plan.filter(col("day") >= lit(*parse_date("2024-02-01"))));
}

OOC_TEST_UNIT(filter_after_rename_uses_new_name) {
    Fixture f;
    Dataset renamed = f.numbers.rename("score", "points");
    QueryPlan plan = QueryPlan::scan(renamed);
    OOC_ASSERT_THROWS((void)plan.filter("score > 1"), UnknownColumnError);
    OOC_ASSERT_NO_THROW((void)plan.filter("points > 1"));
}

// =============================================================================
// Joins
// =============================================================================

OOC_TEST_UNIT(join_appends_right_columns) {
    Fixture f;
    QueryPlan plan = QueryPlan::scan(f.left).join(f.right, "key");
    OOC_ASSERT_STR_EQ("key:integer, x:string, y:string", plan.schema().to_string());

    const PlanOp& op = plan.operations().back();
    OOC_ASSERT_TRUE(op.kind == OpKind::Join);
    OOC_ASSERT_STR_EQ("key", op.key);
    OOC_ASSERT_TRUE(op.right.directory() == f.right.directory());
}

OOC_TEST_UNIT(join_errors) {
    Fixture f;
    QueryPlan plan = QueryPlan::scan(f.left);
    OOC_ASSERT_THROWS((void)plan.join(f.right, "x"), UnknownColumnError);
    OOC_ASSERT_THROWS((void)plan.join(f.numbers, "key"), UnknownColumnError);
    OOC_ASSERT_THROWS((void)plan.join(f.left, "key"), DuplicateNameError);
    OOC_ASSERT_THROWS((void)plan.join(Dataset(), "key"), ValueError);

    Dataset text_key = test::make_dataset(f.dir, "text", "key,z\nk1,1\n", 8);
    OOC_ASSERT_THROWS((void)plan.join(text_key, "key"), TypeMismatchError);
}

OOC_TEST_UNIT(join_accepts_float_against_integer_key) {
    Fixture f;
    Dataset float_key = test::make_dataset(f.dir, "floaty", "key,z\n2.0,1\n2.5,2\n", 8);
    OOC_ASSERT_TRUE(float_key.schema()[0].type == ColumnType::Float);
    QueryPlan plan = QueryPlan::scan(f.left).join(float_key, "key");
    OOC_ASSERT_EQ(plan.schema().size(), std::size_t{3});
}

// =============================================================================
// Pushdown and Column Requirements
// =============================================================================

OOC_TEST_UNIT(filters_on_base_columns_are_pushable) {
    Fixture f;
    QueryPlan plan = QueryPlan::scan(f.left)
        .filter("key > 1")
        .join(f.right, "key")
        .filter("y == 'q'")
        .filter("x == 'b'")
        .filter("x == y");

    const auto& ops = plan.operations();
    OOC_ASSERT_EQ(ops.size(), std::size_t{5});
    OOC_ASSERT_TRUE(ops[0].pushable);
    OOC_ASSERT_FALSE(ops[2].pushable);
    OOC_ASSERT_TRUE(ops[3].pushable);
    OOC_ASSERT_FALSE(ops[4].pushable);

    std::vector<std::string> refs = {"x"};
    OOC_ASSERT_TRUE(ops[4].base_refs == refs);
}

OOC_TEST_UNIT(filters_after_head_stay_in_place) {
    Fixture f;
    QueryPlan plan = QueryPlan::scan(f.numbers).filter("id > 1").head(5).filter("id < 4");
    const auto& ops = plan.operations();
    OOC_ASSERT_TRUE(ops[0].pushable);
    OOC_ASSERT_TRUE(ops[1].kind == OpKind::Head);
    OOC_ASSERT_EQ(ops[1].limit, std::uint64_t{5});
    OOC_ASSERT_FALSE(ops[2].pushable);
}

OOC_TEST_UNIT(required_base_columns_follow_base_order) {
    Fixture f;
    QueryPlan plan = QueryPlan::scan(f.numbers).filter("day > date('2024-01-05')").select({"grade", "id"});
    std::vector<std::string> expected = {"id", "grade", "day"};
    OOC_ASSERT_TRUE(plan.required_base_columns() == expected);

    std::vector<std::string> all = {"id", "score", "grade", "day"};
    OOC_ASSERT_TRUE(QueryPlan::scan(f.numbers).required_base_columns() == all);
}

OOC_TEST_UNIT(required_base_columns_keep_join_key) {
    Fixture f;
    QueryPlan plan = QueryPlan::scan(f.left).join(f.right, "key").select({"y"});
    std::vector<std::string> expected = {"key"};
    OOC_ASSERT_TRUE(plan.required_base_columns() == expected);
}

OOC_TEST_UNIT(plan_text_lists_operations) {
    Fixture f;
    QueryPlan plan = QueryPlan::scan(f.left).filter("key >= 2").join(f.right, "key").select({"y"}).head(3);
    const std::string text = plan.to_string();
    OOC_ASSERT_STR_CONTAINS(text, "scan ");
    OOC_ASSERT_STR_CONTAINS(text, "filter (key >= 2)");
    OOC_ASSERT_STR_CONTAINS(text, "join ");
    OOC_ASSERT_STR_CONTAINS(text, " on key");
    OOC_ASSERT_STR_CONTAINS(text, "select [y]");
    OOC_ASSERT_STR_CONTAINS(text, "head 3");
}

OOC_TEST_END

OOC_TEST_MAIN()
