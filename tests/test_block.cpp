#include <blockwise/core/block.hpp>
#include <blockwise/core/block_builder.hpp>
#include <blockwise/core/format.hpp>

#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace blockwise;

namespace {

// [1, null, [2, 3], 4]
auto mixed_int_block() -> IntBlock {
    auto block = IntBlock::from_arrays({1, 2, 3, 4}, {0, 1, 1, 3, 4});
    REQUIRE(block.has_value());
    return *block;
}

/// Sample values per element type; `other` differs from `c`.
template <typename T>
struct BlockSample;

template <>
struct BlockSample<bool> {
    static auto a() -> bool { return true; }
    static auto b() -> bool { return false; }
    static auto c() -> bool { return true; }
    static auto other() -> bool { return false; }
};

template <>
struct BlockSample<std::int32_t> {
    static auto a() -> std::int32_t { return 10; }
    static auto b() -> std::int32_t { return -20; }
    static auto c() -> std::int32_t { return 30; }
    static auto other() -> std::int32_t { return 31; }
};

template <>
struct BlockSample<std::int64_t> {
    static auto a() -> std::int64_t { return 10'000'000'000; }
    static auto b() -> std::int64_t { return -20; }
    static auto c() -> std::int64_t { return std::numeric_limits<std::int64_t>::max(); }
    static auto other() -> std::int64_t { return std::numeric_limits<std::int64_t>::min(); }
};

template <>
struct BlockSample<double> {
    static auto a() -> double { return 1.5; }
    static auto b() -> double { return -2.25; }
    static auto c() -> double { return 3.0; }
    static auto other() -> double { return 3.5; }
};

template <>
struct BlockSample<std::string> {
    static auto a() -> std::string { return "a"; }
    static auto b() -> std::string { return "bc"; }
    static auto c() -> std::string { return ""; }
    static auto other() -> std::string { return "d"; }
};

/// Equality must be reflexive and symmetric, and equal blocks hash equal.
template <typename T>
void check_all_equal(const std::vector<Block<T>>& blocks) {
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        for (std::size_t j = 0; j < blocks.size(); ++j) {
            INFO("layouts " << i << " and " << j);
            REQUIRE(blocks[i] == blocks[j]);
            REQUIRE(blocks[j] == blocks[i]);
            REQUIRE(blocks[i].hash() == blocks[j].hash());
        }
    }
}

}  // namespace

TEST_CASE("Block array representation accessors", "[core][block]") {
    auto block = mixed_int_block();

    REQUIRE(block.representation() == BlockRepresentation::Array);
    REQUIRE(block.position_count() == 4);
    REQUIRE(block.may_have_nulls());
    REQUIRE(block.may_have_multivalued_fields());
    REQUIRE_FALSE(block.are_all_values_null());
    REQUIRE(block.total_value_count() == 4);

    REQUIRE_FALSE(block.is_null(0));
    REQUIRE(block.is_null(1));
    REQUIRE(block.value_count(1) == 0);
    REQUIRE(block.value_count(2) == 2);
    REQUIRE(block.first_value_index(2) == 1);
    REQUIRE(block.get(block.first_value_index(2) + 1) == 3);
    REQUIRE(block.get(block.first_value_index(3)) == 4);
}

TEST_CASE("Block::from_arrays validates the layout", "[core][block]") {
    SECTION("offsets must not decrease") {
        auto block = IntBlock::from_arrays({1, 2}, {0, 2, 1});
        REQUIRE_FALSE(block.has_value());
        REQUIRE(block.error().kind == ErrorKind::ShapeMismatch);
    }

    SECTION("offsets must stay inside the values") {
        auto block = IntBlock::from_arrays({1}, {0, 1, 2});
        REQUIRE_FALSE(block.has_value());
        REQUIRE(block.error().kind == ErrorKind::ShapeMismatch);
    }

    SECTION("a null flag cannot carry values") {
        auto block = IntBlock::from_arrays({1}, {0, 1}, {true});
        REQUIRE_FALSE(block.has_value());
        REQUIRE(block.error().kind == ErrorKind::ShapeMismatch);
    }

    SECTION("explicit null flags agree with empty entries") {
        auto block = IntBlock::from_arrays({1}, {0, 1, 1}, {false, true});
        REQUIRE(block.has_value());
        REQUIRE(block->is_null(1));
    }
}

TEST_CASE("Block constant and constant-null", "[core][block]") {
    auto constant = LongBlock::constant(7, 3);
    REQUIRE(constant.position_count() == 3);
    REQUIRE_FALSE(constant.may_have_nulls());
    REQUIRE(constant == LongBlock(LongVector{7, 7, 7}));

    auto nulls = LongBlock::constant_null(3);
    REQUIRE(nulls.representation() == BlockRepresentation::ConstantNull);
    REQUIRE(nulls.are_all_values_null());
    REQUIRE(nulls.total_value_count() == 0);

    auto built_nulls = LongBlockBuilder().append_null().append_null().append_null().build();
    REQUIRE(built_nulls.has_value());
    REQUIRE(nulls == *built_nulls);
    REQUIRE(nulls.hash() == built_nulls->hash());
}

TEST_CASE("Block hash is positional", "[core][block][hash]") {
    SECTION("empty block hashes to 1") {
        REQUIRE(IntBlock().hash() == 1);
    }

    SECTION("null contributes -1") {
        REQUIRE(IntBlock::constant_null(1).hash() == 31 - 1);
    }

    SECTION("a value contributes its count then itself") {
        REQUIRE(IntBlock(IntVector{5}).hash() == (31 + 1) * 31 + 5);
    }

    SECTION("order matters") {
        REQUIRE(IntBlock(IntVector{1, 2}).hash() != IntBlock(IntVector{2, 1}).hash());
    }
}

TEMPLATE_TEST_CASE("Block equality holds across representations", "[core][block][hash]", bool,
                   std::int32_t, std::int64_t, double, std::string) {
    using T = TestType;
    const T a = BlockSample<T>::a();
    const T b = BlockSample<T>::b();
    const T c = BlockSample<T>::c();
    const T other = BlockSample<T>::other();

    SECTION("single values in every layout") {
        // [a, b, c]
        auto array_block = Block<T>::from_arrays({a, b, c}, {0, 1, 2, 3});
        REQUIRE(array_block.has_value());
        auto wide = Block<T>::from_arrays({other, c, a, b}, {0, 1, 2, 3, 4});
        REQUIRE(wide.has_value());
        const std::int32_t pick_array[] = {2, 3, 1};
        const std::int32_t pick_vector[] = {2, 1, 0};
        auto built = BlockBuilder<T>().append_value(a).append_value(b).append_value(c).build();
        REQUIRE(built.has_value());

        check_all_equal(std::vector<Block<T>>{
            Block<T>(Vector<T>{a, b, c}),
            *array_block,
            wide->filter(pick_array),
            Block<T>(Vector<T>{c, b, a, other}).filter(pick_vector),
            *built,
        });

        REQUIRE_FALSE(Block<T>(Vector<T>{a, b, c}) == Block<T>(Vector<T>{a, b}));
        REQUIRE_FALSE(Block<T>(Vector<T>{a, b, c}) == Block<T>(Vector<T>{a, b, other}));
        REQUIRE_FALSE(Block<T>(Vector<T>{a, b, other}) == *array_block);
    }

    SECTION("constant values in every layout") {
        // [a, a, a]
        auto array_block = Block<T>::from_arrays({a, a, a}, {0, 1, 2, 3});
        REQUIRE(array_block.has_value());
        const std::int32_t repeat[] = {1, 1, 1};

        check_all_equal(std::vector<Block<T>>{
            Block<T>::constant(a, 3),
            Block<T>(Vector<T>::constant(a, 5)).filter(repeat),
            Block<T>(Vector<T>{a, a, a}),
            *array_block,
            Block<T>(Vector<T>{other, a}).filter(repeat),
        });

        REQUIRE_FALSE(Block<T>::constant(a, 3) == Block<T>::constant(other, 3));
        REQUIRE_FALSE(Block<T>::constant(a, 3) == Block<T>::constant(a, 2));
    }

    SECTION("nulls and multi-valued positions") {
        // [a, null, [b, c]]
        auto array_block = Block<T>::from_arrays({a, b, c}, {0, 1, 1, 3});
        REQUIRE(array_block.has_value());
        auto flagged = Block<T>::from_arrays({a, b, c}, {0, 1, 1, 3}, {false, true, false});
        REQUIRE(flagged.has_value());
        // [other] [b, c] null [a]
        auto wide = Block<T>::from_arrays({other, b, c, a}, {0, 1, 3, 3, 4});
        REQUIRE(wide.has_value());
        const std::int32_t pick[] = {3, 2, 1};
        auto built = BlockBuilder<T>()
                         .append_value(a)
                         .append_null()
                         .begin_position_entry()
                         .append_value(b)
                         .append_value(c)
                         .end_position_entry()
                         .build();
        REQUIRE(built.has_value());

        check_all_equal(std::vector<Block<T>>{*array_block, *flagged, wide->filter(pick), *built});

        // [a, [b, c], null]
        auto moved_null = Block<T>::from_arrays({a, b, c}, {0, 1, 3, 3});
        REQUIRE(moved_null.has_value());
        REQUIRE_FALSE(*array_block == *moved_null);
        // [a, [b], c]
        auto split = Block<T>::from_arrays({a, b, c}, {0, 1, 2, 3});
        REQUIRE(split.has_value());
        REQUIRE_FALSE(*array_block == *split);
        REQUIRE_FALSE(*split == *array_block);
    }

    SECTION("all-null blocks in every layout") {
        auto array_block = Block<T>::from_arrays({}, {0, 0, 0});
        REQUIRE(array_block.has_value());
        auto wide = Block<T>::from_arrays({a}, {0, 0, 1, 1});
        REQUIRE(wide.has_value());
        const std::int32_t pick[] = {2, 0};
        auto built = BlockBuilder<T>().append_null().append_null().build();
        REQUIRE(built.has_value());

        check_all_equal(std::vector<Block<T>>{
            Block<T>::constant_null(2),
            *array_block,
            wide->filter(pick),
            *built,
        });

        REQUIRE_FALSE(Block<T>::constant_null(2) == Block<T>::constant(a, 2));
    }
}

TEST_CASE("DoubleBlock equality uses the canonical bit pattern", "[core][block][hash]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();

    SECTION("NaN equals NaN inside blocks") {
        auto array_block = DoubleBlock::from_arrays({1.0, -nan}, {0, 1, 2});
        REQUIRE(array_block.has_value());
        const std::int32_t pick[] = {1, 0};

        check_all_equal(std::vector<DoubleBlock>{
            DoubleBlock(DoubleVector{1.0, nan}),
            *array_block,
            DoubleBlock(DoubleVector{nan, 1.0}).filter(pick),
        });
        REQUIRE(DoubleBlock::constant(nan, 2) == DoubleBlock(DoubleVector{-nan, nan}));
        REQUIRE(DoubleBlock::constant(nan, 2).hash() == DoubleBlock(DoubleVector{-nan, nan}).hash());
    }

    SECTION("0.0 differs from -0.0 inside blocks") {
        REQUIRE_FALSE(DoubleBlock(DoubleVector{0.0}) == DoubleBlock(DoubleVector{-0.0}));
        REQUIRE_FALSE(DoubleBlock::constant(0.0, 2) == DoubleBlock::constant(-0.0, 2));

        auto array_block = DoubleBlock::from_arrays({-0.0}, {0, 1});
        REQUIRE(array_block.has_value());
        REQUIRE_FALSE(*array_block == DoubleBlock(DoubleVector{0.0}));
        REQUIRE(*array_block == DoubleBlock(DoubleVector{-0.0}));
    }
}

TEST_CASE("Block filter composes", "[core][block]") {
    auto block = mixed_int_block();

    const std::int32_t outer[] = {3, 2, 1, 0};
    const std::int32_t inner[] = {1, 2};
    auto twice = block.filter(outer).filter(inner);
    const std::int32_t direct[] = {2, 1};

    REQUIRE(twice.representation() == BlockRepresentation::Filtered);
    REQUIRE(twice == block.filter(direct));
    REQUIRE(twice.value_count(0) == 2);
    REQUIRE(twice.is_null(1));

    SECTION("positions may repeat") {
        const std::int32_t repeat[] = {0, 0, 0};
        auto repeated = block.filter(repeat);
        REQUIRE(repeated == IntBlock::constant(1, 3));
    }

    SECTION("get_row is a one-position filter") {
        auto row = block.get_row(2);
        REQUIRE(row.position_count() == 1);
        REQUIRE(row.value_count(0) == 2);
        REQUIRE(row.total_value_count() == 2);
    }
}

TEST_CASE("Block::as_vector", "[core][block]") {
    SECTION("succeeds on single-valued non-null positions") {
        auto block = IntBlock::from_arrays({5, 6, 7}, {0, 1, 2, 3});
        REQUIRE(block.has_value());
        auto vector = block->as_vector();
        REQUIRE(vector.has_value());
        REQUIRE(*vector == IntVector{5, 6, 7});
    }

    SECTION("follows a filtered view") {
        auto block = mixed_int_block();
        const std::int32_t pick[] = {3, 0};
        auto vector = block.filter(pick).as_vector();
        REQUIRE(vector.has_value());
        REQUIRE(*vector == IntVector{4, 1});
    }

    SECTION("fails on nulls") {
        auto vector = mixed_int_block().as_vector();
        REQUIRE_FALSE(vector.has_value());
        REQUIRE(vector.error().kind == ErrorKind::ShapeMismatch);
    }

    SECTION("fails on multi-valued positions") {
        const std::int32_t pick[] = {2};
        auto vector = mixed_int_block().filter(pick).as_vector();
        REQUIRE_FALSE(vector.has_value());
        REQUIRE(vector.error().kind == ErrorKind::ShapeMismatch);
    }
}

TEST_CASE("AnyBlock helpers", "[core][block]") {
    AnyBlock block = DoubleBlock(DoubleVector{1.5, 2.5});

    REQUIRE(position_count(block) == 2);
    REQUIRE(element_type(block) == ElementType::Double);
    REQUIRE(hash(block) == std::get<DoubleBlock>(block).hash());

    const std::int32_t pick[] = {1};
    REQUIRE(position_count(filter(block, pick)) == 1);

    auto typed = block_as<double>(block);
    REQUIRE(typed.has_value());
    REQUIRE((*typed)->position_count() == 2);

    auto wrong = block_as<std::int64_t>(block);
    REQUIRE_FALSE(wrong.has_value());
    REQUIRE(wrong.error().kind == ErrorKind::UnsupportedShape);

    auto nulls = constant_null_block(ElementType::Bytes, 4);
    REQUIRE(element_type(nulls) == ElementType::Bytes);
    REQUIRE(std::get<BytesBlock>(nulls).are_all_values_null());
}

TEST_CASE("Block renders nulls and multi-values", "[core][block][format]") {
    REQUIRE(to_string(mixed_int_block()) ==
            "intBlock[positions=4, values=[1, null, [2, 3], 4]]");
}
