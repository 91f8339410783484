#include <blockwise/core/format.hpp>
#include <blockwise/core/page.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

using namespace blockwise;

namespace {

auto sample_page() -> Page {
    auto page = Page::make({LongBlock(LongVector{0, 1, 0}), IntBlock(IntVector{7, 8, 9}),
                            BytesBlock::constant("x", 3)});
    REQUIRE(page.has_value());
    return std::move(*page);
}

}  // namespace

TEST_CASE("Page::make checks position counts", "[core][page]") {
    SECTION("aligned blocks") {
        auto page = sample_page();
        REQUIRE(page.position_count() == 3);
        REQUIRE(page.block_count() == 3);
        REQUIRE(element_type(page.block(1)) == ElementType::Int);
    }

    SECTION("mismatched blocks") {
        auto page = Page::make({LongBlock(LongVector{0, 1}), IntBlock(IntVector{7, 8, 9})});
        REQUIRE_FALSE(page.has_value());
        REQUIRE(page.error().kind == ErrorKind::ShapeMismatch);
        REQUIRE(page.error().message == "block 1 has 3 positions but block 0 has 2");
    }

    SECTION("no blocks") {
        auto page = Page::make({});
        REQUIRE(page.has_value());
        REQUIRE(page->position_count() == 0);
        REQUIRE(Page::empty(5).position_count() == 5);
    }
}

TEST_CASE("Page::append_block", "[core][page]") {
    auto page = sample_page();

    auto wider = page.append_block(DoubleBlock(DoubleVector{1.0, 2.0, 3.0}));
    REQUIRE(wider.has_value());
    REQUIRE(wider->block_count() == 4);
    REQUIRE(page.block_count() == 3);

    auto bad = page.append_block(DoubleBlock(DoubleVector{1.0}));
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().kind == ErrorKind::ShapeMismatch);

    SECTION("a block-less page keeps its position count") {
        auto empty = Page::empty(5);

        auto short_block = empty.append_block(IntBlock(IntVector{1, 2, 3}));
        REQUIRE_FALSE(short_block.has_value());
        REQUIRE(short_block.error().kind == ErrorKind::ShapeMismatch);
        REQUIRE(short_block.error().message == "cannot append a block of 3 positions to a page of 5");

        auto matching = empty.append_block(IntBlock::constant(4, 5));
        REQUIRE(matching.has_value());
        REQUIRE(matching->position_count() == 5);
        REQUIRE(matching->block_count() == 1);
    }
}

TEST_CASE("Page::project", "[core][page]") {
    auto page = sample_page();

    const std::size_t channels[] = {1, 1, 0};
    auto projected = page.project(channels);
    REQUIRE(projected.has_value());
    REQUIRE(projected->block_count() == 3);
    REQUIRE(projected->block(0) == page.block(1));
    REQUIRE(projected->block(2) == page.block(0));

    const std::size_t out_of_range[] = {3};
    auto bad = page.project(out_of_range);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().kind == ErrorKind::ShapeMismatch);
}

TEST_CASE("Page::filter filters every block", "[core][page]") {
    auto page = sample_page();

    const std::int32_t keep[] = {2, 0};
    auto filtered = page.filter(keep);
    REQUIRE(filtered.position_count() == 2);
    REQUIRE(std::get<IntBlock>(filtered.block(1)) == IntBlock(IntVector{9, 7}));
    REQUIRE(std::get<BytesBlock>(filtered.block(2)) == BytesBlock::constant("x", 2));
}

TEST_CASE("Page::retain shares blocks", "[core][page]") {
    auto page = sample_page();
    auto second = page.retain();

    REQUIRE(second == page);
    Page moved = std::move(page);
    REQUIRE(moved == second);
}
