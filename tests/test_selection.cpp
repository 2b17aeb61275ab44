#include <gtest/gtest.h>
#include "selection/category_selector.hpp"
#include "selection/cross_category_selector.hpp"
#include "selection/popular_selector.hpp"
#include "selection/random_selector.hpp"
#include "selection/rank_selector.hpp"
#include "selection/relevance_mix_selector.hpp"
#include "selection/selector_table.hpp"

#include <set>

using namespace linksim;

namespace {

struct Catalog {
    std::vector<Page> pages;

    std::vector<const Page*> pointers() const {
        std::vector<const Page*> out;
        for (const Page& p : pages) out.push_back(&p);
        return out;
    }
};

// `same` pages in /a/, `other` pages in /b/. Scores rise with id.
Catalog makeCatalog(size_t same, size_t other) {
    Catalog c;
    PageId id = 1;
    for (size_t i = 0; i < same; i++, id++) {
        c.pages.emplace_back(id, "/a/" + std::to_string(id), "product", "/a/", 0.01 * id);
    }
    for (size_t i = 0; i < other; i++, id++) {
        c.pages.emplace_back(id, "/b/" + std::to_string(id), "product", "/b/", 0.01 * id);
    }
    return c;
}

size_t countCategory(const std::vector<const Page*>& picked, const std::string& category) {
    size_t n = 0;
    for (const Page* p : picked) {
        if (p->category == category) n++;
    }
    return n;
}

} // namespace

TEST(SelectionTest, CategoryKeepsSameCategory) {
    auto c = makeCatalog(6, 6);
    Page source(100, "/a/src", "product", "/a/");
    std::mt19937_64 rng(1);
    auto picked = CategorySelector().select(source, c.pointers(), 4, rng);
    ASSERT_EQ(picked.size(), 4u);
    EXPECT_EQ(countCategory(picked, "/a/"), 4u);
}

TEST(SelectionTest, CategoryReturnsAllWhenFew) {
    auto c = makeCatalog(2, 5);
    Page source(100, "/a/src", "product", "/a/");
    std::mt19937_64 rng(1);
    auto picked = CategorySelector().select(source, c.pointers(), 10, rng);
    EXPECT_EQ(picked.size(), 2u);
}

TEST(SelectionTest, RelevanceMixSplitsSeventyThirty) {
    auto c = makeCatalog(20, 20);
    Page source(100, "/a/src", "product", "/a/");
    std::mt19937_64 rng(3);
    auto picked = RelevanceMixSelector().select(source, c.pointers(), 10, rng);
    ASSERT_EQ(picked.size(), 10u);
    EXPECT_EQ(countCategory(picked, "/a/"), 7u);
    EXPECT_EQ(countCategory(picked, "/b/"), 3u);
}

TEST(SelectionTest, RelevanceMixSkipsEmptyBucket) {
    auto c = makeCatalog(0, 8);
    Page source(100, "/a/src", "product", "/a/");
    std::mt19937_64 rng(3);
    auto picked = RelevanceMixSelector().select(source, c.pointers(), 5, rng);
    EXPECT_EQ(picked.size(), 5u);
    EXPECT_EQ(countCategory(picked, "/b/"), 5u);
}

TEST(SelectionTest, RelevanceMixNoDuplicates) {
    auto c = makeCatalog(3, 3);
    Page source(100, "/a/src", "product", "/a/");
    std::mt19937_64 rng(11);
    auto picked = RelevanceMixSelector().select(source, c.pointers(), 10, rng);
    std::set<PageId> ids;
    for (const Page* p : picked) ids.insert(p->id);
    EXPECT_EQ(ids.size(), picked.size());
}

TEST(SelectionTest, RandomIgnoresCategory) {
    auto c = makeCatalog(3, 3);
    Page source(100, "/z/src", "product", "/z/");
    std::mt19937_64 rng(5);
    EXPECT_EQ(RandomSelector().select(source, c.pointers(), 4, rng).size(), 4u);
    EXPECT_EQ(RandomSelector().select(source, c.pointers(), 40, rng).size(), 6u);
}

TEST(SelectionTest, RankHighAndLow) {
    auto c = makeCatalog(5, 0);
    Page source(100, "/a/src", "product", "/a/");
    std::mt19937_64 rng(5);

    auto high = RankSelector(true).select(source, c.pointers(), 2, rng);
    ASSERT_EQ(high.size(), 2u);
    EXPECT_EQ(high[0]->id, 5u);
    EXPECT_EQ(high[1]->id, 4u);

    auto low = RankSelector(false).select(source, c.pointers(), 2, rng);
    ASSERT_EQ(low.size(), 2u);
    EXPECT_EQ(low[0]->id, 1u);
    EXPECT_EQ(low[1]->id, 2u);
}

TEST(SelectionTest, CrossCategoryExcludesSourceCategory) {
    auto c = makeCatalog(6, 6);
    Page source(100, "/a/src", "product", "/a/");
    std::mt19937_64 rng(2);
    auto picked = CrossCategorySelector().select(source, c.pointers(), 4, rng);
    ASSERT_EQ(picked.size(), 4u);
    EXPECT_EQ(countCategory(picked, "/b/"), 4u);

    auto few = CrossCategorySelector().select(source, makeCatalog(5, 0).pointers(), 4, rng);
    EXPECT_TRUE(few.empty());
}

TEST(SelectionTest, PopularSamplesTopPool) {
    auto c = makeCatalog(40, 40);  // ids 31..80 are the top 50
    Page source(100, "/a/src", "product", "/a/");
    std::mt19937_64 rng(8);
    auto picked = PopularSelector().select(source, c.pointers(), 10, rng);
    ASSERT_EQ(picked.size(), 10u);
    for (const Page* p : picked) {
        EXPECT_GE(p->id, 31u);
    }

    auto all = PopularSelector().select(source, c.pointers(), 100, rng);
    EXPECT_EQ(all.size(), kPopularPoolSize);
}

TEST(SelectionTest, SameSeedSameChoice) {
    auto c = makeCatalog(30, 30);
    Page source(100, "/a/src", "product", "/a/");
    std::mt19937_64 rng_a(42);
    std::mt19937_64 rng_b(42);
    RandomSelector selector;
    auto a = selector.select(source, c.pointers(), 7, rng_a);
    auto b = selector.select(source, c.pointers(), 7, rng_b);
    EXPECT_EQ(a, b);
}

TEST(SelectionTest, ZeroTargets) {
    auto c = makeCatalog(4, 4);
    Page source(100, "/a/src", "product", "/a/");
    std::mt19937_64 rng(1);
    SelectorTable table;
    for (const SelectionStrategy* s : table.getAll()) {
        EXPECT_TRUE(s->select(source, c.pointers(), 0, rng).empty()) << toString(s->method());
    }
}

// ─── Method table ─────────────────────────────────────────────

TEST(SelectorTableTest, HasEveryMethod) {
    SelectorTable table;
    EXPECT_EQ(table.count(), SelectorTable::kMethodCount);
    EXPECT_EQ(table.get(SelectionMethod::RankLow).method(), SelectionMethod::RankLow);
    EXPECT_EQ(table.get(SelectionMethod::RelevanceMix).method(), SelectionMethod::RelevanceMix);
    for (const SelectionStrategy* s : table.getAll()) {
        EXPECT_FALSE(s->describe().empty());
    }
}

TEST(SelectorTableTest, ParseMethodNames) {
    EXPECT_EQ(parseSelectionMethod("category"), SelectionMethod::Category);
    EXPECT_EQ(parseSelectionMethod("Semantic"), SelectionMethod::RelevanceMix);
    EXPECT_EQ(parseSelectionMethod("random"), SelectionMethod::Random);
    EXPECT_EQ(parseSelectionMethod("pagerank_high"), SelectionMethod::RankHigh);
    EXPECT_EQ(parseSelectionMethod("PAGERANK_LOW"), SelectionMethod::RankLow);
    EXPECT_EQ(parseSelectionMethod("cross_sell"), SelectionMethod::CrossCategory);
    EXPECT_EQ(parseSelectionMethod("popular_products"), SelectionMethod::Popular);
    EXPECT_EQ(toString(SelectionMethod::CrossCategory), "cross_sell");
    EXPECT_EQ(toString(SelectionMethod::Popular), "popular_products");
}

TEST(SelectorTableTest, UnknownMethodFallsBackToCategory) {
    EXPECT_EQ(parseSelectionMethod("astrology"), SelectionMethod::Category);
    EXPECT_EQ(parseSelectionMethod(""), SelectionMethod::Category);
}
