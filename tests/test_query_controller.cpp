#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "query/query_controller.h"
#include "index/range_intersection_iterator.h"
#include "index_test_support.h"

using namespace sidx;
using namespace sidx::test;
using namespace std::chrono_literals;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

class QueryControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager_ = std::make_unique<SecondaryIndexManager>(store_);
        ASSERT_TRUE(manager_->createIndex("a", UTF8Type::instance()).ok);
        ASSERT_TRUE(manager_->createIndex("b", UTF8Type::instance()).ok);
        ASSERT_TRUE(manager_->registerColumn("c", UTF8Type::instance()).ok);

        a_ = *manager_->column("a");
        b_ = *manager_->column("b");
        c_ = *manager_->column("c");
    }

    void TearDown() override {
        manager_.reset();
    }

    /// Drei Dateien mit je einem Segment für a und b.
    void addSegments() {
        f1_ = makeFile(1, 1, 10);
        f2_ = makeFile(2, 11, 20);
        f3_ = makeFile(3, 21, 30);
        for (const auto& f : {f1_, f2_, f3_})
            store_.addFile(f);

        auto type = UTF8Type::instance();
        ASSERT_TRUE(manager_->attachSegments("a", {}, {
            makeSegment(f1_, type, {{"apple", 1}, {"apple", 5}}),
            makeSegment(f2_, type, {{"banana", 12}}),
            makeSegment(f3_, type, {{"banana", 25}, {"cherry", 27}})
        }).ok);
        ASSERT_TRUE(manager_->attachSegments("b", {}, {
            makeSegment(f1_, type, {{"x", 1}, {"y", 5}, {"z", 9}}),
            makeSegment(f2_, type, {{"y", 12}, {"z", 15}}),
            makeSegment(f3_, type, {{"y", 25}})
        }).ok);
    }

    QueryController::TimeSource fakeClock() {
        return [this] { return now_; };
    }

    static std::vector<uint64_t> generations(const SegmentSet& segments) {
        std::vector<uint64_t> out;
        for (const auto& s : segments)
            out.push_back(s->generation());
        return out;
    }

    DataStore store_;
    std::unique_ptr<SecondaryIndexManager> manager_;
    ColumnRef a_, b_, c_;
    DataFilePtr f1_, f2_, f3_;
    QueryController::Clock::time_point now_{};
};

TEST_F(QueryControllerTest, ReplanningSameGroupThrows) {
    ASSERT_TRUE(manager_->index(1, "a", "x").ok);
    QueryController controller(*manager_, QueryFilter{}, 1000ms);

    ExpressionGroup group{Expression::eq(a_, "x")};
    auto builder = controller.plan(OperationType::OR, group);
    EXPECT_EQ(builder->rangeCount(), 1u);

    ExpressionGroup again{Expression::eq(a_, "x")};
    EXPECT_THROW(controller.plan(OperationType::OR, again), std::invalid_argument);
    EXPECT_EQ(controller.openGroups(), 1u);
}

TEST_F(QueryControllerTest, OrAndAndOverMemtable) {
    ASSERT_TRUE(manager_->index(1, "a", "x").ok);
    ASSERT_TRUE(manager_->index(3, "a", "x").ok);
    ASSERT_TRUE(manager_->index(2, "b", "y").ok);
    ASSERT_TRUE(manager_->index(3, "b", "y").ok);

    QueryController controller(*manager_, QueryFilter{}, 1000ms);

    auto orBuilder = controller.plan(OperationType::OR, {Expression::eq(a_, "x"), Expression::eq(b_, "y")});
    EXPECT_THAT(drain(orBuilder->build()), ElementsAre(1, 2, 3));

    auto andBuilder = controller.plan(OperationType::AND, {Expression::eq(b_, "y"), Expression::eq(a_, "x")});
    EXPECT_THAT(drain(andBuilder->build()), ElementsAre(3));

    EXPECT_EQ(controller.openGroups(), 2u);
}

TEST_F(QueryControllerTest, TimeQuotaIsCheckedAtCheckpoints) {
    QueryController controller(*manager_, QueryFilter{}, 100ms, fakeClock());

    now_ += 50ms;
    EXPECT_NO_THROW(controller.checkpoint());
    EXPECT_EQ(controller.elapsed(), 50ms);

    now_ += 100ms;
    try {
        controller.checkpoint();
        FAIL() << "expected TimeQuotaExceededException";
    } catch (const TimeQuotaExceededException& e) {
        EXPECT_EQ(e.elapsed(), 150ms);
        EXPECT_EQ(e.quota(), 100ms);
    }
}

TEST_F(QueryControllerTest, QuotaBoundaryIsInclusive) {
    QueryController controller(*manager_, QueryFilter{}, 100ms, fakeClock());
    now_ += 99ms;
    EXPECT_NO_THROW(controller.checkpoint());
    now_ += 1ms;
    EXPECT_THROW(controller.checkpoint(), TimeQuotaExceededException);
}

TEST_F(QueryControllerTest, PrimaryIsTheMostSelectiveExpression) {
    addSegments();
    QueryController controller(*manager_, QueryFilter{}, 1000ms);

    ExpressionGroup group{Expression::eq(b_, "y"), Expression::eq(a_, "apple")};
    auto primary = controller.primary(group);
    ASSERT_TRUE(primary.has_value());
    EXPECT_EQ(primary->first, Expression::eq(a_, "apple"));
    EXPECT_THAT(generations(primary->second), ElementsAre(1));

    // Kandidaten für b nur innerhalb des Schlüsselbereichs des Primärausdrucks
    auto candidates = controller.candidates(OperationType::AND, group);
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].first, Expression::eq(b_, "y"));
    EXPECT_THAT(generations(candidates[0].second), ElementsAre(1));
    for (const auto& seg : candidates[0].second) {
        bool overlaps = false;
        for (const auto& p : primary->second)
            overlaps |= seg->minKey() <= p->maxKey() && seg->maxKey() >= p->minKey();
        EXPECT_TRUE(overlaps) << seg->toString();
    }

    auto builder = controller.plan(OperationType::AND, group);
    EXPECT_THAT(drain(builder->build()), ElementsAre(5));
}

TEST_F(QueryControllerTest, PrimaryTieKeepsFirstExpression) {
    addSegments();
    QueryController controller(*manager_, QueryFilter{}, 1000ms);

    ExpressionGroup group{Expression::prefix(a_, "app"), Expression::eq(a_, "apple")};
    auto primary = controller.primary(group);
    ASSERT_TRUE(primary.has_value());
    EXPECT_EQ(primary->first, Expression::prefix(a_, "app"));
}

TEST_F(QueryControllerTest, PrimaryWithoutSegmentsLeavesOthersUnnarrowed) {
    addSegments();
    // a='m' steht nur im Memtable
    ASSERT_TRUE(manager_->index(12, "a", "m").ok);
    QueryController controller(*manager_, QueryFilter{}, 1000ms);

    ExpressionGroup group{Expression::eq(a_, "m"), Expression::eq(b_, "y")};
    auto primary = controller.primary(group);
    ASSERT_TRUE(primary.has_value());
    EXPECT_EQ(primary->first, Expression::eq(a_, "m"));
    EXPECT_THAT(primary->second, IsEmpty());

    auto candidates = controller.candidates(OperationType::AND, group);
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_THAT(generations(candidates[0].second), IsEmpty());
    EXPECT_EQ(candidates[1].first, Expression::eq(b_, "y"));
    EXPECT_THAT(generations(candidates[1].second), ElementsAre(1, 2, 3));

    auto builder = controller.plan(OperationType::AND, group);
    EXPECT_EQ(builder->rangeCount(), 2u);
    EXPECT_THAT(drain(builder->build()), ElementsAre(12));
}

TEST_F(QueryControllerTest, OrMatchesEveryExpressionIndependently) {
    addSegments();
    QueryController controller(*manager_, QueryFilter{}, 1000ms);

    auto candidates = controller.candidates(OperationType::OR, {Expression::eq(a_, "apple"), Expression::eq(b_, "y")});
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_THAT(generations(candidates[0].second), ElementsAre(1));
    EXPECT_THAT(generations(candidates[1].second), ElementsAre(1, 2, 3));
}

TEST_F(QueryControllerTest, NotEqualAndUnindexedAreLeftToPostFilter) {
    addSegments();
    QueryController controller(*manager_, QueryFilter{}, 1000ms);

    ExpressionGroup group{Expression::notEq(a_, "apple"), Expression::eq(c_, "z"), Expression::eq(b_, "z")};
    EXPECT_FALSE(QueryController::isEligible(group[0]));
    EXPECT_FALSE(QueryController::isEligible(group[1]));

    auto candidates = controller.candidates(OperationType::AND, group);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].first, group[2]);

    auto description = controller.describe(OperationType::AND, group);
    EXPECT_EQ(description["operation"], "AND");
    EXPECT_EQ(description["post_filter"].size(), 2u);
    EXPECT_EQ(description["candidates"].size(), 1u);
    EXPECT_EQ(description["primary"], group[2].toString());

    auto builder = controller.plan(OperationType::AND, group);
    EXPECT_EQ(builder->rangeCount(), 1u);
    EXPECT_THAT(drain(builder->build()), ElementsAre(9, 15));
}

TEST_F(QueryControllerTest, ScopeLimitsCandidates) {
    addSegments();
    QueryFilter filter{KeyRange::of(11, 30)};
    QueryController controller(*manager_, filter, 1000ms);

    EXPECT_EQ(controller.scope().size(), 2u);
    EXPECT_EQ(controller.scope().count(f1_), 0u);

    auto candidates = controller.candidates(OperationType::OR, {Expression::eq(a_, "apple"), Expression::eq(b_, "y")});
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_THAT(generations(candidates[0].second), IsEmpty());
    EXPECT_THAT(generations(candidates[1].second), ElementsAre(2, 3));

    EXPECT_EQ(controller.plan(OperationType::OR, {Expression::eq(a_, "apple")})->build(), nullptr);
}

TEST_F(QueryControllerTest, UnresolvedKeyRangeHasEmptyScope) {
    addSegments();
    QueryFilter filter{std::nullopt};
    QueryController controller(*manager_, filter, 1000ms);
    EXPECT_TRUE(controller.scope().empty());
    EXPECT_EQ(controller.plan(OperationType::OR, {Expression::eq(b_, "y")})->build(), nullptr);
}

TEST_F(QueryControllerTest, FinishReleasesScopeOnceDespiteFailingClose) {
    addSegments();
    auto f4 = makeFile(4, 40, 40);
    store_.addFile(f4);
    auto failing = std::make_shared<SegmentIndex>(f4, std::make_unique<FailingCloseReader>(std::vector<Token>{40}),
                                                  40, 40, "q", "q");
    ASSERT_TRUE(manager_->attachSegments("a", {}, {failing}).ok);

    const int baseline = f4->refCount();
    const int baseline1 = f1_->refCount();
    {
        QueryController controller(*manager_, QueryFilter{}, 1000ms);
        EXPECT_EQ(f4->refCount(), baseline + 1);

        auto builder = controller.plan(OperationType::OR, {Expression::eq(a_, "q")});
        EXPECT_EQ(failing->refCount(), 2);

        EXPECT_NO_THROW(controller.finish());
        EXPECT_TRUE(controller.isFinished());
        EXPECT_EQ(controller.openGroups(), 0u);
        EXPECT_EQ(f4->refCount(), baseline);
        EXPECT_EQ(failing->refCount(), 1);

        EXPECT_NO_THROW(controller.finish());
        EXPECT_THROW(controller.plan(OperationType::OR, {Expression::eq(a_, "apple")}), std::logic_error);
    }
    EXPECT_EQ(f4->refCount(), baseline);
    EXPECT_EQ(f1_->refCount(), baseline1);
}

TEST_F(QueryControllerTest, DestructorFinishesUnfinishedSession) {
    addSegments();
    const int baseline = f2_->refCount();
    SegmentIndexPtr segment;
    {
        QueryController controller(*manager_, QueryFilter{}, 1000ms);
        auto builder = controller.plan(OperationType::AND, {Expression::eq(a_, "banana"), Expression::eq(b_, "y")});
        EXPECT_EQ(f2_->refCount(), baseline + 1);
        segment = *manager_->getIndex("a")->getView()->match(12, 12).begin();
        EXPECT_EQ(segment->refCount(), 2);
    }
    EXPECT_EQ(f2_->refCount(), baseline);
    EXPECT_EQ(segment->refCount(), 1);
}

TEST_F(QueryControllerTest, ReleaseOfUnknownGroupIsNoOp) {
    addSegments();
    QueryController controller(*manager_, QueryFilter{}, 1000ms);

    ExpressionGroup group{Expression::eq(a_, "banana")};
    controller.plan(OperationType::OR, group);
    EXPECT_NO_THROW(controller.release({Expression::eq(b_, "nothing")}));
    EXPECT_EQ(controller.openGroups(), 1u);

    controller.release(group);
    EXPECT_EQ(controller.openGroups(), 0u);
    controller.release(group);

    // nach release darf dieselbe Gruppe erneut geplant werden
    EXPECT_NO_THROW(controller.plan(OperationType::OR, group));
}

TEST_F(QueryControllerTest, ViewChangeDuringQueryKeepsFilesAlive) {
    addSegments();
    QueryController controller(*manager_, QueryFilter{}, 1000ms);
    auto builder = controller.plan(OperationType::OR, {Expression::eq(a_, "banana")});

    // Kompaktierung während die Query läuft
    store_.replaceFiles({f2_}, {});
    ASSERT_TRUE(manager_->attachSegments("a", DataFileSet{f2_}, {}).ok);
    EXPECT_GT(f2_->refCount(), 0);

    EXPECT_THAT(drain(builder->build()), ElementsAre(12, 25));
    controller.finish();
}
