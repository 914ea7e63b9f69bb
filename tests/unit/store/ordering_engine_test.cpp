#include <gtest/gtest.h>
#include <snipvault/store/ordering_engine.h>

#include <map>
#include <numeric>
#include <random>

#include "../../common/store_fixture.h"

using namespace snipvault;
using namespace snipvault::store;

class OrderingEngineTest : public test::StoreTest {
protected:
    void SetUp() override {
        test::StoreTest::SetUp();
        CollectionId collection = makeCollection();
        auto list = repo().createList(collection, "deploy");
        ASSERT_TRUE(list) << list.error().message;
        list_ = list.value();
        for (const char* label : {"A", "B", "C", "D"}) {
            auto id = repo().createListStep(list_, item(label, std::string("step ") + label));
            ASSERT_TRUE(id) << id.error().message;
            ids_[label] = id.value();
        }
    }

    std::vector<std::string> order() {
        auto steps = repo().listSteps(list_);
        EXPECT_TRUE(steps);
        std::vector<std::string> labels;
        if (!steps)
            return labels;
        for (const auto& step : steps.value()) {
            labels.push_back(step.label);
        }
        return labels;
    }

    std::vector<int> positions() {
        auto steps = repo().listSteps(list_);
        EXPECT_TRUE(steps);
        std::vector<int> out;
        if (!steps)
            return out;
        for (const auto& step : steps.value()) {
            out.push_back(step.listStep() ? step.listStep()->position : -1);
        }
        return out;
    }

    std::vector<ItemId> stepIds() {
        auto steps = repo().listSteps(list_);
        EXPECT_TRUE(steps);
        std::vector<ItemId> out;
        if (!steps)
            return out;
        for (const auto& step : steps.value()) {
            out.push_back(step.id);
        }
        return out;
    }

    ListId list_ = 0;
    std::map<std::string, ItemId> ids_;
};

TEST_F(OrderingEngineTest, AppendsAtEnd) {
    EXPECT_EQ(order(), (std::vector<std::string>{"A", "B", "C", "D"}));
    EXPECT_EQ(positions(), (std::vector<int>{1, 2, 3, 4}));
    auto count = repo().countSteps(list_);
    ASSERT_TRUE(count);
    EXPECT_EQ(count.value(), 4);
}

TEST_F(OrderingEngineTest, MoveUpShiftsIntermediateSteps) {
    ASSERT_TRUE(repo().moveStep(ids_["D"], 2));
    EXPECT_EQ(order(), (std::vector<std::string>{"A", "D", "B", "C"}));
    EXPECT_EQ(positions(), (std::vector<int>{1, 2, 3, 4}));
}

TEST_F(OrderingEngineTest, MoveDownShiftsIntermediateSteps) {
    ASSERT_TRUE(repo().moveStep(ids_["A"], 3));
    EXPECT_EQ(order(), (std::vector<std::string>{"B", "C", "A", "D"}));
    EXPECT_EQ(positions(), (std::vector<int>{1, 2, 3, 4}));
}

TEST_F(OrderingEngineTest, MoveToSamePositionIsNoOp) {
    ASSERT_TRUE(repo().moveStep(ids_["B"], 2));
    EXPECT_EQ(order(), (std::vector<std::string>{"A", "B", "C", "D"}));
}

TEST_F(OrderingEngineTest, MoveOutOfRangeIsRejected) {
    for (int bad : {0, 5, -1}) {
        auto r = repo().moveStep(ids_["A"], bad);
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, ErrorCode::ValidationError);
    }
    EXPECT_EQ(order(), (std::vector<std::string>{"A", "B", "C", "D"}));
}

TEST_F(OrderingEngineTest, MoveNonStepIsNotFound) {
    CollectionId other = makeCollection("other");
    auto loose = repo().createStandaloneItem(other, item("loose", "x"));
    ASSERT_TRUE(loose);
    auto r = repo().moveStep(loose.value(), 1);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST_F(OrderingEngineTest, InsertAtPositionShiftsFollowers) {
    auto id = repo().createListStep(list_, item("X", "inserted"), 2);
    ASSERT_TRUE(id) << id.error().message;
    EXPECT_EQ(order(), (std::vector<std::string>{"A", "X", "B", "C", "D"}));
    EXPECT_EQ(positions(), (std::vector<int>{1, 2, 3, 4, 5}));

    auto bad = repo().createListStep(list_, item("Y", "nope"), 7);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::ValidationError);
    EXPECT_EQ(positions().size(), 5u);
}

TEST_F(OrderingEngineTest, DeleteClosesGap) {
    ASSERT_TRUE(repo().deleteItem(ids_["B"]));
    EXPECT_EQ(order(), (std::vector<std::string>{"A", "C", "D"}));
    EXPECT_EQ(positions(), (std::vector<int>{1, 2, 3}));

    auto contiguous = repo().checkListContiguity(list_);
    ASSERT_TRUE(contiguous);
    EXPECT_TRUE(contiguous.value());
}

TEST_F(OrderingEngineTest, RenumberRepairsGapsAndDuplicates) {
    ASSERT_TRUE(db().execute("UPDATE items SET position = position * 10 WHERE list_id = " +
                             std::to_string(list_)));
    auto broken = repo().checkListContiguity(list_);
    ASSERT_TRUE(broken);
    EXPECT_FALSE(broken.value());

    auto changed = repo().renumberList(list_);
    ASSERT_TRUE(changed);
    EXPECT_EQ(changed.value(), 4);
    EXPECT_EQ(order(), (std::vector<std::string>{"A", "B", "C", "D"}));
    EXPECT_EQ(positions(), (std::vector<int>{1, 2, 3, 4}));

    auto again = repo().renumberList(list_);
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value(), 0);
}

TEST_F(OrderingEngineTest, ListCarriesStepCount) {
    auto list = repo().getList(list_);
    ASSERT_TRUE(list);
    EXPECT_EQ(list.value().stepCount, 4);
    EXPECT_EQ(list.value().name, "deploy");
}

TEST_F(OrderingEngineTest, MixedOperationsKeepPositionsContiguous) {
    std::vector<ItemId> expected = {ids_["A"], ids_["B"], ids_["C"], ids_["D"]};
    std::mt19937 rng(20261019);
    auto pick = [&rng](int lo, int hi) { return std::uniform_int_distribution<int>(lo, hi)(rng); };

    for (int i = 0; i < 200; ++i) {
        const int n = static_cast<int>(expected.size());
        const int op = n < 2 ? 0 : pick(0, 3);
        SCOPED_TRACE("operation " + std::to_string(i) + " kind " + std::to_string(op));

        if (op == 0) {
            const int position = pick(1, n + 1);
            auto id = repo().createListStep(list_, item("s" + std::to_string(i), "step"), position);
            ASSERT_TRUE(id) << id.error().message;
            expected.insert(expected.begin() + (position - 1), id.value());
        } else if (op == 1) {
            auto id = repo().createListStep(list_, item("s" + std::to_string(i), "step"));
            ASSERT_TRUE(id) << id.error().message;
            expected.push_back(id.value());
        } else if (op == 2) {
            const int from = pick(0, n - 1);
            const int to = pick(1, n);
            const ItemId moved = expected[static_cast<size_t>(from)];
            ASSERT_TRUE(repo().moveStep(moved, to));
            expected.erase(expected.begin() + from);
            expected.insert(expected.begin() + (to - 1), moved);
        } else {
            const int victim = pick(0, n - 1);
            ASSERT_TRUE(repo().deleteItem(expected[static_cast<size_t>(victim)]));
            expected.erase(expected.begin() + victim);
        }

        auto contiguous = repo().checkListContiguity(list_);
        ASSERT_TRUE(contiguous);
        ASSERT_TRUE(contiguous.value());
        ASSERT_EQ(stepIds(), expected);
    }

    std::vector<int> wanted(expected.size());
    std::iota(wanted.begin(), wanted.end(), 1);
    EXPECT_EQ(positions(), wanted);
}
