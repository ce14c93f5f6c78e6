#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../include/Tether.h"

namespace {
    Tether::Weights::Table two_attributes() {
        return Tether::Weights::normalize({{"color", 0.4}, {"style", 0.6}});
    }
}

TEST(PriorityTest, SeededFromNormalizedWeights) {
    auto store = Tether::Priority::Store(two_attributes());

    ASSERT_EQ(store->size(), 2u);
    EXPECT_NEAR(store->value("color").item<double>(), 0.4, 1e-6);
    EXPECT_NEAR(store->value("style").item<double>(), 0.6, 1e-6);
    EXPECT_EQ(store->value("color").scalar_type(), torch::kFloat32);
    EXPECT_EQ(store->value("color").dim(), 0);
}

TEST(PriorityTest, ParametersAreTrainableAndOrdered) {
    auto store = Tether::Priority::Store(two_attributes());

    const auto parameters = store->parameters();
    ASSERT_EQ(parameters.size(), 2u);
    for (const auto& parameter : parameters) {
        EXPECT_TRUE(parameter.requires_grad());
    }
    EXPECT_EQ(store->names(), (std::vector<std::string>{"color", "style"}));
    EXPECT_NEAR(parameters[0].item<double>(), 0.4, 1e-6);
}

TEST(PriorityTest, UnknownNameThrows) {
    auto store = Tether::Priority::Store(two_attributes());

    EXPECT_FALSE(store->contains("texture"));
    EXPECT_THROW((void)store->value("texture"), Tether::UnknownAttributeError);
}

TEST(PriorityTest, DottedNamesAreRegistered) {
    auto store = Tether::Priority::Store(Tether::Weights::normalize({{"hair.color", 1.0}, {"hair_color", 1.0}}));

    EXPECT_EQ(store->parameters().size(), 2u);
    EXPECT_NEAR(store->value("hair.color").item<double>(), 0.5, 1e-6);
}

TEST(PriorityTest, SnapshotFollowsOptimizerUpdates) {
    auto store = Tether::Priority::Store(two_attributes());
    torch::optim::SGD optimizer(store->parameters(), torch::optim::SGDOptions(0.1));

    optimizer.zero_grad();
    auto objective = store->value("color") * 2.0;
    objective.backward();
    optimizer.step();

    const auto snapshot = store->snapshot();
    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(snapshot[0].first, "color");
    EXPECT_NEAR(snapshot[0].second, 0.4 - 0.2, 1e-6);
    EXPECT_NEAR(snapshot[1].second, 0.6, 1e-6);
}

TEST(PriorityTest, StoresNeverShareParameters) {
    const auto table = two_attributes();
    auto first = Tether::Priority::Store(table);
    auto second = Tether::Priority::Store(table);

    EXPECT_NE(first->value("color").data_ptr(), second->value("color").data_ptr());

    torch::optim::SGD optimizer(first->parameters(), torch::optim::SGDOptions(1.0));
    optimizer.zero_grad();
    (first->value("style") * 1.0).backward();
    optimizer.step();

    EXPECT_NEAR(first->value("style").item<double>(), -0.4, 1e-6);
    EXPECT_NEAR(second->value("style").item<double>(), 0.6, 1e-6);
}
