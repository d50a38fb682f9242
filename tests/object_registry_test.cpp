#include "flyweight_factory.hpp"
#include "object.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

class Widget : public Object {
public:
    std::string getType() const override { return "Widget"; }
};

class Gadget : public Object {
public:
    std::string getType() const override { return "Gadget"; }
};

class ObjectRegistryTest : public ::testing::Test {
protected:
    ObjectRegistry& registry = ObjectRegistry::getInstance();

    void SetUp() override { registry.clear(); }
    void TearDown() override { registry.clear(); }
};

} // namespace

TEST_F(ObjectRegistryTest, IsASingleton) {
    EXPECT_EQ(&ObjectRegistry::getInstance(), &registry);
}

TEST_F(ObjectRegistryTest, RegisterAndLookup) {
    auto widget = std::make_shared<Widget>();
    registry.registerObject("widget", widget);

    EXPECT_TRUE(registry.hasObject("widget"));
    EXPECT_EQ(registry.getObject("widget").get(), widget.get());
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_FALSE(registry.isEmpty());
}

TEST_F(ObjectRegistryTest, MissingObjectIsNull) {
    EXPECT_EQ(registry.getObject("nothing"), nullptr);
    EXPECT_FALSE(registry.hasObject("nothing"));
    EXPECT_TRUE(registry.isEmpty());
}

TEST_F(ObjectRegistryTest, RegisterReplacesExisting) {
    registry.registerObject("item", std::make_shared<Widget>());
    registry.registerObject("item", std::make_shared<Gadget>());

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.getObject("item")->getType(), "Gadget");
}

TEST_F(ObjectRegistryTest, TypedLookup) {
    registry.registerObject("widget", std::make_shared<Widget>());

    EXPECT_NE(registry.getObjectAs<Widget>("widget"), nullptr);
    EXPECT_EQ(registry.getObjectAs<Gadget>("widget"), nullptr);
    EXPECT_EQ(registry.getObjectAs<Widget>("missing"), nullptr);
}

TEST_F(ObjectRegistryTest, RemoveReportsPresence) {
    registry.registerObject("widget", std::make_shared<Widget>());

    EXPECT_TRUE(registry.removeObject("widget"));
    EXPECT_FALSE(registry.removeObject("widget"));
    EXPECT_FALSE(registry.hasObject("widget"));
}

TEST_F(ObjectRegistryTest, NamesAreSorted) {
    registry.registerObject("zeta", std::make_shared<Widget>());
    registry.registerObject("alpha", std::make_shared<Gadget>());

    std::vector<std::string> expected{"alpha", "zeta"};
    EXPECT_EQ(registry.getObjectNames(), expected);
}

TEST_F(ObjectRegistryTest, HoldsFactoriesByName) {
    auto factory = std::make_shared<RegisteredFlyweightFactory<Object>>("widgets");
    factory->registerType<Widget>("Widget");
    registry.registerObject("widget_factory", factory);

    auto found = registry.getObjectAs<RegisteredFlyweightFactory<Object>>("widget_factory");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->acquire("Widget").get(), factory->acquire("Widget").get());
}

TEST_F(ObjectRegistryTest, ConcurrentRegistration) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this, i]() {
            for (int j = 0; j < 50; ++j) {
                registry.registerObject("obj_" + std::to_string(i) + "_" + std::to_string(j),
                                        std::make_shared<Widget>());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(registry.size(), 400u);
}
