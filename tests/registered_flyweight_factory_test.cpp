#include "flyweight_factory.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

class Glyph : public Object {
public:
    virtual char symbol() const = 0;
};

class LetterA : public Glyph {
public:
    std::string getType() const override { return "LetterA"; }
    char symbol() const override { return 'A'; }
};

// Takes its font size from the construction context
class SizedLetter : public Glyph {
private:
    double fontSize;

public:
    explicit SizedLetter(const Context& context)
        : fontSize(context.has("size") ? context.get("size")->numberValue : 12.0) {}

    std::string getType() const override { return "SizedLetter"; }
    char symbol() const override { return 'S'; }
    double size() const { return fontSize; }
};

} // namespace

TEST(RegisteredFlyweightFactory, ProducesRegisteredTypes) {
    RegisteredFlyweightFactory<Glyph> glyphs;
    glyphs.registerType<LetterA>("A");

    auto first = glyphs.acquire("A");
    auto second = glyphs.acquire("A");

    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->symbol(), 'A');
    EXPECT_EQ(first.get(), second.get());
}

TEST(RegisteredFlyweightFactory, PassesContextToConstructor) {
    RegisteredFlyweightFactory<Glyph> glyphs;
    glyphs.registerType<SizedLetter>("S");

    auto small = std::dynamic_pointer_cast<SizedLetter>(glyphs.acquire("S", {{"size", 8}}));
    auto large = std::dynamic_pointer_cast<SizedLetter>(glyphs.acquire("S", {{"size", 24}}));
    auto fallback = std::dynamic_pointer_cast<SizedLetter>(glyphs.acquire("S"));

    ASSERT_NE(small, nullptr);
    ASSERT_NE(large, nullptr);
    ASSERT_NE(fallback, nullptr);
    EXPECT_DOUBLE_EQ(small->size(), 8.0);
    EXPECT_DOUBLE_EQ(large->size(), 24.0);
    EXPECT_DOUBLE_EQ(fallback->size(), 12.0);
    EXPECT_NE(small.get(), large.get());
}

TEST(RegisteredFlyweightFactory, CustomProducerIsCalledOncePerKey) {
    RegisteredFlyweightFactory<Glyph> glyphs;
    int calls = 0;
    glyphs.registerProducer("A", [&calls](const Context&) {
        ++calls;
        return std::make_shared<LetterA>();
    });

    glyphs.acquire("A", {{"bold", true}});
    glyphs.acquire("A", {{"bold", true}});
    glyphs.acquire("A", {{"bold", false}});

    EXPECT_EQ(calls, 2);
}

TEST(RegisteredFlyweightFactory, UnknownIdentifierRaisesConstructionError) {
    RegisteredFlyweightFactory<Glyph> glyphs;
    glyphs.registerType<LetterA>("A");

    try {
        glyphs.acquire("Z");
        FAIL() << "expected ConstructionError";
    } catch (const ConstructionError& e) {
        EXPECT_EQ(e.identifier(), "Z");
        EXPECT_NE(std::string(e.what()).find("no producer registered"), std::string::npos);
    }

    // Registering afterwards makes the same request succeed
    glyphs.registerType<SizedLetter>("Z");
    EXPECT_NE(glyphs.acquire("Z"), nullptr);
}

TEST(RegisteredFlyweightFactory, ProducerTableManagement) {
    RegisteredFlyweightFactory<Glyph> glyphs;
    glyphs.registerType<SizedLetter>("S").registerType<LetterA>("A");

    std::vector<std::string> expected{"A", "S"};
    EXPECT_EQ(glyphs.producerNames(), expected);
    EXPECT_TRUE(glyphs.hasProducer("A"));

    glyphs.removeProducer("A");
    EXPECT_FALSE(glyphs.hasProducer("A"));
    EXPECT_THROW(glyphs.acquire("A"), ConstructionError);
}

TEST(RegisteredFlyweightFactory, RemovingProducerKeepsCachedInstances) {
    RegisteredFlyweightFactory<Glyph> glyphs;
    glyphs.registerType<LetterA>("A");
    auto cached = glyphs.acquire("A");

    glyphs.removeProducer("A");
    EXPECT_EQ(glyphs.acquire("A").get(), cached.get());
}

TEST(RegisteredFlyweightFactory, RejectsEmptyProducer) {
    RegisteredFlyweightFactory<Glyph> glyphs;
    EXPECT_THROW(glyphs.registerProducer("A", nullptr), std::invalid_argument);
    EXPECT_FALSE(glyphs.hasProducer("A"));
}

TEST(RegisteredFlyweightFactory, ReportsItsType) {
    RegisteredFlyweightFactory<Glyph> glyphs("glyphs");
    EXPECT_EQ(glyphs.getType(), "RegisteredFlyweightFactory");
    EXPECT_EQ(glyphs.getName(), "glyphs");
}
