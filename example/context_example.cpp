#include "context.hpp"
#include "flyweight_factory.hpp"

#include <fmt/core.h>
#include <stdexcept>

int main() {
    std::string fontJson = R"({
        "family": "Serif",
        "size": 12,
        "style": { "italic": false, "bold": true },
        "fallbacks": ["Times", "Georgia"]
    })";

    try {
        fmt::print("=== Parsing a context ===\n");
        Context font = Context::fromJson(fontJson);
        fmt::print("{}\n", font.toString());

        fmt::print("\n=== Canonical form ===\n");
        fmt::print("{}\n", font.canonical());

        Context reordered{
            {"fallbacks", Context::fromJson(R"({"list": ["Times", "Georgia"]})").get("list")},
            {"style", Context{{"bold", true}, {"italic", false}}},
            {"size", 12},
            {"family", "Serif"}
        };
        fmt::print("reordered equals parsed: {}\n", reordered == font);
        fmt::print("derived key: {}\n", deriveFlyweightKey("Font", reordered));

        fmt::print("\n=== Accessing values ===\n");
        ContextNodeConstPtr style = font.get("style");
        if (style && style->type == ContextType::OBJECT) {
            ContextNodeConstPtr bold = style->getChild("bold");
            if (bold && bold->type == ContextType::BOOLEAN) {
                fmt::print("Bold: {}\n", bold->booleanValue ? "true" : "false");
            }
        }

        ContextNodeConstPtr fallbacks = font.get("fallbacks");
        if (fallbacks && fallbacks->type == ContextType::ARRAY) {
            ContextNodeConstPtr first = fallbacks->getElement(0);
            if (first && first->type == ContextType::STRING) {
                fmt::print("First fallback: {}\n", first->stringValue);
            }
        }

        fmt::print("\n=== Malformed input ===\n");
        Context::fromJson(R"({"size": })");
    } catch (const std::exception& e) {
        fmt::print("Error: {}\n", e.what());
    }

    return 0;
}
