#include "classification/core/classCatalog.hpp"
#include "classification/core/errors.hpp"

#include <gtest/gtest.h>

#include <array>
#include <string>
#include <string_view>

namespace geolabel::classification::core {
namespace gtest {

TEST(ClassCatalogUnit, Normalize) {
	EXPECT_EQ(ClassCatalog::normalize("  Water \t"), "water");
	EXPECT_EQ(ClassCatalog::normalize("Bare Soil"), "bare soil");
	EXPECT_EQ(ClassCatalog::normalize("   "), "");
}

TEST(ClassCatalogUnit, Register_StoresRequestedColor) {
	ClassCatalog catalog;
	EXPECT_EQ(catalog.registerClass("Water", "#0000FF"), "#0000ff");
	EXPECT_TRUE(catalog.contains("water"));
	EXPECT_TRUE(catalog.contains(" WATER "));
	EXPECT_EQ(catalog.colorOf("water"), "#0000ff");
	EXPECT_EQ(catalog.size(), 1u);
}

TEST(ClassCatalogUnit, Reregister_KeepsColor) {
	ClassCatalog catalog;
	const std::string first = catalog.registerClass("forest", "#00aa00");

	static constexpr std::array<std::string_view, 4> OTHER = {"#ff0000", "", "not-a-color", "#00AA00"};
	for (const std::string_view color: OTHER) {
		EXPECT_EQ(catalog.registerClass(" Forest", color), first) << color;
	}
	EXPECT_EQ(catalog.colorOf("forest"), "#00aa00");
	EXPECT_EQ(catalog.size(), 1u);
}

TEST(ClassCatalogUnit, Register_EmptyName) {
	ClassCatalog catalog;
	EXPECT_THROW(catalog.registerClass("  ", "#123456"), InvalidClassError);
	EXPECT_TRUE(catalog.empty());
}

TEST(ClassCatalogUnit, Register_InvalidColor_UsesFallback) {
	ClassCatalog catalog;
	EXPECT_EQ(catalog.registerClass("urban", "red"), ClassCatalog::fallbackColor("urban"));
	EXPECT_EQ(catalog.registerClass("cloud", ""), ClassCatalog::fallbackColor("cloud"));
}

TEST(ClassCatalogUnit, Remove_Idempotent) {
	ClassCatalog catalog;
	catalog.registerClass("water", "#0000ff");

	catalog.remove("WATER");
	EXPECT_FALSE(catalog.contains("water"));
	EXPECT_NO_THROW(catalog.remove("water"));
	EXPECT_NO_THROW(catalog.remove("never-registered"));
	EXPECT_TRUE(catalog.empty());
}

TEST(ClassCatalogUnit, ColorOf_UnknownDoesNotInsert) {
	ClassCatalog catalog;
	const std::string color = catalog.colorOf("grassland");

	EXPECT_EQ(color, ClassCatalog::fallbackColor("grassland"));
	EXPECT_FALSE(catalog.contains("grassland"));
	EXPECT_TRUE(catalog.empty());
}

TEST(ClassCatalogUnit, FallbackColor_Deterministic) {
	const std::string a = ClassCatalog::fallbackColor("wetland");
	EXPECT_TRUE(ClassCatalog::isValidColor(a)) << a;
	EXPECT_EQ(a, ClassCatalog::fallbackColor("wetland"));
	EXPECT_EQ(a, ClassCatalog::fallbackColor("  WetLand "));
	EXPECT_EQ(ClassCatalog::fallbackColor(""), std::string(ClassCatalog::UNCLASSIFIED_COLOR));
}

TEST(ClassCatalogUnit, FallbackColor_Hue) {
	// "a": h = 7 * 31 + 97 = 314 -> hue 314. HLS(314, 0.45, 0.65) is a magenta: red and blue high, green lowest.
	const std::string color = ClassCatalog::fallbackColor("a");
	ASSERT_TRUE(ClassCatalog::isValidColor(color));

	const int r = std::stoi(color.substr(1, 2), nullptr, 16);
	const int g = std::stoi(color.substr(3, 2), nullptr, 16);
	const int b = std::stoi(color.substr(5, 2), nullptr, 16);
	EXPECT_GT(r, g);
	EXPECT_GT(b, g);
	EXPECT_GT(r, b);
}

TEST(ClassCatalogUnit, Entries_Sorted) {
	ClassCatalog catalog;
	catalog.registerClass("water", "#0000ff");
	catalog.registerClass("forest", "#00ff00");
	catalog.registerClass("bare soil", "#aa8800");

	const auto entries = catalog.entries();
	ASSERT_EQ(entries.size(), 3u);
	EXPECT_EQ(entries[0].name, "bare soil");
	EXPECT_EQ(entries[1].name, "forest");
	EXPECT_EQ(entries[2].name, "water");
	EXPECT_EQ(entries[2].color, "#0000ff");
}

TEST(ClassCatalogUnit, IsValidColor) {
	EXPECT_TRUE(ClassCatalog::isValidColor("#a1B2c3"));
	EXPECT_FALSE(ClassCatalog::isValidColor("a1b2c3"));
	EXPECT_FALSE(ClassCatalog::isValidColor("#a1b2c"));
	EXPECT_FALSE(ClassCatalog::isValidColor("#a1b2cg"));
}

} // namespace gtest
} // namespace geolabel::classification::core
