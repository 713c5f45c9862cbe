#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "records/Categories.hpp"

namespace {

std::string tempFile(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

}  // namespace

TEST(CategoriesTest, DefaultTaxonomyOrderAndContents) {
    const auto& cats = defaultCategories();
    ASSERT_EQ(cats.size(), 10u);
    EXPECT_EQ(cats.front().name, "Food & Dining");
    EXPECT_EQ(cats.back().name, "Other");
    EXPECT_EQ(cats[4].name, "Bills & Utilities");
    ASSERT_EQ(cats[4].subcategories.size(), 6u);
    EXPECT_EQ(cats[4].subcategories[0], "Rent/Mortgage");
}

TEST(CategoriesTest, MissingFileFallsBackToDefault) {
    CategoryDocument doc = loadCategoryDocument(tempFile("expense_no_such_categories.json"));
    EXPECT_EQ(doc.source, CategorySource::BuiltIn);

    auto parsed = nlohmann::ordered_json::parse(doc.text);
    ASSERT_TRUE(parsed["categories"].is_array());
    EXPECT_EQ(parsed["categories"].size(), 10u);
    EXPECT_EQ(parsed["categories"][1]["name"], "Transportation");
    EXPECT_EQ(parsed["categories"][1]["subcategories"][4], "Rideshare");
    EXPECT_EQ(parsed, categoriesToJson(defaultCategories()));
}

TEST(CategoriesTest, EmptyPathFallsBackToDefault) {
    EXPECT_EQ(loadCategoryDocument("").source, CategorySource::BuiltIn);
}

TEST(CategoriesTest, FileContentIsServedVerbatim) {
    const std::string path = tempFile("expense_categories_test.json");
    const std::string body = "{\"categories\": [{\"name\": \"Pets\", \"subcategories\": [\"Food\"]}]}\n";
    {
        std::ofstream out(path, std::ios::binary);
        out << body;
    }

    CategoryDocument doc = loadCategoryDocument(path);
    EXPECT_EQ(doc.source, CategorySource::File);
    EXPECT_EQ(doc.text, body);

    std::filesystem::remove(path);
}

TEST(CategoriesTest, NonUtf8FileFallsBackToDefault) {
    const std::string path = tempFile("expense_categories_latin1.json");
    {
        std::ofstream out(path, std::ios::binary);
        out << "{\"categories\": [\"Caf\xE9\"]}";
    }

    CategoryDocument doc = loadCategoryDocument(path);
    EXPECT_EQ(doc.source, CategorySource::BuiltIn);
    EXPECT_NO_THROW(nlohmann::ordered_json(doc.text).dump());
    EXPECT_EQ(nlohmann::ordered_json::parse(doc.text), categoriesToJson(defaultCategories()));

    std::filesystem::remove(path);
}

TEST(CategoriesTest, Utf8FileIsKept) {
    const std::string path = tempFile("expense_categories_utf8.json");
    const std::string body = "{\"categories\": [{\"name\": \"Caf\xC3\xA9\", \"subcategories\": []}]}";
    {
        std::ofstream out(path, std::ios::binary);
        out << body;
    }

    CategoryDocument doc = loadCategoryDocument(path);
    EXPECT_EQ(doc.source, CategorySource::File);
    EXPECT_EQ(doc.text, body);

    std::filesystem::remove(path);
}
