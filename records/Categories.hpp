#ifndef EXPENSE_CATEGORIES_HPP
#define EXPENSE_CATEGORIES_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct Category {
    std::string              name;
    std::vector<std::string> subcategories;
};

// 內建分類，沒有 categories 檔時使用
const std::vector<Category>& defaultCategories();

// { "categories": [ { "name": ..., "subcategories": [...] }, ... ] }
nlohmann::ordered_json categoriesToJson(const std::vector<Category>& categories);

enum class CategorySource { File, BuiltIn };

struct CategoryDocument {
    std::string    text;     // 原封不動當作 categories resource 回傳
    CategorySource source = CategorySource::BuiltIn;
};

// 讀取 categories 檔（原文不動）。
// 檔案不存在、讀不到、或不是合法 UTF-8 時，改用內建分類（dump 縮排 2）。
CategoryDocument loadCategoryDocument(const std::string& path);

#endif // EXPENSE_CATEGORIES_HPP
