#include "Categories.hpp"

#include <fstream>
#include <iterator>
#include <utility>

using json = nlohmann::ordered_json;

namespace {

// JSON-RPC 回應必須是合法 UTF-8，否則 dump() 會丟 type_error
bool isValidUtf8(const std::string& text) {
    try {
        (void)json(text).dump();
        return true;
    } catch (const json::type_error&) {
        return false;
    }
}

}  // namespace

const std::vector<Category>& defaultCategories() {
    static const std::vector<Category> kDefaults = {
        {"Food & Dining", {"Groceries", "Restaurants", "Coffee & Snacks", "Delivery"}},
        {"Transportation", {"Gas", "Public Transit", "Parking", "Car Maintenance", "Rideshare"}},
        {"Shopping", {"Clothing", "Electronics", "Home Goods", "Personal Care"}},
        {"Entertainment", {"Movies", "Games", "Sports", "Hobbies", "Subscriptions"}},
        {"Bills & Utilities", {"Rent/Mortgage", "Electric", "Water", "Internet", "Phone", "Insurance"}},
        {"Healthcare", {"Doctor", "Dentist", "Pharmacy", "Gym", "Therapy"}},
        {"Travel", {"Flights", "Hotels", "Activities", "Souvenirs"}},
        {"Education", {"Tuition", "Books", "Courses", "Supplies"}},
        {"Business", {"Office Supplies", "Software", "Equipment", "Services"}},
        {"Other", {"Gifts", "Donations", "Miscellaneous"}},
    };
    return kDefaults;
}

json categoriesToJson(const std::vector<Category>& categories) {
    json arr = json::array();
    for (const auto& c : categories) {
        json jc;
        jc["name"]          = c.name;
        jc["subcategories"] = c.subcategories;
        arr.push_back(jc);
    }
    json root;
    root["categories"] = arr;
    return root;
}

CategoryDocument loadCategoryDocument(const std::string& path) {
    CategoryDocument doc;
    if (!path.empty()) {
        std::ifstream in(path, std::ios::binary);
        if (in) {
            std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            if (!in.bad() && isValidUtf8(text)) {
                doc.text   = std::move(text);
                doc.source = CategorySource::File;
                return doc;
            }
        }
    }
    doc.text   = categoriesToJson(defaultCategories()).dump(2);
    doc.source = CategorySource::BuiltIn;
    return doc;
}
