#include "shell.hpp"
#include "util.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace inventory_tracker {

namespace {

std::optional<int> parseInt(const std::string& text) {
    const std::string s = boost::algorithm::trim_copy(text);
    if (s.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    const long value = std::strtol(s.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0' ||
        value < std::numeric_limits<int>::min() ||
        value > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

} // namespace

InventoryShell::InventoryShell(InventoryRepository& repo,
                               std::istream& in,
                               std::ostream& out,
                               int defaultLowStockThreshold)
    : mRepo(repo)
    , mIn(in)
    , mOut(out)
    , mDefaultThreshold(defaultLowStockThreshold) {}

// ---------------------------------------------------------------------------
// Menu loop
// ---------------------------------------------------------------------------

void InventoryShell::run() {
    while (true) {
        printMenu();
        const auto choice = ask("Choice");
        if (!choice) {
            mOut << "\n";
            return;
        }

        const auto n = parseInt(*choice);
        if (!n) {
            mOut << "Please enter a menu number.\n";
            continue;
        }

        try {
            switch (*n) {
                case 1:  listAll();        break;
                case 2:  addProduct();     break;
                case 3:  searchByName();   break;
                case 4:  findById();       break;
                case 5:  restock();        break;
                case 6:  recordSale();     break;
                case 7:  setStockLevel();  break;
                case 8:  editDetails();    break;
                case 9:  deleteProduct();  break;
                case 10: lowStockReport(); break;
                case 11: listByCategory(); break;
                case 12: inventoryValue(); break;
                case 0:  return;
                default:
                    mOut << "Unknown option " << *n << ".\n";
                    break;
            }
        } catch (const std::invalid_argument& e) {
            mOut << "Rejected: " << e.what() << "\n";
        } catch (const std::exception& e) {
            // e.g. Money overflow
            std::cerr << "[Shell] Operation failed: " << e.what() << "\n";
            mOut << "Error: " << e.what() << "\n";
        }

        if (!mIn) {
            return;
        }
    }
}

void InventoryShell::printMenu() {
    mOut << "\n=== Inventory (" << mRepo.size() << " products) ===\n"
         << "  1) List all products\n"
         << "  2) Add product\n"
         << "  3) Search by name\n"
         << "  4) Find by id\n"
         << "  5) Restock\n"
         << "  6) Record sale\n"
         << "  7) Set stock level\n"
         << "  8) Edit product details\n"
         << "  9) Delete product\n"
         << " 10) Low-stock report\n"
         << " 11) List by category\n"
         << " 12) Inventory value\n"
         << "  0) Save and exit\n";
}

// ---------------------------------------------------------------------------
// Actions
// ---------------------------------------------------------------------------

void InventoryShell::listAll() {
    printTable(mRepo.listAll());
}

void InventoryShell::addProduct() {
    const auto name = ask("Name");
    if (!name) return;

    const auto priceText = ask("Price");
    if (!priceText) return;
    Money price;
    try {
        price = Money::parse(*priceText);
    } catch (const std::invalid_argument& e) {
        mOut << "Invalid price: " << e.what() << "\n";
        return;
    }

    const auto quantity = askInt("Initial stock");
    if (!quantity) return;

    const auto category = ask("Category");
    if (!category) return;

    const Product p = mRepo.create(boost::algorithm::trim_copy(*name), price,
                                   *quantity,
                                   boost::algorithm::trim_copy(*category));
    mOut << "Added product #" << p.id << ".\n";
}

void InventoryShell::searchByName() {
    const auto query = ask("Name contains");
    if (!query) return;

    const auto matches = mRepo.findByName(boost::algorithm::trim_copy(*query));
    if (matches.empty()) {
        mOut << "No products match \"" << *query << "\".\n";
        return;
    }
    printTable(matches);
}

void InventoryShell::findById() {
    const auto p = askProduct();
    if (p) printProduct(*p);
}

void InventoryShell::restock() {
    const auto p = askProduct();
    if (!p) return;

    const auto qty = askInt("Quantity received");
    if (!qty) return;
    if (*qty <= 0) {
        mOut << "Quantity must be positive.\n";
        return;
    }

    if (mRepo.adjustStock(p->id, *qty)) {
        mOut << "Stock for #" << p->id << " is now "
             << mRepo.findById(p->id)->stockQuantity << ".\n";
    } else {
        mOut << "Restock rejected: stock would overflow.\n";
    }
}

void InventoryShell::recordSale() {
    const auto p = askProduct();
    if (!p) return;

    const auto qty = askInt("Quantity sold");
    if (!qty) return;
    if (*qty <= 0) {
        mOut << "Quantity must be positive.\n";
        return;
    }

    if (mRepo.adjustStock(p->id, -*qty)) {
        mOut << "Stock for #" << p->id << " is now "
             << mRepo.findById(p->id)->stockQuantity << ".\n";
    } else {
        mOut << "Insufficient stock: only " << p->stockQuantity
             << " available.\n";
    }
}

void InventoryShell::setStockLevel() {
    const auto p = askProduct();
    if (!p) return;

    const auto target = askInt("New stock level");
    if (!target) return;

    const int64_t delta = static_cast<int64_t>(*target) - p->stockQuantity;
    if (*target < 0 ||
        !mRepo.adjustStock(p->id, static_cast<int>(delta))) {
        mOut << "Stock level must not be negative.\n";
        return;
    }
    mOut << "Stock for #" << p->id << " set to " << *target << ".\n";
}

void InventoryShell::editDetails() {
    const auto p = askProduct();
    if (!p) return;

    mOut << "Leave a field empty to keep its current value.\n";
    ProductUpdate update;

    const auto name = ask("Name [" + p->name + "]");
    if (!name) return;
    if (!boost::algorithm::trim_copy(*name).empty()) {
        update.name = boost::algorithm::trim_copy(*name);
    }

    const auto priceText = ask("Price [" + p->price.toString() + "]");
    if (!priceText) return;
    if (!boost::algorithm::trim_copy(*priceText).empty()) {
        try {
            update.price = Money::parse(*priceText);
        } catch (const std::invalid_argument& e) {
            mOut << "Invalid price: " << e.what() << "\n";
            return;
        }
    }

    const auto category = ask("Category [" + p->category + "]");
    if (!category) return;
    if (!boost::algorithm::trim_copy(*category).empty()) {
        update.category = boost::algorithm::trim_copy(*category);
    }

    if (mRepo.updateDetails(p->id, update)) {
        mOut << "Updated product #" << p->id << ".\n";
    } else {
        mOut << "Product #" << p->id << " no longer exists.\n";
    }
}

void InventoryShell::deleteProduct() {
    const auto p = askProduct();
    if (!p) return;

    const auto confirm = ask("Delete \"" + p->name + "\"? (y/n)");
    if (!confirm) return;

    const std::string answer = boost::algorithm::trim_copy(*confirm);
    if (answer != "y" && answer != "Y") {
        mOut << "Cancelled.\n";
        return;
    }

    if (mRepo.remove(p->id)) {
        mOut << "Deleted product #" << p->id << ".\n";
    } else {
        mOut << "Product #" << p->id << " not found.\n";
    }
}

void InventoryShell::lowStockReport() {
    const auto answer = ask("Threshold [" + std::to_string(mDefaultThreshold) + "]");
    if (!answer) return;

    // Empty answer means "use the default"; an explicit 0 is a real threshold.
    int threshold = mDefaultThreshold;
    if (!boost::algorithm::trim_copy(*answer).empty()) {
        const auto parsed = parseInt(*answer);
        if (!parsed) {
            mOut << "Invalid number: " << *answer << "\n";
            return;
        }
        threshold = *parsed;
    }

    const auto low = mRepo.listLowStock(threshold);
    if (low.empty()) {
        mOut << "No products at or below " << threshold << " units.\n";
        return;
    }
    mOut << "Products at or below " << threshold << " units:\n";
    printTable(low);
}

void InventoryShell::listByCategory() {
    const auto cats = mRepo.categories();
    if (cats.empty()) {
        mOut << "No products.\n";
        return;
    }
    mOut << "Categories:";
    for (const auto& c : cats) mOut << " [" << c << "]";
    mOut << "\n";

    const auto category = ask("Category");
    if (!category) return;

    const auto products = mRepo.listByCategory(boost::algorithm::trim_copy(*category));
    if (products.empty()) {
        mOut << "No products in category \"" << *category << "\".\n";
        return;
    }
    printTable(products);
}

void InventoryShell::inventoryValue() {
    mOut << "Total inventory value: " << mRepo.totalValue().toString() << "\n";
}

// ---------------------------------------------------------------------------
// Input helpers
// ---------------------------------------------------------------------------

std::optional<std::string> InventoryShell::ask(const std::string& label) {
    mOut << label << ": " << std::flush;
    std::string line;
    if (!std::getline(mIn, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

std::optional<int> InventoryShell::askInt(const std::string& label) {
    const auto line = ask(label);
    if (!line) return std::nullopt;

    const auto value = parseInt(*line);
    if (!value) {
        mOut << "Invalid number: " << *line << "\n";
    }
    return value;
}

std::optional<Product> InventoryShell::askProduct() {
    const auto id = askInt("Product id");
    if (!id) return std::nullopt;

    auto p = mRepo.findById(*id);
    if (!p) {
        mOut << "Product #" << *id << " not found.\n";
    }
    return p;
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

void InventoryShell::printTable(const std::vector<Product>& products) {
    if (products.empty()) {
        mOut << "No products.\n";
        return;
    }

    mOut << std::left
         << std::setw(6)  << "ID"
         << std::setw(30) << "Name"
         << std::setw(18) << "Category"
         << std::right
         << std::setw(12) << "Price"
         << std::setw(8)  << "Stock" << "  "
         << std::left << "Last updated" << "\n"
         << std::string(100, '-') << "\n";

    for (const auto& p : products) {
        mOut << std::left
             << std::setw(6)  << p.id
             << std::setw(30) << p.name
             << std::setw(18) << p.category
             << std::right
             << std::setw(12) << p.price.toString()
             << std::setw(8)  << p.stockQuantity << "  "
             << std::left << formatTimestamp(p.lastUpdated) << "\n";
    }
    mOut << products.size() << " product(s)\n";
}

void InventoryShell::printProduct(const Product& p) {
    mOut << "Product #" << p.id << "\n"
         << "  Name:         " << p.name << "\n"
         << "  Category:     " << p.category << "\n"
         << "  Price:        " << p.price.toString() << "\n"
         << "  Stock:        " << p.stockQuantity << "\n"
         << "  Last updated: " << formatTimestamp(p.lastUpdated) << "\n";
}

} // namespace inventory_tracker
