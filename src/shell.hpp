#pragma once

#include "models.hpp"
#include "repository.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace inventory_tracker {

/// Text-menu front end over an InventoryRepository.
/// Reads one answer per line from @p in and renders to @p out, so a session
/// can be scripted in tests.  End of input ends the session like "exit".
class InventoryShell {
public:
    InventoryShell(InventoryRepository& repo,
                   std::istream& in,
                   std::ostream& out,
                   int defaultLowStockThreshold = 5);

    /// Run the menu loop until the user exits or input ends.
    void run();

private:
    InventoryRepository& mRepo;
    std::istream&        mIn;
    std::ostream&        mOut;
    int                  mDefaultThreshold;

    void printMenu();

    void listAll();
    void addProduct();
    void searchByName();
    void findById();
    void restock();
    void recordSale();
    void setStockLevel();
    void editDetails();
    void deleteProduct();
    void lowStockReport();
    void listByCategory();
    void inventoryValue();

    /// Prompt and read one line; nullopt at end of input.
    std::optional<std::string> ask(const std::string& label);

    /// Prompt for an integer; nullopt at end of input or on a bad number
    /// (which is reported).
    std::optional<int> askInt(const std::string& label);

    /// Prompt for an id and look the product up, reporting a miss.
    std::optional<Product> askProduct();

    void printTable(const std::vector<Product>& products);
    void printProduct(const Product& p);
};

} // namespace inventory_tracker
