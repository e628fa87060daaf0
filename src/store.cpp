#include "store.hpp"
#include "mapping.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace inventory_tracker {

const char* toString(StoreStatus status) {
    switch (status) {
        case StoreStatus::Ok:        return "ok";
        case StoreStatus::Missing:   return "missing";
        case StoreStatus::Malformed: return "malformed";
        case StoreStatus::IoError:   return "io-error";
    }
    return "unknown";
}

JsonFileStore::JsonFileStore(std::string path)
    : mPath(std::move(path)) {}

// ---------------------------------------------------------------------------
// Load
// ---------------------------------------------------------------------------

LoadResult JsonFileStore::load() const {
    LoadResult result;

    std::error_code ec;
    if (!fs::exists(mPath, ec)) {
        if (ec) {
            result.status  = StoreStatus::IoError;
            result.message = "Cannot access " + mPath + ": " + ec.message();
            std::cerr << "[Store] Warning: " << result.message << "\n";
            return result;
        }
        result.status  = StoreStatus::Missing;
        result.message = "No data file at " + mPath + "; starting empty";
        if (mVerbose) {
            std::cerr << "[Store] " << result.message << "\n";
        }
        return result;
    }

    std::ifstream in(mPath, std::ios::binary);
    if (!in || fs::is_directory(mPath, ec)) {
        result.status  = StoreStatus::IoError;
        result.message = "Cannot open " + mPath + " for reading";
        std::cerr << "[Store] Warning: " << result.message << "\n";
        return result;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        result.status  = StoreStatus::IoError;
        result.message = "Read error on " + mPath;
        std::cerr << "[Store] Warning: " << result.message << "\n";
        return result;
    }

    const std::string text = buffer.str();

    try {
        // An empty or whitespace-only file counts as an empty inventory.
        if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
            result.message = "Data file " + mPath + " is empty";
        } else {
            result.products = parseInventoryDocument(nlohmann::json::parse(text));
        }
    } catch (const std::exception& e) {
        result.products.clear();
        result.status  = StoreStatus::Malformed;
        result.message = "Ignoring malformed data file " + mPath + ": " + e.what();
        std::cerr << "[Store] Warning: " << result.message << "\n";
        return result;
    }

    if (mVerbose) {
        std::cerr << "[Store] Loaded " << result.products.size()
                  << " products from " << mPath << "\n";
    }
    return result;
}

// ---------------------------------------------------------------------------
// Save
// ---------------------------------------------------------------------------

StoreStatus JsonFileStore::save(const std::vector<Product>& products) {
    mLastError.clear();

    if (mSaveBlocked) {
        mLastError = "Refusing to overwrite " + mPath
                   + ", which could not be loaded or moved aside";
        std::cerr << "[Store] Save failed: " << mLastError << "\n";
        return StoreStatus::IoError;
    }

    const fs::path target(mPath);
    fs::path tmp = target;
    tmp += ".tmp";

    auto fail = [&](const std::string& msg) {
        mLastError = msg;
        std::cerr << "[Store] Save failed: " << msg << "\n";
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return StoreStatus::IoError;
    };

    std::string body;
    try {
        body = buildInventoryDocument(products).dump(2);
    } catch (const nlohmann::json::exception& e) {
        // dump() throws on invalid UTF-8 in a name or category.
        return fail(std::string("Cannot encode inventory: ") + e.what());
    }

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return fail("Cannot create directory "
                        + target.parent_path().string() + ": " + ec.message());
        }
    }

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return fail("Cannot open " + tmp.string() + " for writing");
        }
        out << body << "\n";
        out.flush();
        if (!out) {
            return fail("Write error on " + tmp.string());
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        return fail("Cannot replace " + mPath + ": " + ec.message());
    }

    if (mVerbose) {
        std::cerr << "[Store] Saved " << products.size()
                  << " products to " << mPath << "\n";
    }
    return StoreStatus::Ok;
}

StoreStatus JsonFileStore::quarantine() {
    mLastError.clear();

    fs::path aside(mPath);
    aside += ".corrupt";

    std::error_code ec;
    fs::rename(mPath, aside, ec);
    if (ec) {
        mLastError = "Cannot move " + mPath + " aside: " + ec.message();
        std::cerr << "[Store] " << mLastError << "\n";
        return StoreStatus::IoError;
    }

    std::cerr << "[Store] Moved unreadable data file to " << aside.string() << "\n";
    return StoreStatus::Ok;
}

bool JsonFileStore::protectUnreadable(StoreStatus loadStatus) {
    switch (loadStatus) {
        case StoreStatus::Ok:
        case StoreStatus::Missing:
            return true;
        case StoreStatus::Malformed:
            if (quarantine() == StoreStatus::Ok) {
                return true;
            }
            break;
        case StoreStatus::IoError:
            // Leave the file where it is; we cannot tell what it holds.
            break;
    }

    mSaveBlocked = true;
    std::cerr << "[Store] Warning: saving to " << mPath << " is disabled\n";
    return false;
}

} // namespace inventory_tracker
