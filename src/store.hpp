#pragma once

#include "models.hpp"

#include <string>
#include <vector>

namespace inventory_tracker {

enum class StoreStatus {
    Ok,
    Missing,     // no file yet; not an error
    Malformed,   // file exists but is not a valid inventory document
    IoError,     // could not read or write
};

const char* toString(StoreStatus status);

/// Result of loading the data file.  products is empty unless status is Ok.
struct LoadResult {
    std::vector<Product> products;
    StoreStatus          status = StoreStatus::Ok;
    std::string          message;
};

/// Whole-file JSON persistence for the product set.
/// Never throws; failures are reported through the returned status.
class JsonFileStore {
public:
    explicit JsonFileStore(std::string path);

    /// Read and validate the whole document.
    LoadResult load() const;

    /// Write the whole document via a temp file + rename, so the previous
    /// file survives any failure.  Creates missing parent directories.
    StoreStatus save(const std::vector<Product>& products);

    /// Move the current data file aside to "<path>.corrupt" so a later save
    /// does not destroy a file that failed to load.
    StoreStatus quarantine();

    /// Keep a data file that failed to load with `loadStatus` safe for the
    /// rest of the session.  A malformed file is quarantined; if that fails,
    /// or the file could not be read at all, save() is disabled.
    /// Returns whether save() may still write.
    bool protectUnreadable(StoreStatus loadStatus);

    bool canSave() const { return !mSaveBlocked; }

    const std::string& path()      const { return mPath; }
    const std::string& lastError() const { return mLastError; }

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::string mPath;
    std::string mLastError;
    bool        mVerbose     = false;
    bool        mSaveBlocked = false;
};

} // namespace inventory_tracker
