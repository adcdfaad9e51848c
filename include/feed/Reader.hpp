#pragma once

#include "feed/Entry.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cw::feed {

// Access to the remote store holding the rundowns. Every call may block; none
// may throw for transport failures (they are reported through the return value).
class Reader {
public:
    virtual ~Reader() = default;

    virtual bool connect() = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool isConnected() const = 0;

    // Reconnects when the session was lost and returns to the folder the lost
    // session was in. Safe to call before every operation.
    virtual bool ensureConnected() {
        if (isConnected()) return true;

        const auto folder = currentFolder();
        disconnect();
        if (!connect()) return false;

        // a folder that is gone now fails the reads that follow, not the session
        if (!folder.empty() && !navigateTo(folder)) return isConnected();
        return true;
    }

    virtual bool navigateTo(const std::string& path) = 0;

    // Folder of the last successful navigateTo, empty at the root.
    [[nodiscard]] virtual std::string currentFolder() const = 0;

    // An empty path lists the current directory. Failures yield an empty list.
    virtual std::vector<Entry> listEntries(const std::string& path) = 0;

    virtual std::optional<std::string> readEntry(const std::string& name) = 0;

    // Number of times a session dropped under an operation.
    [[nodiscard]] std::size_t sessionLosses() const { return sessionLosses_; }

protected:
    void noteSessionLost() { ++sessionLosses_; }

private:
    std::size_t sessionLosses_ = 0;
};

}
