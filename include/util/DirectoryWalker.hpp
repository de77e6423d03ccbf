#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

namespace ppt::util {

    namespace fs = std::filesystem;

    class DirectoryWalker {
    public:
        struct Entry {
            fs::path path;
            fs::path relative;
            bool is_directory;
            std::uintmax_t size;
        };

        explicit DirectoryWalker(bool recursive = true);

        // Entries sorted by path. A missing or unreadable root yields nothing;
        // unreadable subtrees are skipped.
        std::vector<Entry> walk(const fs::path& root,
                                std::function<bool(const fs::directory_entry&)> filter = nullptr) const;

    private:
        bool recursive;
    };

} // namespace ppt::util
