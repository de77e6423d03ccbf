#include "util/DirectoryWalker.hpp"

#include <algorithm>

namespace ppt::util {

DirectoryWalker::DirectoryWalker(const bool recursive) : recursive(recursive) {}

std::vector<DirectoryWalker::Entry> DirectoryWalker::walk(const fs::path& root,
                                                          std::function<bool(const fs::directory_entry&)> filter) const {
    std::vector<Entry> entries;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return entries;

    const auto add = [&](const fs::directory_entry& de) {
        if (filter && !filter(de)) return;
        std::error_code sec;
        const bool dir = de.is_directory(sec);
        entries.push_back({de.path(), fs::relative(de.path(), root, sec), dir, dir ? 0 : de.file_size(sec)});
    };

    if (recursive) {
        for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
            add(*it);
    } else {
        for (auto it = fs::directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::directory_iterator(); it.increment(ec))
            add(*it);
    }

    std::ranges::sort(entries, {}, &Entry::path);
    return entries;
}

}
