// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "codegraph/path_filter.hpp"
#include <algorithm>

namespace codegraph {

PathFilter::PathFilter(const std::vector<std::string> &roots) {
    roots_.reserve(roots.size());
    for (const auto &root : roots) {
        fs::path canonical = canonicalize(root);
        if (canonical.empty())
            continue;
        if (std::find(roots_.begin(), roots_.end(), canonical) == roots_.end()) {
            roots_.push_back(std::move(canonical));
        }
    }
}

fs::path PathFilter::canonicalize(const fs::path &path) {
    if (path.empty())
        return {};

    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec)
        return {};
    fs::path resolved = fs::weakly_canonical(absolute, ec);
    if (ec)
        return {};

    // "/a/b/" canonicalizes with a trailing empty component
    if (!resolved.has_filename() && resolved != resolved.root_path()) {
        resolved = resolved.parent_path();
    }
    return resolved;
}

bool PathFilter::is_under(const fs::path &path, const fs::path &root) {
    auto pit = path.begin();
    for (auto rit = root.begin(); rit != root.end(); ++rit, ++pit) {
        if (pit == path.end() || *pit != *rit)
            return false;
    }
    return true;
}

bool PathFilter::in_scope(const std::string &path) const {
    return in_scope(fs::path(path));
}

bool PathFilter::in_scope(const fs::path &path) const {
    if (roots_.empty())
        return true;

    fs::path canonical = canonicalize(path);
    if (canonical.empty())
        return false;

    for (const auto &root : roots_) {
        if (is_under(canonical, root))
            return true;
    }
    return false;
}

} // namespace codegraph
