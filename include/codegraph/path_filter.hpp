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

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace codegraph {

namespace fs = std::filesystem;

// Decides whether a source file lies under one of a fixed set of root
// directories. Both sides are canonicalized before comparison, and the
// comparison is per path component, so root "/a/b" contains "/a/b/c.py" but
// not "/a/bc". A filter without roots accepts every path.
class PathFilter {
public:
    PathFilter() = default;
    explicit PathFilter(const std::vector<std::string> &roots);

    bool in_scope(const std::string &path) const;
    bool in_scope(const fs::path &path) const;

    bool accepts_everything() const { return roots_.empty(); }
    const std::vector<fs::path> &roots() const { return roots_; }

    // Absolute, symlink-resolved where the path exists, lexically normalized
    // otherwise. Returns an empty path if resolution fails.
    static fs::path canonicalize(const fs::path &path);

private:
    std::vector<fs::path> roots_;

    static bool is_under(const fs::path &path, const fs::path &root);
};

} // namespace codegraph
