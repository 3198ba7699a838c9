// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


#include <parcp/seen_set.hpp>

namespace parcp {

bool SeenSet::claim(const std::string &path) {
    std::lock_guard<std::mutex> lock(mutex_);
    return paths_.insert(path).second;
}

bool SeenSet::contains(const std::string &path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paths_.count(path) != 0;
}

size_t SeenSet::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paths_.size();
}

} // namespace parcp
