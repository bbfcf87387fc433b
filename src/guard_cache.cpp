#include "sapio/guard.hpp"

namespace sapio {

const Clause* GuardCache::find(const void* instance, const void* guard) const {
    auto it = memo_.find(std::make_pair(instance, guard));
    return it == memo_.end() ? nullptr : &it->second;
}

const Clause& GuardCache::insert(const void* instance, const void* guard, Clause clause) {
    auto res = memo_.insert_or_assign(std::make_pair(instance, guard), std::move(clause));
    return res.first->second;
}

void GuardCache::clear() {
    memo_.clear();
    hits_ = misses_ = 0;
}

} // namespace sapio
