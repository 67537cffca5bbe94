#include "types.hpp"

#include <algorithm>
#include <chrono>

namespace spl {

bool Group::has_member(const MemberKey& member) const {
    return std::find(members.begin(), members.end(), member) != members.end();
}

bool Group::add_member(const MemberKey& member) {
    if (has_member(member)) return false;
    members.push_back(member);
    return true;
}

Money Expense::share() const {
    return amount.split(participants.size()).share;
}

Timestamp now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace spl
