#include "ledger_store.hpp"
#include "errors.hpp"

namespace spl {

std::vector<MemberKey> LedgerStore::list_members(GroupId id) {
    std::optional<Group> group = find_group(id);
    if (!group) {
        throw UnknownGroup("Group does not exist: " + std::to_string(id));
    }
    return group->members;
}

bool LedgerStore::is_member(GroupId id, const MemberKey& member) {
    std::optional<Group> group = find_group(id);
    return group && group->has_member(member);
}

} // namespace spl
