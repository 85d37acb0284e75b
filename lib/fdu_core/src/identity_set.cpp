#include "fdu/du/identity_set.hpp"

namespace fdu::du
{

bool IdentitySet::shouldCount(std::uint64_t device, std::uint64_t inode, std::uint64_t nlink, bool countHardLinks)
{
    if (countHardLinks || nlink <= 1)
        return true;
    auto [it, inserted] = files.insert(FileIdentity{device, inode});
    return inserted;
}

bool IdentitySet::markVisited(std::uint64_t device, std::uint64_t inode)
{
    auto [it, inserted] = directories.insert(FileIdentity{device, inode});
    return inserted;
}

void IdentitySet::clear() noexcept
{
    files.clear();
    directories.clear();
}

} // namespace fdu::du
