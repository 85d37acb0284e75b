#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_set>

namespace fdu::du
{

struct FileIdentity
{
    std::uint64_t device = 0;
    std::uint64_t inode = 0;

    bool operator==(const FileIdentity &) const noexcept = default;
};

struct FileIdentityHash
{
    std::size_t operator()(const FileIdentity &id) const noexcept
    {
        std::size_t h1 = std::hash<std::uint64_t>{}(id.device);
        std::size_t h2 = std::hash<std::uint64_t>{}(id.inode);
        return h1 ^ (h2 << 1);
    }
};

// Device+inode pairs seen during one walk. Not synchronised: the walk that
// owns it is single-threaded.
class IdentitySet
{
public:
    // True when a leaf with this identity should be added to the totals.
    // Multiply-linked files are counted once unless countHardLinks is set.
    bool shouldCount(std::uint64_t device, std::uint64_t inode, std::uint64_t nlink, bool countHardLinks);

    // Records a directory; false if it was already entered.
    bool markVisited(std::uint64_t device, std::uint64_t inode);

    std::size_t size() const noexcept { return files.size() + directories.size(); }
    void clear() noexcept;

private:
    std::unordered_set<FileIdentity, FileIdentityHash> files;
    std::unordered_set<FileIdentity, FileIdentityHash> directories;
};

} // namespace fdu::du
