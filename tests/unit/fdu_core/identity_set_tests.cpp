#include <gtest/gtest.h>

#include "fdu/du/identity_set.hpp"

TEST(IdentitySet, CountsSingleLinkFilesEveryTime)
{
    fdu::du::IdentitySet identities;
    EXPECT_TRUE(identities.shouldCount(1, 42, 1, false));
    EXPECT_TRUE(identities.shouldCount(1, 42, 1, false));
    EXPECT_EQ(identities.size(), 0u);
}

TEST(IdentitySet, CountsHardLinkedFileOnce)
{
    fdu::du::IdentitySet identities;
    EXPECT_TRUE(identities.shouldCount(1, 42, 2, false));
    EXPECT_FALSE(identities.shouldCount(1, 42, 2, false));
    EXPECT_TRUE(identities.shouldCount(2, 42, 2, false));
    EXPECT_EQ(identities.size(), 2u);
}

TEST(IdentitySet, CountHardLinksBypassesDeduplication)
{
    fdu::du::IdentitySet identities;
    EXPECT_TRUE(identities.shouldCount(1, 42, 3, true));
    EXPECT_TRUE(identities.shouldCount(1, 42, 3, true));
    EXPECT_EQ(identities.size(), 0u);
}

TEST(IdentitySet, MarksDirectoriesOnce)
{
    fdu::du::IdentitySet identities;
    EXPECT_TRUE(identities.markVisited(5, 7));
    EXPECT_FALSE(identities.markVisited(5, 7));

    // Directories and files are tracked separately.
    EXPECT_TRUE(identities.shouldCount(5, 7, 2, false));

    identities.clear();
    EXPECT_EQ(identities.size(), 0u);
    EXPECT_TRUE(identities.markVisited(5, 7));
}

TEST(IdentitySet, HashSeparatesDeviceAndInode)
{
    fdu::du::FileIdentityHash hash;
    fdu::du::FileIdentity a{1, 2};
    fdu::du::FileIdentity b{2, 1};
    EXPECT_NE(a, b);
    EXPECT_EQ(hash(a), hash(fdu::du::FileIdentity{1, 2}));
}
