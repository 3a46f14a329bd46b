#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include "LanChat/profile_store.hpp"

TEST(ProfileStoreTest, FileNameKeepsOnlyPlainCharacters) {
    EXPECT_EQ(ProfileStore::fileNameFor("Jean Luc!"), "Jean_Luc_.profile");
    EXPECT_EQ(ProfileStore::fileNameFor("bob42"), "bob42.profile");
}

TEST(ProfileStoreTest, SaveLoadRemove) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    ProfileStore store(dir.path().toStdString());

    store.save(Participant("Jean Luc", "10.0.0.7", true, "jl.png"));
    const auto loaded = store.load("Jean Luc");

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->name(), "Jean Luc");
    EXPECT_EQ(loaded->address(), "10.0.0.7");
    EXPECT_TRUE(loaded->online());
    EXPECT_EQ(loaded->avatar(), "jl.png");

    EXPECT_TRUE(store.remove("Jean Luc"));
    EXPECT_FALSE(store.load("Jean Luc").has_value());
    EXPECT_FALSE(store.remove("Jean Luc"));
}

TEST(ProfileStoreTest, UnknownKeysAndBareLinesAreIgnored) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    {
        QFile file(dir.filePath("zed.profile"));
        ASSERT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Text));
        file.write("# comment\nusername=Zed\ncolour=blue\nnonsense\n");
    }

    const auto loaded = ProfileStore(dir.path().toStdString()).load("zed");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->name(), "Zed");
    EXPECT_EQ(loaded->address(), "127.0.0.1");
    EXPECT_FALSE(loaded->online());
    EXPECT_EQ(loaded->avatar(), DEFAULT_AVATAR);
}

TEST(ProfileStoreTest, SavedNamesAreSorted) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    ProfileStore store(dir.path().toStdString());

    store.save(Participant("mallory", "1.1.1.3"));
    store.save(Participant("Alice", "1.1.1.1"));
    store.save(Participant("bob", "1.1.1.2"));

    EXPECT_EQ(store.savedNames(), (std::vector<std::string>{"Alice", "bob", "mallory"}));
}
